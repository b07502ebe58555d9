#include "config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <set>
#include <stdexcept>

namespace j = nlohmann;

namespace quiesce
{

static int read_int(const j::json& obj, const char* key, int def = 0)
{
    auto it = obj.find(key);
    return (it == obj.end()) ? def : it->get<int>();
}

static Config parse(const j::json& root)
{
    Config out{};

    // ===== basic settings =====
    if (root.contains("basic settings"))
    {
        if (!root["basic settings"].is_array() ||
            root["basic settings"].empty())
        {
            throw std::runtime_error("basic settings must be a non-empty array");
        }
        const auto& basic = root["basic settings"].at(0);
        out.basic.warmupMinutes =
            read_int(basic, "warmupminutes", out.basic.warmupMinutes);
        out.basic.journalPath =
            basic.value("journal", out.basic.journalPath);
        if (out.basic.warmupMinutes < 0)
            throw std::runtime_error("warmupminutes must be >= 0");
    }

    // ===== services =====
    if (!root.contains("services") || !root["services"].is_array())
    {
        throw std::runtime_error("Missing services");
    }
    for (const auto& s : root["services"])
    {
        out.services.push_back(s.get<std::string>());
    }

    if (root.contains("slowservice") && root["slowservice"].is_object())
    {
        const auto& s = root["slowservice"];
        out.slowService.name = s.value("name", std::string{});
        out.slowService.delaySec =
            read_int(s, "delay", out.slowService.delaySec);
        if (out.slowService.delaySec < 0)
            throw std::runtime_error("slowservice delay must be >= 0");
    }

    // ===== processes (ordered) =====
    if (!root.contains("processes") || !root["processes"].is_array())
    {
        throw std::runtime_error("Missing processes");
    }
    std::set<std::string> seen;
    for (const auto& p : root["processes"])
    {
        ProcessEntry e{};
        if (p.is_string())
        {
            e.name = p.get<std::string>();
        }
        else
        {
            e.name = p.value("name", std::string{});
            if (p.contains("spawns"))
                e.spawns = p["spawns"].get<std::vector<std::string>>();
        }
        if (e.name.empty())
            throw std::runtime_error("process entry without name");
        if (!seen.insert(e.name).second)
            throw std::runtime_error("duplicate process entry: " + e.name);
        out.processes.push_back(e);
    }

    // ===== scheduler =====
    if (root.contains("scheduler") && root["scheduler"].is_object())
    {
        out.scheduler.unit =
            root["scheduler"].value("unit", out.scheduler.unit);
    }
    if (out.scheduler.unit.empty())
        throw std::runtime_error("scheduler unit must not be empty");

    return out;
}

Config loadConfigFromJsonFile(const std::string& jsonPath)
{
    std::ifstream ifs(jsonPath);
    if (!ifs.good())
    {
        throw std::runtime_error("Cannot open config file: " + jsonPath);
    }

    try
    {
        return parse(j::json::parse(ifs));
    }
    catch (const j::json::exception& e)
    {
        throw std::runtime_error(jsonPath + ": " + e.what());
    }
}

Config loadConfigFromJsonText(const std::string& text)
{
    try
    {
        return parse(j::json::parse(text));
    }
    catch (const j::json::exception& e)
    {
        throw std::runtime_error(e.what());
    }
}

} // namespace quiesce
