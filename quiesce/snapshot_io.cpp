#include "snapshot_io.hpp"

#include "../core/logging.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>

namespace j = nlohmann;

namespace quiesce::snapshotio
{

static constexpr int kFormat = 1;

bool save(const std::string& path, const Snapshot& snapshot)
{
    j::json root;
    root["format"] = kFormat;
    root["services"] = j::json::array();
    for (const auto& s : snapshot.services())
    {
        j::json e = {{"name", s.name},
                     {"existed", s.existed},
                     {"running", s.wasRunning}};
        root["services"].push_back(e);
    }
    root["processes"] = j::json::array();
    for (const auto& p : snapshot.processes())
    {
        j::json e = {{"name", p.name},
                     {"existed", p.existed},
                     {"suspended", p.wasSuspended}};
        if (p.executablePath)
            e["path"] = *p.executablePath;
        if (p.owner)
        {
            e["uid"] = p.owner->uid;
            e["gid"] = p.owner->gid;
        }
        root["processes"].push_back(e);
    }

    std::error_code ec;
    std::filesystem::create_directories(
        std::filesystem::path(path).parent_path(), ec);
    std::ofstream ofs(path, std::ios::out | std::ios::trunc);
    if (!ofs.good())
    {
        log::warn("cannot write snapshot: " + path);
        return false;
    }
    ofs << root.dump(4) << "\n";
    ofs.flush();
    return ofs.good();
}

std::optional<Snapshot> load(const std::string& path)
{
    std::ifstream ifs(path);
    if (!ifs.good())
    {
        log::warn("cannot open snapshot: " + path);
        return std::nullopt;
    }

    try
    {
        j::json root = j::json::parse(ifs);
        if (root.value("format", 0) != kFormat)
        {
            log::warn("unsupported snapshot format in " + path);
            return std::nullopt;
        }

        std::vector<ServiceRecord> svc;
        for (const auto& s : root.at("services"))
        {
            ServiceRecord r{};
            r.name = s.at("name").get<std::string>();
            r.existed = s.value("existed", false);
            r.wasRunning = s.value("running", false);
            svc.push_back(r);
        }

        std::vector<ProcessRecord> proc;
        for (const auto& p : root.at("processes"))
        {
            ProcessRecord r{};
            r.name = p.at("name").get<std::string>();
            r.existed = p.value("existed", false);
            r.wasSuspended = p.value("suspended", false);
            if (p.contains("path"))
                r.executablePath = p["path"].get<std::string>();
            if (p.contains("uid") && p.contains("gid"))
                r.owner = ProcessOwner{p["uid"].get<uint32_t>(),
                                       p["gid"].get<uint32_t>()};
            proc.push_back(r);
        }

        return Snapshot(std::move(svc), std::move(proc));
    }
    catch (const j::json::exception& e)
    {
        log::warn("malformed snapshot " + path + ": " + e.what());
        return std::nullopt;
    }
}

bool discard(const std::string& path)
{
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec)
    {
        log::warn("cannot remove snapshot " + path + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace quiesce::snapshotio
