#include "procfs.hpp"

#include "../core/logging.hpp"

#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <map>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace quiesce::procfs
{

static constexpr size_t kCommLen = 15;
static constexpr const char* kDeletedSuffix = " (deleted)";

static bool isNumeric(const std::string& s)
{
    if (s.empty())
        return false;
    for (char c : s)
    {
        if (c < '0' || c > '9')
            return false;
    }
    return true;
}

static std::optional<std::string> readComm(const std::string& pidDir)
{
    std::ifstream ifs(pidDir + "/comm");
    if (!ifs.good())
        return std::nullopt;
    std::string comm;
    std::getline(ifs, comm);
    return comm;
}

static std::optional<char> readState(const std::string& statPath)
{
    std::ifstream ifs(statPath);
    if (!ifs.good())
        return std::nullopt;
    std::string line;
    std::getline(ifs, line);
    return parseStatState(line);
}

// comm -> pids, one pass over /proc.
static std::optional<std::map<std::string, std::vector<int>>> commTable()
{
    std::error_code ec;
    fs::directory_iterator it("/proc", ec);
    if (ec)
    {
        log::warn("list /proc failed: " + ec.message());
        return std::nullopt;
    }

    std::map<std::string, std::vector<int>> table;
    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        const std::string base = it->path().filename().string();
        if (!isNumeric(base))
            continue;
        if (auto comm = readComm(it->path().string()))
            table[*comm].push_back(std::stoi(base));
    }
    if (ec)
    {
        log::warn("walking /proc failed: " + ec.message());
        return std::nullopt;
    }
    for (auto& entry : table)
        std::sort(entry.second.begin(), entry.second.end());
    return table;
}

std::string commKey(const std::string& name)
{
    return name.substr(0, kCommLen);
}

std::optional<char> parseStatState(const std::string& line)
{
    auto close = line.rfind(')');
    if (close == std::string::npos || close + 2 >= line.size())
        return std::nullopt;
    return line[close + 2];
}

std::optional<std::vector<int>> pidsByName(const std::string& name)
{
    auto table = commTable();
    if (!table)
        return std::nullopt;
    auto it = table->find(commKey(name));
    if (it == table->end())
        return std::vector<int>{};
    return it->second;
}

std::optional<bool> allThreadsStopped(int pid)
{
    const std::string taskDir = "/proc/" + std::to_string(pid) + "/task";
    std::error_code ec;
    fs::directory_iterator it(taskDir, ec);
    if (ec)
        return std::nullopt;

    size_t threads = 0;
    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        auto state = readState(it->path().string() + "/stat");
        if (!state)
            return std::nullopt;
        if (*state != 'T')
            return false;
        ++threads;
    }
    if (ec || threads == 0)
        return std::nullopt;
    return true;
}

std::optional<std::string> normaliseExe(const std::string& target)
{
    std::string path = target;
    const std::string suffix = kDeletedSuffix;
    if (path.size() > suffix.size() &&
        path.compare(path.size() - suffix.size(), suffix.size(), suffix) == 0)
    {
        path.erase(path.size() - suffix.size());
    }

    std::error_code ec;
    if (path.empty() || !fs::is_regular_file(path, ec))
    {
        log::warn("executable " + target + " is gone from disk");
        return std::nullopt;
    }
    return path;
}

std::optional<std::string> exePath(int pid)
{
    std::error_code ec;
    auto target =
        fs::read_symlink("/proc/" + std::to_string(pid) + "/exe", ec);
    if (ec)
        return std::nullopt;
    return normaliseExe(target.string());
}

std::optional<ProcessOwner> ownerOf(int pid)
{
    std::ifstream ifs("/proc/" + std::to_string(pid) + "/status");
    if (!ifs.good())
        return std::nullopt;

    // "Uid:\treal\teffective\tsaved\tfs"
    std::optional<uint32_t> uid;
    std::optional<uint32_t> gid;
    std::string line;
    while (std::getline(ifs, line))
    {
        std::istringstream iss(line);
        std::string key;
        unsigned long real = 0;
        if (!(iss >> key >> real))
            continue;
        if (key == "Uid:")
            uid = static_cast<uint32_t>(real);
        else if (key == "Gid:")
            gid = static_cast<uint32_t>(real);
    }
    if (!uid || !gid)
        return std::nullopt;
    return ProcessOwner{*uid, *gid};
}

std::optional<std::vector<int>> killOrder(const std::vector<std::string>& names)
{
    auto table = commTable();
    if (!table)
        return std::nullopt;

    const int self = static_cast<int>(::getpid());
    std::set<int> seen;
    std::vector<int> out;
    for (const auto& name : names)
    {
        auto it = table->find(commKey(name));
        if (it == table->end())
            continue;
        for (int pid : it->second)
        {
            if (pid != self && seen.insert(pid).second)
                out.push_back(pid);
        }
    }
    return out;
}

bool killByNames(const std::vector<std::string>& names)
{
    auto pids = killOrder(names);
    if (!pids)
        return false;

    bool ok = true;
    for (int pid : *pids)
    {
        if (::kill(pid, SIGKILL) == 0)
            continue;
        const int err = errno;
        if (err != ESRCH)
        {
            log::warn("kill " + std::to_string(pid) +
                      " failed: " + std::strerror(err));
            ok = false;
        }
    }
    return ok;
}

} // namespace quiesce::procfs
