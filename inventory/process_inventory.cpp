#include "process_inventory.hpp"

#include "../core/logging.hpp"
#include "../core/shell.hpp"

#include <map>
#include <set>
#include <string>

namespace quiesce::processes
{

std::vector<ProcessRecord> snapshotAndStop(HostControl& host,
                                           const std::vector<ProcessEntry>& catalog)
{
    std::vector<ProcessRecord> records;
    records.reserve(catalog.size());
    std::vector<std::string> active;

    for (const auto& entry : catalog)
    {
        ProcessRecord r{};
        r.name = entry.name;
        r.existed = isPresent(host.processExists(entry.name));
        if (r.existed)
        {
            // Never kill something that was parked on purpose.
            r.wasSuspended = isPresent(host.processSuspended(entry.name));
            r.executablePath = host.processExecutable(entry.name);
            r.owner = host.processOwner(entry.name);
            if (!r.executablePath)
                log::warn("no executable path for " + entry.name +
                          "; it cannot be relaunched");
            if (!r.wasSuspended)
                active.push_back(entry.name);
        }
        records.push_back(r);
    }

    if (active.empty())
    {
        log::info("no catalog processes active");
        return records;
    }

    log::info("force-stopping " + std::to_string(active.size()) +
              " process(es)");
    if (!host.killProcesses(active))
        log::warn("batched process stop reported failure");

    return records;
}

LaunchBatch planRestart(HostControl& host,
                        const std::vector<ProcessRecord>& records,
                        const std::vector<ProcessEntry>& catalog)
{
    std::map<std::string, std::vector<std::string>> spawnsOf;
    for (const auto& e : catalog)
        spawnsOf[e.name] = e.spawns;

    LaunchBatch batch{};
    std::set<std::string> covered; // started by something already queued

    for (const auto& r : records)
    {
        if (!r.existed || r.wasSuspended)
            continue;

        if (covered.count(r.name))
        {
            log::info(r.name + " is started by an earlier entry; skipping");
            continue;
        }

        if (isPresent(host.processExists(r.name)))
        {
            log::info(r.name + " already running; skipping");
            continue;
        }

        if (!r.executablePath || r.executablePath->empty())
        {
            log::warn("cannot relaunch " + r.name + ": path unknown");
            continue;
        }

        batch.targets.push_back({*r.executablePath, r.owner});
        auto it = spawnsOf.find(r.name);
        if (it != spawnsOf.end())
            covered.insert(it->second.begin(), it->second.end());
    }

    batch.commandLine = shell::launchCommand(batch.targets);
    return batch;
}

bool restart(HostControl& host, const std::vector<ProcessRecord>& records,
             const std::vector<ProcessEntry>& catalog)
{
    auto batch = planRestart(host, records, catalog);
    if (batch.targets.empty())
        return true;

    log::info("launching " + std::to_string(batch.targets.size()) +
              " process(es)");
    if (!host.launch(batch))
    {
        log::warn("batched process launch reported failure");
        return false;
    }
    return true;
}

} // namespace quiesce::processes
