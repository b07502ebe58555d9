#include "service_inventory.hpp"

#include "../core/logging.hpp"

#include <algorithm>

namespace quiesce::services
{

std::vector<ServiceRecord> snapshotAndStop(HostControl& host,
                                           const std::vector<std::string>& catalog,
                                           const SlowService& slow)
{
    std::vector<ServiceRecord> records;
    records.reserve(catalog.size());
    std::vector<std::string> running;

    for (const auto& name : catalog)
    {
        ServiceRecord r{};
        r.name = name;
        r.existed = isPresent(host.serviceExists(name));
        if (r.existed)
            r.wasRunning = isPresent(host.serviceRunning(name));
        if (r.wasRunning)
            running.push_back(name);
        records.push_back(r);
    }

    if (running.empty())
    {
        log::info("no catalog services running");
        return records;
    }

    log::info("stopping " + std::to_string(running.size()) + " service(s)");
    if (!host.stopServices(running))
        log::warn("batched service stop reported failure");

    if (!slow.name.empty() &&
        std::find(running.begin(), running.end(), slow.name) != running.end())
    {
        log::info("waiting " + std::to_string(slow.delaySec) + "s for " +
                  slow.name + " teardown to settle");
        host.sleepSeconds(slow.delaySec);
    }

    return records;
}

bool restart(HostControl& host, const std::vector<ServiceRecord>& records)
{
    std::vector<std::string> toStart;
    for (const auto& r : records)
    {
        if (r.existed && r.wasRunning)
            toStart.push_back(r.name);
    }
    if (toStart.empty())
        return true;

    log::info("starting " + std::to_string(toStart.size()) + " service(s)");
    if (!host.startServices(toStart))
    {
        log::warn("batched service start reported failure");
        return false;
    }
    return true;
}

} // namespace quiesce::services
