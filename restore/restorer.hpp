#pragma once

#include "../config/config.hpp"
#include "../host/host_control.hpp"
#include "../inventory/snapshot.hpp"
#include "../scheduler/scheduler_toggle.hpp"

namespace quiesce
{

struct RestoreReport
{
    bool servicesStarted{true};
    bool processesLaunched{true};
    scheduler::Status scheduler;

    bool schedulerPendingRestart() const
    {
        return scheduler.pendingRestart;
    }

    bool success() const
    {
        return servicesStarted && processesLaunched;
    }
};

// Bring back exactly what the snapshot says was running, then re-enable the
// scheduler. Does not check preconditions and does not consume the snapshot.
RestoreReport restore(HostControl& host, const Snapshot& snapshot,
                      const Config& cfg);

} // namespace quiesce
