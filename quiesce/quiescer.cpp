#include "quiescer.hpp"

#include "../core/logging.hpp"
#include "../guard/precondition_guard.hpp"
#include "../inventory/process_inventory.hpp"
#include "../inventory/service_inventory.hpp"
#include "../scheduler/scheduler_toggle.hpp"

#include <utility>

namespace quiesce
{

Quiescer::Quiescer(HostControl& host, Config cfg) :
    host(host), cfg(std::move(cfg))
{}

Outcome<Snapshot> Quiescer::disable()
{
    auto verdict = guard::evaluate(host, cfg.basic.warmupMinutes);
    if (!verdict.ok)
    {
        log::info(verdict.message);
        return Cancelled{CancelReason::GuardRefused, verdict.message};
    }

    auto sched = scheduler::disable(host);
    if (!sched.defined())
        return Cancelled{CancelReason::UndefinedSchedulerFlag, sched.message};
    if (sched.pendingRestart)
        return Cancelled{CancelReason::PendingRestart, sched.message};
    if (*sched.flag != SchedulerFlag::Disabled)
        return Cancelled{CancelReason::SchedulerWriteFailed, sched.message};

    auto svc = services::snapshotAndStop(host, cfg.services, cfg.slowService);
    auto proc = processes::snapshotAndStop(host, cfg.processes);

    log::info("host quiesced");
    return Snapshot(std::move(svc), std::move(proc));
}

Outcome<RestoreReport> Quiescer::enable(Snapshot& snapshot)
{
    if (!snapshot.valid())
    {
        const std::string msg = "snapshot already used; nothing restored";
        log::warn(msg);
        return Cancelled{CancelReason::InvalidSnapshot, msg};
    }

    auto verdict = guard::evaluate(host, cfg.basic.warmupMinutes);
    if (!verdict.ok)
    {
        log::info(verdict.message);
        return Cancelled{CancelReason::GuardRefused, verdict.message};
    }

    snapshot.consume();
    auto report = restore(host, snapshot, cfg);
    log::info(report.success() ? "host restored" : "host partially restored");
    return report;
}

} // namespace quiesce
