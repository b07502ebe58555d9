#include "restorer.hpp"

#include "../core/logging.hpp"
#include "../inventory/process_inventory.hpp"
#include "../inventory/service_inventory.hpp"

namespace quiesce
{

RestoreReport restore(HostControl& host, const Snapshot& snapshot,
                      const Config& cfg)
{
    RestoreReport report{};

    report.servicesStarted = services::restart(host, snapshot.services());
    report.processesLaunched =
        processes::restart(host, snapshot.processes(), cfg.processes);
    report.scheduler = scheduler::enable(host);

    if (!report.success())
        log::warn("restore finished with failures; check the host by hand");
    return report;
}

} // namespace quiesce
