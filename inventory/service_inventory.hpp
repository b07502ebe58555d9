#pragma once

#include "../config/config.hpp"
#include "../host/host_control.hpp"
#include "snapshot.hpp"

#include <string>
#include <vector>

namespace quiesce::services
{

// Query every catalog service, stop the running subset in one batch, and
// wait out the slow service's teardown if it was among them.
std::vector<ServiceRecord> snapshotAndStop(HostControl& host,
                                           const std::vector<std::string>& catalog,
                                           const SlowService& slow);

// Start every record that was running, in one batch. Best effort.
bool restart(HostControl& host, const std::vector<ServiceRecord>& records);

} // namespace quiesce::services
