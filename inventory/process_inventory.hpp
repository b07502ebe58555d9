#pragma once

#include "../config/config.hpp"
#include "../host/host_control.hpp"
#include "snapshot.hpp"

#include <vector>

namespace quiesce::processes
{

// Query every catalog process in order and force-stop the existing,
// non-suspended ones in a single batch.
std::vector<ProcessRecord> snapshotAndStop(HostControl& host,
                                           const std::vector<ProcessEntry>& catalog);

// Decide which recorded processes need launching, checking the live host again.
// Order follows records. Entries spawned by an earlier queued entry are left
// to that entry.
LaunchBatch planRestart(HostControl& host,
                        const std::vector<ProcessRecord>& records,
                        const std::vector<ProcessEntry>& catalog);

// planRestart() then one launch. Best effort; false if the launch failed.
bool restart(HostControl& host, const std::vector<ProcessRecord>& records,
             const std::vector<ProcessEntry>& catalog);

} // namespace quiesce::processes
