#pragma once

#include "../host/host_control.hpp"

#include <optional>
#include <string>

namespace quiesce::scheduler
{

struct Status
{
    // std::nullopt: flag unreadable or holding an undefined value.
    std::optional<SchedulerFlag> flag;
    bool pendingRestart{}; // live state will only match after a host restart
    bool flagWritten{};
    std::string message;

    bool defined() const
    {
        return flag.has_value();
    }
};

// Read-only view of the current flag and runner.
Status inspect(HostControl& host);

// Persist Disabled. Ready (pendingRestart=false) only when the flag already
// reads Disabled and the runner is no longer active.
Status disable(HostControl& host);

// Persist EnabledDelayed. Ready only when the flag already reads
// EnabledDelayed and the runner is active.
Status enable(HostControl& host);

} // namespace quiesce::scheduler
