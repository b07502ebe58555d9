#include "scheduler_toggle.hpp"

#include "../core/logging.hpp"

namespace quiesce::scheduler
{

static std::optional<SchedulerFlag> decode(std::optional<int> raw)
{
    if (!raw)
        return std::nullopt;
    switch (*raw)
    {
        case static_cast<int>(SchedulerFlag::EnabledDelayed):
            return SchedulerFlag::EnabledDelayed;
        case static_cast<int>(SchedulerFlag::Disabled):
            return SchedulerFlag::Disabled;
        default:
            return std::nullopt;
    }
}

static Status undefinedStatus(std::optional<int> raw)
{
    Status s{};
    s.message = raw ? "scheduler flag holds undefined value " +
                          std::to_string(*raw) + "; leaving it untouched"
                    : "scheduler flag could not be read; leaving it untouched";
    log::warn(s.message);
    return s;
}

// Flip the flag toward target, or confirm the runner already agrees with it.
static Status transition(HostControl& host, SchedulerFlag target,
                         const char* verbPast, bool wantRunnerActive)
{
    const auto raw = host.readSchedulerFlag();
    const auto flag = decode(raw);
    if (!flag)
        return undefinedStatus(raw);

    Status s{};
    s.flag = flag;

    if (*flag != target)
    {
        if (!host.writeSchedulerFlag(target))
        {
            s.message = "failed to update scheduler flag";
            log::warn(s.message);
            return s;
        }
        s.flag = target;
        s.flagWritten = true;
        s.pendingRestart = true;
        s.message = std::string("scheduler updated to be ") + verbPast +
                    "; restart the host for it to take effect";
        log::info(s.message);
        return s;
    }

    const bool runnerActive = isPresent(host.schedulerRunnerActive());
    if (runnerActive != wantRunnerActive)
    {
        s.pendingRestart = true;
        s.message = std::string("scheduler is set to be ") + verbPast +
                    " but the runner has not followed; restart the host";
        log::info(s.message);
        return s;
    }

    s.message = std::string("scheduler is ") + verbPast;
    return s;
}

Status inspect(HostControl& host)
{
    const auto raw = host.readSchedulerFlag();
    Status s{};
    s.flag = decode(raw);
    if (!s.flag)
    {
        s.message = raw ? "undefined flag value " + std::to_string(*raw)
                        : "flag unreadable";
        return s;
    }

    const bool active = isPresent(host.schedulerRunnerActive());
    const bool wantActive = *s.flag == SchedulerFlag::EnabledDelayed;
    s.pendingRestart = active != wantActive;
    s.message = std::string(wantActive ? "enabled" : "disabled") +
                (active ? ", runner active" : ", runner inactive") +
                (s.pendingRestart ? " (restart pending)" : "");
    return s;
}

Status disable(HostControl& host)
{
    return transition(host, SchedulerFlag::Disabled, "shut down", false);
}

Status enable(HostControl& host)
{
    return transition(host, SchedulerFlag::EnabledDelayed, "started", true);
}

} // namespace quiesce::scheduler
