#include "precondition_guard.hpp"

#include "../core/logging.hpp"
#include "../core/time_utils.hpp"

#include <chrono>

namespace quiesce::guard
{

std::string formatWait(long minutes)
{
    return std::to_string(minutes) +
           (minutes == 1 ? " more minute" : " more minutes");
}

Verdict evaluate(HostControl& host, int warmupMinutes)
{
    Verdict v{};

    auto logon = host.lastLogon();
    if (!logon)
    {
        v.message = "cannot determine last logon time; refusing to touch "
                    "services";
        return v;
    }

    const auto window = std::chrono::minutes(warmupMinutes);
    const auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(
        host.now() - *logon);
    if (elapsed < window)
    {
        v.minutesRemaining = timeutil::ceilMinutes(
            std::chrono::duration_cast<std::chrono::seconds>(window) -
            elapsed);
        v.message = "services may still be starting after logon; please wait " +
                    formatWait(v.minutesRemaining) + " and try again";
        return v;
    }

    if (!host.isElevated())
    {
        v.message = "administrator privileges required; re-run as root";
        return v;
    }

    v.ok = true;
    return v;
}

bool check(HostControl& host, int warmupMinutes)
{
    auto v = evaluate(host, warmupMinutes);
    if (!v.ok)
        log::info(v.message);
    return v.ok;
}

} // namespace quiesce::guard
