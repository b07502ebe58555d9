#pragma once

namespace quiesce::dbusconst
{

// Our service and object for the Quiesced switch.
inline constexpr const char* kQuiesceService = "xyz.openbmc_project.HostQuiesce";
inline constexpr const char* kQuiescePath = "/xyz/openbmc_project/HostQuiesce";
inline constexpr const char* kQuiesceIface =
    "xyz.openbmc_project.HostQuiesce"; // property: Quiesced (bool)

// systemd manager.
inline constexpr const char* kSystemdService = "org.freedesktop.systemd1";
inline constexpr const char* kSystemdPath = "/org/freedesktop/systemd1";
inline constexpr const char* kSystemdManagerIface =
    "org.freedesktop.systemd1.Manager";
inline constexpr const char* kSystemdUnitIface = "org.freedesktop.systemd1.Unit";

// logind.
inline constexpr const char* kLogindService = "org.freedesktop.login1";
inline constexpr const char* kLogindPath = "/org/freedesktop/login1";
inline constexpr const char* kLogindManagerIface =
    "org.freedesktop.login1.Manager";
inline constexpr const char* kLogindSessionIface =
    "org.freedesktop.login1.Session";
inline constexpr const char* kLogindUserIface = "org.freedesktop.login1.User";

// D-Bus helper well-knowns.
inline constexpr const char* kPropertiesIface =
    "org.freedesktop.DBus.Properties";

} // namespace quiesce::dbusconst
