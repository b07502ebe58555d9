#include "systemd_host.hpp"

#include "../core/logging.hpp"
#include "../core/shell.hpp"
#include "../core/time_utils.hpp"
#include "../dbus/constants.hpp"
#include "procfs.hpp"

#include <sdbusplus/bus.hpp>
#include <sdbusplus/exception.hpp>
#include <sdbusplus/message.hpp>

#include <unistd.h>

#include <cstdint>
#include <cstdlib>
#include <tuple>
#include <utility>
#include <variant>

namespace quiesce
{

static sdbusplus::bus_t& bus()
{
    static sdbusplus::bus_t b = sdbusplus::bus::new_default_system();
    return b;
}

// Manager.LoadUnit → unit object path (loads the unit if it is not yet).
static std::optional<std::string> unitPath(const std::string& unit)
{
    try
    {
        auto m = bus().new_method_call(
            dbusconst::kSystemdService, dbusconst::kSystemdPath,
            dbusconst::kSystemdManagerIface, "LoadUnit");
        m.append(unit);

        sdbusplus::message::object_path path;
        auto reply = bus().call(m);
        reply.read(path);
        return path.str;
    }
    catch (const sdbusplus::exception_t& e)
    {
        log::warn("LoadUnit failed for " + unit + ": " + e.what());
        return std::nullopt;
    }
}

// Properties.Get → string.
static std::optional<std::string> getString(const char* service,
                                            const std::string& path,
                                            const char* iface,
                                            const char* prop)
{
    try
    {
        auto m = bus().new_method_call(service, path.c_str(),
                                       dbusconst::kPropertiesIface, "Get");
        m.append(iface, prop);

        std::variant<std::string> v;
        auto reply = bus().call(m);
        reply.read(v);
        return std::get<std::string>(v);
    }
    catch (const sdbusplus::exception_t& e)
    {
        log::warn("Properties.Get failed for " + path + " " + iface + "." +
                  prop + ": " + e.what());
        return std::nullopt;
    }
}

// Properties.Get → uint64 (logind timestamps are 't' in microseconds).
static std::optional<uint64_t> getUint64(const char* service,
                                         const std::string& path,
                                         const char* iface, const char* prop)
{
    try
    {
        auto m = bus().new_method_call(service, path.c_str(),
                                       dbusconst::kPropertiesIface, "Get");
        m.append(iface, prop);

        std::variant<uint64_t> v;
        auto reply = bus().call(m);
        reply.read(v);
        return std::get<uint64_t>(v);
    }
    catch (const sdbusplus::exception_t& e)
    {
        log::warn("Properties.Get failed for " + path + " " + iface + "." +
                  prop + ": " + e.what());
        return std::nullopt;
    }
}

static std::optional<std::string> unitActiveState(const std::string& unit)
{
    auto path = unitPath(unit);
    if (!path)
        return std::nullopt;
    return getString(dbusconst::kSystemdService, *path,
                      dbusconst::kSystemdUnitIface, "ActiveState");
}

static Presence activePresence(const std::optional<std::string>& state)
{
    if (!state)
        return Presence::Unknown;
    if (*state == "active" || *state == "reloading" || *state == "activating")
        return Presence::Present;
    return Presence::Absent;
}

// Logind object path for the session owning this process, or the user's.
static std::optional<std::pair<std::string, const char*>> logonObject()
{
    try
    {
        auto m = bus().new_method_call(
            dbusconst::kLogindService, dbusconst::kLogindPath,
            dbusconst::kLogindManagerIface, "GetSessionByPID");
        m.append(static_cast<uint32_t>(::getpid()));

        sdbusplus::message::object_path path;
        auto reply = bus().call(m);
        reply.read(path);
        return std::make_pair(path.str, dbusconst::kLogindSessionIface);
    }
    catch (const sdbusplus::exception_t& e)
    {
        log::warn(std::string("GetSessionByPID failed: ") + e.what() +
                  "; falling back to user record");
    }

    uint32_t uid = static_cast<uint32_t>(::getuid());
    if (const char* sudoUid = std::getenv("SUDO_UID"))
    {
        try
        {
            uid = static_cast<uint32_t>(std::stoul(sudoUid));
        }
        catch (const std::exception&)
        {
            log::warn(std::string("ignoring malformed SUDO_UID=") + sudoUid);
        }
    }

    try
    {
        auto m = bus().new_method_call(
            dbusconst::kLogindService, dbusconst::kLogindPath,
            dbusconst::kLogindManagerIface, "GetUser");
        m.append(uid);

        sdbusplus::message::object_path path;
        auto reply = bus().call(m);
        reply.read(path);
        return std::make_pair(path.str, dbusconst::kLogindUserIface);
    }
    catch (const sdbusplus::exception_t& e)
    {
        log::warn("GetUser(" + std::to_string(uid) + ") failed: " + e.what());
        return std::nullopt;
    }
}

SystemdHost::SystemdHost(std::string schedulerUnit) :
    schedulerUnit(std::move(schedulerUnit))
{}

std::chrono::system_clock::time_point SystemdHost::now()
{
    return std::chrono::system_clock::now();
}

std::optional<std::chrono::system_clock::time_point> SystemdHost::lastLogon()
{
    auto obj = logonObject();
    if (!obj)
        return std::nullopt;

    auto usec = getUint64(dbusconst::kLogindService, obj->first, obj->second,
                          "Timestamp");
    if (!usec || *usec == 0)
        return std::nullopt;

    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::microseconds(*usec)));
}

bool SystemdHost::isElevated()
{
    return ::geteuid() == 0;
}

Presence SystemdHost::serviceExists(const std::string& name)
{
    auto path = unitPath(name);
    if (!path)
        return Presence::Unknown;
    auto load = getString(dbusconst::kSystemdService, *path,
                          dbusconst::kSystemdUnitIface, "LoadState");
    if (!load)
        return Presence::Unknown;
    return (*load == "not-found" || *load == "masked") ? Presence::Absent
                                                       : Presence::Present;
}

Presence SystemdHost::serviceRunning(const std::string& name)
{
    return activePresence(unitActiveState(name));
}

bool SystemdHost::stopServices(const std::vector<std::string>& names)
{
    if (names.empty())
        return true;
    return shell::run(shell::joinCommand("systemctl", "stop", names));
}

bool SystemdHost::startServices(const std::vector<std::string>& names)
{
    if (names.empty())
        return true;
    return shell::run(shell::joinCommand("systemctl", "start", names));
}

Presence SystemdHost::processExists(const std::string& name)
{
    auto pids = procfs::pidsByName(name);
    if (!pids)
        return Presence::Unknown;
    return pids->empty() ? Presence::Absent : Presence::Present;
}

Presence SystemdHost::processSuspended(const std::string& name)
{
    auto pids = procfs::pidsByName(name);
    if (!pids)
        return Presence::Unknown;
    if (pids->empty())
        return Presence::Absent;

    for (int pid : *pids)
    {
        auto stopped = procfs::allThreadsStopped(pid);
        if (!stopped)
            return Presence::Unknown;
        if (!*stopped)
            return Presence::Absent;
    }
    return Presence::Present;
}

std::optional<ProcessOwner> SystemdHost::processOwner(const std::string& name)
{
    auto pids = procfs::pidsByName(name);
    if (!pids)
        return std::nullopt;
    for (int pid : *pids)
    {
        if (auto owner = procfs::ownerOf(pid))
            return owner;
    }
    return std::nullopt;
}

std::optional<std::string> SystemdHost::processExecutable(
    const std::string& name)
{
    auto pids = procfs::pidsByName(name);
    if (!pids)
        return std::nullopt;
    for (int pid : *pids)
    {
        if (auto exe = procfs::exePath(pid))
            return exe;
    }
    return std::nullopt;
}

bool SystemdHost::killProcesses(const std::vector<std::string>& names)
{
    if (names.empty())
        return true;
    return procfs::killByNames(names);
}

bool SystemdHost::launch(const LaunchBatch& batch)
{
    if (batch.commandLine.empty())
        return true;
    return shell::run(batch.commandLine);
}

std::optional<int> SystemdHost::readSchedulerFlag()
{
    try
    {
        auto m = bus().new_method_call(
            dbusconst::kSystemdService, dbusconst::kSystemdPath,
            dbusconst::kSystemdManagerIface, "GetUnitFileState");
        m.append(schedulerUnit);

        std::string state;
        auto reply = bus().call(m);
        reply.read(state);

        if (state == "enabled")
            return static_cast<int>(SchedulerFlag::EnabledDelayed);
        if (state == "disabled")
            return static_cast<int>(SchedulerFlag::Disabled);

        log::warn(schedulerUnit + " unit file state not two-valued: " + state);
        return std::nullopt;
    }
    catch (const sdbusplus::exception_t& e)
    {
        log::warn("GetUnitFileState failed for " + schedulerUnit + ": " +
                  e.what());
        return std::nullopt;
    }
}

bool SystemdHost::writeSchedulerFlag(SchedulerFlag value)
{
    using Change = std::tuple<std::string, std::string, std::string>;
    const std::vector<std::string> files = {schedulerUnit};

    try
    {
        if (value == SchedulerFlag::EnabledDelayed)
        {
            auto m = bus().new_method_call(
                dbusconst::kSystemdService, dbusconst::kSystemdPath,
                dbusconst::kSystemdManagerIface, "EnableUnitFiles");
            m.append(files, false, false);

            bool carriesInstallInfo = false;
            std::vector<Change> changes;
            auto reply = bus().call(m);
            reply.read(carriesInstallInfo, changes);
        }
        else
        {
            auto m = bus().new_method_call(
                dbusconst::kSystemdService, dbusconst::kSystemdPath,
                dbusconst::kSystemdManagerIface, "DisableUnitFiles");
            m.append(files, false);

            std::vector<Change> changes;
            auto reply = bus().call(m);
            reply.read(changes);
        }

        auto reload = bus().new_method_call(
            dbusconst::kSystemdService, dbusconst::kSystemdPath,
            dbusconst::kSystemdManagerIface, "Reload");
        (void)bus().call(reload);
        return true;
    }
    catch (const sdbusplus::exception_t& e)
    {
        log::warn("unit file update failed for " + schedulerUnit + ": " +
                  e.what());
        return false;
    }
}

Presence SystemdHost::schedulerRunnerActive()
{
    return activePresence(unitActiveState(schedulerUnit));
}

void SystemdHost::sleepSeconds(int sec)
{
    timeutil::sleepSeconds(sec);
}

} // namespace quiesce
