#pragma once

#include "../core/owner.hpp"
#include "../core/presence.hpp"
#include "../core/shell.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace quiesce
{

// Persisted scheduler flag values.
enum class SchedulerFlag : int
{
    EnabledDelayed = 2,
    Disabled = 4,
};

// A batched launch: the targets in order, plus the one command line that
// starts them all.
struct LaunchBatch
{
    std::vector<shell::LaunchTarget> targets;
    std::string commandLine;

    std::vector<std::string> executables() const
    {
        std::vector<std::string> out;
        out.reserve(targets.size());
        for (const auto& t : targets)
            out.push_back(t.executable);
        return out;
    }
};

// Everything the quiescing logic needs from the live host. Queries never throw;
// a failed query is Presence::Unknown. Mutations return false on failure.
class HostControl
{
  public:
    virtual ~HostControl() = default;

    // ----- session -----
    virtual std::chrono::system_clock::time_point now() = 0;
    virtual std::optional<std::chrono::system_clock::time_point>
        lastLogon() = 0;
    virtual bool isElevated() = 0;

    // ----- services -----
    virtual Presence serviceExists(const std::string& name) = 0;
    virtual Presence serviceRunning(const std::string& name) = 0;
    virtual bool stopServices(const std::vector<std::string>& names) = 0;
    virtual bool startServices(const std::vector<std::string>& names) = 0;

    // ----- processes -----
    virtual Presence processExists(const std::string& name) = 0;
    // Present only when every thread of every instance is stopped.
    virtual Presence processSuspended(const std::string& name) = 0;
    virtual std::optional<std::string>
        processExecutable(const std::string& name) = 0;
    // Real uid/gid of the first instance; std::nullopt when unreadable.
    virtual std::optional<ProcessOwner>
        processOwner(const std::string& name) = 0;
    virtual bool killProcesses(const std::vector<std::string>& names) = 0;
    virtual bool launch(const LaunchBatch& batch) = 0;

    // ----- scheduler -----
    // Raw persisted value; std::nullopt when it cannot be read.
    virtual std::optional<int> readSchedulerFlag() = 0;
    virtual bool writeSchedulerFlag(SchedulerFlag value) = 0;
    virtual Presence schedulerRunnerActive() = 0;

    virtual void sleepSeconds(int sec) = 0;
};

} // namespace quiesce
