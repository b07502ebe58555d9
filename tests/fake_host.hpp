#pragma once

#include "host/host_control.hpp"

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace quiesce::test
{

// Deterministic in-memory host. Every mutating call is recorded.
class FakeHost : public HostControl
{
  public:
    struct Service
    {
        bool exists{true};
        bool running{};
        bool queryFails{};
    };

    struct Process
    {
        bool running{};
        bool suspended{};
        std::string exe;
        bool queryFails{};
        std::vector<std::string> spawns; // names started alongside this one
        std::optional<ProcessOwner> owner;
    };

    // ----- state -----
    std::chrono::system_clock::time_point clock{
        std::chrono::system_clock::from_time_t(1700000000)};
    std::optional<std::chrono::system_clock::time_point> logon{
        clock - std::chrono::hours(1)};
    bool elevated{true};

    std::map<std::string, Service> services;
    std::map<std::string, Process> processes;

    std::optional<int> flag{static_cast<int>(SchedulerFlag::Disabled)};
    bool runnerActive{};
    bool flagWriteFails{};
    bool serviceStartFails{};

    // ----- recorded calls -----
    std::vector<std::vector<std::string>> stopCalls;
    std::vector<std::vector<std::string>> startCalls;
    std::vector<std::vector<std::string>> killCalls;
    std::vector<LaunchBatch> launchCalls;
    std::vector<SchedulerFlag> flagWrites;
    std::vector<int> sleeps;

    size_t mutations() const
    {
        return stopCalls.size() + startCalls.size() + killCalls.size() +
               launchCalls.size() + flagWrites.size();
    }

    std::vector<std::string> runningServices() const
    {
        std::vector<std::string> out;
        for (const auto& [name, s] : services)
        {
            if (s.exists && s.running)
                out.push_back(name);
        }
        return out;
    }

    std::vector<std::string> runningProcesses() const
    {
        std::vector<std::string> out;
        for (const auto& [name, p] : processes)
        {
            if (p.running)
                out.push_back(name);
        }
        return out;
    }

    // ----- HostControl -----
    std::chrono::system_clock::time_point now() override
    {
        return clock;
    }

    std::optional<std::chrono::system_clock::time_point> lastLogon() override
    {
        return logon;
    }

    bool isElevated() override
    {
        return elevated;
    }

    Presence serviceExists(const std::string& name) override
    {
        auto it = services.find(name);
        if (it == services.end())
            return Presence::Absent;
        if (it->second.queryFails)
            return Presence::Unknown;
        return it->second.exists ? Presence::Present : Presence::Absent;
    }

    Presence serviceRunning(const std::string& name) override
    {
        auto it = services.find(name);
        if (it == services.end() || !it->second.exists)
            return Presence::Absent;
        if (it->second.queryFails)
            return Presence::Unknown;
        return it->second.running ? Presence::Present : Presence::Absent;
    }

    bool stopServices(const std::vector<std::string>& names) override
    {
        stopCalls.push_back(names);
        for (const auto& n : names)
            services[n].running = false;
        return true;
    }

    bool startServices(const std::vector<std::string>& names) override
    {
        startCalls.push_back(names);
        if (serviceStartFails)
            return false;
        for (const auto& n : names)
            services[n].running = true;
        return true;
    }

    Presence processExists(const std::string& name) override
    {
        auto it = processes.find(name);
        if (it == processes.end())
            return Presence::Absent;
        if (it->second.queryFails)
            return Presence::Unknown;
        return it->second.running ? Presence::Present : Presence::Absent;
    }

    Presence processSuspended(const std::string& name) override
    {
        auto it = processes.find(name);
        if (it == processes.end() || !it->second.running)
            return Presence::Absent;
        return it->second.suspended ? Presence::Present : Presence::Absent;
    }

    std::optional<std::string> processExecutable(const std::string& name) override
    {
        auto it = processes.find(name);
        if (it == processes.end() || !it->second.running ||
            it->second.exe.empty())
            return std::nullopt;
        return it->second.exe;
    }

    std::optional<ProcessOwner> processOwner(const std::string& name) override
    {
        auto it = processes.find(name);
        if (it == processes.end() || !it->second.running)
            return std::nullopt;
        return it->second.owner;
    }

    bool killProcesses(const std::vector<std::string>& names) override
    {
        killCalls.push_back(names);
        for (const auto& n : names)
            processes[n].running = false;
        return true;
    }

    bool launch(const LaunchBatch& batch) override
    {
        launchCalls.push_back(batch);
        for (const auto& exe : batch.executables())
        {
            for (auto& [name, p] : processes)
            {
                if (p.exe != exe)
                    continue;
                p.running = true;
                for (const auto& child : p.spawns)
                    processes[child].running = true;
            }
        }
        return true;
    }

    std::optional<int> readSchedulerFlag() override
    {
        return flag;
    }

    bool writeSchedulerFlag(SchedulerFlag value) override
    {
        flagWrites.push_back(value);
        if (flagWriteFails)
            return false;
        flag = static_cast<int>(value);
        return true;
    }

    Presence schedulerRunnerActive() override
    {
        return runnerActive ? Presence::Present : Presence::Absent;
    }

    void sleepSeconds(int sec) override
    {
        sleeps.push_back(sec);
    }
};

} // namespace quiesce::test
