#pragma once

#include "host_control.hpp"

#include <string>

namespace quiesce
{

// Live Linux host: systemd and logind over D-Bus, processes through /proc,
// batched mutations through systemctl and /bin/sh.
class SystemdHost : public HostControl
{
  public:
    explicit SystemdHost(std::string schedulerUnit);

    std::chrono::system_clock::time_point now() override;
    std::optional<std::chrono::system_clock::time_point> lastLogon() override;
    bool isElevated() override;

    Presence serviceExists(const std::string& name) override;
    Presence serviceRunning(const std::string& name) override;
    bool stopServices(const std::vector<std::string>& names) override;
    bool startServices(const std::vector<std::string>& names) override;

    Presence processExists(const std::string& name) override;
    Presence processSuspended(const std::string& name) override;
    std::optional<std::string>
        processExecutable(const std::string& name) override;
    std::optional<ProcessOwner>
        processOwner(const std::string& name) override;
    bool killProcesses(const std::vector<std::string>& names) override;
    bool launch(const LaunchBatch& batch) override;

    std::optional<int> readSchedulerFlag() override;
    bool writeSchedulerFlag(SchedulerFlag value) override;
    Presence schedulerRunnerActive() override;

    void sleepSeconds(int sec) override;

  private:
    std::string schedulerUnit;
};

} // namespace quiesce
