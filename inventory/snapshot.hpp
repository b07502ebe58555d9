#pragma once

#include "../core/owner.hpp"

#include <optional>
#include <string>
#include <vector>

namespace quiesce
{

struct ServiceRecord
{
    std::string name;
    bool existed{};
    bool wasRunning{};
};

struct ProcessRecord
{
    std::string name;
    bool existed{};
    bool wasSuspended{};
    std::optional<std::string> executablePath; // only for existing processes
    std::optional<ProcessOwner> owner;         // relaunch as this user
};

// Pre-shutdown record handed from disable() to enable(). Single use: it can
// be moved but not copied, and the moved-from object is no longer valid.
class Snapshot
{
  public:
    Snapshot(std::vector<ServiceRecord> services,
             std::vector<ProcessRecord> processes);

    Snapshot(const Snapshot&) = delete;
    Snapshot& operator=(const Snapshot&) = delete;
    Snapshot(Snapshot&& other) noexcept;
    Snapshot& operator=(Snapshot&& other) noexcept;
    ~Snapshot() = default;

    bool valid() const
    {
        return live;
    }

    const std::vector<ServiceRecord>& services() const
    {
        return svc;
    }

    const std::vector<ProcessRecord>& processes() const
    {
        return proc;
    }

    // Mark as spent; further enable() calls are refused.
    void consume()
    {
        live = false;
    }

  private:
    std::vector<ServiceRecord> svc;
    std::vector<ProcessRecord> proc;
    bool live{true};
};

} // namespace quiesce
