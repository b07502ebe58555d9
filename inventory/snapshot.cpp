#include "snapshot.hpp"

#include <utility>

namespace quiesce
{

Snapshot::Snapshot(std::vector<ServiceRecord> services,
                   std::vector<ProcessRecord> processes) :
    svc(std::move(services)), proc(std::move(processes))
{}

Snapshot::Snapshot(Snapshot&& other) noexcept :
    svc(std::move(other.svc)), proc(std::move(other.proc)), live(other.live)
{
    other.svc.clear();
    other.proc.clear();
    other.live = false;
}

Snapshot& Snapshot::operator=(Snapshot&& other) noexcept
{
    if (this != &other)
    {
        svc = std::move(other.svc);
        proc = std::move(other.proc);
        live = other.live;
        other.svc.clear();
        other.proc.clear();
        other.live = false;
    }
    return *this;
}

} // namespace quiesce
