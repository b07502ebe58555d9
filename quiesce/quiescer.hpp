#pragma once

#include "../config/config.hpp"
#include "../core/outcome.hpp"
#include "../host/host_control.hpp"
#include "../inventory/snapshot.hpp"
#include "../restore/restorer.hpp"

namespace quiesce
{

// Usage around a noise-sensitive workload:
//
//   auto snap = q.disable();
//   if (!snap.ok()) ...;          // nothing was quiesced
//   runWorkload();
//   auto done = q.enable(snap.value());
//
// One session owns the host at a time; concurrent calls are not supported.
class Quiescer
{
  public:
    Quiescer(HostControl& host, Config cfg);

    Outcome<Snapshot> disable();
    // Consumes the snapshot unless refused by the guard, so a refused call
    // can be retried once the host is ready.
    Outcome<RestoreReport> enable(Snapshot& snapshot);

    const Config& config() const
    {
        return cfg;
    }

  private:
    HostControl& host;
    Config cfg;
};

} // namespace quiesce
