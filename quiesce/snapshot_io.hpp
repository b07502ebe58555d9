#pragma once

#include "../inventory/snapshot.hpp"

#include <optional>
#include <string>

namespace quiesce::snapshotio
{

// Write snapshot as JSON, creating parent directories. False on I/O error.
bool save(const std::string& path, const Snapshot& snapshot);

// Read a snapshot written by save(). std::nullopt if missing or malformed.
std::optional<Snapshot> load(const std::string& path);

// Delete a consumed snapshot file so it cannot drive a second restore.
bool discard(const std::string& path);

} // namespace quiesce::snapshotio
