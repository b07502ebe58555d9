#pragma once

#include "../core/owner.hpp"

#include <optional>
#include <string>
#include <vector>

namespace quiesce::procfs
{

// The kernel truncates comm to 15 characters; compare on that prefix.
std::string commKey(const std::string& name);

// State letter from one /proc/.../stat line. comm may itself contain ')' or
// spaces, so the field is located from the last ')'.
std::optional<char> parseStatState(const std::string& line);

// Pids whose comm matches name, ascending. std::nullopt when /proc cannot be
// listed.
std::optional<std::vector<int>> pidsByName(const std::string& name);

// True when every thread of pid is in state 'T' (stopped by a signal).
// std::nullopt when the task list cannot be read.
std::optional<bool> allThreadsStopped(int pid);

// A relaunchable form of an exe link target: a " (deleted)" suffix left by a
// replaced binary is dropped, and the result must exist on disk.
std::optional<std::string> normaliseExe(const std::string& target);

// Target of /proc/<pid>/exe, normalised as above.
std::optional<std::string> exePath(int pid);

// Real uid and gid from /proc/<pid>/status.
std::optional<ProcessOwner> ownerOf(int pid);

// Pids to kill for names: all pids of names[0], then names[1], and so on.
// Our own pid and duplicates are left out. std::nullopt when /proc cannot
// be listed.
std::optional<std::vector<int>> killOrder(const std::vector<std::string>& names);

// SIGKILL every process whose comm is in names, name by name in the given
// order. Returns false if any kill failed for a reason other than the
// process having already exited.
bool killByNames(const std::vector<std::string>& names);

} // namespace quiesce::procfs
