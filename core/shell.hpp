#pragma once

#include "owner.hpp"

#include <optional>
#include <string>
#include <vector>

namespace quiesce::shell
{

struct LaunchTarget
{
    std::string executable;
    std::optional<ProcessOwner> owner; // unset or uid 0: run as ourselves
};

// Single-quote a word for /bin/sh; embedded quotes become '\''. Nothing
// inside the result is interpreted, newlines included.
std::string escape(const std::string& word);

// "<tool> <verb> a b c" with every argument quoted.
std::string joinCommand(const std::string& tool, const std::string& verb,
                        const std::vector<std::string>& args);

// One command line that launches every target detached, in order, dropping
// to the recorded owner where there is one. Exits non-zero if any target is
// missing or could not be started.
std::string launchCommand(const std::vector<LaunchTarget>& targets);

// Run through /bin/sh. Returns true on exit status 0.
bool run(const std::string& cmd);

} // namespace quiesce::shell
