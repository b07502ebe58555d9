#pragma once

#include "../host/host_control.hpp"

#include <string>

namespace quiesce::guard
{

struct Verdict
{
    bool ok{};
    long minutesRemaining{}; // > 0 only when refused for the warm-up window
    std::string message;
};

// "1 more minute", "3 more minutes".
std::string formatWait(long minutes);

// Pure evaluation; touches nothing but read-only host queries.
Verdict evaluate(HostControl& host, int warmupMinutes);

// Evaluate once and log the refusal reason. No retries.
bool check(HostControl& host, int warmupMinutes);

} // namespace quiesce::guard
