#pragma once

#include <chrono>
#include <thread>

namespace quiesce::timeutil
{

inline void sleepSeconds(int sec)
{
    std::this_thread::sleep_for(std::chrono::seconds(sec));
}

// Whole minutes needed to cover d, rounded up. Non-positive -> 0.
inline long ceilMinutes(std::chrono::seconds d)
{
    if (d.count() <= 0)
        return 0;
    return static_cast<long>((d.count() + 59) / 60);
}

} // namespace quiesce::timeutil
