#pragma once

#include <cstdint>

namespace quiesce
{

// Real uid/gid a process ran under, so it can be relaunched as the same user.
struct ProcessOwner
{
    uint32_t uid{};
    uint32_t gid{};
};

inline bool operator==(const ProcessOwner& a, const ProcessOwner& b)
{
    return a.uid == b.uid && a.gid == b.gid;
}

} // namespace quiesce
