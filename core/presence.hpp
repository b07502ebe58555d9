#pragma once

namespace quiesce
{

// Outcome of a single host query. Unknown means the query itself failed.
enum class Presence
{
    Present,
    Absent,
    Unknown,
};

// Failed queries degrade to the negative answer.
inline bool isPresent(Presence p)
{
    return p == Presence::Present;
}

inline const char* toString(Presence p)
{
    switch (p)
    {
        case Presence::Present:
            return "present";
        case Presence::Absent:
            return "absent";
        case Presence::Unknown:
            return "unknown";
    }
    return "unknown";
}

} // namespace quiesce
