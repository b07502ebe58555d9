#pragma once

#include <string>
#include <utility>
#include <variant>

namespace quiesce
{

enum class CancelReason
{
    GuardRefused,           // too soon after logon, or not elevated
    PendingRestart,         // scheduler flag persisted, needs a host restart
    UndefinedSchedulerFlag, // flag unreadable or holds an unexpected value
    SchedulerWriteFailed,   // flag could not be persisted
    InvalidSnapshot,        // snapshot already consumed or moved from
};

inline const char* toString(CancelReason r)
{
    switch (r)
    {
        case CancelReason::GuardRefused:
            return "guard refused";
        case CancelReason::PendingRestart:
            return "pending restart";
        case CancelReason::UndefinedSchedulerFlag:
            return "undefined scheduler flag";
        case CancelReason::SchedulerWriteFailed:
            return "scheduler write failed";
        case CancelReason::InvalidSnapshot:
            return "invalid snapshot";
    }
    return "cancelled";
}

struct Cancelled
{
    CancelReason reason;
    std::string message;
};

// Either a value or an explicit cancellation; callers must check ok().
template <typename T>
class Outcome
{
  public:
    Outcome(T value) : v(std::move(value)) {}
    Outcome(Cancelled c) : v(std::move(c)) {}

    bool ok() const
    {
        return std::holds_alternative<T>(v);
    }

    T& value()
    {
        return std::get<T>(v);
    }

    const T& value() const
    {
        return std::get<T>(v);
    }

    const Cancelled& cancelled() const
    {
        return std::get<Cancelled>(v);
    }

  private:
    std::variant<T, Cancelled> v;
};

} // namespace quiesce
