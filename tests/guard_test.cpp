#include "guard/precondition_guard.hpp"

#include "fake_host.hpp"

#include <gtest/gtest.h>

namespace quiesce::test
{
using namespace std::chrono_literals;

TEST(Guard, FormatWait_SingularAndPlural)
{
    EXPECT_EQ(guard::formatWait(1), "1 more minute");
    EXPECT_EQ(guard::formatWait(2), "2 more minutes");
    EXPECT_EQ(guard::formatWait(5), "5 more minutes");
}

TEST(Guard, ReadyAfterWarmupAndElevated)
{
    FakeHost host;
    host.logon = host.clock - 5min;
    auto v = guard::evaluate(host, 5);
    EXPECT_TRUE(v.ok);
    EXPECT_TRUE(guard::check(host, 5));
}

TEST(Guard, OneMinuteAfterLogon_RefusesWithFourMinutesLeft)
{
    FakeHost host;
    host.logon = host.clock - 1min;
    auto v = guard::evaluate(host, 5);
    EXPECT_FALSE(v.ok);
    EXPECT_EQ(v.minutesRemaining, 4);
    EXPECT_NE(v.message.find("4 more minutes"), std::string::npos);
}

TEST(Guard, PartialMinuteRoundsUp)
{
    FakeHost host;
    host.logon = host.clock - 4min - 30s;
    auto v = guard::evaluate(host, 5);
    EXPECT_FALSE(v.ok);
    EXPECT_EQ(v.minutesRemaining, 1);
    EXPECT_NE(v.message.find("1 more minute "), std::string::npos);
}

TEST(Guard, NotElevated_Refuses)
{
    FakeHost host;
    host.elevated = false;
    auto v = guard::evaluate(host, 5);
    EXPECT_FALSE(v.ok);
    EXPECT_EQ(v.minutesRemaining, 0);
    EXPECT_FALSE(guard::check(host, 5));
}

TEST(Guard, UnknownLogon_FailsClosed)
{
    FakeHost host;
    host.logon.reset();
    EXPECT_FALSE(guard::check(host, 5));
}

TEST(Guard, NeverMutates)
{
    FakeHost host;
    host.logon = host.clock - 1min;
    (void)guard::check(host, 5);
    host.elevated = false;
    host.logon = host.clock - 1h;
    (void)guard::check(host, 5);
    EXPECT_EQ(host.mutations(), 0u);
}

} // namespace quiesce::test
