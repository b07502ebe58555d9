#include "host/procfs.hpp"

#include <signal.h>
#include <sys/prctl.h>
#include <sys/wait.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace quiesce::test
{

namespace
{

// Fork a child that renames itself to comm and waits for a signal. Returns
// once the rename is visible.
pid_t spawnNamed(const std::string& comm)
{
    int fds[2];
    if (::pipe(fds) != 0)
        return -1;

    pid_t pid = ::fork();
    if (pid == 0)
    {
        ::close(fds[0]);
        ::prctl(PR_SET_NAME, comm.c_str(), 0, 0, 0);
        char ready = 1;
        (void)::write(fds[1], &ready, 1);
        for (;;)
            ::pause();
    }

    ::close(fds[1]);
    char ready = 0;
    (void)::read(fds[0], &ready, 1);
    ::close(fds[0]);
    return pid;
}

void reap(pid_t pid)
{
    ::kill(pid, SIGKILL);
    ::waitpid(pid, nullptr, 0);
}

std::string selfComm()
{
    std::ifstream ifs("/proc/self/comm");
    std::string comm;
    std::getline(ifs, comm);
    return comm;
}

} // namespace

TEST(Procfs, CommKeyTruncatesToKernelLength)
{
    EXPECT_EQ(procfs::commKey("tracker-miner-fs-3"), "tracker-miner-f");
    EXPECT_EQ(procfs::commKey("gsd-color"), "gsd-color");
}

TEST(Procfs, StatStateFoundAfterLastParen)
{
    EXPECT_EQ(procfs::parseStatState("4242 (odd) name) T 1 4242").value_or('?'),
              'T');
    EXPECT_EQ(procfs::parseStatState("17 (two words) S 1 17").value_or('?'),
              'S');
    EXPECT_FALSE(procfs::parseStatState("17 (truncated").has_value());
    EXPECT_FALSE(procfs::parseStatState("").has_value());
}

TEST(Procfs, StoppedChildReportsAllThreadsStopped)
{
    const std::string comm = "hq-st-" + std::to_string(::getpid());
    pid_t child = spawnNamed(comm);
    ASSERT_GT(child, 0);

    EXPECT_EQ(procfs::allThreadsStopped(child), std::optional<bool>(false));

    ::kill(child, SIGSTOP);
    int status = 0;
    ASSERT_EQ(::waitpid(child, &status, WUNTRACED), child);
    ASSERT_TRUE(WIFSTOPPED(status));
    EXPECT_EQ(procfs::allThreadsStopped(child), std::optional<bool>(true));

    reap(child);
}

TEST(Procfs, MissingPidIsUnknown)
{
    EXPECT_FALSE(procfs::allThreadsStopped(-1).has_value());
    EXPECT_FALSE(procfs::exePath(-1).has_value());
    EXPECT_FALSE(procfs::ownerOf(-1).has_value());
}

TEST(Procfs, PidsByNameFindsRenamedChild)
{
    const std::string comm = "hq-pn-" + std::to_string(::getpid());
    pid_t child = spawnNamed(comm);
    ASSERT_GT(child, 0);

    auto pids = procfs::pidsByName(comm);
    ASSERT_TRUE(pids.has_value());
    EXPECT_EQ(*pids, std::vector<int>{child});

    reap(child);
}

TEST(Procfs, ExePathOfSelf)
{
    auto exe = procfs::exePath(::getpid());
    ASSERT_TRUE(exe.has_value());
    EXPECT_EQ(*exe, std::filesystem::read_symlink("/proc/self/exe").string());
}

TEST(Procfs, ReplacedBinaryLosesDeletedSuffix)
{
    const auto self = std::filesystem::read_symlink("/proc/self/exe").string();
    EXPECT_EQ(procfs::normaliseExe(self + " (deleted)").value_or(""), self);
    EXPECT_EQ(procfs::normaliseExe(self).value_or(""), self);
}

TEST(Procfs, VanishedBinaryHasNoPath)
{
    EXPECT_FALSE(
        procfs::normaliseExe("/nonexistent/host-quiesce (deleted)").has_value());
    EXPECT_FALSE(procfs::normaliseExe(" (deleted)").has_value());
}

TEST(Procfs, OwnerOfSelfIsRealIds)
{
    auto owner = procfs::ownerOf(::getpid());
    ASSERT_TRUE(owner.has_value());
    EXPECT_EQ(owner->uid, static_cast<uint32_t>(::getuid()));
    EXPECT_EQ(owner->gid, static_cast<uint32_t>(::getgid()));
}

TEST(Procfs, KillOrderFollowsNamesNotPids)
{
    const std::string tag = std::to_string(::getpid());
    const std::string firstName = "hq-a-" + tag;
    const std::string secondName = "hq-b-" + tag;

    // The lower pid gets the name that must be killed second.
    pid_t low = spawnNamed(secondName);
    pid_t high = spawnNamed(firstName);
    ASSERT_GT(low, 0);
    ASSERT_GT(high, 0);

    auto order = procfs::killOrder({firstName, secondName});
    ASSERT_TRUE(order.has_value());
    EXPECT_EQ(*order, (std::vector<int>{high, low}));

    EXPECT_TRUE(procfs::killByNames({firstName, secondName}));
    int status = 0;
    ASSERT_EQ(::waitpid(high, &status, 0), high);
    EXPECT_TRUE(WIFSIGNALED(status) && WTERMSIG(status) == SIGKILL);
    ASSERT_EQ(::waitpid(low, &status, 0), low);
    EXPECT_TRUE(WIFSIGNALED(status) && WTERMSIG(status) == SIGKILL);
}

TEST(Procfs, KillOrderSkipsSelfAndDuplicates)
{
    const std::string comm = "hq-dup-" + std::to_string(::getpid());
    pid_t child = spawnNamed(comm);
    ASSERT_GT(child, 0);

    auto order = procfs::killOrder({selfComm(), comm, comm});
    ASSERT_TRUE(order.has_value());
    for (int pid : *order)
        EXPECT_NE(pid, ::getpid());
    EXPECT_EQ(std::count(order->begin(), order->end(), child), 1);

    reap(child);
}

} // namespace quiesce::test
