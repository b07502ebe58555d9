#include "core/logging.hpp"
#include "host/procfs.hpp"

#include <unistd.h>

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace quiesce::test
{

namespace
{

class JournalFixture : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        path = (std::filesystem::temp_directory_path() /
                ("host_quiesce_journal_" + std::to_string(::getpid())) /
                "quiesce.log")
                   .string();
        std::filesystem::remove(path);
        log::setJournal(path);
    }

    void TearDown() override
    {
        log::setJournal("");
        std::filesystem::remove_all(std::filesystem::path(path).parent_path());
    }

    std::string journal() const
    {
        std::ifstream ifs(path);
        std::stringstream ss;
        ss << ifs.rdbuf();
        return ss.str();
    }

    std::string path;
};

} // namespace

TEST_F(JournalFixture, WarnIsMirroredWithPrefix)
{
    log::warn("scheduler flag unreadable");
    EXPECT_NE(journal().find("WARN: scheduler flag unreadable"),
              std::string::npos);
}

TEST_F(JournalFixture, BackendFailuresReachJournal)
{
    EXPECT_FALSE(
        procfs::normaliseExe("/nonexistent/helper (deleted)").has_value());
    EXPECT_NE(journal().find("WARN: executable /nonexistent/helper (deleted)"),
              std::string::npos);
}

TEST_F(JournalFixture, EmptyPathDisablesMirror)
{
    log::setJournal("");
    log::info("not mirrored");
    EXPECT_FALSE(std::filesystem::exists(path));
}

} // namespace quiesce::test
