#pragma once
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>

namespace quiesce::log
{

inline std::string nowIso()
{
    using namespace std::chrono;
    auto t = system_clock::now();
    std::time_t tt = system_clock::to_time_t(t);
    std::tm tm = *std::gmtime(&tt);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Append a timestamped line to the given path, creating directories as needed.
inline void appendLine(const std::string& path, const std::string& line)
{
    std::error_code ec;
    std::filesystem::create_directories(
        std::filesystem::path(path).parent_path(), ec);
    std::ofstream f(path, std::ios::app);
    if (!f.good())
        return;
    f << nowIso() << " " << line << "\n";
}

// Journal file mirrored by info()/warn(). Empty disables the mirror.
inline std::string& journalPath()
{
    static std::string path;
    return path;
}

inline void setJournal(const std::string& path)
{
    journalPath() = path;
}

inline void info(const std::string& line)
{
    std::cerr << "[quiesce] " << line << "\n";
    if (!journalPath().empty())
        appendLine(journalPath(), line);
}

inline void warn(const std::string& line)
{
    info("WARN: " + line);
}

} // namespace quiesce::log
