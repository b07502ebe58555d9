#pragma once

#include <string>
#include <vector>

namespace quiesce
{

struct BasicSettings
{
    int warmupMinutes{5}; // minimum time since logon before mutating
    std::string journalPath{"/var/lib/host-quiesce/log/quiesce.log"};
};

// Service whose stop kicks off a long asynchronous teardown elsewhere.
struct SlowService
{
    std::string name; // empty: no slow service
    int delaySec{90};
};

struct ProcessEntry
{
    std::string name;
    std::vector<std::string> spawns; // catalog members this one starts
};

struct SchedulerSettings
{
    std::string unit{"cron.service"};
};

struct Config
{
    BasicSettings basic;
    std::vector<std::string> services;
    SlowService slowService;
    std::vector<ProcessEntry> processes; // order is spawn order
    SchedulerSettings scheduler;
};

// Load from file (JSON). Throws std::runtime_error on hard schema issues.
Config loadConfigFromJsonFile(const std::string& jsonPath);

// Same, from an in-memory document.
Config loadConfigFromJsonText(const std::string& text);

} // namespace quiesce
