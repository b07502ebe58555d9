#include "config/config.hpp"
#include "core/logging.hpp"
#include "core/shell.hpp"
#include "dbus/constants.hpp"
#include "guard/precondition_guard.hpp"
#include "host/systemd_host.hpp"
#include "quiesce/quiescer.hpp"
#include "quiesce/snapshot_io.hpp"
#include "scheduler/scheduler_toggle.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <sdbusplus/asio/connection.hpp>
#include <sdbusplus/asio/object_server.hpp>
#include <sdbusplus/bus/match.hpp> // keep this; avoid rules.hpp

#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace
{

constexpr const char* kDefaultConfig =
    "/usr/share/host-quiesce/configs/quiesce.json";
constexpr const char* kDefaultSnapshot = "/var/lib/host-quiesce/snapshot.json";

struct Args
{
    std::string configPath{kDefaultConfig};
    std::string snapshotPath{kDefaultSnapshot};
    std::string mode{"daemon"};
    std::vector<std::string> workload;
};

void usage()
{
    std::cerr
        << "usage: host-quiesce [-c config.json] [-s snapshot.json] MODE\n"
        << "  run -- CMD...  quiesce, run CMD, restore\n"
        << "  disable        quiesce and save the snapshot\n"
        << "  enable         restore from the saved snapshot\n"
        << "  status         show guard and scheduler state\n"
        << "  daemon         serve the Quiesced switch on D-Bus (default)\n";
}

std::optional<Args> parseArgs(int argc, char** argv)
{
    Args a{};
    bool haveMode = false;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if ((arg == "-c" || arg == "-s") && i + 1 < argc)
        {
            (arg == "-c" ? a.configPath : a.snapshotPath) = argv[++i];
        }
        else if (arg == "-h" || arg == "--help")
        {
            return std::nullopt;
        }
        else if (arg == "--" && haveMode)
        {
            for (++i; i < argc; ++i)
                a.workload.emplace_back(argv[i]);
        }
        else if (!haveMode && arg[0] != '-')
        {
            a.mode = arg;
            haveMode = true;
        }
        else
        {
            std::cerr << "[quiesce] unexpected argument: " << arg << "\n";
            return std::nullopt;
        }
    }
    if (a.mode == "run" && a.workload.empty())
    {
        std::cerr << "[quiesce] run needs a workload after --\n";
        return std::nullopt;
    }
    return a;
}

void reportCancel(const quiesce::Cancelled& c)
{
    std::cerr << "[quiesce] cancelled (" << quiesce::toString(c.reason)
              << "): " << c.message << "\n";
}

int reportRestore(const quiesce::Outcome<quiesce::RestoreReport>& out)
{
    if (!out.ok())
    {
        reportCancel(out.cancelled());
        return 1;
    }
    const auto& r = out.value();
    if (r.schedulerPendingRestart())
        std::cerr << "[quiesce] " << r.scheduler.message << "\n";
    return r.success() ? 0 : 1;
}

int runWorkload(quiesce::Quiescer& q, const std::vector<std::string>& cmd)
{
    auto snap = q.disable();
    if (!snap.ok())
    {
        reportCancel(snap.cancelled());
        return 2;
    }

    std::string line = quiesce::shell::escape(cmd.front());
    for (size_t i = 1; i < cmd.size(); ++i)
        line += " " + quiesce::shell::escape(cmd[i]);

    quiesce::log::info("running workload: " + line);
    const bool workloadOk = quiesce::shell::run(line);

    int rc = reportRestore(q.enable(snap.value()));
    return workloadOk ? rc : 3;
}

int disableToFile(quiesce::Quiescer& q, const std::string& path)
{
    auto snap = q.disable();
    if (!snap.ok())
    {
        reportCancel(snap.cancelled());
        return 2;
    }
    if (!quiesce::snapshotio::save(path, snap.value()))
    {
        // Without the file nothing could be restored later; undo now.
        std::cerr << "[quiesce] snapshot not saved; restoring immediately\n";
        (void)reportRestore(q.enable(snap.value()));
        return 1;
    }
    std::cerr << "[quiesce] snapshot saved to " << path << "\n";
    return 0;
}

int enableFromFile(quiesce::Quiescer& q, const std::string& path)
{
    auto snap = quiesce::snapshotio::load(path);
    if (!snap)
        return 1;

    auto out = q.enable(*snap);
    if (out.ok())
        (void)quiesce::snapshotio::discard(path);
    return reportRestore(out);
}

int status(quiesce::HostControl& host, const quiesce::Config& cfg)
{
    auto v = quiesce::guard::evaluate(host, cfg.basic.warmupMinutes);
    std::cout << "guard: " << (v.ok ? "ready" : v.message) << "\n";
    auto s = quiesce::scheduler::inspect(host);
    std::cout << "scheduler " << cfg.scheduler.unit << ": " << s.message
              << "\n";
    return 0;
}

int serve(quiesce::Quiescer& q)
{
    boost::asio::io_context io;
    auto conn = std::make_shared<sdbusplus::asio::connection>(io);
    conn->request_name(quiesce::dbusconst::kQuiesceService);

    sdbusplus::asio::object_server server(conn);
    auto iface = server.add_interface(quiesce::dbusconst::kQuiescePath,
                                      quiesce::dbusconst::kQuiesceIface);

    bool quiesced = false;
    bool running = false; // re-entrancy guard
    std::optional<quiesce::Snapshot> held;

    iface->register_property("Quiesced", quiesced,
                             sdbusplus::asio::PropertyPermission::readWrite);
    iface->initialize();

    // Publish the real state back, e.g. after a cancelled request.
    auto publish = [&](bool value) {
        try
        {
            quiesced = value;
            iface->set_property("Quiesced", quiesced);
        }
        catch (const std::exception& e)
        {
            std::cerr << "[quiesce] WARN: set Quiesced failed: " << e.what()
                      << "\n";
        }
    };

    auto doDisable = [&]() {
        if (running || held)
            return;
        running = true;
        auto snap = q.disable();
        if (snap.ok())
            held.emplace(std::move(snap.value()));
        else
            reportCancel(snap.cancelled());
        running = false;
        publish(held.has_value());
    };

    auto doEnable = [&]() {
        if (running || !held)
            return;
        running = true;
        auto out = q.enable(*held);
        if (out.ok() || !held->valid())
            held.reset();
        (void)reportRestore(out);
        running = false;
        publish(held.has_value());
    };

    auto& rawbus = static_cast<sdbusplus::bus_t&>(*conn);
    const std::string matchRule =
        "type='signal',"
        "interface='org.freedesktop.DBus.Properties',"
        "member='PropertiesChanged',"
        "path='" +
        std::string(quiesce::dbusconst::kQuiescePath) + "'";

    sdbusplus::bus::match_t matcher(
        rawbus, matchRule.c_str(), [&](sdbusplus::message_t& msg) {
            std::string ifaceName;
            std::map<std::string,
                     std::variant<bool, int64_t, double, std::string>>
                changed;
            std::vector<std::string> invalidated;
            try
            {
                // Signature: sa{sv}as
                msg.read(ifaceName, changed, invalidated);
            }
            catch (const std::exception& e)
            {
                std::cerr << "[quiesce] match read error: " << e.what()
                          << "\n";
                return;
            }

            if (ifaceName != quiesce::dbusconst::kQuiesceIface)
                return;

            auto it = changed.find("Quiesced");
            if (it == changed.end())
                return;

            if (auto pval = std::get_if<bool>(&it->second))
            {
                if (running)
                {
                    std::cerr << "[quiesce] transition in progress; ignored\n";
                    return;
                }
                if (*pval && !held)
                    boost::asio::post(io, doDisable);
                else if (!*pval && held)
                    boost::asio::post(io, doEnable);
            }
        });

    quiesce::log::info("serving " +
                       std::string(quiesce::dbusconst::kQuiescePath));
    io.run();
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    auto args = parseArgs(argc, argv);
    if (!args)
    {
        usage();
        return 64;
    }

    quiesce::Config cfg;
    try
    {
        cfg = quiesce::loadConfigFromJsonFile(args->configPath);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[quiesce] Config error: " << e.what() << "\n";
        return 1;
    }
    quiesce::log::setJournal(cfg.basic.journalPath);

    quiesce::SystemdHost host(cfg.scheduler.unit);

    if (args->mode == "status")
        return status(host, cfg);

    quiesce::Quiescer q(host, cfg);
    if (args->mode == "run")
        return runWorkload(q, args->workload);
    if (args->mode == "disable")
        return disableToFile(q, args->snapshotPath);
    if (args->mode == "enable")
        return enableFromFile(q, args->snapshotPath);
    if (args->mode == "daemon")
        return serve(q);

    usage();
    return 64;
}
