#include "config/Config.hpp"
#include "control/Server.hpp"
#include "daemon/Daemon.hpp"
#include "log/Registry.hpp"
#include "runtime/Context.hpp"
#include "sync/Reconciler.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

using namespace fa;

namespace {

constexpr auto kDefaultConfigPath = "/etc/fieldagent/fieldagent.yaml";

std::atomic<bool> shouldExit = false;

void signalHandler(int) { shouldExit.store(true); }

struct Options {
    std::string config = kDefaultConfigPath;
    bool foreground = false;
    std::optional<std::string> command;  // forwarded to a running daemon
    bool help = false;
};

void printUsage(const char* prog) {
    fmt::print("Usage: {} [-c CONFIG] [-f|--foreground] [--stop|--restart|--sync|--status]\n"
               "  -c, --conf PATH    configuration file (default {})\n"
               "  -f, --foreground   run in the foreground without firmware checks\n"
               "  -s, --stop         stop the running daemon\n"
               "  -r, --restart      restart the running daemon\n"
               "  -y, --sync         sync now\n"
               "  -t, --status       report whether the daemon is running\n",
               prog, kDefaultConfigPath);
}

Options parseArgs(const std::vector<std::string>& args) {
    Options opts;
    for (size_t i = 1; i < args.size(); ++i) {
        const auto& a = args[i];
        if (a == "-c" || a == "--conf") {
            if (i + 1 >= args.size()) throw std::invalid_argument(fmt::format("{} requires a path", a));
            opts.config = args[++i];
        } else if (a.starts_with("--conf=")) opts.config = a.substr(7);
        else if (a == "-f" || a == "--foreground") opts.foreground = true;
        else if (a == "-s" || a == "--stop") opts.command = "STOP";
        else if (a == "-r" || a == "--restart") opts.command = "RESTART";
        else if (a == "-y" || a == "--sync") opts.command = "SYNC";
        else if (a == "-t" || a == "--status") opts.command = "STATUS";
        else if (a == "-h" || a == "--help") opts.help = true;
        else throw std::invalid_argument(fmt::format("Unknown argument '{}'", a));
    }
    return opts;
}

// Control commands only need the socket address; a missing config file means the defaults.
config::DaemonConfig controlAddress(const std::string& path) {
    if (!std::filesystem::exists(path)) return {};
    return config::loadDaemonConfig(path).daemon;
}

int sendCommand(const Options& opts) {
    const auto daemonCfg = controlAddress(opts.config);
    const control::Client client(daemonCfg.control_host, daemonCfg.control_port);
    try {
        fmt::print("{}\n", client.send(*opts.command));
        return EXIT_SUCCESS;
    } catch (const control::NotRunning&) {
        if (*opts.command == "STATUS") {
            fmt::print("not running\n");
            return EXIT_SUCCESS;
        }
        fmt::print(stderr, "fieldagent is not running\n");
        return EXIT_FAILURE;
    }
}

[[noreturn]] void reexec(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    ::execvp(argv.front(), argv.data());
    throw std::runtime_error(fmt::format("execvp({}) failed: {}", args.front(), std::strerror(errno)));
}

}

int main(const int argc, char** argv) {
    const std::vector<std::string> args(argv, argv + argc);

    Options opts;
    try {
        opts = parseArgs(args);
    } catch (const std::exception& e) {
        fmt::print(stderr, "{}\n", e.what());
        printUsage(argv[0]);
        return EXIT_FAILURE;
    }
    if (opts.help) {
        printUsage(argv[0]);
        return EXIT_SUCCESS;
    }

    try {
        if (opts.command) return sendCommand(opts);
    } catch (const std::exception& e) {
        fmt::print(stderr, "[-] {}\n", e.what());
        return EXIT_FAILURE;
    }

    std::shared_ptr<log::Registry> logs;
    try {
        auto cfg = std::make_shared<const config::Config>(config::loadDaemonConfig(opts.config));
        logs = std::make_shared<log::Registry>(cfg->logging);
        const runtime::Context ctx{cfg, logs};

        logs->agent()->info("[*] Initializing fieldagent for device class '{}' with {}...", cfg->device.device_class,
                            cfg->path.string());

        const auto agent = daemon::Daemon::fromConfig(ctx, !opts.foreground, args);
        agent->watchStopFlag(&shouldExit);

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        const auto plan = agent->run();
        if (!plan.restart) {
            logs->agent()->info("[✓] fieldagent shut down cleanly.");
            return EXIT_SUCCESS;
        }

        logs->agent()->info("[*] Restarting: {}", fmt::join(plan.argv, " "));
        logs->flush();
        reexec(plan.argv);
    } catch (const sync::ClientError& e) {
        if (logs) logs->agent()->critical("[-] fieldagent stopped: {}", e.what());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        if (logs) logs->agent()->error("[-] Failed to run fieldagent: {}", e.what());
        else fmt::print(stderr, "[-] Failed to start fieldagent: {}\n", e.what());
        return EXIT_FAILURE;
    }
}
