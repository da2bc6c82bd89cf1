#pragma once

#include "runtime/Context.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fa::sync { class Reconciler; }
namespace fa::tasks { class Scheduler; }
namespace fa::control { class Server; }

namespace fa::daemon {

enum class State { Starting, Running, Stopping, Restarting, Terminated };

std::string to_string(State state);

// What the process should do once run() returns.
struct ExitPlan {
    bool restart{false};
    std::vector<std::string> argv;  // startup arguments, replayed on restart
};

class Daemon {
public:
    using Clock = std::chrono::steady_clock;

    Daemon(const runtime::Context& ctx, std::shared_ptr<sync::Reconciler> reconciler,
           std::shared_ptr<tasks::Scheduler> tasks, std::vector<std::string> argv);
    ~Daemon();

    Daemon(const Daemon&) = delete;
    Daemon& operator=(const Daemon&) = delete;

    // Builds the full collaborator graph from configuration.
    static std::unique_ptr<Daemon> fromConfig(const runtime::Context& ctx, bool checkFirmware,
                                              std::vector<std::string> argv);

    // Starts the task scheduler and control socket, then polls on the calling thread
    // until a stop or restart is requested. Rethrows sync::ClientError after the
    // shutdown sequence has run.
    ExitPlan run();

    // Runs a cycle when none has been attempted yet or the poll interval has elapsed.
    // Returns whether a cycle was attempted.
    bool pollOnce(Clock::time_point now);

    // Control socket dispatch: RESTART, STOP, SYNC, STATUS.
    std::string onCommand(const std::string& command);

    void requestStop();
    void requestRestart();

    // Polled every quantum; set from a signal handler to request a stop.
    void watchStopFlag(const std::atomic<bool>* flag) noexcept { stopFlag_ = flag; }

    [[nodiscard]] State state() const noexcept { return state_.load(); }

    [[nodiscard]] uint16_t controlPort() const;

    [[nodiscard]] std::optional<Clock::time_point> lastAttempt() const;

private:
    runtime::Context ctx_;
    std::shared_ptr<sync::Reconciler> reconciler_;
    std::shared_ptr<tasks::Scheduler> tasks_;
    std::unique_ptr<control::Server> server_;
    std::vector<std::string> argv_;

    std::atomic<State> state_{State::Starting};
    const std::atomic<bool>* stopFlag_ = nullptr;

    mutable std::mutex mutex_;
    std::optional<Clock::time_point> lastAttempt_;
    std::exception_ptr fatal_;

    // Runs one cycle. Returns the error text, empty on success. A ClientError is
    // recorded for the poll loop as well as reported.
    std::string runCycle();

    void rethrowFatal();
    void shutdownServices();
    bool transition(State from, State to);
};

}
