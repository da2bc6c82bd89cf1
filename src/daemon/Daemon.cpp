#include "daemon/Daemon.hpp"
#include "auth/Token.hpp"
#include "control/Server.hpp"
#include "device/Identity.hpp"
#include "firmware/Installer.hpp"
#include "rpc/Client.hpp"
#include "rpc/Transport.hpp"
#include "sampler/Provider.hpp"
#include "settings/Store.hpp"
#include "sync/Reconciler.hpp"
#include "tasks/Scheduler.hpp"
#include "timeline/Manager.hpp"

#include <thread>

using namespace fa::daemon;

namespace fa::daemon {

std::string to_string(const State state) {
    switch (state) {
        case State::Starting: return "starting";
        case State::Running: return "running";
        case State::Stopping: return "stopping";
        case State::Restarting: return "restarting";
        case State::Terminated: return "terminated";
    }
    return "unknown";
}

}

Daemon::Daemon(const runtime::Context& ctx, std::shared_ptr<sync::Reconciler> reconciler,
               std::shared_ptr<tasks::Scheduler> tasks, std::vector<std::string> argv)
    : ctx_(ctx), reconciler_(std::move(reconciler)), tasks_(std::move(tasks)), argv_(std::move(argv)) {
    if (!reconciler_ || !tasks_) throw std::invalid_argument("Daemon requires a reconciler and a task scheduler");

    server_ = std::make_unique<control::Server>(ctx_, [this](const std::string& command) {
        return onCommand(command);
    });

    reconciler_->onRestartRequested([this] {
        ctx_.log->agent()->info("[Daemon] Firmware updated, restarting");
        requestRestart();
    });
}

Daemon::~Daemon() {
    reconciler_->onRestartRequested(nullptr);
    server_.reset();
}

std::unique_ptr<Daemon> Daemon::fromConfig(const runtime::Context& ctx, const bool checkFirmware,
                                           std::vector<std::string> argv) {
    const auto& cfg = ctx.conf();

    auto transport = std::make_shared<rpc::CurlTransport>(cfg.server.url, cfg.server.timeout);
    auto scheduler = std::make_shared<tasks::Manager>(ctx);

    sync::Collaborators deps{
        .client = std::make_shared<rpc::Client>(ctx, std::move(transport)),
        .token = std::make_shared<auth::Token>(cfg.device.auth),
        .timelines = timeline::Manager::fromConfig(ctx),
        .samplers = sampler::Manager::fromConfig(ctx),
        .settings = settings::Manager::fromConfig(ctx),
        .tasks = scheduler,
        .installer = std::make_shared<firmware::DirectoryInstaller>(ctx),
    };

    auto reconciler = std::make_shared<sync::Reconciler>(ctx, std::move(deps),
                                                          device::Identity::fromConfig(cfg.device),
                                                          firmware::readVersion(cfg.firmware.version_file),
                                                          checkFirmware && cfg.daemon.check_firmware);

    return std::make_unique<Daemon>(ctx, std::move(reconciler), std::move(scheduler), std::move(argv));
}

uint16_t Daemon::controlPort() const { return server_->port(); }

std::optional<Daemon::Clock::time_point> Daemon::lastAttempt() const {
    std::scoped_lock lock(mutex_);
    return lastAttempt_;
}

bool Daemon::transition(State from, const State to) {
    if (!state_.compare_exchange_strong(from, to)) return false;
    ctx_.log->agent()->debug("[Daemon] {} -> {}", to_string(from), to_string(to));
    return true;
}

void Daemon::requestStop() {
    if (!transition(State::Running, State::Stopping)) transition(State::Starting, State::Stopping);
}

void Daemon::requestRestart() {
    if (!transition(State::Running, State::Restarting)) transition(State::Starting, State::Restarting);
}

std::string Daemon::runCycle() {
    const auto log = ctx_.log->agent();
    try {
        const auto report = reconciler_->sync();
        log->debug("[Daemon] Sync {}: {} sampler(s) and {} event(s) cleared", sync::to_string(report.outcome),
                   report.samplers_cleared, report.events_cleared);
        return {};
    } catch (const sync::ClientError& e) {
        log->critical("[Daemon] Unrecoverable client error: {}", e.what());
        std::scoped_lock lock(mutex_);
        if (!fatal_) fatal_ = std::current_exception();
        return e.what();
    } catch (const std::exception& e) {
        log->error("[Daemon] Sync failed: {}", e.what());
        return e.what();
    }
}

bool Daemon::pollOnce(const Clock::time_point now) {
    {
        std::scoped_lock lock(mutex_);
        if (lastAttempt_ && now - *lastAttempt_ < ctx_.conf().daemon.poll_interval) return false;
        lastAttempt_ = now;
    }
    (void)runCycle();
    rethrowFatal();
    return true;
}

void Daemon::rethrowFatal() {
    std::exception_ptr fatal;
    {
        std::scoped_lock lock(mutex_);
        fatal = fatal_;
    }
    if (fatal) std::rethrow_exception(fatal);
}

std::string Daemon::onCommand(const std::string& command) {
    const auto log = ctx_.log->agent();

    if (command == "RESTART") {
        log->info("[Daemon] Restart requested");
        requestRestart();
        return "OK";
    }
    if (command == "STOP") {
        log->info("[Daemon] Stop requested");
        requestStop();
        return "OK";
    }
    if (command == "SYNC") {
        log->info("[Daemon] Sync requested");
        const auto error = runCycle();
        return error.empty() ? "OK" : error;
    }
    if (command == "STATUS") {
        log->debug("[Daemon] Status requested");
        return "running";
    }

    log->warn("[Daemon] Unknown command '{}'", command);
    return "BADCOMMAND";
}

void Daemon::shutdownServices() {
    const auto log = ctx_.log->agent();
    try {
        server_->stop();
    } catch (const std::exception& e) {
        log->error("[Daemon] Error stopping control socket: {}", e.what());
    }
    try {
        tasks_->stop();
    } catch (const std::exception& e) {
        log->error("[Daemon] Error stopping task scheduler: {}", e.what());
    }
}

ExitPlan Daemon::run() {
    const auto log = ctx_.log->agent();
    const auto& cfg = ctx_.conf().daemon;

    log->info("[Daemon] Starting with config {}", ctx_.conf().path.string());

    tasks_->start();
    try {
        server_->start();
    } catch (const std::exception& e) {
        log->critical("[Daemon] Unable to start control socket: {}", e.what());
        tasks_->stop();
        state_.store(State::Terminated);
        throw;
    }

    transition(State::Starting, State::Running);
    log->info("[Daemon] Ready");

    std::exception_ptr fatal;
    try {
        while (state_.load() == State::Running) {
            if (stopFlag_ && stopFlag_->load()) {
                log->info("[Daemon] Exit requested");
                requestStop();
                break;
            }
            pollOnce(Clock::now());
            rethrowFatal();
            std::this_thread::sleep_for(cfg.poll_quantum);
        }
    } catch (const sync::ClientError&) {
        fatal = std::current_exception();
        requestStop();
    }

    log->debug("[Daemon] Closing");
    shutdownServices();

    ExitPlan plan;
    if (state_.load() == State::Restarting) {
        plan.restart = true;
        plan.argv = argv_;
        std::this_thread::sleep_for(cfg.restart_grace);
    }

    state_.store(State::Terminated);
    log->info("[Daemon] Goodbye");
    ctx_.log->flush();

    if (fatal) std::rethrow_exception(fatal);
    return plan;
}
