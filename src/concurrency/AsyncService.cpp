#include "concurrency/AsyncService.hpp"

using namespace fa::concurrency;

AsyncService::AsyncService(std::string serviceName, std::shared_ptr<spdlog::logger> log)
    : serviceName_(std::move(serviceName)), log_(std::move(log)) {}

AsyncService::~AsyncService() {
    if (worker_.joinable()) {
        interruptFlag_.store(true, std::memory_order_release);
        if (std::this_thread::get_id() != worker_.get_id()) worker_.join();
        else worker_.detach();
    }
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join(); // previous run ended on its own

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log_->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    log_->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    log_->info("[{}] Stopping service...", serviceName_);
    interruptFlag_.store(true, std::memory_order_release);
    onStop();

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();

    running_.store(false, std::memory_order_release);
    log_->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::shutdown() {
    if (worker_.joinable()) stop();
}
