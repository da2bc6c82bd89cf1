#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <spdlog/logger.h>

namespace fa::concurrency {

// A named worker thread running runLoop(). stop() raises interruptFlag_, calls
// onStop() so a blocking loop can be woken, then joins.
class AsyncService {
public:
    AsyncService(std::string serviceName, std::shared_ptr<spdlog::logger> log);

    virtual ~AsyncService();

    AsyncService(const AsyncService&) = delete;
    AsyncService& operator=(const AsyncService&) = delete;

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(std::memory_order_acquire); }

    [[nodiscard]] const std::string& serviceName() const noexcept { return serviceName_; }

protected:
    std::string serviceName_;
    std::shared_ptr<spdlog::logger> log_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    virtual void onStop() {}

    // Call from the most-derived destructor so runLoop() never outlives the object it uses.
    void shutdown();
};

}
