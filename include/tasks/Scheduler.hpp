#pragma once

#include "concurrency/AsyncService.hpp"
#include "runtime/Context.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace fa::tasks {

class Scheduler {
public:
    virtual ~Scheduler() = default;

    virtual void start() = 0;
    virtual void stop() = 0;

    // Settings documents `names` were rewritten by a sync.
    virtual void settingsChanged(const std::vector<std::string>& names) = 0;
};

// Runs registered periodic tasks and settings listeners on one worker thread.
class Manager final : public Scheduler, private concurrency::AsyncService {
public:
    using TaskFn = std::function<void()>;
    using SettingsListener = std::function<void(const std::vector<std::string>&)>;

    explicit Manager(const runtime::Context& ctx);
    ~Manager() override;

    void addTask(std::string name, std::chrono::milliseconds period, TaskFn fn);
    void onSettingsChanged(SettingsListener listener);

    void start() override;
    void stop() override;
    void settingsChanged(const std::vector<std::string>& names) override;

    [[nodiscard]] bool running() const { return isRunning(); }

protected:
    void runLoop() override;
    void onStop() override;

private:
    struct Task {
        std::string name;
        std::chrono::milliseconds period;
        TaskFn fn;
        std::chrono::steady_clock::time_point next_run;
    };

    std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<Task> tasks_;
    std::vector<SettingsListener> listeners_;
    std::vector<std::vector<std::string>> pendingChanges_;

    void runTask(Task& task);
};

}
