#include "tasks/Scheduler.hpp"

#include <algorithm>

using namespace fa::tasks;
using namespace std::chrono;

Manager::Manager(const runtime::Context& ctx) : AsyncService("TaskManager", ctx.log->tasks()) {}

Manager::~Manager() { shutdown(); }

void Manager::addTask(std::string name, const milliseconds period, TaskFn fn) {
    if (period.count() <= 0) throw std::invalid_argument("task period must be positive");
    {
        std::scoped_lock lock(mutex_);
        tasks_.push_back({std::move(name), period, std::move(fn), steady_clock::now() + period});
    }
    cv_.notify_all();
}

void Manager::onSettingsChanged(SettingsListener listener) {
    std::scoped_lock lock(mutex_);
    listeners_.push_back(std::move(listener));
}

void Manager::start() { AsyncService::start(); }

void Manager::stop() { AsyncService::stop(); }

void Manager::onStop() {
    std::scoped_lock lock(mutex_);
    cv_.notify_all();
}

void Manager::settingsChanged(const std::vector<std::string>& names) {
    if (names.empty()) return;
    {
        std::scoped_lock lock(mutex_);
        pendingChanges_.push_back(names);
    }
    log_->debug("[TaskManager] {} setting(s) changed", names.size());
    cv_.notify_all();
}

void Manager::runTask(Task& task) {
    try {
        task.fn();
    } catch (const std::exception& e) {
        log_->error("[TaskManager] Task '{}' failed: {}", task.name, e.what());
    }
}

void Manager::runLoop() {
    std::unique_lock lock(mutex_);

    while (!interruptFlag_.load(std::memory_order_acquire)) {
        if (!pendingChanges_.empty()) {
            auto changes = std::move(pendingChanges_);
            pendingChanges_.clear();
            const auto listeners = listeners_;
            lock.unlock();
            for (const auto& names : changes)
                for (const auto& listener : listeners) {
                    try {
                        listener(names);
                    } catch (const std::exception& e) {
                        log_->error("[TaskManager] Settings listener failed: {}", e.what());
                    }
                }
            lock.lock();
            continue;
        }

        auto next = steady_clock::now() + seconds(1);
        // by index: addTask() may grow tasks_ while the lock is released
        for (size_t i = 0; i < tasks_.size(); ++i) {
            if (tasks_[i].next_run > steady_clock::now()) continue;
            tasks_[i].next_run = steady_clock::now() + tasks_[i].period;
            auto task = tasks_[i];
            lock.unlock();
            runTask(task);
            lock.lock();
        }
        for (const auto& task : tasks_) next = std::min(next, task.next_run);

        cv_.wait_until(lock, next, [this] {
            return interruptFlag_.load(std::memory_order_acquire) || !pendingChanges_.empty();
        });
    }
}
