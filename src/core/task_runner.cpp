#include "intentional/task_runner.hpp"
#include "intentional/logger.hpp"

#include <exception>

namespace intentional {

TaskRunner& TaskRunner::instance() {
    static TaskRunner instance;
    return instance;
}

void TaskRunner::post(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push_back(std::move(task));
    if (!worker_.joinable()) {
        worker_ = std::jthread([this](std::stop_token st) { workerLoop(st); });
    }
    cv_.notify_one();
}

void TaskRunner::workerLoop(std::stop_token st) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, st, [this] { return !queue_.empty(); });
            if (queue_.empty()) {
                // Stop requested and nothing left to run
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Task failed: ") + e.what());
        }
    }
}

void TaskRunner::shutdown() {
    std::jthread worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        worker = std::move(worker_);
    }
    if (!worker.joinable())
        return;

    LOG_DEBUG("Shutting down TaskRunner, draining queue...");
    worker.request_stop();
    worker.join();
    LOG_DEBUG("TaskRunner shutdown complete.");
}

TaskRunner::~TaskRunner() {
    shutdown();
}

} // namespace intentional
