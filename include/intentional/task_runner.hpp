#ifndef INTENTIONAL_TASK_RUNNER_HPP
#define INTENTIONAL_TASK_RUNNER_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

namespace intentional {

// The primary's single serialized execution context. Tasks run one at a
// time, in posting order, on one managed jthread.
class TaskRunner {
public:
    static TaskRunner& instance();

    // Queues a task. Starts the worker on first use.
    void post(std::function<void()> task);

    // Runs the queued tasks that are already posted, then joins the worker.
    // Tasks posted afterwards start a new worker.
    void shutdown();

    ~TaskRunner();

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

private:
    TaskRunner() = default;

    void workerLoop(std::stop_token st);

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::jthread worker_;
};

} // namespace intentional

#endif // INTENTIONAL_TASK_RUNNER_HPP
