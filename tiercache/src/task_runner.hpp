#pragma once

#include <string>
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <cstdint>

/**
 * Worker pool for fire-and-forget work. Every task runs under a
 * supervisor that logs its failure; nothing escapes to the submitter.
 *
 * With a single thread, tasks run in the order they were posted. At most
 * max_pending tasks are queued or running; post() drops the rest.
 */
class TaskRunner {
public:
    explicit TaskRunner(int num_threads = 2, size_t max_pending = 10000);
    ~TaskRunner();

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

    // Returns false when the task was dropped
    bool post(std::string label, std::function<void()> task);

    // Blocks until every task posted so far has finished
    void wait_idle();

    uint64_t failed_count() const;
    uint64_t dropped_count() const;
    size_t pending() const;

private:
    struct Task {
        std::string label;
        std::function<void()> fn;
    };

    std::vector<std::thread> threads_;
    std::queue<Task> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    bool stop_ = false;
    size_t max_pending_;
    size_t in_flight_ = 0;
    uint64_t failed_ = 0;
    uint64_t dropped_ = 0;

    void worker_loop();
};
