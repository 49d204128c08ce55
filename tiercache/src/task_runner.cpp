#include "task_runner.hpp"
#include <spdlog/spdlog.h>
#include <exception>

TaskRunner::TaskRunner(int num_threads, size_t max_pending)
    : max_pending_(max_pending > 0 ? max_pending : 1)
{
    if (num_threads < 1) num_threads = 1;
    for (int i = 0; i < num_threads; ++i) {
        threads_.emplace_back([this]() { worker_loop(); });
    }
}

TaskRunner::~TaskRunner() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

bool TaskRunner::post(std::string label, std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            spdlog::warn("Dropping background task {}: runner is stopping", label);
            dropped_++;
            return false;
        }
        if (in_flight_ >= max_pending_) {
            spdlog::warn("Dropping background task {}: {} tasks already pending", label, in_flight_);
            dropped_++;
            return false;
        }
        tasks_.push(Task{std::move(label), std::move(task)});
        in_flight_++;
    }
    cv_.notify_one();
    return true;
}

void TaskRunner::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this]() { return in_flight_ == 0; });
}

uint64_t TaskRunner::failed_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failed_;
}

uint64_t TaskRunner::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

size_t TaskRunner::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

void TaskRunner::worker_loop() {
    while (true) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stop_ || !tasks_.empty(); });

            // Queued work is drained before the pool exits
            if (stop_ && tasks_.empty()) return;

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        bool failed = false;
        try {
            task.fn();
        } catch (const std::exception& e) {
            failed = true;
            spdlog::warn("Background task {} failed: {}", task.label, e.what());
        } catch (...) {
            failed = true;
            spdlog::warn("Background task {} failed with a non-standard exception", task.label);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            in_flight_--;
            if (failed) failed_++;
        }
        idle_cv_.notify_all();
    }
}
