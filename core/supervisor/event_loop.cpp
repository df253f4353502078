#include "event_loop.hpp"

#include "logging/logger.hpp"

namespace minder {
namespace supervisor {

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void EventLoop::run() {
    loop_thread_ = std::this_thread::get_id();
    Task task;
    while (next_task(task, nullptr)) {
        execute(task);
    }
    loop_thread_ = std::thread::id{};
}

bool EventLoop::run_for(std::chrono::milliseconds timeout) {
    loop_thread_ = std::this_thread::get_id();
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    Task task;
    while (next_task(task, &deadline)) {
        execute(task);
    }
    loop_thread_ = std::thread::id{};

    std::lock_guard<std::mutex> lock(mutex_);
    if (stop_requested_) {
        stop_requested_ = false;
        return true;
    }
    return false;
}

size_t EventLoop::run_pending() {
    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(tasks_);
    }

    loop_thread_ = std::this_thread::get_id();
    for (auto &task : batch) {
        execute(task);
    }
    loop_thread_ = std::thread::id{};
    return batch.size();
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
}

size_t EventLoop::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

bool EventLoop::next_task(Task &task, const std::chrono::steady_clock::time_point *deadline) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto ready = [this] { return stop_requested_ || !tasks_.empty(); };

    if (deadline != nullptr) {
        if (!cv_.wait_until(lock, *deadline, ready)) {
            return false;
        }
    } else {
        cv_.wait(lock, ready);
    }

    if (stop_requested_) {
        // run_for() reports and clears the flag itself
        if (deadline == nullptr) {
            stop_requested_ = false;
        }
        return false;
    }

    task = std::move(tasks_.front());
    tasks_.pop_front();
    return true;
}

void EventLoop::execute(Task &task) {
    try {
        task();
    } catch (const std::exception &e) {
        LOG_ERROR("[EventLoop] Task failed: " << e.what());
    }
}

}  // namespace supervisor
}  // namespace minder
