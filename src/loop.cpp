#include "loop.hpp"

namespace roomlink {

void Loop::Run() {
    while (true)
    {
        Task task;

        {
            std::unique_lock<std::mutex> lock(Mutex_);
            while (true) {
                if (Stopped_) {
                    return;
                }
                if (!TaskQueue_.empty()) {
                    task = std::move(TaskQueue_.front());
                    TaskQueue_.pop();
                    break;
                }
                if (!DelayedQueue_.empty()) {
                    auto deadline = DelayedQueue_.top().Deadline;
                    if (deadline <= Clock::now()) {
                        task = std::move(const_cast<DelayedTask&>(DelayedQueue_.top()).Fn);
                        DelayedQueue_.pop();
                        break;
                    }
                    Cv_.wait_until(lock, deadline);
                } else {
                    Cv_.wait(lock);
                }
            }
        }
        task();
    }
}

void Loop::Stop() {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        Stopped_ = true;
    }

    Cv_.notify_all();
}

size_t Loop::RunPending() {
    size_t executed = 0;
    Task task;
    while (PopDueTask(task)) {
        task();
        ++executed;
    }
    return executed;
}

bool Loop::PopDueTask(Task& task) {
    std::lock_guard<std::mutex> lock(Mutex_);
    if (!TaskQueue_.empty()) {
        task = std::move(TaskQueue_.front());
        TaskQueue_.pop();
        return true;
    }
    if (!DelayedQueue_.empty() && DelayedQueue_.top().Deadline <= Clock::now()) {
        task = std::move(const_cast<DelayedTask&>(DelayedQueue_.top()).Fn);
        DelayedQueue_.pop();
        return true;
    }
    return false;
}

void Loop::EnqueueTask(Task&& task) {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        TaskQueue_.push(std::move(task));
    }

    Cv_.notify_one();
}

void Loop::EnqueueDelayedTask(std::chrono::milliseconds delay, Task&& task) {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        DelayedQueue_.push(DelayedTask{Clock::now() + delay, NextSequence_++, std::move(task)});
    }

    Cv_.notify_one();
}

} //namespace roomlink
