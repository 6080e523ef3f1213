#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <vector>

namespace roomlink {

using Task = std::function<void()>;

// Single-threaded sequential dispatcher. Every task runs on the thread
// that calls Run() (or RunPending()), in enqueue order; delayed tasks run
// once their deadline has passed, ordered by deadline.
class Loop {
public:
    using Clock = std::chrono::steady_clock;

    void EnqueueTask(Task&& task);
    void EnqueueDelayedTask(std::chrono::milliseconds delay, Task&& task);

    void Run();
    void Stop();

    // Runs every task that is due now without blocking. Returns the number
    // of tasks executed.
    size_t RunPending();

private:
    struct DelayedTask {
        Clock::time_point Deadline;
        uint64_t Sequence;
        Task Fn;
    };

    struct Later {
        bool operator()(const DelayedTask& a, const DelayedTask& b) const {
            if (a.Deadline != b.Deadline) {
                return a.Deadline > b.Deadline;
            }
            return a.Sequence > b.Sequence;
        }
    };

    bool PopDueTask(Task& task);

    std::mutex Mutex_;
    std::condition_variable Cv_;
    std::queue<Task> TaskQueue_;
    std::priority_queue<DelayedTask, std::vector<DelayedTask>, Later> DelayedQueue_;
    uint64_t NextSequence_ = 0;
    bool Stopped_ = false;
};

} // namespace roomlink
