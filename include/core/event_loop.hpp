#ifndef EVENT_LOOP_HPP
#define EVENT_LOOP_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

// Single-threaded task queue with timers. Any thread may post; tasks run in
// posting order on whichever thread drives the loop.
class EventLoop {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;
    using TimerId = uint64_t;

    EventLoop() = default;
    ~EventLoop();

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    void post(Task task);
    TimerId postDelayed(std::chrono::milliseconds delay, Task task);
    void cancel(TimerId id);

    // Drives the loop on the calling thread until stop()
    void run();

    // Drives the loop on an owned thread
    void start();
    void stop();

    // Runs every task that is due now, without blocking. Returns the count.
    size_t runPending();

    // Runs tasks as they become due until pred() holds or the timeout passes.
    bool runUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout);

    bool isRunning() const { return running_.load(); }
    bool inLoopThread() const;

private:
    void loop();
    bool popReady(Task& out);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::multimap<Clock::time_point, std::pair<TimerId, Task>> timers_;
    TimerId nextTimerId_ = 1;

    std::atomic<bool> running_{false};
    std::thread thread_;
    std::thread::id loopThreadId_;
};

#endif
