#include "core/event_loop.hpp"

#include <exception>
#include <iostream>
#include <utility>

// Destructor
EventLoop::~EventLoop() { stop(); }

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

EventLoop::TimerId EventLoop::postDelayed(std::chrono::milliseconds delay, Task task) {
    TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = nextTimerId_++;
        timers_.emplace(Clock::now() + delay, std::make_pair(id, std::move(task)));
    }
    cv_.notify_one();
    return id;
}

void EventLoop::cancel(TimerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = timers_.begin(); it != timers_.end(); ++it) {
        if (it->second.first == id) {
            timers_.erase(it);
            return;
        }
    }
}

bool EventLoop::inLoopThread() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::this_thread::get_id() == loopThreadId_;
}

// Moves due timers into the task queue, then pops the head task
bool EventLoop::popReady(Task& out) {
    const auto now = Clock::now();
    while (!timers_.empty() && timers_.begin()->first <= now) {
        tasks_.push_back(std::move(timers_.begin()->second.second));
        timers_.erase(timers_.begin());
    }
    if (tasks_.empty()) return false;
    out = std::move(tasks_.front());
    tasks_.pop_front();
    return true;
}

static void runTask(EventLoop::Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        std::cerr << "[EventLoop] [ERROR] task threw: " << e.what() << std::endl;
    }
}

void EventLoop::run() {
    running_ = true;
    loop();
}

void EventLoop::loop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loopThreadId_ = std::this_thread::get_id();
    }

    while (running_.load()) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            while (running_.load() && !popReady(task)) {
                if (timers_.empty()) {
                    cv_.wait(lock);
                } else {
                    cv_.wait_until(lock, timers_.begin()->first);
                }
            }
            if (!running_.load()) break;
        }
        runTask(task);
    }
}

// Starts the loop thread
void EventLoop::start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread([this] { loop(); });
}

// Stops the loop; queued tasks that have not run are dropped
void EventLoop::stop() {
    running_ = false;
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) thread_.join();
}

size_t EventLoop::runPending() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loopThreadId_ = std::this_thread::get_id();
    }

    size_t count = 0;
    while (true) {
        Task task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!popReady(task)) break;
        }
        runTask(task);
        ++count;
    }
    return count;
}

bool EventLoop::runUntil(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    while (true) {
        runPending();
        if (pred()) return true;
        if (Clock::now() >= deadline) return false;

        std::unique_lock<std::mutex> lock(mutex_);
        auto wakeAt = deadline;
        if (!timers_.empty() && timers_.begin()->first < wakeAt) wakeAt = timers_.begin()->first;
        // Short cap so predicates that depend on other threads are re-checked
        const auto cap = Clock::now() + std::chrono::milliseconds(5);
        if (cap < wakeAt) wakeAt = cap;
        if (tasks_.empty()) cv_.wait_until(lock, wakeAt);
    }
}
