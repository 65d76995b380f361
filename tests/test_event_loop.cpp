#include "core/event_loop.hpp"
#include "core/event_sink.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

using std::chrono::milliseconds;

TEST(EventLoopTest, RunsTasksInPostingOrder) {
    EventLoop loop;
    std::vector<int> order;
    loop.post([&] { order.push_back(1); });
    loop.post([&] { order.push_back(2); });
    loop.post([&] { order.push_back(3); });

    EXPECT_EQ(loop.runPending(), 3u);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(EventLoopTest, DelayedTaskWaitsForItsTime) {
    EventLoop loop;
    bool fired = false;
    loop.postDelayed(milliseconds(30), [&] { fired = true; });

    EXPECT_EQ(loop.runPending(), 0u);
    EXPECT_TRUE(loop.runUntil([&] { return fired; }, milliseconds(1000)));
}

TEST(EventLoopTest, CancelledTimerNeverRuns) {
    EventLoop loop;
    bool fired = false;
    const auto id = loop.postDelayed(milliseconds(5), [&] { fired = true; });
    loop.cancel(id);

    EXPECT_FALSE(loop.runUntil([&] { return fired; }, milliseconds(50)));
}

TEST(EventLoopTest, ThrowingTaskDoesNotStopTheLoop) {
    EventLoop loop;
    bool after = false;
    loop.post([] { throw std::runtime_error("boom"); });
    loop.post([&] { after = true; });

    loop.runPending();
    EXPECT_TRUE(after);
}

TEST(EventLoopTest, OwnedThreadRunsPostsFromOtherThreads) {
    EventLoop loop;
    loop.start();
    EXPECT_TRUE(loop.isRunning());

    std::atomic<int> count{0};
    std::atomic<bool> inLoop{false};
    std::thread producer([&] {
        for (int i = 0; i < 100; ++i) loop.post([&] { ++count; });
    });
    producer.join();
    loop.post([&] { inLoop = loop.inLoopThread(); });

    EXPECT_TRUE(waitFor([&] { return count.load() == 100 && inLoop.load(); }));
    EXPECT_FALSE(loop.inLoopThread());
    loop.stop();
    EXPECT_FALSE(loop.isRunning());
}

TEST(EventLoopTest, StopRightAfterStartDoesNotHang) {
    for (int i = 0; i < 20; ++i) {
        EventLoop loop;
        loop.start();
        loop.stop();
        EXPECT_FALSE(loop.isRunning());
    }
}

TEST(LoopSinkTest, DeliversEventsOnTheLoop) {
    EventLoop loop;
    std::vector<std::string> seen;
    LoopSink<TtsEvent> sink(loop, [&](const TtsEvent& e) { seen.push_back(e.text); });

    sink.emit(TtsEvent{TtsEvent::Kind::PlaybackStarted, "a"});
    sink.emit(TtsEvent{TtsEvent::Kind::PlaybackStarted, "b"});
    EXPECT_TRUE(seen.empty());

    loop.runPending();
    EXPECT_EQ(seen, (std::vector<std::string>{"a", "b"}));
}
