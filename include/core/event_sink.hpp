#ifndef EVENT_SINK_HPP
#define EVENT_SINK_HPP

#include "core/event_loop.hpp"

#include <functional>
#include <utility>

// Typed event channel. Producers call emit() from any thread.
template <typename Event>
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const Event& event) = 0;
};

// Queues each event onto an EventLoop; the handler only ever runs on the loop.
template <typename Event>
class LoopSink : public EventSink<Event> {
public:
    using Handler = std::function<void(const Event&)>;

    LoopSink(EventLoop& loop, Handler handler) : loop_(loop), handler_(std::move(handler)) {}

    void emit(const Event& event) override {
        Handler handler = handler_;
        loop_.post([handler, event] { handler(event); });
    }

private:
    EventLoop& loop_;
    Handler handler_;
};

#endif
