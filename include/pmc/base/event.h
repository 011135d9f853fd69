#pragma once

namespace pmc {
namespace base {

struct Event {
    enum class Type {
        None,
        PollReadable,
        Timer
    };

    struct PollEvent {
        int fd;
    };

    struct TimerEvent {
        int timerId;
    };

    Type type = Type::None;
    union {
        PollEvent poll;
        TimerEvent timer;
    };

    Event() : poll{-1} {}

    static Event pollReadable(int fd) {
        Event e;
        e.type = Type::PollReadable;
        e.poll.fd = fd;
        return e;
    }

    static Event timerEvent(int timerId) {
        Event e;
        e.type = Type::Timer;
        e.timer.timerId = timerId;
        return e;
    }
};

} // namespace base
} // namespace pmc
