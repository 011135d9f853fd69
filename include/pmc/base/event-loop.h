#pragma once

#include <pmc/base/event.h>
#include <pmc/base/event-listener.h>
#include <pmc/result.hpp>
#include <memory>

namespace pmc {
namespace base {

using PollId = int;
using TimerId = int;
using Timeout = int;

// libuv loop with fd polls and timers; listeners are held weakly
class EventLoop {
public:
    using Ptr = std::shared_ptr<EventLoop>;

    static Result<Ptr> create() noexcept;

    virtual ~EventLoop() = default;

    // Start the event loop (blocking)
    virtual int start() = 0;

    // Stop the event loop
    virtual Result<void> stop() = 0;

    // Poll (file descriptor) management
    virtual Result<PollId> createPoll() = 0;
    virtual Result<void> configPoll(PollId id, int fd) = 0;
    virtual Result<void> startPoll(PollId id) = 0;
    virtual Result<void> stopPoll(PollId id) = 0;
    virtual Result<void> destroyPoll(PollId id) = 0;
    virtual Result<void> registerPollListener(PollId id, EventListener::Ptr listener) = 0;

    // Timer management; repeat 0 fires once
    virtual Result<TimerId> createTimer() = 0;
    virtual Result<void> configTimer(TimerId id, Timeout timeoutMs, Timeout repeatMs = 0) = 0;
    virtual Result<void> startTimer(TimerId id) = 0;
    virtual Result<void> stopTimer(TimerId id) = 0;
    virtual Result<void> destroyTimer(TimerId id) = 0;
    virtual Result<void> registerTimerListener(TimerId id, EventListener::Ptr listener) = 0;

protected:
    EventLoop() = default;
};

} // namespace base
} // namespace pmc
