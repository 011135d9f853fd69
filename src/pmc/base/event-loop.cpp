#include <pmc/base/event-loop.h>
#include <ytrace/ytrace.hpp>
#include <uv.h>
#include <unordered_map>
#include <vector>

namespace pmc {
namespace base {

namespace {

struct PollHandle {
    uv_poll_t poll;
    int fd = -1;
    bool initialized = false;
    std::vector<std::weak_ptr<EventListener>> listeners;
};

struct TimerHandle {
    uv_timer_t timer;
    TimerId id = -1;
    Timeout timeout = 0;
    Timeout repeat = 0;
    std::vector<std::weak_ptr<EventListener>> listeners;
};

void notify(const std::vector<std::weak_ptr<EventListener>>& listeners, const Event& event) {
    // Copy: a listener may register or drop others while we iterate
    auto copy = listeners;
    for (const auto& wp : copy) {
        if (auto sp = wp.lock()) {
            if (auto res = sp->onEvent(event); !res) {
                yerror("EventLoop: listener failed: {}", error_msg(res));
            }
        }
    }
}

void onPollClosed(uv_handle_t* handle) {
    delete static_cast<PollHandle*>(handle->data);
}

void onTimerClosed(uv_handle_t* handle) {
    delete static_cast<TimerHandle*>(handle->data);
}

} // namespace

class EventLoopImpl : public EventLoop {
public:
    EventLoopImpl() = default;

    Result<void> init() {
        int r = uv_loop_init(&_loop);
        if (r != 0) {
            return Err<void>(std::string("uv_loop_init failed: ") + uv_strerror(r));
        }
        _initialized = true;
        return Ok();
    }

    ~EventLoopImpl() override {
        if (!_initialized) return;
        for (auto& [id, ph] : _polls) {
            closePoll(ph.release());
        }
        for (auto& [id, th] : _timers) {
            closeTimer(th.release());
        }
        _polls.clear();
        _timers.clear();
        // Let the close callbacks run
        uv_run(&_loop, UV_RUN_DEFAULT);
        if (int r = uv_loop_close(&_loop); r != 0) {
            ywarn("EventLoop: uv_loop_close: {}", uv_strerror(r));
        }
    }

    int start() override {
        yinfo("EventLoop::start");
        return uv_run(&_loop, UV_RUN_DEFAULT);
    }

    Result<void> stop() override {
        yinfo("EventLoop::stop");
        uv_stop(&_loop);
        return Ok();
    }

    Result<PollId> createPoll() override {
        PollId id = _nextPollId++;
        _polls[id] = std::make_unique<PollHandle>();
        return Ok(id);
    }

    Result<void> configPoll(PollId id, int fd) override {
        auto it = _polls.find(id);
        if (it == _polls.end()) {
            return Err<void>("Poll not found");
        }

        auto& ph = it->second;
        ph->fd = fd;
        int r = uv_poll_init(&_loop, &ph->poll, fd);
        if (r != 0) {
            yerror("EventLoop::configPoll: uv_poll_init failed for fd={}: {}", fd, uv_strerror(r));
            return Err<void>(std::string("uv_poll_init failed: ") + uv_strerror(r));
        }
        ph->poll.data = ph.get();
        ph->initialized = true;
        ydebug("EventLoop::configPoll: id={} fd={}", id, fd);
        return Ok();
    }

    Result<void> startPoll(PollId id) override {
        auto it = _polls.find(id);
        if (it == _polls.end()) {
            return Err<void>("Poll not found");
        }
        if (!it->second->initialized) {
            return Err<void>("Poll not configured");
        }
        int r = uv_poll_start(&it->second->poll, UV_READABLE, onPollCallback);
        if (r != 0) {
            yerror("EventLoop::startPoll: uv_poll_start failed for fd={}: {}", it->second->fd, uv_strerror(r));
            return Err<void>(std::string("uv_poll_start failed: ") + uv_strerror(r));
        }
        return Ok();
    }

    Result<void> stopPoll(PollId id) override {
        auto it = _polls.find(id);
        if (it == _polls.end()) {
            return Err<void>("Poll not found");
        }
        if (it->second->initialized) {
            uv_poll_stop(&it->second->poll);
        }
        return Ok();
    }

    Result<void> destroyPoll(PollId id) override {
        auto it = _polls.find(id);
        if (it == _polls.end()) {
            return Err<void>("Poll not found");
        }
        closePoll(it->second.release());
        _polls.erase(it);
        return Ok();
    }

    Result<void> registerPollListener(PollId id, EventListener::Ptr listener) override {
        auto it = _polls.find(id);
        if (it == _polls.end()) {
            return Err<void>("Poll not found");
        }
        ydebug("EventLoop::registerPollListener: id={} fd={}", id, it->second->fd);
        it->second->listeners.push_back(listener);
        return Ok();
    }

    Result<TimerId> createTimer() override {
        TimerId id = _nextTimerId++;
        auto th = std::make_unique<TimerHandle>();
        th->id = id;
        int r = uv_timer_init(&_loop, &th->timer);
        if (r != 0) {
            return Err<TimerId>(std::string("uv_timer_init failed: ") + uv_strerror(r));
        }
        th->timer.data = th.get();
        _timers[id] = std::move(th);
        ydebug("EventLoop::createTimer: id={}", id);
        return Ok(id);
    }

    Result<void> configTimer(TimerId id, Timeout timeoutMs, Timeout repeatMs) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }

        auto& th = it->second;
        th->timeout = timeoutMs;
        th->repeat = repeatMs;
        // Restart timer if it's already running
        if (uv_is_active(reinterpret_cast<uv_handle_t*>(&th->timer))) {
            uv_timer_start(&th->timer, onTimerCallback, th->timeout, th->repeat);
        }
        ydebug("EventLoop::configTimer: id={} timeout={} repeat={}", id, timeoutMs, repeatMs);
        return Ok();
    }

    Result<void> startTimer(TimerId id) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }

        auto& th = it->second;
        int r = uv_timer_start(&th->timer, onTimerCallback, th->timeout, th->repeat);
        if (r != 0) {
            return Err<void>(std::string("uv_timer_start failed: ") + uv_strerror(r));
        }
        return Ok();
    }

    Result<void> stopTimer(TimerId id) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }
        uv_timer_stop(&it->second->timer);
        return Ok();
    }

    Result<void> destroyTimer(TimerId id) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }
        closeTimer(it->second.release());
        _timers.erase(it);
        return Ok();
    }

    Result<void> registerTimerListener(TimerId id, EventListener::Ptr listener) override {
        auto it = _timers.find(id);
        if (it == _timers.end()) {
            return Err<void>("Timer not found");
        }
        it->second->listeners.push_back(listener);
        return Ok();
    }

private:
    static void closePoll(PollHandle* ph) {
        if (!ph->initialized) {
            delete ph;
            return;
        }
        uv_poll_stop(&ph->poll);
        uv_close(reinterpret_cast<uv_handle_t*>(&ph->poll), onPollClosed);
    }

    static void closeTimer(TimerHandle* th) {
        uv_timer_stop(&th->timer);
        uv_close(reinterpret_cast<uv_handle_t*>(&th->timer), onTimerClosed);
    }

    static void onPollCallback(uv_poll_t* handle, int status, int events) {
        auto* ph = static_cast<PollHandle*>(handle->data);
        if (status < 0) {
            ywarn("EventLoop::onPollCallback: fd={}: {}", ph->fd, uv_strerror(status));
            return;
        }
        if (events & UV_READABLE) {
            notify(ph->listeners, Event::pollReadable(ph->fd));
        }
    }

    static void onTimerCallback(uv_timer_t* handle) {
        auto* th = static_cast<TimerHandle*>(handle->data);
        notify(th->listeners, Event::timerEvent(th->id));
    }

    uv_loop_t _loop{};
    bool _initialized = false;
    std::unordered_map<PollId, std::unique_ptr<PollHandle>> _polls;
    std::unordered_map<TimerId, std::unique_ptr<TimerHandle>> _timers;
    PollId _nextPollId = 1;
    TimerId _nextTimerId = 1;
};

Result<EventLoop::Ptr> EventLoop::create() noexcept {
    auto loop = std::make_shared<EventLoopImpl>();
    if (auto res = loop->init(); !res) {
        return Err<Ptr>("Failed to create event loop", res);
    }
    return Ok(Ptr(loop));
}

} // namespace base
} // namespace pmc
