#include <pmc/runner.h>
#include <ytrace/ytrace.hpp>
#include <chrono>

namespace pmc {

RunnerOptions RunnerOptions::fromConfig(const Config& config) {
    RunnerOptions options;
    options.escapeTimeoutMs = config.get<int>(Config::KEY_INPUT_ESCAPE_TIMEOUT, options.escapeTimeoutMs);
    options.resizeDebounceMs = config.get<int>(Config::KEY_INPUT_RESIZE_DEBOUNCE, options.resizeDebounceMs);
    return options;
}

Result<Runner::Ptr> Runner::create(Terminal::Ptr terminal, App::Ptr app, base::EventLoop::Ptr loop,
                                   RunnerOptions options) {
    if (!terminal || !app || !loop) {
        return Err<Ptr>("Runner::create: terminal, app and loop are required");
    }
    auto runner = Ptr(new Runner(std::move(terminal), std::move(app), std::move(loop), options));
    if (auto res = runner->setup(); !res) {
        return Err<Ptr>("Failed to set up runner", res);
    }
    return Ok(runner);
}

Runner::Runner(Terminal::Ptr terminal, App::Ptr app, base::EventLoop::Ptr loop, RunnerOptions options)
    : _terminal(std::move(terminal)), _app(std::move(app)), _loop(std::move(loop)),
      _options(options),
      _debouncer(std::chrono::milliseconds(options.resizeDebounceMs), _terminal->size()) {}

Result<void> Runner::setup() {
    auto self = shared_from_this();

    auto inputPoll = _loop->createPoll();
    if (!inputPoll) return Err<void>("input poll", inputPoll);
    _inputPoll = *inputPoll;
    if (auto res = _loop->configPoll(_inputPoll, _terminal->inputFd()); !res) return res;
    if (auto res = _loop->registerPollListener(_inputPoll, self); !res) return res;

    auto resizePoll = _loop->createPoll();
    if (!resizePoll) return Err<void>("resize poll", resizePoll);
    _resizePoll = *resizePoll;
    if (auto res = _loop->configPoll(_resizePoll, _terminal->resizeFd()); !res) return res;
    if (auto res = _loop->registerPollListener(_resizePoll, self); !res) return res;

    auto timer = _loop->createTimer();
    if (!timer) return Err<void>("resize timer", timer);
    _resizeTimer = *timer;
    return _loop->registerTimerListener(_resizeTimer, self);
}

Result<void> Runner::run() {
    if (auto res = _loop->startPoll(_inputPoll); !res) return res;
    if (auto res = _loop->startPoll(_resizePoll); !res) return res;

    auto sz = _terminal->size();
    _app->resize(sz.width, sz.height);
    _app->render();

    _loop->start();

    for (base::PollId id : {_inputPoll, _resizePoll}) {
        if (auto res = _loop->destroyPoll(id); !res) {
            ywarn("Runner: {}", error_msg(res));
        }
    }
    if (auto res = _loop->destroyTimer(_resizeTimer); !res) {
        ywarn("Runner: {}", error_msg(res));
    }
    return _exitStatus;
}

Result<bool> Runner::onEvent(const base::Event& event) {
    Result<void> res = Ok();
    if (event.type == base::Event::Type::PollReadable) {
        if (event.poll.fd == _terminal->inputFd()) {
            res = onInput();
        } else if (event.poll.fd == _terminal->resizeFd()) {
            _terminal->drainResizeSignal();
            res = pollSize();
        } else {
            return Ok(false);
        }
    } else if (event.type == base::Event::Type::Timer && event.timer.timerId == _resizeTimer) {
        res = onResizeTimer();
    } else {
        return Ok(false);
    }

    if (!res) {
        finish(res);
    } else if (!_app->running()) {
        finish(Ok());
    }
    return Ok(true);
}

Result<void> Runner::onInput() {
    if (auto res = _terminal->readKeys(_decoder, _options.escapeTimeoutMs); !res) {
        return res;
    }
    bool changed = false;
    for (const auto& key : _decoder.drain()) {
        ydebug("Runner: key {}", describeKey(key));
        changed = _app->handleKey(key) || changed;
        if (!_app->running()) {
            return Ok();
        }
    }
    if (auto res = pollSize(); !res) {
        return res;
    }
    if (changed) {
        _app->render();
    }
    return Ok();
}

Result<void> Runner::pollSize() {
    auto now = ResizeDebouncer::Clock::now();
    if (!_debouncer.observe(_terminal->size(), now)) {
        return Ok();
    }
    if (!_debouncer.pending()) {
        return _loop->stopTimer(_resizeTimer);
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(_debouncer.remaining(now));
    if (auto res = _loop->configTimer(_resizeTimer, static_cast<base::Timeout>(remaining.count()) + 1); !res) {
        return res;
    }
    return _loop->startTimer(_resizeTimer);
}

Result<void> Runner::onResizeTimer() {
    auto now = ResizeDebouncer::Clock::now();
    if (auto size = _debouncer.due(now)) {
        _app->resize(size->width, size->height);
        _app->render();
        return Ok();
    }
    if (_debouncer.pending()) {
        // Woke a little early; wait out the rest
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(_debouncer.remaining(now));
        if (auto res = _loop->configTimer(_resizeTimer, static_cast<base::Timeout>(remaining.count()) + 1); !res) {
            return res;
        }
        return _loop->startTimer(_resizeTimer);
    }
    return Ok();
}

void Runner::finish(Result<void> why) {
    if (!why) {
        yerror("Runner: stopping: {}", error_msg(why));
    } else {
        yinfo("Runner: app terminated");
    }
    _exitStatus = std::move(why);
    if (auto res = _loop->stop(); !res) {
        ywarn("Runner: {}", error_msg(res));
    }
}

} // namespace pmc
