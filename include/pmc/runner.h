#pragma once

#include <pmc/app.h>
#include <pmc/base/event-loop.h>
#include <pmc/key-decoder.h>
#include <pmc/resize-debouncer.h>
#include <pmc/terminal.h>
#include <memory>

namespace pmc {

struct RunnerOptions {
    int escapeTimeoutMs = 25;
    int resizeDebounceMs = 120;

    static RunnerOptions fromConfig(const Config& config);
};

//=============================================================================
// Runner - drives an App from a Terminal on the event loop
//
// Each readable input is one iteration: read keys, handle them, poll the
// terminal size, render if anything changed. A size change arms a one-shot
// timer; the App is resized and redrawn only when it fires undisturbed.
//=============================================================================

class Runner : public base::EventListener, public std::enable_shared_from_this<Runner> {
public:
    using Ptr = std::shared_ptr<Runner>;

    static Result<Ptr> create(Terminal::Ptr terminal, App::Ptr app, base::EventLoop::Ptr loop,
                              RunnerOptions options = {});

    ~Runner() override = default;

    // Blocks until the App terminates or input ends
    Result<void> run();

    Result<bool> onEvent(const base::Event& event) override;

private:
    Runner(Terminal::Ptr terminal, App::Ptr app, base::EventLoop::Ptr loop, RunnerOptions options);

    Result<void> setup();
    Result<void> onInput();
    Result<void> pollSize();
    Result<void> onResizeTimer();
    void finish(Result<void> why);

    Terminal::Ptr _terminal;
    App::Ptr _app;
    base::EventLoop::Ptr _loop;
    RunnerOptions _options;

    KeyDecoder _decoder;
    ResizeDebouncer _debouncer;

    base::PollId _inputPoll = -1;
    base::PollId _resizePoll = -1;
    base::TimerId _resizeTimer = -1;

    Result<void> _exitStatus;
};

} // namespace pmc
