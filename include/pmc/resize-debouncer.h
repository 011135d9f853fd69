#pragma once

#include <chrono>
#include <optional>

namespace pmc {

struct TermSize {
    int width = 0;
    int height = 0;

    bool operator==(const TermSize& o) const { return width == o.width && height == o.height; }
    bool operator!=(const TermSize& o) const { return !(*this == o); }
};

//=============================================================================
// ResizeDebouncer - report a new terminal size only once it stops changing
//
// Time is passed in, so the loop drives it with the real clock and tests
// with a fake one.
//=============================================================================

class ResizeDebouncer {
public:
    using Clock = std::chrono::steady_clock;

    ResizeDebouncer(std::chrono::milliseconds window, TermSize applied)
        : _window(window), _applied(applied), _observed(applied) {}

    // Feed the current size. True when it differs from the last one seen,
    // which (re)starts the quiet window.
    bool observe(TermSize size, Clock::time_point now);

    // The settled size, once, after the window passed with no change
    std::optional<TermSize> due(Clock::time_point now);

    bool pending() const { return _pending; }

    // Time left until due() can fire; zero when nothing is pending
    Clock::duration remaining(Clock::time_point now) const;

    TermSize applied() const { return _applied; }
    std::chrono::milliseconds window() const { return _window; }

private:
    std::chrono::milliseconds _window;
    TermSize _applied;
    TermSize _observed;
    Clock::time_point _lastChange{};
    bool _pending = false;
};

} // namespace pmc
