#include <pmc/resize-debouncer.h>
#include <ytrace/ytrace.hpp>

namespace pmc {

bool ResizeDebouncer::observe(TermSize size, Clock::time_point now) {
    if (size == _observed) {
        return false;
    }
    _observed = size;
    _lastChange = now;
    // Bouncing back to the applied size cancels the pending resize
    _pending = size != _applied;
    ydebug("ResizeDebouncer: observed {}x{}", size.width, size.height);
    return true;
}

std::optional<TermSize> ResizeDebouncer::due(Clock::time_point now) {
    if (!_pending || now - _lastChange < _window) {
        return std::nullopt;
    }
    _pending = false;
    _applied = _observed;
    return _applied;
}

ResizeDebouncer::Clock::duration ResizeDebouncer::remaining(Clock::time_point now) const {
    if (!_pending) {
        return Clock::duration::zero();
    }
    auto elapsed = now - _lastChange;
    if (elapsed >= _window) {
        return Clock::duration::zero();
    }
    return _window - elapsed;
}

} // namespace pmc
