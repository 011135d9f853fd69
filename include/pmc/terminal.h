#pragma once

#include <pmc/key-decoder.h>
#include <pmc/resize-debouncer.h>
#include <pmc/result.hpp>
#include <pmc/term-output.h>
#include <memory>
#include <termios.h>
#include <signal.h>

namespace pmc {

//=============================================================================
// Terminal - raw-mode session on a tty
//
// Entering: raw termios, alternate screen, hidden cursor, SIGWINCH handler.
// restore() (also run by the destructor) undoes all of it in reverse.
// Only one Terminal may be live at a time: the signal handler is global.
//=============================================================================

class Terminal {
public:
    using Ptr = std::shared_ptr<Terminal>;

    static Result<Ptr> create(int inFd, int outFd);

    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    // TIOCGWINSZ, 80x24 when unknown
    TermSize size() const;

    TermOutput& output() { return _output; }

    int inputFd() const { return _inFd; }

    // Readable after every SIGWINCH
    int resizeFd() const { return _resizePipe[0]; }

    // Empty the resize pipe; true if a signal had arrived
    bool drainResizeSignal();

    // Read what is available into the decoder. While an escape prefix is
    // unresolved, wait up to escapeTimeoutMs for the rest before calling
    // decoder.timeout(). End of input is an error.
    Result<void> readKeys(KeyDecoder& decoder, int escapeTimeoutMs);

    void restore();

private:
    Terminal(int inFd, int outFd) : _inFd(inFd), _outFd(outFd), _output(outFd) {}

    Result<void> enter();

    int _inFd;
    int _outFd;
    FdTermOutput _output;
    struct termios _origTermios{};
    struct sigaction _origWinch{};
    int _resizePipe[2] = {-1, -1};
    bool _rawMode = false;
    bool _handlerInstalled = false;
};

} // namespace pmc
