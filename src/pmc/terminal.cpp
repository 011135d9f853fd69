#include <pmc/terminal.h>
#include <ytrace/ytrace.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace pmc {

namespace {

constexpr const char* ENTER_SEQ = "\x1b[?1049h\x1b[?25l";
constexpr const char* LEAVE_SEQ = "\x1b[0m\x1b[?25h\x1b[?1049l";

volatile sig_atomic_t g_resizeWriteFd = -1;

void onSigwinch(int) {
    int saved = errno;
    int fd = g_resizeWriteFd;
    if (fd >= 0) {
        char b = 1;
        // Pipe full means a wakeup is already queued
        (void)!::write(fd, &b, 1);
    }
    errno = saved;
}

Result<void> setFlags(int fd, int fdFlags, int statusFlags) {
    if (fdFlags && ::fcntl(fd, F_SETFD, ::fcntl(fd, F_GETFD) | fdFlags) < 0) {
        return Err<void>(std::string("fcntl(F_SETFD): ") + strerror(errno));
    }
    if (statusFlags && ::fcntl(fd, F_SETFL, ::fcntl(fd, F_GETFL) | statusFlags) < 0) {
        return Err<void>(std::string("fcntl(F_SETFL): ") + strerror(errno));
    }
    return Ok();
}

} // namespace

Result<Terminal::Ptr> Terminal::create(int inFd, int outFd) {
    if (!::isatty(inFd)) {
        return Err<Ptr>("input is not a terminal");
    }
    auto term = Ptr(new Terminal(inFd, outFd));
    if (auto res = term->enter(); !res) {
        term->restore();
        return Err<Ptr>("Failed to set up terminal", res);
    }
    return Ok(term);
}

Terminal::~Terminal() {
    restore();
}

Result<void> Terminal::enter() {
    if (::tcgetattr(_inFd, &_origTermios) != 0) {
        return Err<void>(std::string("tcgetattr: ") + strerror(errno));
    }
    struct termios raw = _origTermios;
    cfmakeraw(&raw);
    raw.c_oflag |= OPOST;
    if (::tcsetattr(_inFd, TCSANOW, &raw) != 0) {
        return Err<void>(std::string("tcsetattr: ") + strerror(errno));
    }
    _rawMode = true;

    if (::pipe(_resizePipe) != 0) {
        return Err<void>(std::string("pipe: ") + strerror(errno));
    }
    for (int fd : _resizePipe) {
        if (auto res = setFlags(fd, FD_CLOEXEC, O_NONBLOCK); !res) {
            return res;
        }
    }
    g_resizeWriteFd = _resizePipe[1];

    struct sigaction sa{};
    sa.sa_handler = onSigwinch;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGWINCH, &sa, &_origWinch) != 0) {
        return Err<void>(std::string("sigaction(SIGWINCH): ") + strerror(errno));
    }
    _handlerInstalled = true;

    if (auto res = _output.write(ENTER_SEQ); !res) {
        return res;
    }
    auto sz = size();
    yinfo("Terminal: raw mode on fd {}, {}x{}", _inFd, sz.width, sz.height);
    return Ok();
}

void Terminal::restore() {
    if (_handlerInstalled) {
        ::sigaction(SIGWINCH, &_origWinch, nullptr);
        _handlerInstalled = false;
    }
    g_resizeWriteFd = -1;
    for (int& fd : _resizePipe) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
    if (_rawMode) {
        if (auto res = _output.write(LEAVE_SEQ); !res) {
            ywarn("Terminal::restore: {}", error_msg(res));
        }
        if (::tcsetattr(_inFd, TCSANOW, &_origTermios) != 0) {
            ywarn("Terminal::restore: tcsetattr: {}", strerror(errno));
        }
        _rawMode = false;
        yinfo("Terminal: restored");
    }
}

TermSize Terminal::size() const {
    struct winsize ws{};
    if (::ioctl(_outFd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        return TermSize{ws.ws_col, ws.ws_row};
    }
    return TermSize{80, 24};
}

bool Terminal::drainResizeSignal() {
    if (_resizePipe[0] < 0) return false;
    bool any = false;
    char buf[64];
    for (;;) {
        ssize_t n = ::read(_resizePipe[0], buf, sizeof(buf));
        if (n > 0) {
            any = true;
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    return any;
}

Result<void> Terminal::readKeys(KeyDecoder& decoder, int escapeTimeoutMs) {
    char buf[256];
    ssize_t n = ::read(_inFd, buf, sizeof(buf));
    if (n == 0) {
        return Err<void>("end of input");
    }
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) {
            return Ok();
        }
        return Err<void>(std::string("read: ") + strerror(errno));
    }
    decoder.feed(std::string_view(buf, static_cast<size_t>(n)));

    // Bounded wait for the rest of an escape sequence
    while (decoder.pending()) {
        struct pollfd pfd{};
        pfd.fd = _inFd;
        pfd.events = POLLIN;
        int ret = ::poll(&pfd, 1, escapeTimeoutMs);
        if (ret < 0) {
            if (errno == EINTR) continue;
            return Err<void>(std::string("poll: ") + strerror(errno));
        }
        if (ret == 0) {
            decoder.timeout();
            break;
        }
        n = ::read(_inFd, buf, sizeof(buf));
        if (n == 0) {
            decoder.timeout();
            return Err<void>("end of input");
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return Err<void>(std::string("read: ") + strerror(errno));
        }
        decoder.feed(std::string_view(buf, static_cast<size_t>(n)));
    }
    return Ok();
}

} // namespace pmc
