//=============================================================================
// Terminal / EventLoop / Runner Tests
//
// The tty side runs on a pseudo-terminal: the test holds the master end,
// Terminal gets the slave.
//=============================================================================

#include <boost/ut.hpp>
#include <pmc/app.h>
#include <pmc/base/event-loop.h>
#include <pmc/runner.h>
#include <pmc/terminal.h>

#include <csignal>
#include <memory>
#include <string>
#include <vector>

#include <fcntl.h>
#include <pty.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

using namespace boost::ut;
using namespace pmc;

namespace {

struct Pty {
    int master = -1;
    int slave = -1;

    Pty(unsigned short cols, unsigned short rows) {
        struct winsize ws{};
        ws.ws_col = cols;
        ws.ws_row = rows;
        if (::openpty(&master, &slave, nullptr, nullptr, &ws) != 0) {
            master = slave = -1;
            return;
        }
        ::fcntl(master, F_SETFL, ::fcntl(master, F_GETFL) | O_NONBLOCK);
    }
    ~Pty() {
        if (slave >= 0) ::close(slave);
        if (master >= 0) ::close(master);
    }

    bool ok() const { return master >= 0; }

    void send(const std::string& bytes) const {
        ssize_t n = ::write(master, bytes.data(), bytes.size());
        expect(n == static_cast<ssize_t>(bytes.size()));
    }

    // Everything the slave side has written so far
    std::string drain() const {
        std::string out;
        char buf[4096];
        for (;;) {
            ssize_t n = ::read(master, buf, sizeof(buf));
            if (n <= 0) break;
            out.append(buf, static_cast<size_t>(n));
        }
        return out;
    }

    void setSize(unsigned short cols, unsigned short rows) const {
        struct winsize ws{};
        ws.ws_col = cols;
        ws.ws_row = rows;
        ::ioctl(master, TIOCSWINSZ, &ws);
    }
};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

Store::Ptr makeStore() {
    auto adapter = FunctionPersistence::create(
        [] { return Ok(Collections{{"tasks", {}}}); },
        [](const Collections&) { return Ok(); });
    return *Store::create(adapter, {{"tasks", ValidationRules{}}}, StoreOptions{false, 5});
}

std::vector<ColumnSpec> columns(const std::string&) {
    return {{"title", "Title", 20}};
}

// Counts timer events and stops the loop after the last one it wants
class CountingListener : public base::EventListener {
public:
    CountingListener(base::EventLoop& loop, int stopAfter) : _loop(loop), _stopAfter(stopAfter) {}

    Result<bool> onEvent(const base::Event& event) override {
        if (event.type != base::Event::Type::Timer) {
            return Ok(false);
        }
        if (++count >= _stopAfter) {
            if (auto res = _loop.stop(); !res) {
                return Err<bool>("stop failed", res);
            }
        }
        return Ok(true);
    }

    int count = 0;

private:
    base::EventLoop& _loop;
    int _stopAfter;
};

class ReadListener : public base::EventListener {
public:
    ReadListener(base::EventLoop& loop, int fd) : _loop(loop), _fd(fd) {}

    Result<bool> onEvent(const base::Event& event) override {
        if (event.type != base::Event::Type::PollReadable || event.poll.fd != _fd) {
            return Ok(false);
        }
        char buf[64];
        ssize_t n = ::read(_fd, buf, sizeof(buf));
        if (n > 0) data.append(buf, static_cast<size_t>(n));
        return _loop.stop().has_value() ? Ok(true) : Err<bool>("stop failed");
    }

    std::string data;

private:
    base::EventLoop& _loop;
    int _fd;
};

} // namespace

suite event_loop_tests = [] {
    "one-shot timer fires once"_test = [] {
        auto loop = base::EventLoop::create();
        expect(loop.has_value() >> fatal);
        auto listener = std::make_shared<CountingListener>(**loop, 1);
        auto timer = (*loop)->createTimer();
        expect(timer.has_value() >> fatal);
        expect((*loop)->configTimer(*timer, 1).has_value());
        expect((*loop)->registerTimerListener(*timer, listener).has_value());
        expect((*loop)->startTimer(*timer).has_value());
        (*loop)->start();
        expect(listener->count == 1_i);
        expect((*loop)->destroyTimer(*timer).has_value());
    };

    "repeating timer keeps firing until stopped"_test = [] {
        auto loop = base::EventLoop::create();
        expect(loop.has_value() >> fatal);
        auto listener = std::make_shared<CountingListener>(**loop, 3);
        auto timer = *(*loop)->createTimer();
        expect((*loop)->configTimer(timer, 1, 1).has_value());
        expect((*loop)->registerTimerListener(timer, listener).has_value());
        expect((*loop)->startTimer(timer).has_value());
        (*loop)->start();
        expect(listener->count == 3_i);
    };

    "poll reports a readable fd"_test = [] {
        int fds[2];
        expect((::pipe(fds) == 0) >> fatal);
        auto loop = *base::EventLoop::create();
        auto listener = std::make_shared<ReadListener>(*loop, fds[0]);
        auto poll = *loop->createPoll();
        expect(loop->configPoll(poll, fds[0]).has_value());
        expect(loop->registerPollListener(poll, listener).has_value());
        expect(loop->startPoll(poll).has_value());
        expect(::write(fds[1], "hi", 2) == 2);
        loop->start();
        expect(listener->data == "hi");
        expect(loop->destroyPoll(poll).has_value());
        ::close(fds[0]);
        ::close(fds[1]);
    };

    "unknown ids are errors"_test = [] {
        auto loop = *base::EventLoop::create();
        expect(!loop->startPoll(42));
        expect(!loop->configTimer(42, 1));
        expect(!loop->destroyTimer(42));
        auto poll = *loop->createPoll();
        expect(!loop->startPoll(poll)) << "not configured yet";
    };
};

suite terminal_tests = [] {
    "rejects a non-tty input"_test = [] {
        int fds[2];
        expect((::pipe(fds) == 0) >> fatal);
        auto term = Terminal::create(fds[0], fds[1]);
        expect(!term);
        expect(error_msg(term) == "input is not a terminal");
        ::close(fds[0]);
        ::close(fds[1]);
    };

    "enters and restores the session"_test = [] {
        Pty pty(40, 10);
        expect(pty.ok() >> fatal);
        struct termios before{};
        ::tcgetattr(pty.slave, &before);
        {
            auto term = Terminal::create(pty.slave, pty.slave);
            expect(term.has_value() >> fatal);
            struct termios raw{};
            ::tcgetattr(pty.slave, &raw);
            expect(!(raw.c_lflag & ICANON));
            expect(!(raw.c_lflag & ECHO));
            expect(((*term)->size() == TermSize{40, 10}));
            expect(contains(pty.drain(), "\x1b[?1049h\x1b[?25l"));
        }
        struct termios after{};
        ::tcgetattr(pty.slave, &after);
        expect(after.c_lflag == before.c_lflag);
        expect(contains(pty.drain(), "\x1b[?25h\x1b[?1049l"));
    };

    "SIGWINCH wakes the resize pipe"_test = [] {
        Pty pty(40, 10);
        expect(pty.ok() >> fatal);
        auto term = *Terminal::create(pty.slave, pty.slave);
        expect(!term->drainResizeSignal());
        pty.setSize(50, 12);
        ::raise(SIGWINCH);
        expect(term->drainResizeSignal());
        expect(!term->drainResizeSignal()) << "drained";
        expect((term->size() == TermSize{50, 12}));
        term->restore();
    };

    "readKeys decodes what is available"_test = [] {
        Pty pty(40, 10);
        expect(pty.ok() >> fatal);
        auto term = *Terminal::create(pty.slave, pty.slave);
        KeyDecoder decoder;
        pty.send("a\x1b[A");
        expect(term->readKeys(decoder, 25).has_value());
        auto keys = decoder.drain();
        expect((keys.size() == 2_u) >> fatal);
        expect(keys[0] == KeyEvent::character(U'a'));
        expect(keys[1] == KeyEvent::key(KeyCode::Up));
    };

    "a lone escape resolves after the timeout"_test = [] {
        Pty pty(40, 10);
        expect(pty.ok() >> fatal);
        auto term = *Terminal::create(pty.slave, pty.slave);
        KeyDecoder decoder;
        pty.send("\x1b");
        expect(term->readKeys(decoder, 5).has_value());
        expect(!decoder.pending());
        auto keys = decoder.drain();
        expect((keys.size() == 1_u) >> fatal);
        expect(keys[0] == KeyEvent::key(KeyCode::Escape));
    };
};

suite runner_tests = [] {
    "options come from config"_test = [] {
        auto defaults = RunnerOptions::fromConfig(*Config::createDefaults());
        expect(defaults.escapeTimeoutMs == 25_i);
        expect(defaults.resizeDebounceMs == 120_i);

        auto config = Config::createDefaults();
        config->set(Config::KEY_INPUT_ESCAPE_TIMEOUT, 40);
        config->set(Config::KEY_INPUT_RESIZE_DEBOUNCE, 0);
        auto custom = RunnerOptions::fromConfig(*config);
        expect(custom.escapeTimeoutMs == 40_i);
        expect(custom.resizeDebounceMs == 0_i);
    };

    "create requires all parts"_test = [] {
        auto loop = *base::EventLoop::create();
        expect(!Runner::create(nullptr, nullptr, loop));
    };

    "runs until the app quits"_test = [] {
        Pty pty(40, 10);
        expect(pty.ok() >> fatal);
        auto term = *Terminal::create(pty.slave, pty.slave);
        auto app = *App::create(makeStore(), "tasks", columns, term->output(), 80, 24);
        auto loop = *base::EventLoop::create();
        auto runner = Runner::create(term, app, loop);
        expect(runner.has_value() >> fatal);

        // Queued before the loop starts: typed text, then Ctrl+Q
        pty.send("ab\x11");
        auto res = (*runner)->run();
        expect(res.has_value());
        expect(!app->running());
        expect(app->state().command.text() == "ab");
        expect(app->layout().header.width == 40_i) << "sized from the tty";
        expect(app->layout().command.y == 9_i);

        auto out = pty.drain();
        expect(contains(out, " pmc | tasks"));
        term->restore();
    };
};
