#include <pmc/renderer.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <optional>

namespace pmc {

namespace {

constexpr const char* CSI = "\x1b[";
constexpr const char* HIDE_CURSOR = "\x1b[?25l";
constexpr const char* SHOW_CURSOR = "\x1b[?25h";
constexpr const char* RESET_SGR = "\x1b[0m";
constexpr const char* CLEAR_SCREEN = "\x1b[2J";

int toCube(uint8_t c) {
    return c / 51; // map 0-255 to 0-5
}

void appendColor(std::string& seq, const Color& color, bool foreground, bool truecolor) {
    switch (color.kind) {
    case Color::Kind::Default:
        // SGR 0 at the start of every sequence already selected the default
        break;
    case Color::Kind::Named:
        seq += ';';
        seq += std::to_string((foreground ? 30 : 40) + color.index);
        break;
    case Color::Kind::Bright:
        seq += ';';
        seq += std::to_string((foreground ? 90 : 100) + color.index);
        break;
    case Color::Kind::Rgb:
        if (truecolor) {
            seq += foreground ? ";38;2;" : ";48;2;";
            seq += std::to_string(color.r) + ";" + std::to_string(color.g) + ";" +
                   std::to_string(color.b);
        } else {
            int idx = 16 + 36 * toCube(color.r) + 6 * toCube(color.g) + toCube(color.b);
            seq += foreground ? ";38;5;" : ";48;5;";
            seq += std::to_string(idx);
        }
        break;
    }
}

} // namespace

Renderer::Renderer(TermOutput& out, int width, int height, bool truecolor)
    : _out(out), _front(width, height), _back(width, height), _truecolor(truecolor) {}

void Renderer::resize(int width, int height) {
    _front.resize(width, height);
    _back.resize(width, height);
    _forceFull = true;
    _diff.clear();
    ydebug("Renderer::resize: {}x{}", width, height);
}

void Renderer::setCursor(int x, int y, bool visible) {
    _cursorX = x;
    _cursorY = y;
    _cursorVisible = visible;
}

std::string Renderer::sgr(const CellStyle& style) const {
    std::string seq = CSI;
    seq += '0';
    if (style.attrs & ATTR_BOLD) seq += ";1";
    if (style.attrs & ATTR_ITALIC) seq += ";3";
    if (style.attrs & ATTR_UNDERLINE) seq += ";4";
    appendColor(seq, style.fg, true, _truecolor);
    appendColor(seq, style.bg, false, _truecolor);
    seq += 'm';
    return seq;
}

std::string Renderer::moveTo(int x, int y) {
    return std::string(CSI) + std::to_string(y + 1) + ";" + std::to_string(x + 1) + "H";
}

RenderDiff Renderer::computeDiff() const {
    RenderDiff diff;
    if (_forceFull || _front.width() != _back.width() || _front.height() != _back.height()) {
        diff.fullRefresh = true;
        return diff;
    }
    for (int y = 0; y < _back.height(); ++y) {
        for (int x = 0; x < _back.width(); ++x) {
            const ScreenCell cell = _back.get(x, y);
            if (cell != _front.get(x, y)) {
                diff.set(x, y, cell);
            }
        }
    }
    return diff;
}

void Renderer::emitFull(std::string& out) {
    out += RESET_SGR;
    out += CLEAR_SCREEN;
    std::optional<CellStyle> current;
    for (int y = 0; y < _back.height(); ++y) {
        out += moveTo(0, y);
        for (int x = 0; x < _back.width(); ++x) {
            const ScreenCell cell = _back.get(x, y);
            CellStyle style = cell.style();
            if (!current || *current != style) {
                out += sgr(style);
                current = style;
            }
            appendUtf8(out, cell.glyph);
        }
    }
}

void Renderer::emitDiff(const RenderDiff& diff, std::string& out) {
    std::optional<CellStyle> current;
    int runY = -1;
    int nextX = -1;
    for (const auto& [key, cell] : diff.changes) {
        const int y = key.first;
        const int x = key.second;
        if (y != runY || x != nextX) {
            // New run: one cursor move, then the batched cells
            out += moveTo(x, y);
            runY = y;
        }
        CellStyle style = cell.style();
        if (!current || *current != style) {
            out += sgr(style);
            current = style;
        }
        appendUtf8(out, cell.glyph);
        nextX = x + 1;
    }
}

void Renderer::emitCursor(std::string& out) const {
    if (!_cursorVisible || _back.width() == 0 || _back.height() == 0) {
        return;
    }
    int x = std::clamp(_cursorX, 0, _back.width() - 1);
    int y = std::clamp(_cursorY, 0, _back.height() - 1);
    out += moveTo(x, y);
    out += SHOW_CURSOR;
}

void Renderer::render() {
    _diff = computeDiff();

    std::string out;
    out += HIDE_CURSOR;
    if (_diff.fullRefresh) {
        emitFull(out);
    } else {
        emitDiff(_diff, out);
    }
    out += RESET_SGR;
    emitCursor(out);

    auto res = _out.write(out);
    if (res) {
        res = _out.flush();
    }
    if (!res) {
        ++_failedFrames;
        ywarn("Renderer: frame skipped ({} failed so far): {}", _failedFrames, error_msg(res));
        // Terminal state is unknown after a partial write
        _forceFull = true;
        _diff.clear();
        return;
    }

    _front = _back;
    _forceFull = false;
    _diff.clear();
    ++_frames;
}

} // namespace pmc
