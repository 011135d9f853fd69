#pragma once

#include <pmc/screen-buffer.h>
#include <pmc/term-output.h>
#include <cstdint>
#include <map>
#include <string>
#include <utility>

namespace pmc {

//=============================================================================
// RenderDiff - what changed between the front and back buffers
//=============================================================================

struct RenderDiff {
    // (y, x) so iteration is row-major and rows group naturally
    using Key = std::pair<int, int>;

    bool fullRefresh = false;
    std::map<Key, ScreenCell> changes;

    void set(int x, int y, const ScreenCell& cell) { changes[{y, x}] = cell; }
    bool empty() const { return !fullRefresh && changes.empty(); }
    void clear() {
        fullRefresh = false;
        changes.clear();
    }
};

//=============================================================================
// Renderer - double-buffered, differential ANSI output
//
// Upper layers draw into drawBuffer(); render() compares it against what was
// last painted and emits only the changed runs. One cursor move per run,
// one SGR reset per frame.
//=============================================================================

class Renderer {
public:
    Renderer(TermOutput& out, int width, int height, bool truecolor = true);

    ScreenBuffer& drawBuffer() { return _back; }
    const ScreenBuffer& frontBuffer() const { return _front; }

    int width() const { return _back.width(); }
    int height() const { return _back.height(); }

    // Resizes both buffers; next render repaints everything
    void resize(int width, int height);

    void forceFullRefresh() { _forceFull = true; }
    bool fullRefreshPending() const { return _forceFull; }

    // Where the hardware cursor goes after a frame
    void setCursor(int x, int y, bool visible);

    RenderDiff computeDiff() const;

    // Emit the frame. Write failures are logged and counted, never propagated.
    void render();

    uint64_t framesRendered() const { return _frames; }
    uint64_t failedFrames() const { return _failedFrames; }

    // Escape sequence building blocks (exposed for tests)
    std::string sgr(const CellStyle& style) const;
    static std::string moveTo(int x, int y);

private:
    void emitFull(std::string& out);
    void emitDiff(const RenderDiff& diff, std::string& out);
    void emitCursor(std::string& out) const;

    TermOutput& _out;
    ScreenBuffer _front;
    ScreenBuffer _back;
    RenderDiff _diff;
    bool _truecolor;
    bool _forceFull = true;

    int _cursorX = 0;
    int _cursorY = 0;
    bool _cursorVisible = false;

    uint64_t _frames = 0;
    uint64_t _failedFrames = 0;
};

} // namespace pmc
