#pragma once

#include <pmc/screen-cell.h>
#include <string>
#include <string_view>
#include <vector>

namespace pmc {

// Decode UTF-8 into code points; invalid bytes become U+FFFD
std::u32string decodeUtf8(std::string_view text);

// Append the UTF-8 encoding of one code point
void appendUtf8(std::string& out, char32_t cp);

// What a cell may hold: one printable, single-column code point. Tab becomes
// a space; C0/C1 controls, DEL, zero-width and double-width code points
// become U+FFFD so stored text can neither move the terminal cursor nor
// inject escape sequences.
char32_t displayGlyph(char32_t cp);

//=============================================================================
// ScreenBuffer - width x height grid of cells, row-major
//
// Coordinates are never trusted: out-of-range reads return a default cell
// and out-of-range writes are dropped. A resize landing between layout and
// draw must not take the frame down. Every write passes its glyph through
// displayGlyph(), so one cell is always exactly one terminal column.
//=============================================================================

class ScreenBuffer {
public:
    ScreenBuffer(int width = 0, int height = 0);

    int width() const { return _width; }
    int height() const { return _height; }

    bool contains(int x, int y) const {
        return x >= 0 && y >= 0 && x < _width && y < _height;
    }

    ScreenCell get(int x, int y) const;
    void set(int x, int y, const ScreenCell& cell);

    // Write UTF-8 text starting at (x, y), one cell per code point.
    // Text is not interpreted: a newline is drawn as U+FFFD, not a line break.
    // Stops at the right edge. Returns the number of cells written.
    int setText(int x, int y, std::string_view text, Color fg, Color bg, uint8_t attrs = 0);
    int setText(int x, int y, std::string_view text, const CellStyle& style) {
        return setText(x, y, text, style.fg, style.bg, style.attrs);
    }

    void fill(int x, int y, int w, int h, const ScreenCell& cell);

    void clear();
    void clearRegion(int x, int y, int w, int h);

    // Keeps the overlapping top-left region
    void resize(int width, int height);

    bool operator==(const ScreenBuffer& o) const {
        return _width == o._width && _height == o._height && _cells == o._cells;
    }
    bool operator!=(const ScreenBuffer& o) const { return !(*this == o); }

private:
    size_t index(int x, int y) const {
        return static_cast<size_t>(y) * static_cast<size_t>(_width) + static_cast<size_t>(x);
    }

    int _width = 0;
    int _height = 0;
    std::vector<ScreenCell> _cells;
};

} // namespace pmc
