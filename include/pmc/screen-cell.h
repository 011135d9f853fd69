#pragma once

#include <cstdint>

namespace pmc {

//=============================================================================
// Color - terminal default, 16-color (normal/bright) or 24-bit
//=============================================================================

struct Color {
    enum class Kind : uint8_t {
        Default,
        Named,   // SGR 30-37 / 40-47
        Bright,  // SGR 90-97 / 100-107
        Rgb      // SGR 38;2 / 48;2
    };

    Kind kind = Kind::Default;
    uint8_t index = 0;  // 0-7 for Named/Bright
    uint8_t r = 0, g = 0, b = 0;

    static constexpr Color defaultColor() { return Color{}; }
    static constexpr Color named(uint8_t i) { return Color{Kind::Named, static_cast<uint8_t>(i & 7), 0, 0, 0}; }
    static constexpr Color bright(uint8_t i) { return Color{Kind::Bright, static_cast<uint8_t>(i & 7), 0, 0, 0}; }
    static constexpr Color rgb(uint8_t r, uint8_t g, uint8_t b) { return Color{Kind::Rgb, 0, r, g, b}; }

    bool operator==(const Color& o) const {
        if (kind != o.kind) return false;
        switch (kind) {
        case Kind::Default: return true;
        case Kind::Named:
        case Kind::Bright: return index == o.index;
        case Kind::Rgb: return r == o.r && g == o.g && b == o.b;
        }
        return false;
    }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

// Named color indices
namespace colors {
static constexpr uint8_t BLACK   = 0;
static constexpr uint8_t RED     = 1;
static constexpr uint8_t GREEN   = 2;
static constexpr uint8_t YELLOW  = 3;
static constexpr uint8_t BLUE    = 4;
static constexpr uint8_t MAGENTA = 5;
static constexpr uint8_t CYAN    = 6;
static constexpr uint8_t WHITE   = 7;
} // namespace colors

// Attribute bits
static constexpr uint8_t ATTR_BOLD      = 0x01;
static constexpr uint8_t ATTR_ITALIC    = 0x02;
static constexpr uint8_t ATTR_UNDERLINE = 0x04;

//=============================================================================
// CellStyle - everything about a cell except its glyph
//=============================================================================

struct CellStyle {
    Color fg;
    Color bg;
    uint8_t attrs = 0;

    bool operator==(const CellStyle& o) const { return fg == o.fg && bg == o.bg && attrs == o.attrs; }
    bool operator!=(const CellStyle& o) const { return !(*this == o); }
};

//=============================================================================
// ScreenCell - one terminal character position
//=============================================================================

struct ScreenCell {
    char32_t glyph = U' ';  // printable, one column wide; ScreenBuffer enforces it
    Color fg;
    Color bg;
    bool bold = false;
    bool italic = false;
    bool underline = false;

    ScreenCell() = default;
    ScreenCell(char32_t ch, const CellStyle& style)
        : glyph(ch), fg(style.fg), bg(style.bg),
          bold(style.attrs & ATTR_BOLD), italic(style.attrs & ATTR_ITALIC),
          underline(style.attrs & ATTR_UNDERLINE) {}

    CellStyle style() const {
        uint8_t attrs = 0;
        if (bold) attrs |= ATTR_BOLD;
        if (italic) attrs |= ATTR_ITALIC;
        if (underline) attrs |= ATTR_UNDERLINE;
        return CellStyle{fg, bg, attrs};
    }

    bool operator==(const ScreenCell& o) const {
        return glyph == o.glyph && fg == o.fg && bg == o.bg &&
               bold == o.bold && italic == o.italic && underline == o.underline;
    }
    bool operator!=(const ScreenCell& o) const { return !(*this == o); }
};

} // namespace pmc
