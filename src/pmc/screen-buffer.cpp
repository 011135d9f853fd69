#include <pmc/screen-buffer.h>
#include <algorithm>

namespace pmc {

std::u32string decodeUtf8(std::string_view text) {
    std::u32string out;
    out.reserve(text.size());
    size_t i = 0;
    const size_t len = text.size();
    while (i < len) {
        auto c = static_cast<unsigned char>(text[i]);
        char32_t cp = 0;
        size_t extra = 0;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        } else {
            out.push_back(U'\uFFFD');
            ++i;
            continue;
        }
        bool ok = true;
        for (size_t k = 1; k <= extra; ++k) {
            if (i + k >= len) {
                ok = false;
                break;
            }
            auto cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                ok = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!ok) {
            out.push_back(U'\uFFFD');
            ++i;
            continue;
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

void appendUtf8(std::string& out, char32_t ch) {
    if (ch <= 0x7F) {
        out.push_back(static_cast<char>(ch));
    } else if (ch <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((ch >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
    } else if (ch <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((ch >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((ch >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((ch >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((ch >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (ch & 0x3F)));
    }
}

namespace {

struct Range {
    char32_t first;
    char32_t last;
};

// East Asian wide/fullwidth blocks and the emoji planes
constexpr Range WIDE[] = {
    {0x1100, 0x115F},   {0x2E80, 0x303E},   {0x3041, 0x33FF},   {0x3400, 0x4DBF},
    {0x4E00, 0x9FFF},   {0xA000, 0xA4CF},   {0xAC00, 0xD7A3},   {0xF900, 0xFAFF},
    {0xFE30, 0xFE4F},   {0xFF00, 0xFF60},   {0xFFE0, 0xFFE6},   {0x1F300, 0x1F64F},
    {0x1F900, 0x1F9FF}, {0x20000, 0x3FFFD},
};

// Combining marks, zero-width and bidi controls, variation selectors, BOM
constexpr Range ZERO_WIDTH[] = {
    {0x0300, 0x036F}, {0x200B, 0x200F}, {0x2028, 0x202E}, {0x2060, 0x2064},
    {0xFE00, 0xFE0F}, {0xFEFF, 0xFEFF},
};

template<size_t N>
bool inRanges(char32_t cp, const Range (&ranges)[N]) {
    for (const auto& r : ranges) {
        if (cp >= r.first && cp <= r.last) return true;
    }
    return false;
}

} // namespace

char32_t displayGlyph(char32_t cp) {
    if (cp == U'\t') return U' ';
    if (cp < 0x20 || (cp >= 0x7F && cp <= 0x9F)) return U'\uFFFD';
    if (cp >= 0xD800 && cp <= 0xDFFF) return U'\uFFFD';
    if (cp > 0x10FFFF) return U'\uFFFD';
    if (inRanges(cp, ZERO_WIDTH) || inRanges(cp, WIDE)) return U'\uFFFD';
    return cp;
}

ScreenBuffer::ScreenBuffer(int width, int height) {
    resize(width, height);
}

ScreenCell ScreenBuffer::get(int x, int y) const {
    if (!contains(x, y)) return ScreenCell{};
    return _cells[index(x, y)];
}

void ScreenBuffer::set(int x, int y, const ScreenCell& cell) {
    if (!contains(x, y)) return;
    _cells[index(x, y)] = cell;
    _cells[index(x, y)].glyph = displayGlyph(cell.glyph);
}

int ScreenBuffer::setText(int x, int y, std::string_view text, Color fg, Color bg, uint8_t attrs) {
    if (y < 0 || y >= _height) return 0;
    CellStyle style{fg, bg, attrs};
    int written = 0;
    int col = x;
    for (char32_t cp : decodeUtf8(text)) {
        if (col >= _width) break;
        if (col >= 0) {
            _cells[index(col, y)] = ScreenCell(displayGlyph(cp), style);
            ++written;
        }
        ++col;
    }
    return written;
}

void ScreenBuffer::fill(int x, int y, int w, int h, const ScreenCell& cell) {
    int x0 = std::max(0, x);
    int y0 = std::max(0, y);
    int x1 = std::min(_width, x + std::max(0, w));
    int y1 = std::min(_height, y + std::max(0, h));
    ScreenCell safe = cell;
    safe.glyph = displayGlyph(cell.glyph);
    for (int row = y0; row < y1; ++row) {
        for (int col = x0; col < x1; ++col) {
            _cells[index(col, row)] = safe;
        }
    }
}

void ScreenBuffer::clear() {
    std::fill(_cells.begin(), _cells.end(), ScreenCell{});
}

void ScreenBuffer::clearRegion(int x, int y, int w, int h) {
    fill(x, y, w, h, ScreenCell{});
}

void ScreenBuffer::resize(int width, int height) {
    width = std::max(0, width);
    height = std::max(0, height);
    if (width == _width && height == _height) return;

    std::vector<ScreenCell> cells(static_cast<size_t>(width) * static_cast<size_t>(height));
    int copyW = std::min(width, _width);
    int copyH = std::min(height, _height);
    for (int row = 0; row < copyH; ++row) {
        for (int col = 0; col < copyW; ++col) {
            cells[static_cast<size_t>(row) * width + col] = _cells[index(col, row)];
        }
    }
    _cells = std::move(cells);
    _width = width;
    _height = height;
}

} // namespace pmc
