#pragma once

#include <pmc/key-event.h>
#include <string>

namespace pmc {

// Single-line text buffer with a cursor counted in code points
class LineEditor {
public:
    LineEditor() = default;

    std::string text() const;
    size_t cursor() const { return _cursor; }
    size_t length() const { return _chars.size(); }
    bool empty() const { return _chars.empty(); }

    // Cursor past the end is clamped to the end
    void setText(const std::string& text, size_t cursor = std::string::npos);
    void clear();

    void insert(char32_t ch);
    bool backspace();
    bool deleteForward();
    bool moveLeft();
    bool moveRight();
    void home() { _cursor = 0; }
    void end() { _cursor = _chars.size(); }

    // Printable text, Backspace, Delete, Left, Right, Home, End.
    // Returns false for any other key.
    bool handleKey(const KeyEvent& ev);

private:
    std::u32string _chars;
    size_t _cursor = 0;
};

} // namespace pmc
