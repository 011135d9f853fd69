#pragma once

#include <pmc/config.h>
#include <pmc/result.hpp>
#include <pmc/screen-cell.h>
#include <string_view>

namespace pmc {

// "default", "black".."white", "bright-black".."bright-white", "#rrggbb"
Result<Color> parseColor(std::string_view text);

//=============================================================================
// Theme - cell styles for every part of the interface
//=============================================================================

struct Theme {
    CellStyle header{Color::bright(colors::WHITE), Color::named(colors::BLUE), ATTR_BOLD};
    CellStyle gridHeader{Color::bright(colors::YELLOW), Color::defaultColor(), ATTR_BOLD | ATTR_UNDERLINE};
    CellStyle row{};
    CellStyle selectedRow{Color::named(colors::BLACK), Color::named(colors::CYAN), 0};
    CellStyle selectedCell{Color::named(colors::BLACK), Color::bright(colors::CYAN), ATTR_BOLD};
    CellStyle editCell{Color::bright(colors::WHITE), Color::named(colors::MAGENTA), ATTR_UNDERLINE};
    CellStyle status{Color::named(colors::BLACK), Color::named(colors::WHITE), 0};
    CellStyle command{};
    CellStyle commandFocused{Color::bright(colors::WHITE), Color::defaultColor(), ATTR_BOLD};

    // Reads theme.<name>.fg / .bg; a bad color string is logged and the default kept
    static Theme fromConfig(const Config& config);
};

} // namespace pmc
