#include <pmc/theme.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace pmc {

namespace {

constexpr std::array<const char*, 8> COLOR_NAMES = {
    "black", "red", "green", "yellow", "blue", "magenta", "cyan", "white"
};

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

void applyColor(const Config& config, const std::string& key, Color& target) {
    auto text = config.get<std::string>(key);
    if (!text) return;
    auto color = parseColor(*text);
    if (!color) {
        ywarn("Theme: {}: {}", key, error_msg(color));
        return;
    }
    target = *color;
}

void applyStyle(const Config& config, const std::string& name, CellStyle& style) {
    applyColor(config, "theme." + name + ".fg", style.fg);
    applyColor(config, "theme." + name + ".bg", style.bg);
}

} // namespace

Result<Color> parseColor(std::string_view text) {
    std::string s(text);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (s.empty() || s == "default") {
        return Ok(Color::defaultColor());
    }

    if (s[0] == '#') {
        if (s.size() != 7) {
            return Err<Color>("bad color '" + std::string(text) + "', expected #rrggbb");
        }
        uint8_t rgb[3];
        for (int i = 0; i < 3; ++i) {
            int hi = hexDigit(s[1 + i * 2]);
            int lo = hexDigit(s[2 + i * 2]);
            if (hi < 0 || lo < 0) {
                return Err<Color>("bad color '" + std::string(text) + "', not hex");
            }
            rgb[i] = static_cast<uint8_t>(hi * 16 + lo);
        }
        return Ok(Color::rgb(rgb[0], rgb[1], rgb[2]));
    }

    bool isBright = false;
    std::string_view name = s;
    constexpr std::string_view BRIGHT_PREFIX = "bright-";
    if (name.substr(0, BRIGHT_PREFIX.size()) == BRIGHT_PREFIX) {
        isBright = true;
        name.remove_prefix(BRIGHT_PREFIX.size());
    }
    for (size_t i = 0; i < COLOR_NAMES.size(); ++i) {
        if (name == COLOR_NAMES[i]) {
            auto index = static_cast<uint8_t>(i);
            return Ok(isBright ? Color::bright(index) : Color::named(index));
        }
    }
    return Err<Color>("unknown color '" + std::string(text) + "'");
}

Theme Theme::fromConfig(const Config& config) {
    Theme theme;
    applyStyle(config, "header", theme.header);
    applyStyle(config, "grid-header", theme.gridHeader);
    applyStyle(config, "row", theme.row);
    applyStyle(config, "selected-row", theme.selectedRow);
    applyStyle(config, "selected-cell", theme.selectedCell);
    applyStyle(config, "edit-cell", theme.editCell);
    applyStyle(config, "status", theme.status);
    applyStyle(config, "command", theme.command);
    applyStyle(config, "command-focused", theme.commandFocused);
    return theme;
}

} // namespace pmc
