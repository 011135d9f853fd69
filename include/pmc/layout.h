#pragma once

namespace pmc {

enum class RegionKind {
    Header,
    Content,
    Status,
    Command
};

struct Region {
    RegionKind kind = RegionKind::Content;
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool empty() const { return width <= 0 || height <= 0; }
    int bottom() const { return y + height; }

    bool operator==(const Region& o) const {
        return kind == o.kind && x == o.x && y == o.y && width == o.width && height == o.height;
    }
};

struct RegionLayout {
    Region header;
    Region content;
    Region status;
    Region command;

    const Region& at(RegionKind kind) const {
        switch (kind) {
        case RegionKind::Header: return header;
        case RegionKind::Status: return status;
        case RegionKind::Command: return command;
        case RegionKind::Content: break;
        }
        return content;
    }
};

// Header on top, command line at the bottom, status above it, content between.
// When the bands do not fit they are satisfied header, command, status in that
// order; content never goes negative.
RegionLayout computeLayout(int width, int height,
                           int headerHeight, int statusHeight, int commandHeight);

} // namespace pmc
