#include <pmc/layout.h>
#include <algorithm>

namespace pmc {

RegionLayout computeLayout(int width, int height,
                           int headerHeight, int statusHeight, int commandHeight) {
    width = std::max(0, width);
    height = std::max(0, height);

    int remaining = height;
    const int header = std::min(std::max(0, headerHeight), remaining);
    remaining -= header;
    const int command = std::min(std::max(0, commandHeight), remaining);
    remaining -= command;
    const int status = std::min(std::max(0, statusHeight), remaining);
    remaining -= status;
    const int content = remaining;

    RegionLayout layout;
    layout.header = {RegionKind::Header, 0, 0, width, header};
    layout.content = {RegionKind::Content, 0, header, width, content};
    layout.status = {RegionKind::Status, 0, header + content, width, status};
    layout.command = {RegionKind::Command, 0, header + content + status, width, command};
    return layout;
}

} // namespace pmc
