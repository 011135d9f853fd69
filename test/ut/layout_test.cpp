//=============================================================================
// Layout Tests
//=============================================================================

#include <boost/ut.hpp>
#include <pmc/layout.h>

using namespace boost::ut;
using namespace pmc;

suite layout_tests = [] {
    "standard 80x24 layout"_test = [] {
        auto l = computeLayout(80, 24, 1, 1, 1);
        expect(l.header == Region{RegionKind::Header, 0, 0, 80, 1});
        expect(l.content == Region{RegionKind::Content, 0, 1, 80, 21});
        expect(l.status == Region{RegionKind::Status, 0, 22, 80, 1});
        expect(l.command == Region{RegionKind::Command, 0, 23, 80, 1});
    };

    "regions tile the screen without overlap"_test = [] {
        for (int h = 0; h <= 8; ++h) {
            auto l = computeLayout(40, h, 2, 1, 1);
            int total = l.header.height + l.content.height + l.status.height + l.command.height;
            expect(total == h) << "height" << h;
            expect(l.content.y == l.header.bottom());
            expect(l.status.y == l.content.bottom());
            expect(l.command.y == l.status.bottom());
            expect(l.content.height >= 0_i);
        }
    };

    "tiny terminal keeps header then command then status"_test = [] {
        auto one = computeLayout(10, 1, 1, 1, 1);
        expect(one.header.height == 1_i);
        expect(one.command.empty());
        expect(one.status.empty());
        expect(one.content.empty());

        auto two = computeLayout(10, 2, 1, 1, 1);
        expect(two.header.height == 1_i);
        expect(two.command.height == 1_i);
        expect(two.status.empty());
        expect(two.command.y == 1_i);

        auto three = computeLayout(10, 3, 1, 1, 1);
        expect(three.status.height == 1_i);
        expect(three.content.empty());
    };

    "negative sizes clamp"_test = [] {
        auto l = computeLayout(-5, -2, 1, 1, 1);
        expect(l.header.width == 0_i);
        expect(l.header.height == 0_i);
        expect(l.content.height == 0_i);

        auto noBands = computeLayout(20, 5, -1, 0, 0);
        expect(noBands.content == Region{RegionKind::Content, 0, 0, 20, 5});
    };

    "at looks regions up by kind"_test = [] {
        auto l = computeLayout(20, 10, 1, 1, 1);
        expect(l.at(RegionKind::Command) == l.command);
        expect(l.at(RegionKind::Content) == l.content);
    };
};
