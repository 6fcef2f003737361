//
// Unit tests for outline bounding boxes
//

#include <doctest/doctest.h>
#include <interlock/markup/outline_extent.hh>
#include <interlock/markup/markup_parser.hh>

namespace {
    void check_extent(const std::optional<interlock::outline_extent>& e,
                      float x0, float y0, float x1, float y1) {
        REQUIRE(e.has_value());
        CHECK(e->min.x == doctest::Approx(x0).epsilon(1e-4));
        CHECK(e->min.y == doctest::Approx(y0).epsilon(1e-4));
        CHECK(e->max.x == doctest::Approx(x1).epsilon(1e-4));
        CHECK(e->max.y == doctest::Approx(y1).epsilon(1e-4));
    }

    std::optional<interlock::outline_extent> shape(const char* markup) {
        const auto doc = interlock::svg_markup_parser{}.parse(markup);
        REQUIRE(!doc.children.empty());
        return interlock::element_extent(doc.children[0]);
    }
}

TEST_SUITE("path_extent") {
    using namespace interlock;

    TEST_CASE("absolute lines") {
        check_extent(path_extent("M10 20 L30 40"), 10, 20, 30, 40);
    }

    TEST_CASE("relative commands accumulate") {
        check_extent(path_extent("m10 10 l10 0 l0 10 z"), 10, 10, 20, 20);
    }

    TEST_CASE("horizontal and vertical lines") {
        check_extent(path_extent("M0 0 H50 V25"), 0, 0, 50, 25);
        check_extent(path_extent("M10 10 h-20 v-5"), -10, 5, 10, 10);
    }

    TEST_CASE("implicit lineto after moveto") {
        check_extent(path_extent("M0 0 10 10 20 0"), 0, 0, 20, 10);
    }

    TEST_CASE("compact number syntax") {
        check_extent(path_extent("M1.5.5L-2-3"), -2, -3, 1.5f, 0.5f);
        check_extent(path_extent("M1e1,0 L2E1,5"), 10, 0, 20, 5);
        check_extent(path_extent("M+3 +4"), 3, 4, 3, 4);
    }

    TEST_CASE("cubic control points are included") {
        check_extent(path_extent("M0 0 C0 -10 20 -10 20 0"), 0, -10, 20, 0);
    }

    TEST_CASE("smooth cubic reflects the previous control point") {
        // Reflection of (10,-10) about (20,0) is (30,10)
        check_extent(path_extent("M0 0 C0 0 10 -10 20 0 S40 0 40 0"), 0, -10, 40, 10);
    }

    TEST_CASE("smooth quadratic reflects the previous control point") {
        // Reflection of (10,20) about (20,0) is (30,-20)
        check_extent(path_extent("M0 0 Q10 20 20 0 T40 0"), 0, -20, 40, 20);
    }

    TEST_CASE("elliptical arcs are bounded exactly") {
        // Upper half circle around (50,50)
        check_extent(path_extent("M0 50 A50 50 0 0 1 100 50"), 0, 0, 100, 50);
        // Lower half circle
        check_extent(path_extent("M0 50 A50 50 0 0 0 100 50"), 0, 50, 100, 100);
        // Relative endpoint with compact flags
        check_extent(path_extent("M0 50a50 50 0 01100 0"), 0, 0, 100, 50);
    }

    TEST_CASE("arc radii are scaled up when too small") {
        // Radius 1 cannot span 100 units, the arc becomes a half circle of radius 50
        check_extent(path_extent("M0 50 A1 1 0 0 1 100 50"), 0, 0, 100, 50);
    }

    TEST_CASE("degenerate arcs act as lines") {
        check_extent(path_extent("M0 0 A0 10 0 0 1 30 40"), 0, 0, 30, 40);
    }

    TEST_CASE("parsing stops at the first error") {
        check_extent(path_extent("M0 0 L10 10 L20"), 0, 0, 10, 10);
        check_extent(path_extent("M5 5 L10 10 X 100 100"), 5, 5, 10, 10);
    }

    TEST_CASE("empty data has no extent") {
        CHECK_FALSE(path_extent("").has_value());
        CHECK_FALSE(path_extent("   ").has_value());
        CHECK_FALSE(path_extent("10 10").has_value());
    }
}

TEST_SUITE("element_extent") {
    using namespace interlock;

    TEST_CASE("outline element names") {
        for (const char* name : {"path", "rect", "circle", "ellipse", "line", "polyline", "polygon"}) {
            CHECK(is_outline_element(name));
        }
        CHECK_FALSE(is_outline_element("g"));
        CHECK_FALSE(is_outline_element("text"));
    }

    TEST_CASE("rect") {
        check_extent(shape(R"(<rect x="10" y="20" width="30" height="5"/>)"), 10, 20, 40, 25);
        check_extent(shape(R"(<rect width="30px" height="5"/>)"), 0, 0, 30, 5);
        CHECK_FALSE(shape(R"(<rect width="0" height="5"/>)").has_value());
    }

    TEST_CASE("circle and ellipse") {
        check_extent(shape(R"(<circle cx="50" cy="50" r="10"/>)"), 40, 40, 60, 60);
        check_extent(shape(R"(<ellipse cx="50" cy="50" rx="20" ry="5"/>)"), 30, 45, 70, 55);
        CHECK_FALSE(shape(R"(<circle cx="50" cy="50"/>)").has_value());
    }

    TEST_CASE("line, polyline and polygon") {
        check_extent(shape(R"(<line x1="40" y1="10" x2="0" y2="30"/>)"), 0, 10, 40, 30);
        check_extent(shape(R"(<polyline points="0,0 10,20 -5,5"/>)"), -5, 0, 10, 20);
        check_extent(shape(R"(<polygon points="1 2 3 4 5"/>)"), 1, 2, 3, 4);
        CHECK_FALSE(shape(R"(<polygon/>)").has_value());
    }

    TEST_CASE("path without data") {
        CHECK_FALSE(shape("<path/>").has_value());
    }

    TEST_CASE("non-outline elements") {
        CHECK_FALSE(shape("<g/>").has_value());
    }
}

TEST_SUITE("extent_builder") {
    using namespace interlock;

    TEST_CASE("empty builder") {
        extent_builder b;
        CHECK(b.empty());
        CHECK_FALSE(b.extent().has_value());
    }

    TEST_CASE("accumulates points") {
        extent_builder b;
        b.add(5, 5);
        b.add(euler::point2f{-1.0f, 10.0f});
        CHECK_FALSE(b.empty());
        const auto e = b.extent();
        REQUIRE(e.has_value());
        CHECK(e->width() == doctest::Approx(6.0f));
        CHECK(e->height() == doctest::Approx(5.0f));
    }
}
