//
// Unit tests for footprint extraction
//

#include <doctest/doctest.h>
#include <interlock/footprint.hh>
#include <interlock/markup/markup_parser.hh>
#include <interlock/errors.hh>
#include <atomic>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace {
    using namespace interlock;

    std::string svg(const std::string& attrs, const std::string& body) {
        return "<svg xmlns=\"http://www.w3.org/2000/svg\" " + attrs + ">" + body + "</svg>";
    }

    // Run invariants that must hold for every extracted glyph
    void check_runs(const processed_glyph& g) {
        REQUIRE(g.runs.size() == g.grid.cols());
        for (std::size_t c = 0; c < g.runs.size(); ++c) {
            int previous_bottom = -1;
            for (const auto& run : g.runs[c]) {
                CHECK(run.bottom >= run.top);
                CHECK(run.density > 0.0);
                CHECK(run.density <= 1.0);
                CHECK(run.top > previous_bottom);
                CHECK(run.bottom < static_cast<int>(g.grid.rows()));
                previous_bottom = run.bottom;
            }
        }
    }

    class counting_parser final : public markup_parser {
    public:
        [[nodiscard]] markup_element parse(std::string_view text) const override {
            ++calls;
            return m_inner.parse(text);
        }

        mutable std::atomic<int> calls{0};

    private:
        svg_markup_parser m_inner;
    };
}

TEST_SUITE("footprint helpers") {
    using namespace interlock;

    TEST_CASE("viewBox parsing") {
        const auto f = parse_view_box("0 0 200 100");
        REQUIRE(f.has_value());
        CHECK(*f == glyph_frame{0, 0, 200, 100});

        CHECK(parse_view_box("10,20,30,40") == glyph_frame{10, 20, 30, 40});
        CHECK(parse_view_box(" -5 , 0  12.5 1e2 ") == glyph_frame{-5, 0, 12.5f, 100});
        CHECK_FALSE(parse_view_box("0 0 100").has_value());
        CHECK_FALSE(parse_view_box("0 0 100 100 5").has_value());
        CHECK_FALSE(parse_view_box("a b c d").has_value());
    }

    TEST_CASE("grid size is ceil of frame over resolution") {
        CHECK(grid_size({0, 0, 200, 100}) == std::pair<std::size_t, std::size_t>{10, 20});
        CHECK(grid_size({0, 0, 95, 42}) == std::pair<std::size_t, std::size_t>{5, 10});
        CHECK(grid_size({0, 0, 50, 1}) == std::pair<std::size_t, std::size_t>{1, 5});
    }

    TEST_CASE("rasterize marks touched cells") {
        const glyph_frame frame{0, 0, 100, 100};
        const std::vector<outline_extent> boxes{{{15, 20}, {35, 30}}};
        const auto grid = rasterize(frame, boxes);
        REQUIRE(grid.rows() == 10);
        REQUIRE(grid.cols() == 10);
        // columns floor(1.5)=1 .. ceil(3.5)-1=3, rows 2 .. 2
        CHECK(grid.count() == 3);
        CHECK(grid.cell(2, 1));
        CHECK(grid.cell(2, 3));
        CHECK_FALSE(grid.cell(3, 1));
    }

    TEST_CASE("rasterize is relative to the frame origin and clipped") {
        const glyph_frame frame{50, 50, 100, 100};
        const std::vector<outline_extent> boxes{{{50, 50}, {70, 60}}, {{140, 140}, {400, 400}}};
        const auto grid = rasterize(frame, boxes);
        CHECK(grid.cell(0, 0));
        CHECK(grid.cell(0, 1));
        CHECK_FALSE(grid.cell(0, 2));
        CHECK(grid.cell(9, 9));
        CHECK(grid.count() == 3);
    }

    TEST_CASE("zero width boxes mark one column") {
        const std::vector<outline_extent> boxes{{{45, 0}, {45, 100}}};
        const auto grid = rasterize({0, 0, 100, 100}, boxes);
        CHECK(grid.count() == 10);
        CHECK(grid.cell(0, 4));
        CHECK(grid.cell(9, 4));
    }

    TEST_CASE("grid size stays bounded for extreme frames") {
        const float inf = std::numeric_limits<float>::infinity();
        const float nan = std::numeric_limits<float>::quiet_NaN();
        CHECK(grid_size({0, 0, inf, nan}) == std::pair<std::size_t, std::size_t>{1, MAX_GRID_CELLS});
        CHECK(grid_size({0, 0, -50, 1e30f}) == std::pair<std::size_t, std::size_t>{MAX_GRID_CELLS, 1});
    }

    TEST_CASE("rasterize clamps huge extents and skips non-finite ones") {
        const float inf = std::numeric_limits<float>::infinity();
        const std::vector<outline_extent> boxes{{{-1e30f, 0}, {1e30f, 50}},
                                                {{inf, 0}, {inf, 100}},
                                                {{0, std::nanf("")}, {10, 10}}};
        const auto grid = rasterize({0, 0, 100, 100}, boxes);
        CHECK(grid.count() == 50);
        CHECK(grid.cell(0, 0));
        CHECK(grid.cell(4, 9));
        CHECK_FALSE(grid.cell(5, 0));

        CHECK_THROWS_AS((void)rasterize({0, 0, 1e5f, 1e5f}, {}), std::invalid_argument);
    }

    TEST_CASE("vertical runs close at gaps and at the bottom edge") {
        pixel_grid grid(6, 2);
        grid.set(1, 0);
        grid.set(2, 0);
        grid.set(4, 0);
        grid.set(5, 0);

        const auto runs = compute_vertical_runs(grid);
        REQUIRE(runs.size() == 2);
        REQUIRE(runs[0].size() == 2);
        CHECK(runs[0][0] == vertical_run{1, 2, 1.0});
        CHECK(runs[0][1] == vertical_run{4, 5, 1.0});
        CHECK(runs[1].empty());
    }
}

TEST_SUITE("footprint_extractor") {
    using namespace interlock;

    TEST_CASE("grid dimensions follow the viewBox") {
        footprint_extractor extractor;
        const auto g = extractor.extract(svg(R"(viewBox="0 0 200 100")", R"(<path d="M10 10 L190 90"/>)"), 'w');

        CHECK(g.character == 'w');
        CHECK(g.frame == glyph_frame{0, 0, 200, 100});
        CHECK(g.bounds == glyph_bounds{0, 200, 0, 100});
        CHECK(g.grid.rows() == 10);
        CHECK(g.grid.cols() == 20);
        CHECK(g.grid.rows() == static_cast<std::size_t>(std::ceil(g.height() / SAMPLING_RESOLUTION)));
        CHECK(g.grid.cols() == static_cast<std::size_t>(std::ceil(g.width() / SAMPLING_RESOLUTION)));
        CHECK_FALSE(g.is_space);
        check_runs(g);
    }

    TEST_CASE("missing viewBox uses the default frame") {
        footprint_extractor extractor;
        const auto g = extractor.extract(svg(R"(width="300")", R"(<rect x="0" y="0" width="10" height="10"/>)"), 'i');
        CHECK(g.frame == glyph_frame{});
        CHECK(g.grid.rows() == 10);
        CHECK(g.grid.cols() == 10);
        CHECK(g.grid.count() == 1);
    }

    TEST_CASE("all outline elements at any depth contribute") {
        footprint_extractor extractor;
        const auto g = extractor.extract(
            svg(R"(viewBox="0 0 100 100")",
                R"(<g><g><path d="M0 0 L9 9"/></g></g><circle cx="95" cy="95" r="4"/>)"),
            'k');
        CHECK(g.grid.cell(0, 0));
        CHECK(g.grid.cell(9, 9));
        CHECK(g.grid.count() == 2);
        check_runs(g);
    }

    TEST_CASE("separate boxes in a column give ordered runs") {
        footprint_extractor extractor;
        const auto g = extractor.extract(
            svg(R"(viewBox="0 0 10 100")",
                R"(<rect x="0" y="60" width="10" height="20"/><rect x="0" y="0" width="10" height="20"/>)"),
            'i');
        REQUIRE(g.runs.size() == 1);
        REQUIRE(g.runs[0].size() == 2);
        CHECK(g.runs[0][0].top == 0);
        CHECK(g.runs[0][0].bottom == 1);
        CHECK(g.runs[0][1].top == 6);
        CHECK(g.runs[0][1].bottom == 7);
        check_runs(g);
    }

    TEST_CASE("markup is kept verbatim") {
        footprint_extractor extractor;
        const auto text = svg(R"(viewBox="0 0 10 10")", R"(<path d="M0 0 L5 5"/>)");
        CHECK(extractor.extract(text, 'a').markup == text);
    }

    TEST_CASE("malformed glyphs") {
        footprint_extractor extractor;

        SUBCASE("no outline element") {
            CHECK_THROWS_AS((void)extractor.extract(svg(R"(viewBox="0 0 10 10")", "<title>a</title>"), 'a'),
                            malformed_glyph_error);
        }
        SUBCASE("no svg root") {
            CHECK_THROWS_AS((void)extractor.extract("<g><path d='M0 0 L1 1'/></g>", 'a'), malformed_glyph_error);
        }
        SUBCASE("unparseable markup") {
            CHECK_THROWS_AS((void)extractor.extract("<svg><path d='M0 0'>", 'a'), malformed_glyph_error);
        }
        SUBCASE("frame without area") {
            CHECK_THROWS_AS((void)extractor.extract(svg(R"(viewBox="0 0 0 10")", "<path d='M0 0 L1 1'/>"), 'a'),
                            malformed_glyph_error);
        }
        SUBCASE("frame too large for the grid") {
            CHECK_THROWS_AS((void)extractor.extract(svg(R"(viewBox="0 0 1e9 1e9")", "<path d='M0 0 L1 1'/>"), 'a'),
                            malformed_glyph_error);
        }
        SUBCASE("infinite frame") {
            CHECK_THROWS_AS((void)extractor.extract(svg(R"(viewBox="0 0 inf 100")", "<path d='M0 0 L1 1'/>"), 'a'),
                            malformed_glyph_error);
        }
    }

    TEST_CASE("malformed glyph error names the character") {
        footprint_extractor extractor;
        try {
            (void)extractor.extract("<svg/>", 'q');
            FAIL("expected malformed_glyph_error");
        } catch (const malformed_glyph_error& e) {
            CHECK(e.character() == 'q');
            CHECK(std::string(e.what()).find("'q'") != std::string::npos);
        }
    }

    TEST_CASE("outline elements without geometry give an empty footprint") {
        footprint_extractor extractor;
        const auto g = extractor.extract(svg(R"(viewBox="0 0 20 20")", "<path/>"), 'e');
        CHECK(g.grid.count() == 0);
        CHECK(g.runs.size() == 2);
        CHECK(g.runs[0].empty());
    }

    TEST_CASE("paths far outside the frame are clipped to it") {
        footprint_extractor extractor;
        const auto g = extractor.extract(svg(R"(viewBox="0 0 100 100")", R"(<path d="M-1e30 0 L1e30 50"/>)"), 'h');
        CHECK(g.grid.count() == 50);
        check_runs(g);
    }

    TEST_CASE("injected parser is used") {
        auto parser = std::make_shared<counting_parser>();
        footprint_extractor extractor(parser);
        (void)extractor.extract(svg(R"(viewBox="0 0 10 10")", "<path d='M0 0 L1 1'/>"), 'a');
        CHECK(parser->calls.load() == 1);
        CHECK(&extractor.parser() == parser.get());
    }

    TEST_CASE("null parser is rejected") {
        CHECK_THROWS_AS(footprint_extractor(nullptr), std::invalid_argument);
    }

    TEST_CASE("extraction is deterministic") {
        footprint_extractor extractor;
        const auto text = svg(R"(viewBox="0 0 100 100")", R"(<path d="M20 30 C40 0 60 0 80 30 A20 20 0 0 1 20 30"/>)");
        CHECK(extractor.extract(text, 'a') == extractor.extract(text, 'a'));
    }
}
