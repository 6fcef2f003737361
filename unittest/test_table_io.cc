//
// Unit tests for YAML lookup artifacts
//

#include <doctest/doctest.h>
#include <interlock/lookup/table_io.hh>
#include <interlock/lookup/table_generator.hh>
#include <interlock/footprint.hh>
#include <interlock/errors.hh>

namespace {
    using namespace interlock;

    glyph_table sample_glyphs() {
        footprint_extractor extractor;
        glyph_record a;
        a.key = glyph_key{"straight", 'a', glyph_variant::standard};
        a.glyph = extractor.extract(
            R"(<svg viewBox="0 0 120 100"><path d="M20 30 L60 30 L60 80 Z"/><rect x="90" y="10" width="10" height="10"/></svg>)",
            'a');
        a.metadata = glyph_metadata{true, false, 0.25, a.glyph.markup.size(), true};

        glyph_record y;
        y.key = glyph_key{"straight", 'y', glyph_variant::last};
        y.glyph = extractor.extract(R"(<svg viewBox="5 5 30 40"><line x1="5" y1="5" x2="35" y2="45"/></svg>)", 'Y');
        y.glyph.scale = 0.75f;
        y.glyph.rotation = -5.0f;

        return glyph_table({a, y});
    }
}

TEST_SUITE("overlap table io") {
    using namespace interlock;

    TEST_CASE("generated table survives a round trip") {
        const auto table = generate_overlap_table(standard_charset(), "straight", overlap_rule_set::defaults(),
                                                  rotation_rules::defaults());
        const auto text = serialize(table);
        CHECK(text.find("format_version: 1") != std::string::npos);
        CHECK(deserialize_overlap_table(text) == table);
    }

    TEST_CASE("rotations are optional") {
        const auto table = deserialize_overlap_table(
            "format_version: 1\n"
            "style: round\n"
            "overlaps:\n"
            "  a: {b: 0.25, C: 0.5}\n");
        CHECK(table.style() == "round");
        CHECK(table.find('a', 'c') == 0.5);
        CHECK(table.rotations().empty());
    }

    TEST_CASE("invalid documents") {
        CHECK_THROWS_AS((void)deserialize_overlap_table("[1, 2"), config_error);
        CHECK_THROWS_AS((void)deserialize_overlap_table("- a\n- b\n"), config_error);
        CHECK_THROWS_AS((void)deserialize_overlap_table("style: s\noverlaps: {}\n"), config_error);
        CHECK_THROWS_AS((void)deserialize_overlap_table("format_version: 2\nstyle: s\noverlaps: {}\n"), config_error);
        CHECK_THROWS_AS((void)deserialize_overlap_table("format_version: 1\nstyle: s\n"), config_error);
        CHECK_THROWS_AS((void)deserialize_overlap_table("format_version: 1\nstyle: s\noverlaps: {a: {b: 1.5}}\n"),
                        config_error);
        CHECK_THROWS_AS((void)deserialize_overlap_table("format_version: 1\nstyle: s\noverlaps: {ab: {c: 0.1}}\n"),
                        config_error);
        CHECK_THROWS_AS((void)deserialize_overlap_table("format_version: 1\nstyle: s\noverlaps: {a: {b: wide}}\n"),
                        config_error);
    }

    TEST_CASE("error names the offending key") {
        try {
            (void)deserialize_overlap_table("format_version: 1\nstyle: s\noverlaps: {a: {b: 1.5}}\n");
            FAIL("expected config_error");
        } catch (const config_error& e) {
            CHECK(std::string(e.what()).find("overlaps.a.b") != std::string::npos);
        }
    }
}

TEST_SUITE("glyph table io") {
    using namespace interlock;

    TEST_CASE("round trip keeps footprints and metadata") {
        const auto table = sample_glyphs();
        const auto restored = deserialize_glyph_table(serialize(table));
        REQUIRE(restored.size() == table.size());

        const auto* a = restored.find_exact("straight", 'a', glyph_variant::standard);
        REQUIRE(a != nullptr);
        const auto* original = table.find_exact("straight", 'a', glyph_variant::standard);
        CHECK(a->glyph.grid == original->glyph.grid);
        CHECK(a->glyph.runs == original->glyph.runs);
        CHECK(a->glyph.frame == original->glyph.frame);
        CHECK(a->glyph.markup == original->glyph.markup);
        CHECK(a->metadata == original->metadata);

        const auto* y = restored.find_exact("straight", 'y', glyph_variant::last);
        REQUIRE(y != nullptr);
        CHECK(y->glyph.character == 'Y');
        CHECK(y->glyph.frame == glyph_frame{5, 5, 30, 40});
        CHECK(y->glyph.scale == 0.75f);
        CHECK(y->glyph.rotation == -5.0f);

        CHECK(restored == table);
    }

    TEST_CASE("grid cells must match the declared size") {
        const std::string doc =
            "format_version: 1\n"
            "glyphs:\n"
            "  - style: s\n"
            "    character: a\n"
            "    variant: standard\n"
            "    frame: [0, 0, 20, 10]\n"
            "    bounds: [0, 20, 0, 10]\n"
            "    grid: {rows: 1, cols: 2, cells: ['#']}\n"
            "    runs: [[[0, 0, 1]], []]\n"
            "    markup: '<svg/>'\n";
        CHECK_THROWS_AS((void)deserialize_glyph_table(doc), config_error);
    }

    TEST_CASE("unknown variant") {
        const std::string doc =
            "format_version: 1\n"
            "glyphs:\n"
            "  - style: s\n"
            "    character: a\n"
            "    variant: swash\n";
        CHECK_THROWS_AS((void)deserialize_glyph_table(doc), config_error);
    }

    TEST_CASE("runs must be ordered") {
        const std::string doc =
            "format_version: 1\n"
            "glyphs:\n"
            "  - style: s\n"
            "    character: a\n"
            "    variant: standard\n"
            "    frame: [0, 0, 10, 30]\n"
            "    bounds: [0, 10, 0, 30]\n"
            "    grid: {rows: 3, cols: 1, cells: ['#', '.', '#']}\n"
            "    runs: [[[2, 2, 1], [0, 0, 1]]]\n"
            "    markup: '<svg/>'\n";
        CHECK_THROWS_AS((void)deserialize_glyph_table(doc), config_error);
    }

    TEST_CASE("minimal glyph entry") {
        const std::string doc =
            "format_version: 1\n"
            "glyphs:\n"
            "  - style: s\n"
            "    character: a\n"
            "    variant: standard\n"
            "    frame: [0, 0, 20, 10]\n"
            "    bounds: [0, 20, 0, 10]\n"
            "    grid: {rows: 1, cols: 2, cells: ['#.']}\n"
            "    runs: [[[0, 0, 1]], []]\n"
            "    markup: '<svg/>'\n";
        const auto table = deserialize_glyph_table(doc);
        const auto* a = table.find("s", 'a');
        REQUIRE(a != nullptr);
        CHECK(a->glyph.character == 'a');
        CHECK(a->glyph.grid.count() == 1);
        CHECK(a->glyph.scale == 1.0f);
        CHECK_FALSE(a->metadata.has_content);
    }
}
