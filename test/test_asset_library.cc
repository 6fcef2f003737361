//
// Data-driven tests over the fixture glyph library
//

#include <doctest/doctest.h>
#include <interlock/config.hh>
#include <interlock/footprint.hh>
#include <interlock/errors.hh>
#include <interlock/lookup/asset_source.hh>
#include <interlock/lookup/table_cache.hh>
#include <interlock/lookup/table_generator.hh>
#include <interlock/lookup/table_io.hh>
#include <interlock/markup/markup_tools.hh>
#include <interlock/text/word_layout.hh>
#include "test_data.hh"

using namespace interlock;
using interlock::test::test_data;

namespace {
    processed_glyph extract_fixture(const std::string& variant, char ch) {
        const footprint_extractor extractor;
        return extractor.extract(test_data::load_file(test_data::glyph(variant, ch)), ch);
    }

    style_generation generate_fixture_style(const engine_config& config) {
        const directory_asset_source assets(test_data::asset_root());
        return generate_style(assets, footprint_extractor(), test_data::style(), config.charset, config.rules,
                              config.rotation, config.generation());
    }
}

TEST_SUITE("fixture footprints") {

    TEST_CASE("fixtures are present") {
        REQUIRE(test_data::all_files_exist());
    }

    TEST_CASE("bowl and stem") {
        const auto a = extract_fixture("standard", 'a');
        REQUIRE(a.grid.rows() == 10);
        REQUIRE(a.grid.cols() == 10);
        CHECK(a.grid.count() == 31);

        REQUIRE(a.runs.size() == 10);
        CHECK(a.runs[0].empty());
        CHECK(a.runs[1].empty());
        for (std::size_t c = 2; c <= 5; ++c) {
            REQUIRE(a.runs[c].size() == 1);
            CHECK(a.runs[c][0] == vertical_run{3, 8, 1.0});
        }
        REQUIRE(a.runs[6].size() == 1);
        CHECK(a.runs[6][0] == vertical_run{2, 8, 1.0});
        for (std::size_t c = 7; c < 10; ++c) {
            CHECK(a.runs[c].empty());
        }
    }

    TEST_CASE("circle") {
        const auto o = extract_fixture("standard", 'o');
        CHECK(o.grid.count() == 30);
        CHECK(detect_symmetry(o));
    }

    TEST_CASE("comma separated viewBox") {
        const auto v = extract_fixture("standard", 'v');
        CHECK(v.frame == glyph_frame{0, 0, 120, 100});
        CHECK(v.grid.rows() == 10);
        CHECK(v.grid.cols() == 12);
        CHECK(v.grid.count() == 84);
    }

    TEST_CASE("missing viewBox falls back to the default frame") {
        const auto markup = test_data::load_file(test_data::glyph("standard", 'l'));
        const auto validation = validate_markup(markup, 'l');
        CHECK(validation.valid);
        CHECK_FALSE(validation.warnings.empty());

        const auto l = extract_fixture("standard", 'l');
        CHECK(l.frame == glyph_frame{});
        CHECK(l.grid.count() == 10);
        REQUIRE(l.runs[4].size() == 1);
        CHECK(l.runs[4][0] == vertical_run{0, 9, 1.0});
    }

    TEST_CASE("glyph without outline is malformed") {
        CHECK_THROWS_AS((void)extract_fixture("standard", 'x'), malformed_glyph_error);
    }

    TEST_CASE("optimized markup yields the same footprint") {
        const auto markup = test_data::load_file(test_data::glyph("standard", 'b'));
        const footprint_extractor extractor;
        const auto raw = extractor.extract(markup, 'b');
        const auto optimized = extractor.extract(optimize_markup(markup), 'b');
        CHECK(raw.grid == optimized.grid);
        CHECK(raw.runs == optimized.runs);
    }
}

TEST_SUITE("fixture configuration") {

    TEST_CASE("engine.yaml") {
        const auto config = load_config_file(test_data::engine_config());
        CHECK(config.mode == resolve_mode::runtime_only);
        CHECK(config.lookup_fallback == 0.15);
        CHECK(config.score_runtime);
        CHECK(config.threads == 2);
        CHECK(config.variants.size() == 3);
        CHECK(config.charset == "abolvx");
        CHECK(config.log_level == "warn");

        CHECK(config.rules.resolve('a', 'b') == 0.2);
        CHECK(config.rules.resolve('a', 'o') == doctest::Approx(0.12));
        CHECK(config.rules.resolve('v', 'o') == doctest::Approx(0.1125));
        CHECK(config.rules.resolve('o', 'l') == doctest::Approx(0.2));
        CHECK(config.rotation.resolve('a', 'v') == 5.0);
        CHECK(config.rotation.resolve('v', 'o') == -5.0);
        CHECK(config.rotation.resolve('w', 'a') == 0.0);
    }

    TEST_CASE("missing file") {
        CHECK_THROWS_AS((void)load_config_file(test_data::base_path() / "config" / "absent.yaml"),
                        std::runtime_error);
    }
}

TEST_SUITE("fixture generation") {

    TEST_CASE("generate the straight style") {
        const auto config = load_config_file(test_data::engine_config());
        const auto result = generate_fixture_style(config);

        CHECK(result.report.glyphs_attempted == 8);
        CHECK(result.report.glyphs_processed == 7);
        REQUIRE(result.report.failures.size() == 1);
        CHECK(result.report.failures[0].character == 'x');
        CHECK(result.report.pairs_computed == 36);
        CHECK(result.overlaps->is_complete(config.charset));
        CHECK(result.overlaps->find('x', 'a').has_value());
        CHECK(result.overlaps->find('a', 'b') == 0.2);
        CHECK(result.overlaps->rotation_lookup('v', 'a') == -5.0);

        const auto& glyphs = *result.glyphs;
        CHECK(glyphs.find_exact("straight", 'a', glyph_variant::first) != nullptr);
        CHECK(glyphs.find_exact("straight", 'b', glyph_variant::last) != nullptr);
        CHECK(glyphs.find_exact("straight", 'o', glyph_variant::first) == nullptr);
        CHECK(glyphs.find("straight", 'o', glyph_variant::first) != nullptr);
        CHECK(result.report.checksum == "straight-7-" + std::to_string(glyphs.markup_bytes("straight")));
    }

    TEST_CASE("artifacts survive saving and loading") {
        const auto config = load_config_file(test_data::engine_config());
        const auto result = generate_fixture_style(config);

        const interlock::test::temp_dir dir("interlock_test_artifacts");
        save_overlap_table(*result.overlaps, dir.path() / "overlap.yaml");
        save_glyph_table(*result.glyphs, dir.path() / "glyphs.yaml");

        const auto overlaps = load_overlap_table(dir.path() / "overlap.yaml");
        const auto glyphs = load_glyph_table(dir.path() / "glyphs.yaml");
        CHECK(overlaps == *result.overlaps);
        CHECK(glyphs == *result.glyphs);
        CHECK(compute_checksum(glyphs, "straight") == result.report.checksum);
    }

    TEST_CASE("cache serves the generated style") {
        const auto config = load_config_file(test_data::engine_config());
        table_cache cache([&](std::string_view) { return generate_fixture_style(config); });
        const auto first = cache.glyphs("straight");
        const auto second = cache.glyphs("straight");
        CHECK(first == second);
        CHECK(first->count("straight") == 7);
        CHECK(cache.generations() == 1);
    }

    TEST_CASE("lay out a word from the generated tables") {
        const auto config = load_config_file(test_data::engine_config());
        const auto result = generate_fixture_style(config);

        const mode_dispatcher dispatcher(config.rules, config.dispatcher(), result.overlaps, config.rotation);
        const auto word = assemble_word("Boa", *result.glyphs, "straight");
        REQUIRE(word.size() == 3);

        const auto layout = layout_word(word, dispatcher, resolve_mode::lookup_only);
        REQUIRE(layout.glyphs.size() == 3);
        CHECK(layout.glyphs[0].x == doctest::Approx(0.0));
        CHECK(layout.glyphs[1].overlap == doctest::Approx(config.rules.resolve('b', 'o')));
        CHECK(layout.glyphs[2].overlap == doctest::Approx(config.rules.resolve('o', 'a')));
        CHECK(layout.glyphs[1].x < layout.glyphs[2].x);
        CHECK(layout.content_width > 0.0f);
        CHECK(dispatcher.metrics().lookup_hits == 2);
    }
}
