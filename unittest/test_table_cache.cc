//
// Unit tests for the per-style table cache
//

#include <doctest/doctest.h>
#include <interlock/lookup/table_cache.hh>
#include <stdexcept>

namespace {
    using namespace interlock;

    style_generation fake_generation(std::string_view style) {
        overlap_table_builder builder{std::string(style)};
        builder.set('a', 'b', 0.25);
        style_generation g;
        g.overlaps = std::make_shared<const overlap_table>(std::move(builder).build());
        g.report.style = std::string(style);
        return g;
    }
}

TEST_SUITE("table_cache") {
    using namespace interlock;

    TEST_CASE("generates once per style") {
        int calls = 0;
        table_cache cache([&](std::string_view style) {
            ++calls;
            return fake_generation(style);
        });

        CHECK_FALSE(cache.is_cached("straight"));
        const auto first = cache.overlaps("straight");
        const auto second = cache.overlaps("straight");
        CHECK(calls == 1);
        CHECK(first == second);
        CHECK(first->style() == "straight");
        CHECK(cache.is_cached("straight"));
        CHECK(cache.generations() == 1);

        (void)cache.get("round");
        CHECK(calls == 2);
        CHECK(cache.size() == 2);
    }

    TEST_CASE("missing tables are replaced by empty ones") {
        table_cache cache(fake_generation);
        const auto glyphs = cache.glyphs("straight");
        REQUIRE(glyphs);
        CHECK(glyphs->empty());
    }

    TEST_CASE("invalidate and regenerate") {
        int calls = 0;
        table_cache cache([&](std::string_view style) {
            ++calls;
            return fake_generation(style);
        });
        const auto before = cache.overlaps("s");
        cache.invalidate("s");
        CHECK_FALSE(cache.is_cached("s"));
        const auto after = cache.overlaps("s");
        CHECK(calls == 2);
        CHECK(before != after);
        // earlier handles stay valid
        CHECK(before->find('a', 'b') == 0.25);

        (void)cache.regenerate("s");
        CHECK(calls == 3);

        cache.invalidate("unknown");
        cache.clear();
        CHECK(cache.size() == 0);
    }

    TEST_CASE("put stores externally loaded tables") {
        int calls = 0;
        table_cache cache([&](std::string_view style) {
            ++calls;
            return fake_generation(style);
        });
        style_generation loaded;
        loaded.overlaps = std::make_shared<const overlap_table>();
        cache.put("s", loaded);
        CHECK(cache.overlaps("s")->empty());
        CHECK(calls == 0);
        CHECK(cache.generations() == 0);
    }

    TEST_CASE("generator is required") {
        CHECK_THROWS_AS(table_cache(table_cache::generator{}), std::invalid_argument);
    }
}
