/**
 * @file table_cache.hh
 * @brief Owned cache of generated tables per style.
 *
 * The table_cache memoizes style_generation results so each style is
 * generated at most once. Cached tables are shared immutable snapshots:
 * invalidating or regenerating a style swaps in new shared pointers and
 * never touches a snapshot that a caller may still hold.
 *
 * @section table_cache_example Example
 *
 * @code{.cpp}
 * directory_asset_source assets("assets");
 * footprint_extractor extractor;
 *
 * table_cache cache([&](std::string_view style) {
 *     return generate_style(assets, extractor, std::string(style), standard_charset(),
 *                           overlap_rule_set::defaults(), rotation_rules::defaults());
 * });
 *
 * auto table = cache.overlaps("straight");   // generated on first use
 * auto again = cache.overlaps("straight");   // same snapshot
 *
 * cache.regenerate("straight");              // assets changed on disk
 * // table still points at the old snapshot, cache.overlaps() at the new one
 * @endcode
 */

#pragma once

#include <interlock/export.h>
#include <interlock/lookup/table_generator.hh>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace interlock {
    /**
     * @brief Lazily generated, explicitly invalidated tables per style.
     *
     * @warning This class is NOT thread-safe. get() generates and stores
     *          missing styles. If used from multiple threads, external
     *          synchronization is required. The snapshots it hands out
     *          may be shared freely.
     */
    class INTERLOCK_EXPORT table_cache {
    public:
        /// Produces the tables of one style
        using generator = std::function<style_generation(std::string_view)>;

        /**
         * @throws std::invalid_argument if gen is empty
         */
        explicit table_cache(generator gen);

        /**
         * @brief Tables of a style, generated on first access.
         * @warning Not thread-safe. May modify internal state.
         */
        const style_generation& get(std::string_view style);

        [[nodiscard]] std::shared_ptr<const overlap_table> overlaps(std::string_view style);
        [[nodiscard]] std::shared_ptr<const glyph_table> glyphs(std::string_view style);

        /// Replace the cached tables of a style with externally produced ones
        void put(std::string style, style_generation tables);

        /// Generate a style again and replace the cached entry
        const style_generation& regenerate(std::string_view style);

        /// Drop a style; the next get() regenerates it
        void invalidate(std::string_view style);

        void clear() noexcept { m_entries.clear(); }

        [[nodiscard]] bool is_cached(std::string_view style) const;
        [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }

        /// Number of generator invocations so far
        [[nodiscard]] std::size_t generations() const noexcept { return m_generations; }

    private:
        const style_generation& store(std::string style, style_generation tables);

        generator m_generator;
        std::map<std::string, style_generation, std::less<>> m_entries;
        std::size_t m_generations = 0;
    };
} // namespace interlock
