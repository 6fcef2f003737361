/**
 * @file mode_dispatcher.hh
 * @brief Chooses between the precomputed table and the rule model per pair.
 *
 * | Mode | Table hit | Table miss | No table |
 * |------|-----------|------------|----------|
 * | lookup_only | table value | fallback | fallback |
 * | prefer_lookup_fallback_runtime | table value | rule model | rule model |
 * | runtime_only | rule model | rule model | rule model |
 *
 * Pairs involving a space resolve to 0 in every mode. When score_runtime
 * is set, ratios produced by the rule model for glyphs with footprints
 * are also scored by the density scorer and the score is returned with
 * the decision.
 *
 * @code{.cpp}
 * mode_dispatcher dispatcher(overlap_rule_set::defaults());
 * dispatcher.set_table(std::make_shared<const overlap_table>(load_overlap_table("straight.overlap.yaml")));
 *
 * auto d = dispatcher.resolve('a', 'b', resolve_mode::prefer_lookup_fallback_runtime);
 * if (d.source == decision_source::lookup) { ... }
 *
 * spdlog::info("hits: {}", dispatcher.metrics().lookup_hits);
 * @endcode
 */

#pragma once

#include <interlock/export.h>
#include <interlock/types.hh>
#include <interlock/lookup/overlap_table.hh>
#include <interlock/overlap/overlap_rules.hh>
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace interlock {
    enum class resolve_mode : std::uint8_t {
        lookup_only,
        prefer_lookup_fallback_runtime,
        runtime_only
    };

    [[nodiscard]] INTERLOCK_EXPORT std::string_view mode_name(resolve_mode mode) noexcept;

    /**
     * @brief Parse a mode name as written by mode_name().
     * @throws std::invalid_argument for unknown names
     */
    [[nodiscard]] INTERLOCK_EXPORT resolve_mode parse_mode(std::string_view name);

    /// Path a decision took
    enum class decision_source : std::uint8_t {
        space,    ///< One of the glyphs is a space
        lookup,   ///< Table hit
        fallback, ///< Table miss in lookup_only mode
        runtime   ///< Rule model
    };

    [[nodiscard]] INTERLOCK_EXPORT std::string_view source_name(decision_source source) noexcept;

    /// Result of one resolve() call
    struct INTERLOCK_EXPORT overlap_decision {
        double ratio = 0.0;
        decision_source source = decision_source::runtime;
        std::optional<double> score; ///< Density score, runtime decisions with score_runtime only
    };

    struct INTERLOCK_EXPORT dispatcher_options {
        resolve_mode mode = resolve_mode::prefer_lookup_fallback_runtime; ///< Mode used when none is passed
        double lookup_fallback = DEFAULT_LOOKUP_FALLBACK;                 ///< Ratio for misses in lookup_only
        bool score_runtime = false;                                       ///< Score runtime decisions
    };

    /// Counter values at one point in time
    struct INTERLOCK_EXPORT dispatcher_metrics {
        std::size_t lookup_hits = 0;
        std::size_t lookup_misses = 0;
        std::size_t runtime_computations = 0;
        std::size_t space_pairs = 0;
        std::size_t scored_pairs = 0;
    };

    /**
     * @brief Per-pair dispatch between lookup and runtime computation.
     *
     * resolve() may be called from several threads at once. set_table()
     * must not race with resolve().
     */
    class INTERLOCK_EXPORT mode_dispatcher {
    public:
        explicit mode_dispatcher(overlap_rule_set rules,
                                 dispatcher_options options = {},
                                 std::shared_ptr<const overlap_table> table = nullptr,
                                 rotation_rules rotations = rotation_rules::defaults());

        mode_dispatcher(const mode_dispatcher&) = delete;
        mode_dispatcher& operator=(const mode_dispatcher&) = delete;

        /// Install (or with nullptr remove) the precomputed table
        void set_table(std::shared_ptr<const overlap_table> table) noexcept { m_table = std::move(table); }

        [[nodiscard]] const std::shared_ptr<const overlap_table>& table() const noexcept { return m_table; }
        [[nodiscard]] const overlap_rule_set& rules() const noexcept { return m_rules; }
        [[nodiscard]] const dispatcher_options& options() const noexcept { return m_options; }

        /// Decide the overlap of an ordered glyph pair
        [[nodiscard]] overlap_decision resolve(const processed_glyph& first, const processed_glyph& second,
                                               resolve_mode mode) const;

        /// resolve() with the configured mode
        [[nodiscard]] overlap_decision resolve(const processed_glyph& first, const processed_glyph& second) const {
            return resolve(first, second, m_options.mode);
        }

        /// Character form; ' ' is the space glyph, nothing is scored
        [[nodiscard]] overlap_decision resolve(char first, char second, resolve_mode mode) const;

        /**
         * @brief Rotation in degrees of second when it follows first.
         *
         * lookup_only reads the table, runtime_only the rotation rules,
         * prefer_lookup_fallback_runtime the table for pairs it holds and
         * the rules otherwise.
         */
        [[nodiscard]] double rotation(char first, char second, resolve_mode mode) const noexcept;

        [[nodiscard]] dispatcher_metrics metrics() const noexcept;
        void reset_metrics() noexcept;

    private:
        overlap_rule_set m_rules;
        rotation_rules m_rotations;
        dispatcher_options m_options;
        std::shared_ptr<const overlap_table> m_table;

        mutable std::atomic<std::size_t> m_lookup_hits{0};
        mutable std::atomic<std::size_t> m_lookup_misses{0};
        mutable std::atomic<std::size_t> m_runtime_computations{0};
        mutable std::atomic<std::size_t> m_space_pairs{0};
        mutable std::atomic<std::size_t> m_scored_pairs{0};
    };
} // namespace interlock
