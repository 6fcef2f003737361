/**
 * @file table_generator.hh
 * @brief Batch generation of overlap and glyph tables.
 *
 * Generation is the offline half of the engine: it runs the rule model
 * over every ordered pair of a character set and the footprint extractor
 * over every glyph asset of a style, and packs the results into the
 * tables the renderer consumes.
 *
 * @section generator_threads Threading
 *
 * Work items (one pair, or one glyph variant) are pulled from a shared
 * counter by a bounded pool of std::thread workers. Results go to
 * pre-sized slots, so workers never contend on a lock for the data
 * itself. Setting the cancellation flag stops workers before their next
 * item; items already finished are kept in the partial result.
 *
 * @section generator_failures Failures
 *
 * A glyph whose markup is missing, invalid or malformed is logged,
 * recorded in the generation_report and skipped. Overlap entries never
 * fail because the rule model only reads character labels. Missing
 * non-standard variants are not failures; they fall back to standard at
 * lookup time.
 *
 * @code{.cpp}
 * directory_asset_source assets("assets");
 * footprint_extractor extractor;
 * generation_options options;
 * options.threads = 4;
 *
 * style_generation gen = generate_style(assets, extractor, "straight", standard_charset(),
 *                                       overlap_rule_set::defaults(), rotation_rules::defaults(),
 *                                       options);
 * spdlog::info("{} pairs, {} failures", gen.overlaps->size(), gen.report.failures.size());
 * @endcode
 */

#pragma once

#include <interlock/export.h>
#include <interlock/types.hh>
#include <interlock/lookup/glyph_table.hh>
#include <interlock/lookup/overlap_table.hh>
#include <interlock/overlap/overlap_rules.hh>
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace interlock {
    class asset_source;
    class footprint_extractor;

    /// Called as items finish: (done, total, stage). Calls are serialized but may come from any worker.
    using progress_callback = std::function<void(std::size_t, std::size_t, std::string_view)>;

    /// Knobs of a generation run
    struct INTERLOCK_EXPORT generation_options {
        unsigned threads = 0;                       ///< Worker count, 0 = hardware concurrency
        const std::atomic<bool>* cancel = nullptr;  ///< Optional cancellation flag
        progress_callback progress;                 ///< Optional progress sink
        std::vector<glyph_variant> variants{glyph_variant::standard}; ///< Variants to extract
        bool optimize = true;                       ///< Run optimize_markup() before storing markup
    };

    /// Time spent on one overlap entry
    struct INTERLOCK_EXPORT pair_timing {
        char first = 0;
        char second = 0;
        double ms = 0.0;
    };

    /// A glyph that could not be processed
    struct INTERLOCK_EXPORT glyph_failure {
        char character = 0;
        glyph_variant variant = glyph_variant::standard;
        std::string reason;
    };

    /// What a generation run did
    struct INTERLOCK_EXPORT generation_report {
        std::string style;
        std::size_t pairs_total = 0;
        std::size_t pairs_computed = 0;
        std::size_t glyphs_attempted = 0;
        std::size_t glyphs_processed = 0;
        std::vector<pair_timing> pair_timings;  ///< Completed entries only
        std::vector<glyph_failure> failures;    ///< In character order
        double total_ms = 0.0;
        double average_glyph_ms = 0.0;
        bool cancelled = false;
        std::string checksum;                   ///< compute_checksum() of the glyph table
    };

    /**
     * @brief Overlap ratio (and rotation) for every ordered pair of charset.
     *
     * The complete result satisfies
     * `table.lookup(a, b, x) == rules.resolve(a, b)` for every a, b in charset.
     *
     * @param report Optional, receives pair counts and timings
     */
    [[nodiscard]] INTERLOCK_EXPORT overlap_table generate_overlap_table(std::string_view charset,
                                                                        std::string style,
                                                                        const overlap_rule_set& rules,
                                                                        const rotation_rules& rotations,
                                                                        const generation_options& options = {},
                                                                        generation_report* report = nullptr);

    /**
     * @brief Extract every (character, variant) glyph of a style.
     *
     * @param report Optional, receives glyph counts, failures and timings
     */
    [[nodiscard]] INTERLOCK_EXPORT glyph_table build_glyph_table(const asset_source& assets,
                                                                 const footprint_extractor& extractor,
                                                                 std::string_view style,
                                                                 std::string_view charset,
                                                                 const generation_options& options = {},
                                                                 generation_report* report = nullptr);

    /// Both artifacts of one style
    struct INTERLOCK_EXPORT style_generation {
        std::shared_ptr<const overlap_table> overlaps;
        std::shared_ptr<const glyph_table> glyphs;
        generation_report report;
    };

    /**
     * @brief Generate the overlap table and glyph table of a style.
     *
     * Running it twice on the same assets and rules yields equal tables.
     */
    [[nodiscard]] INTERLOCK_EXPORT style_generation generate_style(const asset_source& assets,
                                                                   const footprint_extractor& extractor,
                                                                   std::string style,
                                                                   std::string_view charset,
                                                                   const overlap_rule_set& rules,
                                                                   const rotation_rules& rotations,
                                                                   const generation_options& options = {});
} // namespace interlock
