/**
 * @file density_scorer.hh
 * @brief Ink collision score of two glyphs at a candidate overlap.
 *
 * The candidate overlap selects how many columns of the two glyphs are
 * stacked on each other:
 *
 * @code
 *   k = min(round(ratio * prev_cols), prev_cols, curr_cols)
 *
 *   prev columns:  0 1 2 ... [prev_cols-k ... prev_cols-1]
 *   curr columns:             [0          ...  k-1       ] k ...
 * @endcode
 *
 * Inside the zone every run of the previous column is compared with every
 * run of the matching current column. A pair of runs that does not meet
 * vertically adds 1; a pair that meets over n cells subtracts
 * n * density_prev * density_curr. Higher scores mean less collision.
 *
 * The score is a diagnostic: nothing in the engine accepts or rejects a
 * ratio by it.
 */

#pragma once

#include <interlock/export.h>
#include <interlock/types.hh>
#include <span>

namespace interlock {
    /// Number of stacked columns for a ratio (the k above)
    [[nodiscard]] INTERLOCK_EXPORT std::size_t overlap_zone_columns(std::size_t prev_cols,
                                                                    std::size_t curr_cols,
                                                                    double ratio) noexcept;

    /**
     * @brief Score a candidate overlap.
     * @param prev_runs Column runs of the previous glyph
     * @param curr_runs Column runs of the current glyph
     * @param candidate_overlap Ratio of the previous glyph's width
     * @return Sum of per-run-pair scores, 0 when the zone is empty
     */
    [[nodiscard]] INTERLOCK_EXPORT double score_overlap(std::span<const column_runs> prev_runs,
                                                        std::span<const column_runs> curr_runs,
                                                        double candidate_overlap) noexcept;

    /// score_overlap() on two processed glyphs
    [[nodiscard]] INTERLOCK_EXPORT double score_overlap(const processed_glyph& prev,
                                                        const processed_glyph& curr,
                                                        double candidate_overlap) noexcept;
} // namespace interlock
