//
// Overlap density scoring
//

#include <interlock/overlap/density_scorer.hh>
#include <algorithm>
#include <cmath>

namespace interlock {
    std::size_t overlap_zone_columns(std::size_t prev_cols, std::size_t curr_cols, double ratio) noexcept {
        if (!(ratio > 0.0)) {
            return 0;
        }
        const double wanted = std::round(ratio * static_cast<double>(prev_cols));
        const auto k = wanted >= static_cast<double>(prev_cols) ? prev_cols : static_cast<std::size_t>(wanted);
        return std::min({k, prev_cols, curr_cols});
    }

    double score_overlap(std::span<const column_runs> prev_runs,
                         std::span<const column_runs> curr_runs,
                         double candidate_overlap) noexcept {
        const std::size_t prev_cols = prev_runs.size();
        const std::size_t k = overlap_zone_columns(prev_cols, curr_runs.size(), candidate_overlap);

        double score = 0.0;
        for (std::size_t j = 0; j < k; ++j) {
            const auto& left = prev_runs[prev_cols - k + j];
            const auto& right = curr_runs[j];

            for (const auto& a : left) {
                for (const auto& b : right) {
                    const int top = std::max(a.top, b.top);
                    const int bottom = std::min(a.bottom, b.bottom);
                    if (bottom < top) {
                        score += 1.0;
                    } else {
                        const int amount = bottom - top + 1;
                        score -= amount * a.density * b.density;
                    }
                }
            }
        }
        return score;
    }

    double score_overlap(const processed_glyph& prev, const processed_glyph& curr, double candidate_overlap) noexcept {
        return score_overlap(std::span<const column_runs>(prev.runs), std::span<const column_runs>(curr.runs),
                             candidate_overlap);
    }
} // namespace interlock
