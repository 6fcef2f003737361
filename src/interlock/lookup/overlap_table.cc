//
// Pairwise overlap table
//

#include <interlock/lookup/overlap_table.hh>
#include <interlock/types.hh>

namespace interlock {
    namespace {
        std::optional<double> find_in(const pair_map& m, char first, char second) {
            const auto row = m.find(normalize_char(first));
            if (row == m.end()) {
                return std::nullopt;
            }
            const auto cell = row->second.find(normalize_char(second));
            if (cell == row->second.end()) {
                return std::nullopt;
            }
            return cell->second;
        }

        std::size_t count_entries(const pair_map& m) {
            std::size_t n = 0;
            for (const auto& [first, row] : m) {
                n += row.size();
            }
            return n;
        }
    } // namespace

    std::size_t overlap_table::size() const noexcept {
        return count_entries(m_ratios);
    }

    std::optional<double> overlap_table::find(char first, char second) const noexcept {
        return find_in(m_ratios, first, second);
    }

    double overlap_table::lookup(char first, char second, double fallback) const noexcept {
        return find(first, second).value_or(fallback);
    }

    double overlap_table::rotation_lookup(char first, char second, double fallback) const noexcept {
        return find_in(m_rotations, first, second).value_or(fallback);
    }

    bool overlap_table::is_complete(std::string_view charset) const noexcept {
        for (char first : charset) {
            for (char second : charset) {
                if (!contains(first, second)) {
                    return false;
                }
            }
        }
        return true;
    }

    // =============================================================================
    // Builder
    // =============================================================================
    overlap_table_builder::overlap_table_builder(std::string style) {
        m_table.m_style = std::move(style);
    }

    overlap_table_builder& overlap_table_builder::set(char first, char second, double ratio) {
        m_table.m_ratios[normalize_char(first)][normalize_char(second)] = ratio;
        return *this;
    }

    overlap_table_builder& overlap_table_builder::set_rotation(char first, char second, double degrees) {
        m_table.m_rotations[normalize_char(first)][normalize_char(second)] = degrees;
        return *this;
    }

    std::size_t overlap_table_builder::size() const noexcept {
        return m_table.size();
    }

    overlap_table overlap_table_builder::build() && {
        overlap_table result = std::move(m_table);
        m_table = overlap_table{};
        return result;
    }
} // namespace interlock
