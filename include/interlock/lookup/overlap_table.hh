/**
 * @file overlap_table.hh
 * @brief Precomputed overlap ratios for every ordered character pair.
 *
 * An overlap_table is the artifact a production renderer consumes instead
 * of running the rule model. It maps (first, second) to a ratio and,
 * optionally, to a rotation of the second glyph. Tables are built once
 * with overlap_table_builder and never change afterwards.
 *
 * | Class | Purpose |
 * |-------|---------|
 * | overlap_table | Immutable pair -> ratio / rotation mapping |
 * | overlap_table_builder | Mutable builder producing an overlap_table |
 *
 * @code{.cpp}
 * overlap_table_builder builder("straight");
 * builder.set('a', 'b', 0.2).set_rotation('a', 'v', 5.0);
 * overlap_table table = std::move(builder).build();
 *
 * table.lookup('A', 'b', 0.12);   // 0.2 (keys are lowercased)
 * table.lookup('a', '!', 0.12);   // 0.12 (miss)
 * @endcode
 */

#pragma once

#include <interlock/export.h>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace interlock {
    /// Version written into serialized tables
    inline constexpr int OVERLAP_TABLE_FORMAT_VERSION = 1;

    /// Ratio returned by consumers on a lookup miss when nothing else is configured
    inline constexpr double DEFAULT_LOOKUP_FALLBACK = 0.12;

    /// first -> second -> value
    using pair_map = std::map<char, std::map<char, double>>;

    /**
     * @brief Immutable pairwise overlap matrix of one style.
     *
     * Keys are stored normalized (letters lowercased). Lookups never fail.
     */
    class INTERLOCK_EXPORT overlap_table {
    public:
        /// Empty table, every lookup misses
        overlap_table() = default;

        [[nodiscard]] const std::string& style() const noexcept { return m_style; }

        /// Number of ratio entries
        [[nodiscard]] std::size_t size() const noexcept;

        [[nodiscard]] bool empty() const noexcept { return m_ratios.empty(); }

        /// Ratio for the pair, or std::nullopt if absent
        [[nodiscard]] std::optional<double> find(char first, char second) const noexcept;

        [[nodiscard]] bool contains(char first, char second) const noexcept { return find(first, second).has_value(); }

        /**
         * @brief Ratio for the pair.
         * @param fallback Returned when the pair has no entry
         */
        [[nodiscard]] double lookup(char first, char second, double fallback) const noexcept;

        /// Rotation in degrees of second after first, fallback if absent
        [[nodiscard]] double rotation_lookup(char first, char second, double fallback = 0.0) const noexcept;

        /// true if every ordered pair of charset has a ratio
        [[nodiscard]] bool is_complete(std::string_view charset) const noexcept;

        [[nodiscard]] const pair_map& ratios() const noexcept { return m_ratios; }
        [[nodiscard]] const pair_map& rotations() const noexcept { return m_rotations; }

        bool operator==(const overlap_table&) const = default;

    private:
        friend class overlap_table_builder;

        std::string m_style;
        pair_map m_ratios;
        pair_map m_rotations;
    };

    /**
     * @brief Mutable builder for overlap_table.
     *
     * Setting a pair twice keeps the last value.
     */
    class INTERLOCK_EXPORT overlap_table_builder {
    public:
        explicit overlap_table_builder(std::string style);

        overlap_table_builder& set(char first, char second, double ratio);
        overlap_table_builder& set_rotation(char first, char second, double degrees);

        /// Number of ratio entries set so far
        [[nodiscard]] std::size_t size() const noexcept;

        /// Finish building. The builder is left empty.
        [[nodiscard]] overlap_table build() &&;

    private:
        overlap_table m_table;
    };
} // namespace interlock
