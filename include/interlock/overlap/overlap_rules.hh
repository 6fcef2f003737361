/**
 * @file overlap_rules.hh
 * @brief Rule model that decides how far adjacent glyphs overlap.
 *
 * An overlap ratio is the share of the previous glyph's width that the
 * next glyph is pulled back over it: 0 means the glyphs touch, 0.2 means
 * the next glyph starts at 80% of the previous glyph's width.
 *
 * @section rules_resolution Resolution
 *
 * For an ordered pair (prev, curr):
 *
 * | Step | Condition | Result |
 * |------|-----------|--------|
 * | 1 | either glyph is a space | 0 |
 * | 2 | rule of prev has a special case for curr | the special case value |
 * | 3 | curr is an exception of prev | midpoint of [min, max(min, max * 0.7)] |
 * | 4 | otherwise | midpoint of [min, max] |
 *
 * Letters are compared lowercase, digits and other symbols as-is. The
 * rule of prev falls back to the default rule when prev has none.
 *
 * @section rules_example Example
 *
 * @code{.cpp}
 * overlap_rule_set rules({{'a', overlap_rule{0.08, 0.16}}},
 *                        overlap_rule{},
 *                        {{'a', {'b'}}});
 *
 * rules.resolve('a', 'c');   // 0.12
 * rules.resolve('a', 'b');   // 0.096, dampened
 * rules.resolve('a', ' ');   // 0
 * @endcode
 */

#pragma once

#include <interlock/export.h>
#include <interlock/types.hh>
#include <map>
#include <vector>

namespace interlock {
    /// Factor applied to max_overlap for exception pairs
    inline constexpr double EXCEPTION_DAMPING = 0.7;

    /**
     * @brief Overlap range of one base letter.
     *
     * Invariant: 0 <= min_overlap <= max_overlap <= 1 and every special
     * case lies in [0, 1].
     */
    struct INTERLOCK_EXPORT overlap_rule {
        double min_overlap = 0.1;
        double max_overlap = 0.3;
        std::map<char, double> special_cases; ///< Exact ratio per following character

        bool operator==(const overlap_rule&) const = default;
    };

    /// Base letter -> following characters whose overlap is dampened
    using exception_map = std::map<char, std::vector<char>>;

    /// Base letter -> rule
    using rule_map = std::map<char, overlap_rule>;

    /**
     * @brief Check the range invariant of a rule.
     * @param rule Rule to check
     * @param label Base letter the rule belongs to, used in the message
     * @throws std::invalid_argument if the invariant does not hold
     */
    INTERLOCK_EXPORT void validate_rule(const overlap_rule& rule, char label);

    /**
     * @brief Overlap ratio for an ordered glyph pair.
     *
     * Reads only the glyph characters and space flags. Never fails.
     *
     * @return Ratio in [0, 1]
     */
    [[nodiscard]] INTERLOCK_EXPORT double resolve_overlap(const processed_glyph& prev,
                                                          const processed_glyph& curr,
                                                          const rule_map& rules,
                                                          const overlap_rule& default_rule,
                                                          const exception_map& exceptions) noexcept;

    /// Character form of resolve_overlap(); ' ' is the space glyph
    [[nodiscard]] INTERLOCK_EXPORT double resolve_overlap(char prev,
                                                          char curr,
                                                          const rule_map& rules,
                                                          const overlap_rule& default_rule,
                                                          const exception_map& exceptions) noexcept;

    /**
     * @brief Validated bundle of rules, default rule and exceptions.
     *
     * Keys are normalized (lowercased) on construction.
     */
    class INTERLOCK_EXPORT overlap_rule_set {
    public:
        /// Empty rule set: every pair uses the default {0.1, 0.3}
        overlap_rule_set() = default;

        /**
         * @throws std::invalid_argument if any rule violates its range invariant
         */
        overlap_rule_set(rule_map rules, overlap_rule default_rule, exception_map exceptions);

        /// Built-in letter rules (a-z at {0.1, 0.3}, a/v/w/y exceptions)
        [[nodiscard]] static overlap_rule_set defaults();

        [[nodiscard]] double resolve(char prev, char curr) const noexcept;
        [[nodiscard]] double resolve(const processed_glyph& prev, const processed_glyph& curr) const noexcept;

        /// Rule used for base letter ch (the default rule if ch has none)
        [[nodiscard]] const overlap_rule& rule_for(char ch) const noexcept;

        [[nodiscard]] const rule_map& rules() const noexcept { return m_rules; }
        [[nodiscard]] const overlap_rule& default_rule() const noexcept { return m_default_rule; }
        [[nodiscard]] const exception_map& exceptions() const noexcept { return m_exceptions; }

        bool operator==(const overlap_rule_set&) const = default;

    private:
        rule_map m_rules;
        overlap_rule m_default_rule;
        exception_map m_exceptions;
    };

    /**
     * @brief Rotation of a glyph depending on the glyph before it.
     *
     * Stored as angles[prev][curr] in degrees. Unlisted pairs and pairs
     * involving a space are not rotated.
     */
    struct INTERLOCK_EXPORT rotation_rules {
        std::map<char, std::map<char, double>> angles;

        /// Built-in rotations (a before v/w/y: 5, v/w/y before a/e/o: -5)
        [[nodiscard]] static rotation_rules defaults();

        [[nodiscard]] double resolve(char prev, char curr) const noexcept;

        bool operator==(const rotation_rules&) const = default;
    };
} // namespace interlock
