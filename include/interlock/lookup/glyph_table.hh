/**
 * @file glyph_table.hh
 * @brief Precomputed glyph footprints keyed by style, character and variant.
 *
 * The glyph table is the second artifact of batch generation. It holds
 * every processed_glyph of a style together with generation metadata so
 * a renderer can lay out words without running the footprint extractor.
 *
 * @section glyph_table_variants Variant Fallback
 *
 * find() returns the requested variant when present and otherwise the
 * standard variant of the same character:
 *
 * @code{.cpp}
 * const glyph_record* r = table.find("straight", 'a', glyph_variant::first);
 * // r->key.variant is first if a "first" drawing exists, standard otherwise
 * @endcode
 */

#pragma once

#include <interlock/export.h>
#include <interlock/types.hh>
#include <compare>
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace interlock {
    /**
     * @brief Identity of a glyph record.
     *
     * character is stored normalized (letters lowercased).
     */
    struct INTERLOCK_EXPORT glyph_key {
        std::string style;
        char character = 'a';
        glyph_variant variant = glyph_variant::standard;

        auto operator<=>(const glyph_key&) const = default;
        bool operator==(const glyph_key&) const = default;
    };

    /// Facts recorded while a glyph was generated
    struct INTERLOCK_EXPORT glyph_metadata {
        bool has_content = false;   ///< Markup holds at least one outline or text element
        bool is_symmetric = false;  ///< Ink margins differ by less than 10% of the width
        double processing_ms = 0.0; ///< Time spent extracting the footprint
        std::size_t byte_size = 0;  ///< Size of the stored markup
        bool optimized = false;     ///< Markup was passed through optimize_markup()

        bool operator==(const glyph_metadata&) const = default;
    };

    /// One entry of a glyph_table
    struct INTERLOCK_EXPORT glyph_record {
        glyph_key key;
        processed_glyph glyph;
        glyph_metadata metadata;

        bool operator==(const glyph_record&) const = default;
    };

    /**
     * @brief Horizontal symmetry of a glyph's ink.
     *
     * Compares the empty columns left of the ink with those right of it.
     * Glyphs without ink are not symmetric.
     */
    [[nodiscard]] INTERLOCK_EXPORT bool detect_symmetry(const processed_glyph& glyph) noexcept;

    /**
     * @brief Variant a letter takes at a position within a word.
     *
     * alternate when requested, otherwise first for the first letter,
     * last for the final letter of a word longer than one letter, and
     * standard in between.
     */
    [[nodiscard]] INTERLOCK_EXPORT glyph_variant select_variant(std::size_t index, std::size_t length,
                                                                bool use_alternate = false) noexcept;

    /**
     * @brief Immutable collection of glyph records.
     *
     * Records with the same key replace earlier ones during construction.
     */
    class INTERLOCK_EXPORT glyph_table {
    public:
        glyph_table() = default;
        explicit glyph_table(std::vector<glyph_record> records);

        [[nodiscard]] std::size_t size() const noexcept { return m_records.size(); }
        [[nodiscard]] bool empty() const noexcept { return m_records.empty(); }

        /// Record with exactly this key, or nullptr
        [[nodiscard]] const glyph_record* find_exact(std::string_view style, char character,
                                                     glyph_variant variant) const;

        /// Requested variant, falling back to standard; nullptr if neither exists
        [[nodiscard]] const glyph_record* find(std::string_view style, char character,
                                               glyph_variant variant = glyph_variant::standard) const;

        /// Distinct style names, sorted
        [[nodiscard]] std::vector<std::string> styles() const;

        /// Sum of stored markup sizes of one style
        [[nodiscard]] std::size_t markup_bytes(std::string_view style) const noexcept;

        /// Number of records of one style
        [[nodiscard]] std::size_t count(std::string_view style) const noexcept;

        [[nodiscard]] const std::map<glyph_key, glyph_record>& records() const noexcept { return m_records; }

        bool operator==(const glyph_table&) const = default;

    private:
        std::map<glyph_key, glyph_record> m_records;
    };

    /**
     * @brief Integrity tag of a style's glyph data.
     * @return "style-recordcount-markupbytes"
     */
    [[nodiscard]] INTERLOCK_EXPORT std::string compute_checksum(const glyph_table& table, std::string_view style);
} // namespace interlock
