/**
 * @file word_layout.hh
 * @brief Horizontal placement of the glyphs of a word.
 *
 * Each glyph starts where the previous one ends, pulled back by the
 * overlap ratio the dispatcher decides for the pair:
 *
 * @code
 *   x[0] = 0
 *   x[i] = x[i-1] + width[i-1] * (1 - overlap(i-1, i))
 * @endcode
 *
 * Positions are then shifted so that the leftmost edge of the group is
 * at 0, and the group's extent is reported as content width and height.
 *
 * @section word_layout_example Example
 *
 * @code{.cpp}
 * mode_dispatcher dispatcher(overlap_rule_set::defaults());
 * auto glyphs = assemble_word("hello", table, "straight");
 * word_layout layout = layout_word(glyphs, dispatcher, resolve_mode::prefer_lookup_fallback_runtime);
 *
 * for (const auto& placed : layout.glyphs) {
 *     // draw placed.glyph.markup at (placed.x, 0) rotated by placed.rotation
 * }
 * @endcode
 */

#pragma once

#include <interlock/export.h>
#include <interlock/types.hh>
#include <interlock/overlap/mode_dispatcher.hh>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace interlock {
    class asset_source;
    class footprint_extractor;
    class glyph_table;

    /// One glyph with its final position
    struct INTERLOCK_EXPORT placed_glyph {
        processed_glyph glyph;
        float x = 0.0f;           ///< Offset added to glyph coordinates, group left edge at 0
        float rotation = 0.0f;    ///< Degrees, from the rotation rules
        double overlap = 0.0;     ///< Ratio used against the previous glyph (0 for the first)
    };

    struct INTERLOCK_EXPORT word_layout {
        std::vector<placed_glyph> glyphs;
        float content_width = 0.0f;  ///< At least 1 for a non-empty word
        float content_height = 0.0f; ///< At least 1 for a non-empty word
    };

    /**
     * @brief Place glyphs left to right.
     * @param glyphs Glyphs in reading order
     * @param dispatcher Source of overlap ratios and rotations
     * @param mode Dispatch mode for every pair
     */
    [[nodiscard]] INTERLOCK_EXPORT word_layout layout_word(std::span<const processed_glyph> glyphs,
                                                           const mode_dispatcher& dispatcher,
                                                           resolve_mode mode);

    /// layout_word() with the dispatcher's configured mode
    [[nodiscard]] INTERLOCK_EXPORT word_layout layout_word(std::span<const processed_glyph> glyphs,
                                                           const mode_dispatcher& dispatcher);

    /**
     * @brief Lowercase text and drop characters that have no glyph.
     *
     * Keeps a-z, 0-9 and spaces.
     */
    [[nodiscard]] INTERLOCK_EXPORT std::string normalize_text(std::string_view text);

    /**
     * @brief Glyphs of a text from a precomputed glyph table.
     *
     * Letters take the variant select_variant() picks for their position
     * (alternate for a letter repeating the one before it), falling back to
     * standard. Spaces become space glyphs. Letters missing from the table
     * are replaced by a space-sized placeholder.
     */
    [[nodiscard]] INTERLOCK_EXPORT std::vector<processed_glyph> assemble_word(std::string_view text,
                                                                              const glyph_table& table,
                                                                              std::string_view style);

    /**
     * @brief Glyphs of a text extracted at runtime.
     *
     * Same variant choice as the table form. A letter whose asset is
     * missing or malformed is logged and replaced by a placeholder instead
     * of failing the word.
     */
    [[nodiscard]] INTERLOCK_EXPORT std::vector<processed_glyph> assemble_word(std::string_view text,
                                                                              const asset_source& assets,
                                                                              const footprint_extractor& extractor,
                                                                              std::string_view style);

    /// Blank stand-in for a glyph that could not be produced
    [[nodiscard]] INTERLOCK_EXPORT processed_glyph make_placeholder_glyph(char character);
} // namespace interlock
