/**
 * @file markup_tools.hh
 * @brief Asset checks and size reduction for glyph markup.
 *
 * Both functions are used by batch generation before a glyph is
 * extracted. Validation never throws: problems are reported in the
 * result so a whole style can be checked in one pass.
 */

#pragma once

#include <interlock/export.h>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace interlock {
    class markup_parser;

    /// Markup larger than this produces a size warning
    inline constexpr std::size_t LARGE_MARKUP_BYTES = 50000;

    /**
     * @brief Outcome of validate_markup().
     *
     * valid is true when errors is empty. Warnings never make markup
     * invalid.
     */
    struct INTERLOCK_EXPORT validation_result {
        bool valid = false;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
        bool has_content = false;       ///< At least one outline or text element
        std::size_t element_count = 0;  ///< Elements below the root <svg>
        std::size_t byte_size = 0;      ///< Size of the markup text
    };

    /**
     * @brief Check glyph markup for structure and content.
     *
     * Errors: empty markup, missing <svg> tags, parse failure.
     * Warnings: no visible content, missing viewBox, missing width or
     * height, markup larger than LARGE_MARKUP_BYTES.
     *
     * @param markup SVG text
     * @param character Glyph the markup belongs to, used in messages
     * @param parser Parser that builds the element tree, the same one the
     *        footprint_extractor will use
     */
    [[nodiscard]] INTERLOCK_EXPORT validation_result validate_markup(std::string_view markup, char character,
                                                                     const markup_parser& parser);

    /// validate_markup() with the built-in svg_markup_parser
    [[nodiscard]] INTERLOCK_EXPORT validation_result validate_markup(std::string_view markup, char character);

    /**
     * @brief Shrink markup without changing its rendering.
     *
     * Removes comments, collapses whitespace runs to one space, drops
     * whitespace between tags and trims both ends.
     */
    [[nodiscard]] INTERLOCK_EXPORT std::string optimize_markup(std::string_view markup);
} // namespace interlock
