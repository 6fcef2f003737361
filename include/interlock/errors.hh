/**
 * @file errors.hh
 * @brief Exception types raised by the overlap engine.
 *
 * | Exception | Raised when | Batch behaviour |
 * |-----------|-------------|-----------------|
 * | malformed_glyph_error | markup has no usable outline | recorded per character, batch continues |
 * | asset_not_found_error | asset source has no markup for a key | recorded per character, batch continues |
 * | markup_parse_error | markup text is not well formed | wrapped into malformed_glyph_error |
 * | config_error | configuration or artifact content is invalid | propagated to the caller |
 *
 * Lookup misses are not errors: they resolve through a fallback value.
 */

#pragma once

#include <interlock/export.h>
#include <stdexcept>
#include <string>

namespace interlock {
    /**
     * @brief Glyph markup contains no recognizable outline element.
     *
     * Fatal to the single glyph only.
     */
    class INTERLOCK_EXPORT malformed_glyph_error : public std::runtime_error {
    public:
        malformed_glyph_error(char character, const std::string& reason);

        /// Character whose markup was rejected
        [[nodiscard]] char character() const noexcept { return m_character; }

    private:
        char m_character;
    };

    /// Asset source holds no markup for the requested glyph
    class INTERLOCK_EXPORT asset_not_found_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// Markup text could not be parsed into an element tree
    class INTERLOCK_EXPORT markup_parse_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /// Configuration or persisted artifact is invalid
    class INTERLOCK_EXPORT config_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };
} // namespace interlock
