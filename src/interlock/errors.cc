//
// Exception types
//

#include <interlock/errors.hh>

namespace interlock {
    malformed_glyph_error::malformed_glyph_error(char character, const std::string& reason)
        : std::runtime_error("Malformed glyph '" + std::string(1, character) + "': " + reason)
          , m_character(character) {
    }
} // namespace interlock
