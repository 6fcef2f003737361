//
// Glyph geometry primitives
//

#include <interlock/types.hh>
#include <failsafe/failsafe.hh>
#include <failsafe/enforce.hh>
#include <algorithm>
#include <cctype>

namespace interlock {
    namespace {
        constexpr std::string_view CHARSET = "abcdefghijklmnopqrstuvwxyz0123456789";
    }

    glyph_bounds bounds_of(const glyph_frame& frame) noexcept {
        return {frame.x, frame.x + frame.width, frame.y, frame.y + frame.height};
    }

    // =============================================================================
    // Pixel grid
    // =============================================================================
    pixel_grid::pixel_grid(std::size_t rows, std::size_t cols)
        : m_rows(rows), m_cols(cols), m_cells(rows * cols, 0) {
    }

    bool pixel_grid::cell(std::size_t row, std::size_t col) const {
        ENFORCE(row < m_rows && col < m_cols);
        return m_cells[row * m_cols + col] != 0;
    }

    void pixel_grid::set(std::size_t row, std::size_t col, bool on) {
        ENFORCE(row < m_rows && col < m_cols);
        m_cells[row * m_cols + col] = on ? 1 : 0;
    }

    void pixel_grid::fill(long row0, long col0, long row1, long col1) {
        const long r0 = std::max(row0, 0L);
        const long c0 = std::max(col0, 0L);
        const long r1 = std::min(row1, static_cast<long>(m_rows));
        const long c1 = std::min(col1, static_cast<long>(m_cols));

        for (long r = r0; r < r1; ++r) {
            for (long c = c0; c < c1; ++c) {
                m_cells[static_cast<std::size_t>(r) * m_cols + static_cast<std::size_t>(c)] = 1;
            }
        }
    }

    std::size_t pixel_grid::count() const noexcept {
        return static_cast<std::size_t>(std::count(m_cells.begin(), m_cells.end(), std::uint8_t{1}));
    }

    // =============================================================================
    // Variants
    // =============================================================================
    std::string_view variant_name(glyph_variant variant) noexcept {
        switch (variant) {
            case glyph_variant::standard: return "standard";
            case glyph_variant::alternate: return "alternate";
            case glyph_variant::first: return "first";
            case glyph_variant::last: return "last";
        }
        return "standard";
    }

    glyph_variant parse_variant(std::string_view name) {
        if (name == "standard") return glyph_variant::standard;
        if (name == "alternate") return glyph_variant::alternate;
        if (name == "first") return glyph_variant::first;
        if (name == "last") return glyph_variant::last;
        THROW_INVALID_ARG("Unknown glyph variant:", std::string(name));
    }

    // =============================================================================
    // Glyph factories
    // =============================================================================
    processed_glyph make_space_glyph(float width) {
        processed_glyph glyph;
        glyph.character = ' ';
        glyph.markup = "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" + std::to_string(static_cast<int>(width)) +
                       "\" height=\"1\" viewBox=\"0 0 " + std::to_string(static_cast<int>(width)) + " 1\"></svg>";
        glyph.frame = {0.0f, 0.0f, width, 1.0f};
        glyph.bounds = bounds_of(glyph.frame);
        glyph.grid = pixel_grid(1, 1);
        glyph.runs.resize(1);
        glyph.is_space = true;
        return glyph;
    }

    processed_glyph make_label_glyph(char character) {
        if (character == ' ') {
            return make_space_glyph();
        }
        processed_glyph glyph;
        glyph.character = character;
        glyph.bounds = bounds_of(glyph.frame);
        return glyph;
    }

    char normalize_char(char ch) noexcept {
        const auto uch = static_cast<unsigned char>(ch);
        if (std::isalpha(uch)) {
            return static_cast<char>(std::tolower(uch));
        }
        return ch;
    }

    std::string_view standard_charset() noexcept {
        return CHARSET;
    }

    bool is_supported_char(char ch) noexcept {
        return CHARSET.find(normalize_char(ch)) != std::string_view::npos;
    }
} // namespace interlock
