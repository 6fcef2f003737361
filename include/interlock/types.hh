/**
 * @file types.hh
 * @brief Core glyph geometry types shared by the whole overlap engine.
 *
 * This file defines the immutable per-glyph record produced by the
 * footprint extractor (processed_glyph) and the geometric pieces it is
 * made of: the logical frame, the derived bounds, the coarse ink grid and
 * the per-column vertical ink runs.
 *
 * @section types_grid Footprint Grid
 *
 * The footprint is sampled at a fixed resolution of SAMPLING_RESOLUTION
 * logical units per cell. A 200x100 frame therefore produces a grid of
 * 10 rows by 20 columns:
 *
 * @code
 *   frame (logical units)            pixel_grid (cells)
 *   +---------------------+          col 0 1 2 ... 19
 *   |      ###            |   --->   row 0 . . # ...
 *   |     #####           |              1 . # # ...
 *   |      ###            |              ...
 *   +---------------------+              9 . . . ...
 * @endcode
 *
 * @section types_runs Vertical Runs
 *
 * For each grid column the contiguous filled cells form runs, listed
 * top to bottom:
 *
 * @code
 *   column 3:  row 0 .
 *              row 1 #  \
 *              row 2 #   > run {top=1, bottom=3, density=1}
 *              row 3 #  /
 *              row 4 .
 *              row 5 #  > run {top=5, bottom=5, density=1}
 * @endcode
 */

#pragma once

#include <interlock/export.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace interlock {
    /// Logical units covered by one footprint grid cell
    inline constexpr float SAMPLING_RESOLUTION = 10.0f;

    /// Largest footprint grid (rows * cols) a glyph frame may produce
    inline constexpr std::size_t MAX_GRID_CELLS = 1'000'000;

    /// Width of the synthetic space glyph when none is given
    inline constexpr float DEFAULT_SPACE_WIDTH = 50.0f;

    /**
     * @brief Logical coordinate box of a glyph (the SVG viewBox).
     *
     * Defaults to {0, 0, 100, 100} when the markup declares no viewBox.
     */
    struct INTERLOCK_EXPORT glyph_frame {
        float x = 0.0f;        ///< Left edge in logical units
        float y = 0.0f;        ///< Top edge in logical units
        float width = 100.0f;  ///< Width in logical units
        float height = 100.0f; ///< Height in logical units

        bool operator==(const glyph_frame&) const = default;
    };

    /**
     * @brief Edges of a glyph derived from its frame.
     *
     * Always {x, x + width, y, y + height}; right > left and bottom > top.
     */
    struct INTERLOCK_EXPORT glyph_bounds {
        float left = 0.0f;
        float right = 0.0f;
        float top = 0.0f;
        float bottom = 0.0f;

        [[nodiscard]] float width() const noexcept { return right - left; }
        [[nodiscard]] float height() const noexcept { return bottom - top; }

        bool operator==(const glyph_bounds&) const = default;
    };

    /// Bounds for a frame
    [[nodiscard]] INTERLOCK_EXPORT glyph_bounds bounds_of(const glyph_frame& frame) noexcept;

    /**
     * @brief Contiguous run of ink cells within one grid column.
     *
     * top and bottom are inclusive row indices. density is the share of
     * filled cells in the run and lies in (0, 1].
     */
    struct INTERLOCK_EXPORT vertical_run {
        int top = 0;
        int bottom = 0;
        double density = 1.0;

        [[nodiscard]] int length() const noexcept { return bottom - top + 1; }

        bool operator==(const vertical_run&) const = default;
    };

    /// Runs of one grid column, top to bottom
    using column_runs = std::vector<vertical_run>;

    /**
     * @brief Coarse boolean ink mask of a glyph.
     *
     * Row-major storage of rows() x cols() cells. Out of range access is
     * an invariant violation.
     */
    class INTERLOCK_EXPORT pixel_grid {
    public:
        pixel_grid() = default;

        /**
         * @brief Create an empty (all false) grid.
         * @param rows Number of rows
         * @param cols Number of columns
         */
        pixel_grid(std::size_t rows, std::size_t cols);

        [[nodiscard]] std::size_t rows() const noexcept { return m_rows; }
        [[nodiscard]] std::size_t cols() const noexcept { return m_cols; }
        [[nodiscard]] bool empty() const noexcept { return m_cells.empty(); }

        /**
         * @brief Read one cell.
         * @param row Row index (0 = top)
         * @param col Column index (0 = left)
         * @return true if the cell holds ink
         */
        [[nodiscard]] bool cell(std::size_t row, std::size_t col) const;

        void set(std::size_t row, std::size_t col, bool on = true);

        /// Fill the half-open cell rectangle [row0, row1) x [col0, col1), clipped to the grid
        void fill(long row0, long col0, long row1, long col1);

        /// Number of filled cells
        [[nodiscard]] std::size_t count() const noexcept;

        bool operator==(const pixel_grid&) const = default;

    private:
        std::size_t m_rows = 0;
        std::size_t m_cols = 0;
        std::vector<std::uint8_t> m_cells;
    };

    /**
     * @brief Asset variant of a letter within a style.
     *
     * first and last are used for word-initial and word-final letters,
     * alternate for a second drawing of the same letter.
     */
    enum class glyph_variant : std::uint8_t {
        standard,
        alternate,
        first,
        last
    };

    /// Lowercase variant name ("standard", "alternate", "first", "last")
    [[nodiscard]] INTERLOCK_EXPORT std::string_view variant_name(glyph_variant variant) noexcept;

    /**
     * @brief Parse a variant name.
     * @throws std::invalid_argument for unknown names
     */
    [[nodiscard]] INTERLOCK_EXPORT glyph_variant parse_variant(std::string_view name);

    /**
     * @brief One resolved letter with its derived footprint.
     *
     * Built once per (style, character, variant) by the footprint
     * extractor, or synthesized by make_space_glyph(), and treated as
     * read-only afterwards.
     */
    struct INTERLOCK_EXPORT processed_glyph {
        char character = ' ';      ///< Symbol as it appeared in the source (case preserved)
        std::string markup;        ///< Serialized outline, used for final render only
        glyph_frame frame;         ///< Logical coordinate box
        glyph_bounds bounds;       ///< Derived edges of frame
        pixel_grid grid;           ///< ceil(height/R) x ceil(width/R) ink mask
        std::vector<column_runs> runs; ///< One entry per grid column
        float scale = 1.0f;        ///< Placement scale, set by the caller
        float rotation = 0.0f;     ///< Placement rotation in degrees, set by the caller
        bool is_space = false;     ///< Synthetic blank glyph

        [[nodiscard]] float width() const noexcept { return bounds.width(); }
        [[nodiscard]] float height() const noexcept { return bounds.height(); }

        bool operator==(const processed_glyph&) const = default;
    };

    /**
     * @brief Create the synthetic blank glyph.
     *
     * The result has bounds {0, width, 0, 1}, a single false cell and no
     * ink runs. Spaces never overlap their neighbours.
     *
     * @param width Advance width in logical units
     */
    [[nodiscard]] INTERLOCK_EXPORT processed_glyph make_space_glyph(float width = DEFAULT_SPACE_WIDTH);

    /**
     * @brief Glyph that carries only a character label.
     *
     * Used where only the rule model is consulted, which reads nothing
     * but the character and the space flag.
     */
    [[nodiscard]] INTERLOCK_EXPORT processed_glyph make_label_glyph(char character);

    /// Lowercase alphabetic characters, leave everything else unchanged
    [[nodiscard]] INTERLOCK_EXPORT char normalize_char(char ch) noexcept;

    /// The 36 supported symbols: a-z followed by 0-9
    [[nodiscard]] INTERLOCK_EXPORT std::string_view standard_charset() noexcept;

    /// true if ch (after normalization) is one of standard_charset()
    [[nodiscard]] INTERLOCK_EXPORT bool is_supported_char(char ch) noexcept;
} // namespace interlock
