/**
 * @file footprint.hh
 * @brief Glyph footprint extraction: markup to processed_glyph.
 *
 * The extractor reduces a glyph outline to the coarse data the overlap
 * engine works on:
 *
 * 1. Parse the markup through the injected markup_parser
 * 2. Take the frame from the root viewBox, or {0, 0, 100, 100}
 * 3. Bound every outline element (path data, basic shapes)
 * 4. Mark every grid cell touched by a bounding box
 * 5. Scan each column top to bottom into vertical runs
 *
 * @section footprint_usage Usage
 *
 * @code{.cpp}
 * footprint_extractor extractor;
 * processed_glyph a = extractor.extract(svg_text, 'a');
 *
 * // a.grid.rows() == ceil(a.frame.height / SAMPLING_RESOLUTION)
 * // a.runs.size() == a.grid.cols()
 * @endcode
 *
 * Extraction is a pure function of its input, so one extractor may be
 * shared by any number of threads.
 */

#pragma once

#include <interlock/export.h>
#include <interlock/types.hh>
#include <interlock/markup/outline_extent.hh>
#include <memory>
#include <optional>
#include <span>
#include <utility>
#include <string_view>
#include <vector>

namespace interlock {
    class markup_parser;

    /**
     * @brief Parse a viewBox attribute ("x y w h", space and/or comma separated).
     * @return The frame, or std::nullopt if the value does not hold four numbers
     */
    [[nodiscard]] INTERLOCK_EXPORT std::optional<glyph_frame> parse_view_box(std::string_view value);

    /**
     * @brief Grid dimensions for a frame.
     * @return {ceil(height / R), ceil(width / R)}, at least one cell and at
     *         most MAX_GRID_CELLS each way
     */
    [[nodiscard]] INTERLOCK_EXPORT std::pair<std::size_t, std::size_t> grid_size(const glyph_frame& frame) noexcept;

    /**
     * @brief Mark every cell covered by an extent.
     *
     * Cells floor(x0/R) .. ceil(x1/R)-1 (relative to the frame origin) are
     * set, clipped to the grid. A box of zero width or height still marks
     * one cell. Extents with non-finite coordinates are skipped.
     *
     * @throws std::invalid_argument if the grid would exceed MAX_GRID_CELLS
     */
    [[nodiscard]] INTERLOCK_EXPORT pixel_grid rasterize(const glyph_frame& frame,
                                                        std::span<const outline_extent> extents);

    /**
     * @brief Per-column ink runs of a grid.
     * @return One column_runs per grid column
     */
    [[nodiscard]] INTERLOCK_EXPORT std::vector<column_runs> compute_vertical_runs(const pixel_grid& grid);

    /**
     * @brief Turns glyph markup into processed_glyph records.
     */
    class INTERLOCK_EXPORT footprint_extractor {
    public:
        /// Extractor using the built-in SVG parser
        footprint_extractor();

        /**
         * @brief Extractor using a host supplied parser.
         * @throws std::invalid_argument if parser is null
         */
        explicit footprint_extractor(std::shared_ptr<const markup_parser> parser);

        /**
         * @brief Extract the footprint of one glyph.
         *
         * @param markup SVG text
         * @param character Symbol the markup draws (case preserved)
         * @return Glyph with markup, frame, bounds, grid and runs filled in
         * @throws malformed_glyph_error if the markup cannot be parsed, has no
         *         root <svg>, has a degenerate or non-finite frame, has a
         *         frame larger than MAX_GRID_CELLS cells, or draws nothing
         */
        [[nodiscard]] processed_glyph extract(std::string_view markup, char character) const;

        [[nodiscard]] const markup_parser& parser() const noexcept { return *m_parser; }

    private:
        std::shared_ptr<const markup_parser> m_parser;
    };
} // namespace interlock
