/**
 * @file outline_extent.hh
 * @brief Bounding boxes of SVG outline primitives.
 *
 * The footprint extractor only needs where ink can be, not its exact
 * shape, so every outline primitive is reduced to an axis-aligned box.
 *
 * @section extent_paths Path Data
 *
 * path_extent() understands the full SVG path grammar (M L H V C S Q T A
 * Z, absolute and relative, implicit command repetition, compact number
 * and arc-flag syntax). Bezier control points are included in the box,
 * which over-approximates curves. Elliptical arcs are bounded exactly
 * using the endpoint to center conversion from the SVG implementation
 * notes. Like an SVG renderer, parsing stops at the first error and the
 * box of the data read so far is returned.
 *
 * @section extent_shapes Basic Shapes
 *
 * element_extent() additionally handles rect, circle, ellipse, line,
 * polyline and polygon elements. Element transforms are not applied.
 */

#pragma once

#include <interlock/export.h>
#include <euler/coordinates/point2.hh>
#include <optional>
#include <string_view>

namespace interlock {
    struct markup_element;

    /// Axis-aligned box in logical units
    struct INTERLOCK_EXPORT outline_extent {
        euler::point2f min{0.0f, 0.0f};
        euler::point2f max{0.0f, 0.0f};

        [[nodiscard]] float width() const noexcept { return max.x - min.x; }
        [[nodiscard]] float height() const noexcept { return max.y - min.y; }
    };

    /**
     * @brief Accumulates points into an outline_extent.
     */
    class INTERLOCK_EXPORT extent_builder {
    public:
        void add(float x, float y) noexcept;
        void add(const euler::point2f& p) noexcept { add(p.x, p.y); }

        [[nodiscard]] bool empty() const noexcept { return m_empty; }

        /// The box, or std::nullopt if no point was added
        [[nodiscard]] std::optional<outline_extent> extent() const;

    private:
        bool m_empty = true;
        float m_min_x = 0.0f;
        float m_min_y = 0.0f;
        float m_max_x = 0.0f;
        float m_max_y = 0.0f;
    };

    /**
     * @brief Bounding box of SVG path data (the "d" attribute).
     * @return Box of all endpoints and control points, std::nullopt for empty data
     */
    [[nodiscard]] INTERLOCK_EXPORT std::optional<outline_extent> path_extent(std::string_view data);

    /// true for element names that describe ink (path and the basic shapes)
    [[nodiscard]] INTERLOCK_EXPORT bool is_outline_element(std::string_view name) noexcept;

    /**
     * @brief Bounding box of one outline element.
     * @return std::nullopt for non-outline elements and for shapes that render nothing
     */
    [[nodiscard]] INTERLOCK_EXPORT std::optional<outline_extent> element_extent(const markup_element& element);
} // namespace interlock
