//
// Glyph footprint extraction
//

#include <interlock/footprint.hh>
#include <interlock/markup/markup_parser.hh>
#include <interlock/errors.hh>
#include <failsafe/failsafe.hh>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <cmath>

namespace interlock {
    std::optional<glyph_frame> parse_view_box(std::string_view value) {
        float v[4] = {};
        std::size_t n = 0;
        std::size_t i = 0;

        while (i < value.size()) {
            const char c = value[i];
            if (c == ' ' || c == ',' || c == '\t' || c == '\n' || c == '\r') {
                ++i;
                continue;
            }
            if (n == 4) {
                return std::nullopt;
            }
            if (c == '+') {
                ++i;
            }
            const char* first = value.data() + i;
            const char* last = value.data() + value.size();
            const auto [ptr, ec] = std::from_chars(first, last, v[n]);
            if (ec != std::errc{} || ptr == first) {
                return std::nullopt;
            }
            i = static_cast<std::size_t>(ptr - value.data());
            ++n;
        }

        if (n != 4) {
            return std::nullopt;
        }
        return glyph_frame{v[0], v[1], v[2], v[3]};
    }

    namespace {
        // Cell count along one axis, clamped so the cast to size_t stays defined
        std::size_t cells_along(float extent) noexcept {
            const double cells = std::ceil(static_cast<double>(extent) / SAMPLING_RESOLUTION);
            if (!(cells >= 1.0)) {
                return 1;
            }
            return static_cast<std::size_t>(std::min(cells, static_cast<double>(MAX_GRID_CELLS)));
        }

        // Cell index of a coordinate, clamped to [-1, limit + 1]
        long cell_index(double quotient, std::size_t limit) noexcept {
            return static_cast<long>(std::clamp(quotient, -1.0, static_cast<double>(limit) + 1.0));
        }
    }

    std::pair<std::size_t, std::size_t> grid_size(const glyph_frame& frame) noexcept {
        return {cells_along(frame.height), cells_along(frame.width)};
    }

    pixel_grid rasterize(const glyph_frame& frame, std::span<const outline_extent> extents) {
        const auto [rows, cols] = grid_size(frame);
        THROW_IF(rows * cols > MAX_GRID_CELLS, std::invalid_argument,
                 "Frame exceeds the footprint grid limit:", frame.width, frame.height);
        pixel_grid grid(rows, cols);

        for (const auto& e : extents) {
            const double x0 = (static_cast<double>(e.min.x) - frame.x) / SAMPLING_RESOLUTION;
            const double y0 = (static_cast<double>(e.min.y) - frame.y) / SAMPLING_RESOLUTION;
            const double x1 = (static_cast<double>(e.max.x) - frame.x) / SAMPLING_RESOLUTION;
            const double y1 = (static_cast<double>(e.max.y) - frame.y) / SAMPLING_RESOLUTION;
            if (!std::isfinite(x0) || !std::isfinite(y0) || !std::isfinite(x1) || !std::isfinite(y1)) {
                continue;
            }

            const auto col0 = cell_index(std::floor(x0), cols);
            const auto row0 = cell_index(std::floor(y0), rows);
            const auto col1 = std::max(cell_index(std::ceil(x1), cols), col0 + 1);
            const auto row1 = std::max(cell_index(std::ceil(y1), rows), row0 + 1);
            grid.fill(row0, col0, row1, col1);
        }
        return grid;
    }

    std::vector<column_runs> compute_vertical_runs(const pixel_grid& grid) {
        std::vector<column_runs> result(grid.cols());

        for (std::size_t c = 0; c < grid.cols(); ++c) {
            auto& runs = result[c];
            int start = -1;

            for (std::size_t r = 0; r < grid.rows(); ++r) {
                const bool on = grid.cell(r, c);
                if (on && start < 0) {
                    start = static_cast<int>(r);
                } else if (!on && start >= 0) {
                    runs.push_back({start, static_cast<int>(r) - 1, 1.0});
                    start = -1;
                }
            }
            if (start >= 0) {
                runs.push_back({start, static_cast<int>(grid.rows()) - 1, 1.0});
            }
        }
        return result;
    }

    // =============================================================================
    // Extractor
    // =============================================================================
    footprint_extractor::footprint_extractor()
        : m_parser(make_default_markup_parser()) {
    }

    footprint_extractor::footprint_extractor(std::shared_ptr<const markup_parser> parser)
        : m_parser(std::move(parser)) {
        THROW_IF(!m_parser, std::invalid_argument, "footprint_extractor requires a markup parser");
    }

    processed_glyph footprint_extractor::extract(std::string_view markup, char character) const {
        markup_element doc;
        try {
            doc = m_parser->parse(markup);
        } catch (const markup_parse_error& e) {
            throw malformed_glyph_error(character, e.what());
        }

        const auto* svg = doc.find_first("svg");
        if (!svg) {
            throw malformed_glyph_error(character, "no <svg> element");
        }

        processed_glyph glyph;
        glyph.character = character;
        glyph.markup = std::string(markup);

        const auto view_box = svg->attribute("viewBox");
        std::optional<glyph_frame> frame = view_box ? parse_view_box(*view_box) : std::nullopt;
        if (frame) {
            glyph.frame = *frame;
        } else {
            spdlog::debug("Glyph '{}' has no usable viewBox, using {}x{} default frame",
                          character, glyph.frame.width, glyph.frame.height);
        }

        if (!std::isfinite(glyph.frame.x) || !std::isfinite(glyph.frame.y) ||
            !std::isfinite(glyph.frame.width) || !std::isfinite(glyph.frame.height)) {
            throw malformed_glyph_error(character, "viewBox is not finite");
        }
        if (!(glyph.frame.width > 0.0f) || !(glyph.frame.height > 0.0f)) {
            throw malformed_glyph_error(character, "viewBox has no area");
        }
        const double cells = std::ceil(static_cast<double>(glyph.frame.width) / SAMPLING_RESOLUTION) *
                             std::ceil(static_cast<double>(glyph.frame.height) / SAMPLING_RESOLUTION);
        if (cells > static_cast<double>(MAX_GRID_CELLS)) {
            throw malformed_glyph_error(character, "viewBox exceeds the footprint grid limit");
        }
        glyph.bounds = bounds_of(glyph.frame);

        std::vector<outline_extent> extents;
        std::size_t outline_elements = 0;
        auto visit = [&](const auto& self, const markup_element& e) -> void {
            if (is_outline_element(e.name)) {
                ++outline_elements;
                if (auto ext = element_extent(e)) {
                    extents.push_back(*ext);
                }
            }
            for (const auto& child : e.children) {
                self(self, child);
            }
        };
        visit(visit, *svg);

        if (outline_elements == 0) {
            throw malformed_glyph_error(character, "no outline element");
        }
        if (extents.empty()) {
            spdlog::debug("Glyph '{}' has {} outline elements but none with geometry", character, outline_elements);
        }

        glyph.grid = rasterize(glyph.frame, extents);
        glyph.runs = compute_vertical_runs(glyph.grid);
        return glyph;
    }
} // namespace interlock
