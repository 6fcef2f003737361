//
// Precomputed glyph footprints
//

#include <interlock/lookup/glyph_table.hh>
#include <cmath>
#include <set>

namespace interlock {
    namespace {
        constexpr double SYMMETRY_TOLERANCE = 0.1;
    }

    bool detect_symmetry(const processed_glyph& glyph) noexcept {
        const std::size_t cols = glyph.runs.size();
        std::size_t first = cols;
        std::size_t last = 0;
        for (std::size_t c = 0; c < cols; ++c) {
            if (!glyph.runs[c].empty()) {
                if (first == cols) first = c;
                last = c;
            }
        }
        if (first == cols) {
            return false;
        }
        const auto left_margin = static_cast<double>(first);
        const auto right_margin = static_cast<double>(cols - 1 - last);
        return std::abs(left_margin - right_margin) / static_cast<double>(cols) < SYMMETRY_TOLERANCE;
    }

    glyph_variant select_variant(std::size_t index, std::size_t length, bool use_alternate) noexcept {
        if (use_alternate) {
            return glyph_variant::alternate;
        }
        if (index == 0) {
            return glyph_variant::first;
        }
        if (index + 1 == length) {
            return glyph_variant::last;
        }
        return glyph_variant::standard;
    }

    glyph_table::glyph_table(std::vector<glyph_record> records) {
        for (auto& r : records) {
            r.key.character = normalize_char(r.key.character);
            auto key = r.key;
            m_records.insert_or_assign(std::move(key), std::move(r));
        }
    }

    const glyph_record* glyph_table::find_exact(std::string_view style, char character, glyph_variant variant) const {
        const auto it = m_records.find(glyph_key{std::string(style), normalize_char(character), variant});
        return it != m_records.end() ? &it->second : nullptr;
    }

    const glyph_record* glyph_table::find(std::string_view style, char character, glyph_variant variant) const {
        if (const auto* r = find_exact(style, character, variant)) {
            return r;
        }
        if (variant == glyph_variant::standard) {
            return nullptr;
        }
        return find_exact(style, character, glyph_variant::standard);
    }

    std::vector<std::string> glyph_table::styles() const {
        std::set<std::string> names;
        for (const auto& [key, record] : m_records) {
            names.insert(key.style);
        }
        return {names.begin(), names.end()};
    }

    std::size_t glyph_table::markup_bytes(std::string_view style) const noexcept {
        std::size_t total = 0;
        for (const auto& [key, record] : m_records) {
            if (key.style == style) {
                total += record.glyph.markup.size();
            }
        }
        return total;
    }

    std::size_t glyph_table::count(std::string_view style) const noexcept {
        std::size_t n = 0;
        for (const auto& [key, record] : m_records) {
            if (key.style == style) {
                ++n;
            }
        }
        return n;
    }

    std::string compute_checksum(const glyph_table& table, std::string_view style) {
        return std::string(style) + "-" + std::to_string(table.count(style)) + "-" +
               std::to_string(table.markup_bytes(style));
    }
} // namespace interlock
