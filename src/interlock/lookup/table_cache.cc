//
// Per-style table cache
//

#include <interlock/lookup/table_cache.hh>
#include <failsafe/failsafe.hh>
#include <spdlog/spdlog.h>

namespace interlock {
    table_cache::table_cache(generator gen)
        : m_generator(std::move(gen)) {
        THROW_IF(!m_generator, std::invalid_argument, "table_cache requires a generator");
    }

    const style_generation& table_cache::get(std::string_view style) {
        const auto it = m_entries.find(style);
        if (it != m_entries.end()) {
            return it->second;
        }
        return regenerate(style);
    }

    std::shared_ptr<const overlap_table> table_cache::overlaps(std::string_view style) {
        return get(style).overlaps;
    }

    std::shared_ptr<const glyph_table> table_cache::glyphs(std::string_view style) {
        return get(style).glyphs;
    }

    void table_cache::put(std::string style, style_generation tables) {
        store(std::move(style), std::move(tables));
    }

    const style_generation& table_cache::regenerate(std::string_view style) {
        spdlog::debug("Generating tables for style '{}'", style);
        auto tables = m_generator(style);
        ++m_generations;
        return store(std::string(style), std::move(tables));
    }

    void table_cache::invalidate(std::string_view style) {
        const auto it = m_entries.find(style);
        if (it != m_entries.end()) {
            m_entries.erase(it);
        }
    }

    bool table_cache::is_cached(std::string_view style) const {
        return m_entries.find(style) != m_entries.end();
    }

    const style_generation& table_cache::store(std::string style, style_generation tables) {
        if (!tables.overlaps) {
            tables.overlaps = std::make_shared<const overlap_table>();
        }
        if (!tables.glyphs) {
            tables.glyphs = std::make_shared<const glyph_table>();
        }
        return m_entries.insert_or_assign(std::move(style), std::move(tables)).first->second;
    }
} // namespace interlock
