//
// Glyph markup sources
//

#include <interlock/lookup/asset_source.hh>
#include <interlock/errors.hh>
#include <failsafe/failsafe.hh>
#include <fstream>
#include <sstream>

namespace interlock {
    namespace {
        std::string describe(std::string_view style, char character, glyph_variant variant) {
            return std::string(style) + "/" + std::string(variant_name(variant)) + "/" + std::string(1, character);
        }
    }

    // =============================================================================
    // directory_asset_source
    // =============================================================================
    directory_asset_source::directory_asset_source(std::filesystem::path root)
        : m_root(std::move(root)) {
    }

    std::filesystem::path directory_asset_source::path_of(std::string_view style, char character,
                                                          glyph_variant variant) const {
        return m_root / std::string(style) / std::string(variant_name(variant)) /
               (std::string(1, normalize_char(character)) + ".svg");
    }

    bool directory_asset_source::contains(std::string_view style, char character, glyph_variant variant) const {
        std::error_code ec;
        return std::filesystem::is_regular_file(path_of(style, character, variant), ec);
    }

    std::string directory_asset_source::load(std::string_view style, char character, glyph_variant variant) const {
        const auto path = path_of(style, character, variant);
        std::ifstream file(path, std::ios::binary);
        THROW_IF(!file, asset_not_found_error, "No glyph asset", describe(style, character, variant),
                 "at", path.string());

        std::ostringstream ss;
        ss << file.rdbuf();
        THROW_IF(file.bad(), std::runtime_error, "Failed to read glyph asset", path.string());
        return ss.str();
    }

    // =============================================================================
    // memory_asset_source
    // =============================================================================
    memory_asset_source& memory_asset_source::add(std::string style, char character, glyph_variant variant,
                                                  std::string markup) {
        m_markup.insert_or_assign(key{std::move(style), normalize_char(character), variant}, std::move(markup));
        return *this;
    }

    bool memory_asset_source::contains(std::string_view style, char character, glyph_variant variant) const {
        return m_markup.contains(key{std::string(style), normalize_char(character), variant});
    }

    std::string memory_asset_source::load(std::string_view style, char character, glyph_variant variant) const {
        const auto it = m_markup.find(key{std::string(style), normalize_char(character), variant});
        THROW_IF(it == m_markup.end(), asset_not_found_error, "No glyph asset",
                 describe(style, character, variant));
        return it->second;
    }
} // namespace interlock
