/**
 * @file asset_source.hh
 * @brief Where glyph markup comes from.
 *
 * Batch generation and runtime word assembly read glyph markup through
 * the asset_source interface. Two implementations are provided:
 *
 * | Class | Storage |
 * |-------|---------|
 * | directory_asset_source | `<root>/<style>/<variant>/<character>.svg` on disk |
 * | memory_asset_source | In-memory map, for tests and embedding hosts |
 *
 * Implementations must be safe to call from several threads at once.
 */

#pragma once

#include <interlock/export.h>
#include <interlock/types.hh>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <tuple>

namespace interlock {
    /**
     * @brief Source of glyph markup.
     */
    class INTERLOCK_EXPORT asset_source {
    public:
        virtual ~asset_source() = default;

        /**
         * @brief Markup of one glyph.
         * @throws asset_not_found_error if there is no markup for the key
         */
        [[nodiscard]] virtual std::string load(std::string_view style, char character,
                                               glyph_variant variant) const = 0;

        /// true if load() would find markup for the key
        [[nodiscard]] virtual bool contains(std::string_view style, char character,
                                            glyph_variant variant) const = 0;
    };

    /**
     * @brief Reads `<root>/<style>/<variant>/<character>.svg`.
     *
     * character is normalized (lowercased) before the path is built.
     */
    class INTERLOCK_EXPORT directory_asset_source final : public asset_source {
    public:
        explicit directory_asset_source(std::filesystem::path root);

        [[nodiscard]] std::string load(std::string_view style, char character,
                                       glyph_variant variant) const override;
        [[nodiscard]] bool contains(std::string_view style, char character,
                                    glyph_variant variant) const override;

        /// File a key maps to
        [[nodiscard]] std::filesystem::path path_of(std::string_view style, char character,
                                                    glyph_variant variant) const;

        [[nodiscard]] const std::filesystem::path& root() const noexcept { return m_root; }

    private:
        std::filesystem::path m_root;
    };

    /**
     * @brief Markup held in memory.
     *
     * Populate with add() before sharing across threads.
     */
    class INTERLOCK_EXPORT memory_asset_source final : public asset_source {
    public:
        memory_asset_source& add(std::string style, char character, glyph_variant variant, std::string markup);

        [[nodiscard]] std::string load(std::string_view style, char character,
                                       glyph_variant variant) const override;
        [[nodiscard]] bool contains(std::string_view style, char character,
                                    glyph_variant variant) const override;

    private:
        using key = std::tuple<std::string, char, glyph_variant>;
        std::map<key, std::string> m_markup;
    };
} // namespace interlock
