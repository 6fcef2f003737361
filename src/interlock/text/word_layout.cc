//
// Word assembly and layout
//

#include <interlock/text/word_layout.hh>
#include <interlock/lookup/asset_source.hh>
#include <interlock/lookup/glyph_table.hh>
#include <interlock/footprint.hh>
#include <interlock/errors.hh>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>

namespace interlock {
    namespace {
        glyph_variant variant_at(const std::string& text, std::size_t i) {
            const bool repeat = i > 0 && text[i - 1] == text[i];
            return select_variant(i, text.size(), repeat);
        }

        template<typename Resolve>
        std::vector<processed_glyph> assemble(const std::string& text, Resolve&& resolve) {
            std::vector<processed_glyph> out;
            out.reserve(text.size());
            for (std::size_t i = 0; i < text.size(); ++i) {
                const char ch = text[i];
                if (ch == ' ') {
                    out.push_back(make_space_glyph());
                } else {
                    out.push_back(resolve(ch, variant_at(text, i)));
                }
            }
            return out;
        }
    } // namespace

    processed_glyph make_placeholder_glyph(char character) {
        auto glyph = make_space_glyph(DEFAULT_SPACE_WIDTH);
        glyph.character = character;
        return glyph;
    }

    std::string normalize_text(std::string_view text) {
        std::string out;
        out.reserve(text.size());
        for (char ch : text) {
            if (ch == ' ' || is_supported_char(ch)) {
                out.push_back(normalize_char(ch));
            }
        }
        return out;
    }

    std::vector<processed_glyph> assemble_word(std::string_view text, const glyph_table& table,
                                               std::string_view style) {
        return assemble(normalize_text(text), [&](char ch, glyph_variant variant) {
            if (const auto* record = table.find(style, ch, variant)) {
                return record->glyph;
            }
            spdlog::warn("No glyph '{}' in style '{}', using placeholder", ch, style);
            return make_placeholder_glyph(ch);
        });
    }

    std::vector<processed_glyph> assemble_word(std::string_view text, const asset_source& assets,
                                               const footprint_extractor& extractor, std::string_view style) {
        return assemble(normalize_text(text), [&](char ch, glyph_variant variant) {
            if (variant != glyph_variant::standard && !assets.contains(style, ch, variant)) {
                variant = glyph_variant::standard;
            }
            try {
                return extractor.extract(assets.load(style, ch, variant), ch);
            } catch (const malformed_glyph_error& e) {
                spdlog::warn("Glyph '{}' of style '{}' unusable, using placeholder: {}", ch, style, e.what());
            } catch (const asset_not_found_error& e) {
                spdlog::warn("Glyph '{}' of style '{}' unusable, using placeholder: {}", ch, style, e.what());
            } catch (const std::exception& e) {
                spdlog::error("Glyph '{}' of style '{}' failed, using placeholder: {}", ch, style, e.what());
            }
            return make_placeholder_glyph(ch);
        });
    }

    word_layout layout_word(std::span<const processed_glyph> glyphs, const mode_dispatcher& dispatcher,
                            resolve_mode mode) {
        word_layout layout;
        if (glyphs.empty()) {
            return layout;
        }

        // Raw positions
        std::vector<float> positions;
        positions.reserve(glyphs.size());
        layout.glyphs.reserve(glyphs.size());

        float x = 0.0f;
        positions.push_back(x - glyphs[0].bounds.left);
        layout.glyphs.push_back({glyphs[0], 0.0f, 0.0f, 0.0});

        for (std::size_t i = 1; i < glyphs.size(); ++i) {
            const auto& prev = glyphs[i - 1];
            const auto& curr = glyphs[i];
            const auto decision = dispatcher.resolve(prev, curr, mode);
            x += prev.width() * static_cast<float>(1.0 - decision.ratio);
            positions.push_back(x - curr.bounds.left);

            const auto rotation = curr.is_space || prev.is_space
                                      ? 0.0f
                                      : static_cast<float>(dispatcher.rotation(prev.character, curr.character, mode));
            layout.glyphs.push_back({curr, 0.0f, rotation, decision.ratio});
        }

        // Group extent
        float min_x = std::numeric_limits<float>::max();
        float max_x = std::numeric_limits<float>::lowest();
        float min_y = std::numeric_limits<float>::max();
        float max_y = std::numeric_limits<float>::lowest();
        for (std::size_t i = 0; i < glyphs.size(); ++i) {
            const auto& g = glyphs[i];
            min_x = std::min(min_x, (positions[i] + g.bounds.left) * g.scale);
            max_x = std::max(max_x, (positions[i] + g.bounds.right) * g.scale);
            min_y = std::min(min_y, g.bounds.top * g.scale);
            max_y = std::max(max_y, g.bounds.bottom * g.scale);
        }
        layout.content_width = std::max(max_x - min_x, 1.0f);
        layout.content_height = std::max(max_y - min_y, 1.0f);

        // Shift so the group starts at 0
        for (std::size_t i = 0; i < glyphs.size(); ++i) {
            layout.glyphs[i].x = positions[i] * glyphs[i].scale - min_x;
        }
        return layout;
    }

    word_layout layout_word(std::span<const processed_glyph> glyphs, const mode_dispatcher& dispatcher) {
        return layout_word(glyphs, dispatcher, dispatcher.options().mode);
    }
} // namespace interlock
