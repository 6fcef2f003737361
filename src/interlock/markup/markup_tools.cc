//
// Glyph markup validation and optimization
//

#include <interlock/markup/markup_tools.hh>
#include <interlock/markup/markup_parser.hh>
#include <interlock/markup/outline_extent.hh>
#include <interlock/errors.hh>
#include <cctype>

namespace interlock {
    namespace {
        std::string context_of(char character) {
            return "glyph '" + std::string(1, character) + "'";
        }

        bool has_visible_content(const markup_element& e) {
            if (is_outline_element(e.name) || e.name == "text") {
                return true;
            }
            for (const auto& child : e.children) {
                if (has_visible_content(child)) {
                    return true;
                }
            }
            return false;
        }
    } // namespace

    validation_result validate_markup(std::string_view markup, char character, const markup_parser& parser) {
        validation_result result;
        const auto context = context_of(character);
        result.byte_size = markup.size();

        if (markup.empty()) {
            result.errors.push_back("Empty markup for " + context);
            return result;
        }

        if (markup.find("<svg") == std::string_view::npos || markup.find("</svg>") == std::string_view::npos) {
            result.errors.push_back("Missing <svg> tags for " + context);
        }

        markup_element doc;
        try {
            doc = parser.parse(markup);
        } catch (const markup_parse_error& e) {
            result.errors.push_back("Parse error for " + context + ": " + e.what());
            return result;
        }

        const auto* svg = doc.find_first("svg");
        if (!svg) {
            result.errors.push_back("No <svg> element for " + context);
        } else {
            result.element_count = svg->descendant_count();
            result.has_content = has_visible_content(*svg);

            if (!result.has_content) {
                result.warnings.push_back("No visible content for " + context);
            }
            if (!svg->has_attribute("viewBox")) {
                result.warnings.push_back("Missing viewBox for " + context);
            }
            if (!svg->has_attribute("width") || !svg->has_attribute("height")) {
                result.warnings.push_back("Missing width or height for " + context);
            }
        }

        if (result.byte_size > LARGE_MARKUP_BYTES) {
            result.warnings.push_back("Large markup for " + context + ": " +
                                      std::to_string(result.byte_size / 1024) + " KB");
        }

        result.valid = result.errors.empty();
        return result;
    }

    validation_result validate_markup(std::string_view markup, char character) {
        const svg_markup_parser parser{};
        return validate_markup(markup, character, parser);
    }

    std::string optimize_markup(std::string_view markup) {
        // Pass 1: drop comments and collapse whitespace
        std::string collapsed;
        collapsed.reserve(markup.size());
        std::size_t i = 0;
        while (i < markup.size()) {
            if (markup.substr(i, 4) == "<!--") {
                const auto end = markup.find("-->", i + 4);
                i = end == std::string_view::npos ? markup.size() : end + 3;
                continue;
            }
            const char c = markup[i++];
            if (std::isspace(static_cast<unsigned char>(c))) {
                if (collapsed.empty() || collapsed.back() != ' ') {
                    collapsed.push_back(' ');
                }
            } else {
                collapsed.push_back(c);
            }
        }

        // Pass 2: remove whitespace between tags and trim
        std::string out;
        out.reserve(collapsed.size());
        for (std::size_t k = 0; k < collapsed.size(); ++k) {
            const char c = collapsed[k];
            if (c == ' ') {
                const bool after_tag = !out.empty() && out.back() == '>';
                const bool before_tag = k + 1 < collapsed.size() && collapsed[k + 1] == '<';
                if (out.empty() || k + 1 == collapsed.size() || (after_tag && before_tag)) {
                    continue;
                }
            }
            out.push_back(c);
        }
        return out;
    }
} // namespace interlock
