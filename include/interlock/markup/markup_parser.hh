/**
 * @file markup_parser.hh
 * @brief Element tree for glyph markup and the parser capability.
 *
 * The footprint extractor never touches raw markup text. It asks an
 * injected markup_parser to turn the text into a markup_element tree and
 * then walks the tree. Hosts that already own a document parser can plug
 * it in by implementing markup_parser; everyone else uses the built-in
 * svg_markup_parser.
 *
 * @section markup_usage Usage
 *
 * @code{.cpp}
 * auto parser = make_default_markup_parser();
 * markup_element doc = parser->parse(svg_text);
 *
 * if (const auto* svg = doc.find_first("svg")) {
 *     auto view_box = svg->attribute("viewBox");
 *     std::vector<const markup_element*> paths;
 *     svg->collect("path", paths);
 * }
 * @endcode
 */

#pragma once

#include <interlock/export.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace interlock {
    /**
     * @brief One element of a parsed markup document.
     *
     * Names are stored without namespace prefix ("svg:path" becomes
     * "path"). Attribute values have entities decoded. Text content is
     * not retained.
     */
    struct INTERLOCK_EXPORT markup_element {
        std::string name;
        std::vector<std::pair<std::string, std::string>> attributes;
        std::vector<markup_element> children;

        /**
         * @brief Look up an attribute by exact name.
         * @return The decoded value, or std::nullopt if absent
         */
        [[nodiscard]] std::optional<std::string_view> attribute(std::string_view key) const;

        [[nodiscard]] bool has_attribute(std::string_view key) const;

        /// Depth-first search for the first element named name (this element included)
        [[nodiscard]] const markup_element* find_first(std::string_view element_name) const;

        /// Append every descendant named element_name (this element included), document order
        void collect(std::string_view element_name, std::vector<const markup_element*>& out) const;

        /// Number of elements in this subtree, excluding this element
        [[nodiscard]] std::size_t descendant_count() const noexcept;
    };

    /**
     * @brief Capability that turns markup text into an element tree.
     *
     * parse() returns a synthetic root named "#document" whose children
     * are the top-level elements of the text.
     */
    class INTERLOCK_EXPORT markup_parser {
    public:
        virtual ~markup_parser() = default;

        /**
         * @brief Parse markup text.
         * @throws markup_parse_error if the text is not well formed
         */
        [[nodiscard]] virtual markup_element parse(std::string_view text) const = 0;
    };

    /**
     * @brief Built-in parser for the XML subset used by SVG glyph assets.
     *
     * Handles elements, quoted attributes, self-closing tags, comments,
     * processing instructions, DOCTYPE, CDATA and character/entity
     * references in attribute values.
     */
    class INTERLOCK_EXPORT svg_markup_parser final : public markup_parser {
    public:
        [[nodiscard]] markup_element parse(std::string_view text) const override;
    };

    /// Parser used when the host does not inject one
    [[nodiscard]] INTERLOCK_EXPORT std::shared_ptr<const markup_parser> make_default_markup_parser();
} // namespace interlock
