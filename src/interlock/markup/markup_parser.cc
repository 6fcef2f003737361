//
// Minimal XML reader for SVG glyph assets
//

#include <interlock/markup/markup_parser.hh>
#include <interlock/errors.hh>
#include <failsafe/failsafe.hh>
#include <cctype>
#include <cstdint>

namespace interlock {
    // =============================================================================
    // Element queries
    // =============================================================================
    std::optional<std::string_view> markup_element::attribute(std::string_view key) const {
        for (const auto& [k, v] : attributes) {
            if (k == key) {
                return std::string_view(v);
            }
        }
        return std::nullopt;
    }

    bool markup_element::has_attribute(std::string_view key) const {
        return attribute(key).has_value();
    }

    const markup_element* markup_element::find_first(std::string_view element_name) const {
        if (name == element_name) {
            return this;
        }
        for (const auto& child : children) {
            if (const auto* found = child.find_first(element_name)) {
                return found;
            }
        }
        return nullptr;
    }

    void markup_element::collect(std::string_view element_name, std::vector<const markup_element*>& out) const {
        if (name == element_name) {
            out.push_back(this);
        }
        for (const auto& child : children) {
            child.collect(element_name, out);
        }
    }

    std::size_t markup_element::descendant_count() const noexcept {
        std::size_t count = children.size();
        for (const auto& child : children) {
            count += child.descendant_count();
        }
        return count;
    }

    // =============================================================================
    // Parser
    // =============================================================================
    namespace {
        constexpr int MAX_DEPTH = 512;

        bool is_name_char(char c) {
            const auto uc = static_cast<unsigned char>(c);
            return std::isalnum(uc) || c == '_' || c == '-' || c == '.' || c == ':' || uc >= 0x80;
        }

        void append_utf8(std::string& out, std::uint32_t cp) {
            if (cp < 0x80) {
                out.push_back(static_cast<char>(cp));
            } else if (cp < 0x800) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp < 0x10000) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0x10FFFF) {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back('?');
            }
        }

        std::string decode_entities(std::string_view raw) {
            std::string out;
            out.reserve(raw.size());

            std::size_t i = 0;
            while (i < raw.size()) {
                if (raw[i] != '&') {
                    out.push_back(raw[i++]);
                    continue;
                }

                const auto semi = raw.find(';', i);
                if (semi == std::string_view::npos) {
                    out.push_back(raw[i++]);
                    continue;
                }

                const auto entity = raw.substr(i + 1, semi - i - 1);
                if (entity == "amp") out.push_back('&');
                else if (entity == "lt") out.push_back('<');
                else if (entity == "gt") out.push_back('>');
                else if (entity == "quot") out.push_back('"');
                else if (entity == "apos") out.push_back('\'');
                else if (entity.size() > 1 && entity[0] == '#') {
                    const bool hex = entity[1] == 'x' || entity[1] == 'X';
                    std::uint32_t value = 0;
                    bool valid = entity.size() > (hex ? 2u : 1u);
                    for (std::size_t k = hex ? 2 : 1; k < entity.size() && valid; ++k) {
                        const auto uc = static_cast<unsigned char>(entity[k]);
                        if (hex && std::isxdigit(uc)) {
                            value = value * 16 + static_cast<std::uint32_t>(
                                std::isdigit(uc) ? uc - '0' : std::tolower(uc) - 'a' + 10);
                        } else if (!hex && std::isdigit(uc)) {
                            value = value * 10 + static_cast<std::uint32_t>(uc - '0');
                        } else {
                            valid = false;
                        }
                        if (value > 0x10FFFF) {
                            valid = false;
                        }
                    }
                    if (!valid) {
                        out.append(raw.substr(i, semi - i + 1));
                    } else {
                        append_utf8(out, value);
                    }
                } else {
                    // Unknown named entity, keep as written
                    out.append(raw.substr(i, semi - i + 1));
                }
                i = semi + 1;
            }
            return out;
        }

        std::string_view local_name(std::string_view qualified) {
            const auto colon = qualified.rfind(':');
            return colon == std::string_view::npos ? qualified : qualified.substr(colon + 1);
        }

        class reader {
        public:
            explicit reader(std::string_view text)
                : m_text(text) {
            }

            markup_element parse_document() {
                markup_element root;
                root.name = "#document";

                while (true) {
                    skip_ws();
                    if (eof()) break;

                    if (starts_with("<?")) {
                        skip_past("?>", "processing instruction");
                    } else if (starts_with("<!--")) {
                        skip_past("-->", "comment");
                    } else if (starts_with("<!")) {
                        skip_declaration();
                    } else if (peek() == '<') {
                        root.children.push_back(parse_element(1));
                    } else {
                        skip_text();
                    }
                }
                return root;
            }

        private:
            std::string_view m_text;
            std::size_t m_pos = 0;

            [[nodiscard]] bool eof() const noexcept { return m_pos >= m_text.size(); }
            [[nodiscard]] char peek() const noexcept { return m_text[m_pos]; }

            [[nodiscard]] bool starts_with(std::string_view s) const noexcept {
                return m_text.substr(m_pos, s.size()) == s;
            }

            void skip_ws() {
                while (!eof() && std::isspace(static_cast<unsigned char>(peek()))) {
                    ++m_pos;
                }
            }

            void skip_text() {
                while (!eof() && peek() != '<') {
                    ++m_pos;
                }
            }

            void skip_past(std::string_view terminator, const char* what) {
                const auto end = m_text.find(terminator, m_pos);
                THROW_IF(end == std::string_view::npos, markup_parse_error, "Unterminated", what, "at offset", m_pos);
                m_pos = end + terminator.size();
            }

            // <!DOCTYPE ...> with an optional [internal subset]
            void skip_declaration() {
                int brackets = 0;
                while (!eof()) {
                    const char c = peek();
                    ++m_pos;
                    if (c == '[') ++brackets;
                    else if (c == ']') --brackets;
                    else if (c == '>' && brackets <= 0) return;
                }
                throw markup_parse_error("Unterminated markup declaration");
            }

            std::string_view read_name() {
                const auto start = m_pos;
                while (!eof() && is_name_char(peek())) {
                    ++m_pos;
                }
                THROW_IF(m_pos == start, markup_parse_error, "Expected a name at offset", start);
                return m_text.substr(start, m_pos - start);
            }

            void expect(char c) {
                THROW_IF(eof() || peek() != c, markup_parse_error,
                         "Expected '", std::string(1, c), "' at offset", m_pos);
                ++m_pos;
            }

            markup_element parse_element(int depth) {
                THROW_IF(depth > MAX_DEPTH, markup_parse_error, "Markup nesting deeper than", MAX_DEPTH);

                expect('<');
                const auto qualified = read_name();

                markup_element element;
                element.name = std::string(local_name(qualified));

                // Attributes
                while (true) {
                    skip_ws();
                    THROW_IF(eof(), markup_parse_error, "Unterminated start tag <", std::string(qualified), ">");

                    if (starts_with("/>")) {
                        m_pos += 2;
                        return element;
                    }
                    if (peek() == '>') {
                        ++m_pos;
                        break;
                    }

                    const auto attr_name = read_name();
                    skip_ws();
                    expect('=');
                    skip_ws();
                    THROW_IF(eof() || (peek() != '"' && peek() != '\''), markup_parse_error,
                             "Attribute", std::string(attr_name), "has no quoted value");
                    const char quote = peek();
                    ++m_pos;
                    const auto value_end = m_text.find(quote, m_pos);
                    THROW_IF(value_end == std::string_view::npos, markup_parse_error,
                             "Unterminated value of attribute", std::string(attr_name));
                    element.attributes.emplace_back(std::string(attr_name),
                                                    decode_entities(m_text.substr(m_pos, value_end - m_pos)));
                    m_pos = value_end + 1;
                }

                // Content
                while (true) {
                    THROW_IF(eof(), markup_parse_error, "Element <", std::string(qualified), "> is not closed");

                    if (starts_with("</")) {
                        m_pos += 2;
                        const auto closing = read_name();
                        skip_ws();
                        expect('>');
                        THROW_IF(closing != qualified, markup_parse_error,
                                 "Mismatched closing tag </", std::string(closing), "> for <",
                                 std::string(qualified), ">");
                        return element;
                    }
                    if (starts_with("<!--")) {
                        skip_past("-->", "comment");
                    } else if (starts_with("<![CDATA[")) {
                        skip_past("]]>", "CDATA section");
                    } else if (starts_with("<?")) {
                        skip_past("?>", "processing instruction");
                    } else if (peek() == '<') {
                        element.children.push_back(parse_element(depth + 1));
                    } else {
                        skip_text();
                    }
                }
            }
        };
    } // namespace

    markup_element svg_markup_parser::parse(std::string_view text) const {
        reader r(text);
        return r.parse_document();
    }

    std::shared_ptr<const markup_parser> make_default_markup_parser() {
        return std::make_shared<svg_markup_parser>();
    }
} // namespace interlock
