//
// Bounding boxes of path data and basic shapes
//

#include <interlock/markup/outline_extent.hh>
#include <interlock/markup/markup_parser.hh>
#include <algorithm>
#include <array>
#include <charconv>
#include <cctype>
#include <cmath>
#include <numbers>

namespace interlock {
    void extent_builder::add(float x, float y) noexcept {
        if (m_empty) {
            m_min_x = m_max_x = x;
            m_min_y = m_max_y = y;
            m_empty = false;
            return;
        }
        m_min_x = std::min(m_min_x, x);
        m_min_y = std::min(m_min_y, y);
        m_max_x = std::max(m_max_x, x);
        m_max_y = std::max(m_max_y, y);
    }

    std::optional<outline_extent> extent_builder::extent() const {
        if (m_empty) {
            return std::nullopt;
        }
        return outline_extent{euler::point2f{m_min_x, m_min_y}, euler::point2f{m_max_x, m_max_y}};
    }

    namespace {
        // =========================================================================
        // Number scanning shared by path data and shape attributes
        // =========================================================================
        bool is_separator(char c) {
            return c == ',' || std::isspace(static_cast<unsigned char>(c));
        }

        // Length of the longest number literal at the start of s
        std::size_t number_length(std::string_view s) {
            std::size_t i = 0;
            if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;

            std::size_t digits = 0;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
                ++i;
                ++digits;
            }
            if (i < s.size() && s[i] == '.') {
                ++i;
                while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
                    ++i;
                    ++digits;
                }
            }
            if (digits == 0) {
                return 0;
            }
            if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
                std::size_t j = i + 1;
                if (j < s.size() && (s[j] == '+' || s[j] == '-')) ++j;
                const std::size_t exp_start = j;
                while (j < s.size() && std::isdigit(static_cast<unsigned char>(s[j]))) ++j;
                if (j > exp_start) {
                    i = j;
                }
            }
            return i;
        }

        std::optional<float> to_float(std::string_view literal) {
            if (!literal.empty() && literal.front() == '+') {
                literal.remove_prefix(1);
            }
            float value = 0.0f;
            const auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), value);
            if (ec != std::errc{} || ptr != literal.data() + literal.size()) {
                return std::nullopt;
            }
            return value;
        }

        class path_lexer {
        public:
            explicit path_lexer(std::string_view s)
                : m_s(s) {
            }

            void skip() {
                while (m_pos < m_s.size() && is_separator(m_s[m_pos])) ++m_pos;
            }

            [[nodiscard]] bool eof() {
                skip();
                return m_pos >= m_s.size();
            }

            [[nodiscard]] bool at_command() {
                skip();
                if (m_pos >= m_s.size()) return false;
                const char c = m_s[m_pos];
                return std::isalpha(static_cast<unsigned char>(c)) && c != 'e' && c != 'E';
            }

            char take_command() { return m_s[m_pos++]; }

            std::optional<float> number() {
                skip();
                const auto len = number_length(m_s.substr(m_pos));
                if (len == 0) return std::nullopt;
                auto value = to_float(m_s.substr(m_pos, len));
                if (value) m_pos += len;
                return value;
            }

            // Arc flags are a single 0 or 1 and may be written without separators
            std::optional<bool> flag() {
                skip();
                if (m_pos >= m_s.size()) return std::nullopt;
                const char c = m_s[m_pos];
                if (c != '0' && c != '1') return std::nullopt;
                ++m_pos;
                return c == '1';
            }

        private:
            std::string_view m_s;
            std::size_t m_pos = 0;
        };

        // =========================================================================
        // Elliptical arc bounds (SVG implementation notes, appendix B.2.4)
        // =========================================================================
        double vector_angle(double ux, double uy, double vx, double vy) {
            const double dot = ux * vx + uy * vy;
            const double len = std::sqrt(ux * ux + uy * uy) * std::sqrt(vx * vx + vy * vy);
            double a = std::acos(std::clamp(dot / len, -1.0, 1.0));
            if (ux * vy - uy * vx < 0) a = -a;
            return a;
        }

        void add_arc(extent_builder& ext, euler::point2f p0, double rx, double ry, double rotation_deg,
                     bool large_arc, bool sweep, euler::point2f p1) {
            ext.add(p1);
            if (p0.x == p1.x && p0.y == p1.y) {
                return;
            }
            rx = std::abs(rx);
            ry = std::abs(ry);
            if (rx == 0.0 || ry == 0.0) {
                return;  // straight line, endpoints suffice
            }

            const double phi = rotation_deg * std::numbers::pi / 180.0;
            const double c = std::cos(phi);
            const double s = std::sin(phi);

            const double dx2 = (static_cast<double>(p0.x) - p1.x) / 2.0;
            const double dy2 = (static_cast<double>(p0.y) - p1.y) / 2.0;
            const double x1p = c * dx2 + s * dy2;
            const double y1p = -s * dx2 + c * dy2;

            const double lambda = (x1p * x1p) / (rx * rx) + (y1p * y1p) / (ry * ry);
            if (lambda > 1.0) {
                rx *= std::sqrt(lambda);
                ry *= std::sqrt(lambda);
            }

            const double num = rx * rx * ry * ry - rx * rx * y1p * y1p - ry * ry * x1p * x1p;
            const double den = rx * rx * y1p * y1p + ry * ry * x1p * x1p;
            double coef = den == 0.0 ? 0.0 : std::sqrt(std::max(0.0, num / den));
            if (large_arc == sweep) coef = -coef;

            const double cxp = coef * rx * y1p / ry;
            const double cyp = -coef * ry * x1p / rx;
            const double cx = c * cxp - s * cyp + (static_cast<double>(p0.x) + p1.x) / 2.0;
            const double cy = s * cxp + c * cyp + (static_cast<double>(p0.y) + p1.y) / 2.0;

            const double theta1 = vector_angle(1.0, 0.0, (x1p - cxp) / rx, (y1p - cyp) / ry);
            double dtheta = std::fmod(vector_angle((x1p - cxp) / rx, (y1p - cyp) / ry,
                                                   (-x1p - cxp) / rx, (-y1p - cyp) / ry),
                                      2.0 * std::numbers::pi);
            if (!sweep && dtheta > 0) dtheta -= 2.0 * std::numbers::pi;
            if (sweep && dtheta < 0) dtheta += 2.0 * std::numbers::pi;

            const double two_pi = 2.0 * std::numbers::pi;
            auto in_sweep = [&](double t) {
                double d = dtheta >= 0 ? std::fmod(t - theta1, two_pi) : std::fmod(theta1 - t, two_pi);
                if (d < 0) d += two_pi;
                return d <= std::abs(dtheta);
            };

            // Angles where x or y of the rotated ellipse is extremal
            const double tx = std::atan2(-ry * s, rx * c);
            const double ty = std::atan2(ry * c, rx * s);
            const std::array<double, 4> extremes{tx, tx + std::numbers::pi, ty, ty + std::numbers::pi};

            for (double t : extremes) {
                if (in_sweep(t)) {
                    const double x = cx + rx * c * std::cos(t) - ry * s * std::sin(t);
                    const double y = cy + rx * s * std::cos(t) + ry * c * std::sin(t);
                    ext.add(static_cast<float>(x), static_cast<float>(y));
                }
            }
        }

        float attribute_number(const markup_element& e, std::string_view key, float fallback = 0.0f) {
            const auto raw = e.attribute(key);
            if (!raw) return fallback;
            std::string_view s = *raw;
            while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
            // Trailing units such as "px" are ignored
            const auto len = number_length(s);
            if (len == 0) return fallback;
            return to_float(s.substr(0, len)).value_or(fallback);
        }

        std::optional<outline_extent> points_extent(std::string_view points) {
            path_lexer lex(points);
            extent_builder ext;
            while (!lex.eof()) {
                const auto x = lex.number();
                const auto y = x ? lex.number() : std::nullopt;
                if (!x || !y) break;
                ext.add(*x, *y);
            }
            return ext.extent();
        }
    } // namespace

    std::optional<outline_extent> path_extent(std::string_view data) {
        path_lexer lex(data);
        extent_builder ext;

        euler::point2f cur{0.0f, 0.0f};
        euler::point2f start{0.0f, 0.0f};
        euler::point2f last_cubic{0.0f, 0.0f};
        euler::point2f last_quad{0.0f, 0.0f};
        char cmd = 0;
        char prev = 0;

        auto point = [&](bool relative, float x, float y) {
            return relative ? euler::point2f{cur.x + x, cur.y + y} : euler::point2f{x, y};
        };

        while (!lex.eof()) {
            if (lex.at_command()) {
                cmd = lex.take_command();
            } else if (cmd == 0 || cmd == 'Z' || cmd == 'z') {
                break;  // numbers without a command
            }

            const bool rel = std::islower(static_cast<unsigned char>(cmd)) != 0;
            const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(cmd)));
            bool ok = true;

            switch (upper) {
                case 'M': {
                    const auto x = lex.number();
                    const auto y = x ? lex.number() : std::nullopt;
                    if (!y) { ok = false; break; }
                    cur = point(rel, *x, *y);
                    start = cur;
                    ext.add(cur);
                    // Subsequent pairs are implicit lineto commands
                    cmd = rel ? 'l' : 'L';
                    break;
                }
                case 'L': {
                    const auto x = lex.number();
                    const auto y = x ? lex.number() : std::nullopt;
                    if (!y) { ok = false; break; }
                    cur = point(rel, *x, *y);
                    ext.add(cur);
                    break;
                }
                case 'H': {
                    const auto x = lex.number();
                    if (!x) { ok = false; break; }
                    cur = euler::point2f{rel ? cur.x + *x : *x, cur.y};
                    ext.add(cur);
                    break;
                }
                case 'V': {
                    const auto y = lex.number();
                    if (!y) { ok = false; break; }
                    cur = euler::point2f{cur.x, rel ? cur.y + *y : *y};
                    ext.add(cur);
                    break;
                }
                case 'C': {
                    std::array<float, 6> v{};
                    for (auto& n : v) {
                        const auto parsed = lex.number();
                        if (!parsed) { ok = false; break; }
                        n = *parsed;
                    }
                    if (!ok) break;
                    const auto c1 = point(rel, v[0], v[1]);
                    const auto c2 = point(rel, v[2], v[3]);
                    const auto end = point(rel, v[4], v[5]);
                    ext.add(c1);
                    ext.add(c2);
                    ext.add(end);
                    last_cubic = c2;
                    cur = end;
                    break;
                }
                case 'S': {
                    std::array<float, 4> v{};
                    for (auto& n : v) {
                        const auto parsed = lex.number();
                        if (!parsed) { ok = false; break; }
                        n = *parsed;
                    }
                    if (!ok) break;
                    const bool smooth = prev == 'C' || prev == 'S';
                    const euler::point2f c1 = smooth
                                                  ? euler::point2f{2 * cur.x - last_cubic.x, 2 * cur.y - last_cubic.y}
                                                  : cur;
                    const auto c2 = point(rel, v[0], v[1]);
                    const auto end = point(rel, v[2], v[3]);
                    ext.add(c1);
                    ext.add(c2);
                    ext.add(end);
                    last_cubic = c2;
                    cur = end;
                    break;
                }
                case 'Q': {
                    std::array<float, 4> v{};
                    for (auto& n : v) {
                        const auto parsed = lex.number();
                        if (!parsed) { ok = false; break; }
                        n = *parsed;
                    }
                    if (!ok) break;
                    const auto c1 = point(rel, v[0], v[1]);
                    const auto end = point(rel, v[2], v[3]);
                    ext.add(c1);
                    ext.add(end);
                    last_quad = c1;
                    cur = end;
                    break;
                }
                case 'T': {
                    const auto x = lex.number();
                    const auto y = x ? lex.number() : std::nullopt;
                    if (!y) { ok = false; break; }
                    const bool smooth = prev == 'Q' || prev == 'T';
                    const euler::point2f c1 = smooth
                                                  ? euler::point2f{2 * cur.x - last_quad.x, 2 * cur.y - last_quad.y}
                                                  : cur;
                    const auto end = point(rel, *x, *y);
                    ext.add(c1);
                    ext.add(end);
                    last_quad = c1;
                    cur = end;
                    break;
                }
                case 'A': {
                    const auto rx = lex.number();
                    const auto ry = rx ? lex.number() : std::nullopt;
                    const auto rot = ry ? lex.number() : std::nullopt;
                    const auto large = rot ? lex.flag() : std::nullopt;
                    const auto sweep = large ? lex.flag() : std::nullopt;
                    const auto x = sweep ? lex.number() : std::nullopt;
                    const auto y = x ? lex.number() : std::nullopt;
                    if (!y) { ok = false; break; }
                    const auto end = point(rel, *x, *y);
                    add_arc(ext, cur, *rx, *ry, *rot, *large, *sweep, end);
                    cur = end;
                    break;
                }
                case 'Z':
                    cur = start;
                    break;
                default:
                    ok = false;
                    break;
            }

            if (!ok) {
                break;
            }
            prev = upper;
        }

        return ext.extent();
    }

    bool is_outline_element(std::string_view name) noexcept {
        return name == "path" || name == "rect" || name == "circle" || name == "ellipse" ||
               name == "line" || name == "polyline" || name == "polygon";
    }

    std::optional<outline_extent> element_extent(const markup_element& element) {
        const std::string_view name = element.name;

        if (name == "path") {
            const auto d = element.attribute("d");
            return d ? path_extent(*d) : std::nullopt;
        }
        if (name == "rect") {
            const float w = attribute_number(element, "width");
            const float h = attribute_number(element, "height");
            if (w <= 0.0f || h <= 0.0f) return std::nullopt;
            const float x = attribute_number(element, "x");
            const float y = attribute_number(element, "y");
            return outline_extent{euler::point2f{x, y}, euler::point2f{x + w, y + h}};
        }
        if (name == "circle") {
            const float r = attribute_number(element, "r");
            if (r <= 0.0f) return std::nullopt;
            const float cx = attribute_number(element, "cx");
            const float cy = attribute_number(element, "cy");
            return outline_extent{euler::point2f{cx - r, cy - r}, euler::point2f{cx + r, cy + r}};
        }
        if (name == "ellipse") {
            const float rx = attribute_number(element, "rx");
            const float ry = attribute_number(element, "ry");
            if (rx <= 0.0f || ry <= 0.0f) return std::nullopt;
            const float cx = attribute_number(element, "cx");
            const float cy = attribute_number(element, "cy");
            return outline_extent{euler::point2f{cx - rx, cy - ry}, euler::point2f{cx + rx, cy + ry}};
        }
        if (name == "line") {
            extent_builder ext;
            ext.add(attribute_number(element, "x1"), attribute_number(element, "y1"));
            ext.add(attribute_number(element, "x2"), attribute_number(element, "y2"));
            return ext.extent();
        }
        if (name == "polyline" || name == "polygon") {
            const auto points = element.attribute("points");
            return points ? points_extent(*points) : std::nullopt;
        }
        return std::nullopt;
    }
} // namespace interlock
