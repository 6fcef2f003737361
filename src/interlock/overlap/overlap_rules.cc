//
// Overlap rule model
//

#include <interlock/overlap/overlap_rules.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <string>

namespace interlock {
    namespace {
        bool in_unit_range(double v) {
            return v >= 0.0 && v <= 1.0;
        }

        rule_map normalized(rule_map rules) {
            rule_map out;
            for (auto& [ch, rule] : rules) {
                std::map<char, double> cases;
                for (const auto& [next, ratio] : rule.special_cases) {
                    cases[normalize_char(next)] = ratio;
                }
                rule.special_cases = std::move(cases);
                out[normalize_char(ch)] = std::move(rule);
            }
            return out;
        }

        exception_map normalized(exception_map exceptions) {
            exception_map out;
            for (auto& [ch, list] : exceptions) {
                auto& target = out[normalize_char(ch)];
                for (char next : list) {
                    const char n = normalize_char(next);
                    if (std::find(target.begin(), target.end(), n) == target.end()) {
                        target.push_back(n);
                    }
                }
            }
            return out;
        }
    } // namespace

    void validate_rule(const overlap_rule& rule, char label) {
        const std::string name(1, label);
        THROW_IF(!in_unit_range(rule.min_overlap), std::invalid_argument,
                 "min_overlap of rule", name, "must lie in [0, 1], got", rule.min_overlap);
        THROW_IF(!in_unit_range(rule.max_overlap), std::invalid_argument,
                 "max_overlap of rule", name, "must lie in [0, 1], got", rule.max_overlap);
        THROW_IF(rule.min_overlap > rule.max_overlap, std::invalid_argument,
                 "min_overlap exceeds max_overlap in rule", name);
        for (const auto& [next, ratio] : rule.special_cases) {
            THROW_IF(!in_unit_range(ratio), std::invalid_argument,
                     "special case", name + std::string(1, next), "must lie in [0, 1], got", ratio);
        }
    }

    double resolve_overlap(char prev, char curr, const rule_map& rules, const overlap_rule& default_rule,
                           const exception_map& exceptions) noexcept {
        if (prev == ' ' || curr == ' ') {
            return 0.0;
        }
        const char p = normalize_char(prev);
        const char c = normalize_char(curr);

        const auto rule_it = rules.find(p);
        const overlap_rule& rule = rule_it != rules.end() ? rule_it->second : default_rule;

        if (const auto special = rule.special_cases.find(c); special != rule.special_cases.end()) {
            return special->second;
        }

        const double min = rule.min_overlap;
        double max = rule.max_overlap;
        if (const auto ex = exceptions.find(p); ex != exceptions.end()) {
            if (std::find(ex->second.begin(), ex->second.end(), c) != ex->second.end()) {
                max = std::max(min, max * EXCEPTION_DAMPING);
            }
        }
        return (min + max) / 2.0;
    }

    double resolve_overlap(const processed_glyph& prev, const processed_glyph& curr, const rule_map& rules,
                           const overlap_rule& default_rule, const exception_map& exceptions) noexcept {
        if (prev.is_space || curr.is_space) {
            return 0.0;
        }
        return resolve_overlap(prev.character, curr.character, rules, default_rule, exceptions);
    }

    // =============================================================================
    // overlap_rule_set
    // =============================================================================
    overlap_rule_set::overlap_rule_set(rule_map rules, overlap_rule default_rule, exception_map exceptions)
        : m_rules(normalized(std::move(rules))),
          m_default_rule(std::move(default_rule)),
          m_exceptions(normalized(std::move(exceptions))) {
        validate_rule(m_default_rule, '*');
        for (const auto& [ch, rule] : m_rules) {
            validate_rule(rule, ch);
        }
    }

    overlap_rule_set overlap_rule_set::defaults() {
        rule_map rules;
        for (char ch = 'a'; ch <= 'z'; ++ch) {
            rules[ch] = overlap_rule{0.1, 0.3, {}};
        }
        exception_map exceptions{
            {'a', {'v', 'w', 'y'}},
            {'v', {'a', 'e', 'o'}},
            {'w', {'a', 'e', 'o'}},
            {'y', {'a', 'e', 'o'}},
        };
        return {std::move(rules), overlap_rule{0.1, 0.3, {}}, std::move(exceptions)};
    }

    double overlap_rule_set::resolve(char prev, char curr) const noexcept {
        return resolve_overlap(prev, curr, m_rules, m_default_rule, m_exceptions);
    }

    double overlap_rule_set::resolve(const processed_glyph& prev, const processed_glyph& curr) const noexcept {
        return resolve_overlap(prev, curr, m_rules, m_default_rule, m_exceptions);
    }

    const overlap_rule& overlap_rule_set::rule_for(char ch) const noexcept {
        const auto it = m_rules.find(normalize_char(ch));
        return it != m_rules.end() ? it->second : m_default_rule;
    }

    // =============================================================================
    // rotation_rules
    // =============================================================================
    rotation_rules rotation_rules::defaults() {
        rotation_rules r;
        r.angles['a'] = {{'v', 5.0}, {'w', 5.0}, {'y', 5.0}};
        for (char ch : {'v', 'w', 'y'}) {
            r.angles[ch] = {{'a', -5.0}, {'e', -5.0}, {'o', -5.0}};
        }
        return r;
    }

    double rotation_rules::resolve(char prev, char curr) const noexcept {
        if (prev == ' ' || curr == ' ') {
            return 0.0;
        }
        const auto row = angles.find(normalize_char(prev));
        if (row == angles.end()) {
            return 0.0;
        }
        const auto cell = row->second.find(normalize_char(curr));
        return cell != row->second.end() ? cell->second : 0.0;
    }
} // namespace interlock
