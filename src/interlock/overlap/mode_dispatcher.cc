//
// Lookup / runtime dispatch
//

#include <interlock/overlap/mode_dispatcher.hh>
#include <interlock/overlap/density_scorer.hh>
#include <failsafe/failsafe.hh>

namespace interlock {
    std::string_view mode_name(resolve_mode mode) noexcept {
        switch (mode) {
            case resolve_mode::lookup_only: return "lookup_only";
            case resolve_mode::prefer_lookup_fallback_runtime: return "prefer_lookup_fallback_runtime";
            case resolve_mode::runtime_only: return "runtime_only";
        }
        return "runtime_only";
    }

    resolve_mode parse_mode(std::string_view name) {
        if (name == "lookup_only") return resolve_mode::lookup_only;
        if (name == "prefer_lookup_fallback_runtime") return resolve_mode::prefer_lookup_fallback_runtime;
        if (name == "runtime_only") return resolve_mode::runtime_only;
        THROW_INVALID_ARG("Unknown resolve mode:", std::string(name));
    }

    std::string_view source_name(decision_source source) noexcept {
        switch (source) {
            case decision_source::space: return "space";
            case decision_source::lookup: return "lookup";
            case decision_source::fallback: return "fallback";
            case decision_source::runtime: return "runtime";
        }
        return "runtime";
    }

    mode_dispatcher::mode_dispatcher(overlap_rule_set rules, dispatcher_options options,
                                     std::shared_ptr<const overlap_table> table, rotation_rules rotations)
        : m_rules(std::move(rules)),
          m_rotations(std::move(rotations)),
          m_options(options),
          m_table(std::move(table)) {
        THROW_IF(m_options.lookup_fallback < 0.0 || m_options.lookup_fallback > 1.0, std::invalid_argument,
                 "lookup_fallback must lie in [0, 1], got", m_options.lookup_fallback);
    }

    overlap_decision mode_dispatcher::resolve(const processed_glyph& first, const processed_glyph& second,
                                              resolve_mode mode) const {
        if (first.is_space || second.is_space) {
            ++m_space_pairs;
            return {0.0, decision_source::space, std::nullopt};
        }

        if (mode != resolve_mode::runtime_only) {
            const auto hit = m_table ? m_table->find(first.character, second.character) : std::nullopt;
            if (hit) {
                ++m_lookup_hits;
                return {*hit, decision_source::lookup, std::nullopt};
            }
            ++m_lookup_misses;
            if (mode == resolve_mode::lookup_only) {
                return {m_options.lookup_fallback, decision_source::fallback, std::nullopt};
            }
        }

        ++m_runtime_computations;
        overlap_decision decision{m_rules.resolve(first, second), decision_source::runtime, std::nullopt};

        if (m_options.score_runtime && !first.runs.empty() && !second.runs.empty()) {
            decision.score = score_overlap(first, second, decision.ratio);
            ++m_scored_pairs;
        }
        return decision;
    }

    overlap_decision mode_dispatcher::resolve(char first, char second, resolve_mode mode) const {
        return resolve(make_label_glyph(first), make_label_glyph(second), mode);
    }

    double mode_dispatcher::rotation(char first, char second, resolve_mode mode) const noexcept {
        if (first == ' ' || second == ' ') {
            return 0.0;
        }
        switch (mode) {
            case resolve_mode::lookup_only:
                return m_table ? m_table->rotation_lookup(first, second, 0.0) : 0.0;
            case resolve_mode::prefer_lookup_fallback_runtime:
                if (m_table && m_table->contains(first, second)) {
                    return m_table->rotation_lookup(first, second, 0.0);
                }
                return m_rotations.resolve(first, second);
            case resolve_mode::runtime_only:
                break;
        }
        return m_rotations.resolve(first, second);
    }

    dispatcher_metrics mode_dispatcher::metrics() const noexcept {
        return {m_lookup_hits.load(), m_lookup_misses.load(), m_runtime_computations.load(), m_space_pairs.load(),
                m_scored_pairs.load()};
    }

    void mode_dispatcher::reset_metrics() noexcept {
        m_lookup_hits = 0;
        m_lookup_misses = 0;
        m_runtime_computations = 0;
        m_space_pairs = 0;
        m_scored_pairs = 0;
    }
} // namespace interlock
