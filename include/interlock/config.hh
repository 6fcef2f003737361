/**
 * @file config.hh
 * @brief Engine configuration loaded from YAML.
 *
 * Every key is optional; missing keys keep the built-in defaults
 * (overlap_rule_set::defaults(), rotation_rules::defaults()). A section that is present
 * (rules, exceptions, rotation) replaces the built-in section as a whole.
 *
 * @code{.yaml}
 * mode: prefer_lookup_fallback_runtime
 * lookup_fallback: 0.12
 * score_runtime: false
 * threads: 0                      # 0 = hardware concurrency
 * variants: [standard, first, last]
 * optimize_markup: true
 * charset: abcdefghijklmnopqrstuvwxyz0123456789
 * log_level: info
 * default_rule: {min: 0.1, max: 0.3}
 * rules:
 *   a: {min: 0.08, max: 0.16, special_cases: {b: 0.2}}
 * exceptions:
 *   a: [v, w, y]
 * rotation:
 *   a: {v: 5, w: 5, y: 5}
 * @endcode
 */

#pragma once

#include <interlock/export.h>
#include <interlock/types.hh>
#include <interlock/lookup/table_generator.hh>
#include <interlock/overlap/mode_dispatcher.hh>
#include <interlock/overlap/overlap_rules.hh>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace interlock {
    struct INTERLOCK_EXPORT engine_config {
        resolve_mode mode = resolve_mode::prefer_lookup_fallback_runtime;
        double lookup_fallback = DEFAULT_LOOKUP_FALLBACK;
        bool score_runtime = false;
        unsigned threads = 0;
        std::vector<glyph_variant> variants{glyph_variant::standard};
        bool optimize_markup = true;
        std::string charset{standard_charset()};
        std::string log_level = "info";
        overlap_rule_set rules = overlap_rule_set::defaults();
        rotation_rules rotation = rotation_rules::defaults();

        /// Dispatcher settings from this configuration
        [[nodiscard]] dispatcher_options dispatcher() const;

        /// Generation settings from this configuration (no cancel flag, no progress sink)
        [[nodiscard]] generation_options generation() const;
    };

    /// Built-in configuration
    [[nodiscard]] INTERLOCK_EXPORT engine_config default_config();

    /**
     * @brief Parse a YAML configuration document.
     * @throws config_error naming the offending key for malformed or mistyped values
     * @throws std::invalid_argument if a rule violates 0 <= min <= max <= 1
     */
    [[nodiscard]] INTERLOCK_EXPORT engine_config parse_config(std::string_view yaml);

    /// parse_config() on a file's contents
    [[nodiscard]] INTERLOCK_EXPORT engine_config load_config_file(const std::filesystem::path& path);

    /**
     * @brief Set the global spdlog level from config.log_level.
     * @throws config_error for unknown level names
     */
    INTERLOCK_EXPORT void apply_log_level(const engine_config& config);
} // namespace interlock
