//
// YAML engine configuration
//

#include <interlock/config.hh>
#include <interlock/lookup/table_io.hh>
#include <interlock/errors.hh>
#include <failsafe/failsafe.hh>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <array>
#include <cmath>

namespace interlock {
    namespace {
        constexpr std::array<std::string_view, 13> KNOWN_KEYS = {
            "mode", "lookup_fallback", "score_runtime", "threads", "variants", "optimize_markup", "charset",
            "log_level", "default_rule", "rules", "exceptions", "rotation", "format_version"
        };

        template<typename T>
        T value_of(const YAML::Node& node, const std::string& key) {
            try {
                return node.as<T>();
            } catch (const YAML::Exception& e) {
                throw config_error("Invalid value for key '" + key + "': " + e.what());
            }
        }

        char char_of(const YAML::Node& node, const std::string& key) {
            const auto s = value_of<std::string>(node, key);
            THROW_IF(s.size() != 1, config_error, "Key", key, "must name a single character, got", s);
            return s[0];
        }

        double number_of(const YAML::Node& node, const std::string& key) {
            const auto v = value_of<double>(node, key);
            THROW_IF(!std::isfinite(v), config_error, "Key", key, "must be a finite number");
            return v;
        }

        overlap_rule rule_of(const YAML::Node& node, const std::string& key, const overlap_rule& base) {
            THROW_IF(!node.IsMap(), config_error, "Key", key, "must be a mapping");
            overlap_rule rule = base;
            rule.special_cases.clear();
            if (node["min"]) rule.min_overlap = number_of(node["min"], key + ".min");
            if (node["max"]) rule.max_overlap = number_of(node["max"], key + ".max");
            if (const auto cases = node["special_cases"]) {
                THROW_IF(!cases.IsMap(), config_error, "Key", key + ".special_cases", "must be a mapping");
                for (auto it = cases.begin(); it != cases.end(); ++it) {
                    const std::string case_key = key + ".special_cases." + value_of<std::string>(it->first, key);
                    rule.special_cases[char_of(it->first, case_key)] = number_of(it->second, case_key);
                }
            }
            return rule;
        }

        template<typename Fn>
        void for_each_entry(const YAML::Node& node, const std::string& key, Fn&& fn) {
            THROW_IF(!node.IsMap(), config_error, "Key", key, "must be a mapping");
            for (auto it = node.begin(); it != node.end(); ++it) {
                const std::string entry_key = key + "." + value_of<std::string>(it->first, key);
                fn(char_of(it->first, entry_key), it->second, entry_key);
            }
        }
    } // namespace

    dispatcher_options engine_config::dispatcher() const {
        dispatcher_options options;
        options.mode = mode;
        options.lookup_fallback = lookup_fallback;
        options.score_runtime = score_runtime;
        return options;
    }

    generation_options engine_config::generation() const {
        generation_options options;
        options.threads = threads;
        options.variants = variants;
        options.optimize = optimize_markup;
        return options;
    }

    engine_config default_config() {
        return engine_config{};
    }

    engine_config parse_config(std::string_view yaml) {
        YAML::Node root;
        try {
            root = YAML::Load(std::string(yaml));
        } catch (const YAML::Exception& e) {
            throw config_error(std::string("Malformed configuration: ") + e.what());
        }

        engine_config config;
        if (root.IsNull()) {
            return config;
        }
        THROW_IF(!root.IsMap(), config_error, "Configuration root must be a mapping");

        for (auto it = root.begin(); it != root.end(); ++it) {
            const auto key = value_of<std::string>(it->first, "<root>");
            if (std::find(KNOWN_KEYS.begin(), KNOWN_KEYS.end(), key) == KNOWN_KEYS.end()) {
                spdlog::warn("Ignoring unknown configuration key '{}'", key);
            }
        }

        const YAML::Node& cfg = root;
        if (const auto n = cfg["mode"]) {
            try {
                config.mode = parse_mode(value_of<std::string>(n, "mode"));
            } catch (const std::invalid_argument& e) {
                throw config_error(std::string("Invalid value for key 'mode': ") + e.what());
            }
        }
        if (const auto n = cfg["lookup_fallback"]) {
            config.lookup_fallback = number_of(n, "lookup_fallback");
            THROW_IF(config.lookup_fallback < 0.0 || config.lookup_fallback > 1.0, config_error,
                     "Key lookup_fallback must lie in [0, 1], got", config.lookup_fallback);
        }
        if (const auto n = cfg["score_runtime"]) {
            config.score_runtime = value_of<bool>(n, "score_runtime");
        }
        if (const auto n = cfg["threads"]) {
            config.threads = value_of<unsigned>(n, "threads");
        }
        if (const auto n = cfg["optimize_markup"]) {
            config.optimize_markup = value_of<bool>(n, "optimize_markup");
        }
        if (const auto n = cfg["charset"]) {
            const auto charset = value_of<std::string>(n, "charset");
            config.charset.clear();
            for (char ch : charset) {
                THROW_IF(!is_supported_char(ch), config_error, "Key charset holds unsupported character",
                         std::string(1, ch));
                config.charset.push_back(normalize_char(ch));
            }
        }
        if (const auto n = cfg["variants"]) {
            THROW_IF(!n.IsSequence(), config_error, "Key variants must be a sequence");
            config.variants.clear();
            for (std::size_t i = 0; i < n.size(); ++i) {
                const std::string key = "variants[" + std::to_string(i) + "]";
                try {
                    config.variants.push_back(parse_variant(value_of<std::string>(n[i], key)));
                } catch (const std::invalid_argument& e) {
                    throw config_error("Invalid value for key '" + key + "': " + e.what());
                }
            }
        }
        if (const auto n = cfg["log_level"]) {
            config.log_level = value_of<std::string>(n, "log_level");
        }

        // Rule model
        overlap_rule default_rule = config.rules.default_rule();
        rule_map rules = config.rules.rules();
        exception_map exceptions = config.rules.exceptions();

        if (const auto n = cfg["default_rule"]) {
            default_rule = rule_of(n, "default_rule", default_rule);
        }
        if (const auto n = cfg["rules"]) {
            rules.clear();
            for_each_entry(n, "rules", [&](char ch, const YAML::Node& value, const std::string& key) {
                rules[ch] = rule_of(value, key, default_rule);
            });
        }
        if (const auto n = cfg["exceptions"]) {
            exceptions.clear();
            for_each_entry(n, "exceptions", [&](char ch, const YAML::Node& value, const std::string& key) {
                THROW_IF(!value.IsSequence(), config_error, "Key", key, "must be a sequence");
                auto& list = exceptions[ch];
                for (std::size_t i = 0; i < value.size(); ++i) {
                    list.push_back(char_of(value[i], key));
                }
            });
        }
        config.rules = overlap_rule_set(std::move(rules), std::move(default_rule), std::move(exceptions));

        if (const auto n = cfg["rotation"]) {
            config.rotation.angles.clear();
            for_each_entry(n, "rotation", [&](char ch, const YAML::Node& value, const std::string& key) {
                auto& row = config.rotation.angles[normalize_char(ch)];
                for_each_entry(value, key, [&](char next, const YAML::Node& degrees, const std::string& k) {
                    row[normalize_char(next)] = number_of(degrees, k);
                });
            });
        }

        return config;
    }

    engine_config load_config_file(const std::filesystem::path& path) {
        spdlog::debug("Loading configuration from {}", path.string());
        return parse_config(load_text_file(path));
    }

    void apply_log_level(const engine_config& config) {
        const auto level = spdlog::level::from_str(config.log_level);
        THROW_IF(level == spdlog::level::off && config.log_level != "off", config_error,
                 "Unknown log_level", config.log_level);
        spdlog::set_level(level);
    }
} // namespace interlock
