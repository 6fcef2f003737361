//
// Batch generation of lookup tables
//

#include <interlock/lookup/table_generator.hh>
#include <interlock/lookup/asset_source.hh>
#include <interlock/markup/markup_tools.hh>
#include <interlock/footprint.hh>
#include <interlock/errors.hh>
#include "parallel_for.hh"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <optional>

namespace interlock {
    namespace {
        using steady = std::chrono::steady_clock;

        double elapsed_ms(steady::time_point since) {
            return std::chrono::duration<double, std::milli>(steady::now() - since).count();
        }

        std::string unique_charset(std::string_view charset) {
            std::string out;
            for (char ch : charset) {
                const char n = normalize_char(ch);
                if (out.find(n) == std::string::npos) {
                    out.push_back(n);
                }
            }
            return out;
        }

        class progress_sink {
        public:
            progress_sink(const progress_callback& cb, std::size_t total, std::string_view stage)
                : m_cb(cb), m_total(total), m_stage(stage) {
            }

            void tick() {
                if (!m_cb) {
                    return;
                }
                std::lock_guard<std::mutex> lock(m_mutex);
                m_cb(++m_done, m_total, m_stage);
            }

        private:
            const progress_callback& m_cb;
            std::size_t m_total;
            std::string_view m_stage;
            std::size_t m_done = 0;
            std::mutex m_mutex;
        };

        struct pair_slot {
            double ratio = 0.0;
            double rotation = 0.0;
            double ms = 0.0;
            bool done = false;
        };

        struct glyph_job {
            char character;
            glyph_variant variant;
        };

        struct glyph_slot {
            std::optional<glyph_record> record;
            std::optional<glyph_failure> failure;
        };
    } // namespace

    overlap_table generate_overlap_table(std::string_view charset, std::string style, const overlap_rule_set& rules,
                                         const rotation_rules& rotations, const generation_options& options,
                                         generation_report* report) {
        const auto start = steady::now();
        const std::string chars = unique_charset(charset);
        const std::size_t n = chars.size();
        const std::size_t total = n * n;

        std::vector<pair_slot> slots(total);
        progress_sink progress(options.progress, total, "overlap pairs");

        detail::parallel_for(total, options.threads, options.cancel, [&](std::size_t i) {
            const auto t0 = steady::now();
            const char first = chars[i / n];
            const char second = chars[i % n];
            auto& slot = slots[i];
            slot.ratio = rules.resolve(first, second);
            slot.rotation = rotations.resolve(first, second);
            slot.ms = elapsed_ms(t0);
            slot.done = true;
            progress.tick();
        });

        overlap_table_builder builder(style);
        std::vector<pair_timing> timings;
        timings.reserve(total);
        for (std::size_t i = 0; i < total; ++i) {
            const auto& slot = slots[i];
            if (!slot.done) {
                continue;
            }
            const char first = chars[i / n];
            const char second = chars[i % n];
            builder.set(first, second, slot.ratio);
            if (slot.rotation != 0.0) {
                builder.set_rotation(first, second, slot.rotation);
            }
            timings.push_back({first, second, slot.ms});
        }

        const std::size_t computed = timings.size();
        const bool cancelled = computed < total;
        if (cancelled) {
            spdlog::warn("Overlap generation for style '{}' cancelled after {} of {} pairs", style, computed, total);
        } else {
            spdlog::info("Generated {} overlap pairs for style '{}' in {:.1f} ms", computed, style, elapsed_ms(start));
        }

        if (report) {
            report->style = style;
            report->pairs_total = total;
            report->pairs_computed = computed;
            report->pair_timings = std::move(timings);
            report->cancelled = report->cancelled || cancelled;
        }
        return std::move(builder).build();
    }

    glyph_table build_glyph_table(const asset_source& assets, const footprint_extractor& extractor,
                                  std::string_view style, std::string_view charset,
                                  const generation_options& options, generation_report* report) {
        const std::string chars = unique_charset(charset);

        std::vector<glyph_variant> variants = options.variants;
        if (std::find(variants.begin(), variants.end(), glyph_variant::standard) == variants.end()) {
            variants.insert(variants.begin(), glyph_variant::standard);
        }

        std::vector<glyph_job> jobs;
        jobs.reserve(chars.size() * variants.size());
        for (char ch : chars) {
            for (auto v : variants) {
                jobs.push_back({ch, v});
            }
        }

        std::vector<glyph_slot> slots(jobs.size());
        std::vector<char> attempted(jobs.size(), 0);
        progress_sink progress(options.progress, jobs.size(), "glyphs");

        detail::parallel_for(jobs.size(), options.threads, options.cancel, [&](std::size_t i) {
            const auto [ch, variant] = jobs[i];
            auto& slot = slots[i];

            if (variant != glyph_variant::standard && !assets.contains(style, ch, variant)) {
                progress.tick();
                return;
            }
            attempted[i] = 1;

            const auto t0 = steady::now();
            try {
                std::string markup = assets.load(style, ch, variant);

                const auto validation = validate_markup(markup, ch, extractor.parser());
                if (!validation.valid) {
                    throw malformed_glyph_error(ch, validation.errors.front());
                }
                for (const auto& w : validation.warnings) {
                    spdlog::debug("{}: {}", style, w);
                }

                if (options.optimize) {
                    markup = optimize_markup(markup);
                }

                glyph_record record;
                record.key = glyph_key{std::string(style), ch, variant};
                record.glyph = extractor.extract(markup, ch);
                record.metadata.has_content = validation.has_content;
                record.metadata.is_symmetric = detect_symmetry(record.glyph);
                record.metadata.byte_size = record.glyph.markup.size();
                record.metadata.optimized = options.optimize;
                record.metadata.processing_ms = elapsed_ms(t0);
                slot.record = std::move(record);
            } catch (const malformed_glyph_error& e) {
                spdlog::warn("Skipping {} glyph '{}' of style '{}': {}", variant_name(variant), ch, style, e.what());
                slot.failure = glyph_failure{ch, variant, e.what()};
            } catch (const asset_not_found_error& e) {
                spdlog::warn("Skipping {} glyph '{}' of style '{}': {}", variant_name(variant), ch, style, e.what());
                slot.failure = glyph_failure{ch, variant, e.what()};
            } catch (const std::exception& e) {
                spdlog::error("Failed {} glyph '{}' of style '{}': {}", variant_name(variant), ch, style, e.what());
                slot.failure = glyph_failure{ch, variant, e.what()};
            }
            progress.tick();
        });

        std::vector<glyph_record> records;
        std::vector<glyph_failure> failures;
        std::size_t attempted_count = 0;
        double glyph_ms = 0.0;
        for (std::size_t i = 0; i < slots.size(); ++i) {
            attempted_count += attempted[i];
            if (slots[i].record) {
                glyph_ms += slots[i].record->metadata.processing_ms;
                records.push_back(std::move(*slots[i].record));
            } else if (slots[i].failure) {
                failures.push_back(std::move(*slots[i].failure));
            }
        }

        const bool cancelled = options.cancel && options.cancel->load();
        spdlog::info("Processed {} glyphs of style '{}' ({} failed)", records.size(), style, failures.size());

        if (report) {
            report->style = std::string(style);
            report->glyphs_attempted = attempted_count;
            report->glyphs_processed = records.size();
            report->average_glyph_ms = records.empty() ? 0.0 : glyph_ms / static_cast<double>(records.size());
            report->failures = std::move(failures);
            report->cancelled = report->cancelled || cancelled;
        }

        glyph_table table(std::move(records));
        if (report) {
            report->checksum = compute_checksum(table, style);
        }
        return table;
    }

    style_generation generate_style(const asset_source& assets, const footprint_extractor& extractor,
                                    std::string style, std::string_view charset, const overlap_rule_set& rules,
                                    const rotation_rules& rotations, const generation_options& options) {
        const auto start = steady::now();
        style_generation result;
        result.report.style = style;

        auto glyphs = build_glyph_table(assets, extractor, style, charset, options, &result.report);
        auto overlaps = generate_overlap_table(charset, style, rules, rotations, options, &result.report);

        result.glyphs = std::make_shared<const glyph_table>(std::move(glyphs));
        result.overlaps = std::make_shared<const overlap_table>(std::move(overlaps));
        result.report.total_ms = elapsed_ms(start);

        spdlog::info("Style '{}': {} pairs, {} glyphs, {} failures, checksum {}", style,
                     result.report.pairs_computed, result.report.glyphs_processed, result.report.failures.size(),
                     result.report.checksum);
        return result;
    }
} // namespace interlock
