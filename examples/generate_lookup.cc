//
// Lookup artifact generator
//
// Generates the overlap table and the glyph table of one style from a
// directory of SVG glyph assets laid out as
// <asset_root>/<style>/<variant>/<character>.svg and writes
// <out_dir>/<style>.overlap.yaml and <out_dir>/<style>.glyphs.yaml.
//
// Usage: interlock_generate <asset_root> <style> <out_dir> [config.yaml]
//

#include <interlock/config.hh>
#include <interlock/errors.hh>
#include <interlock/footprint.hh>
#include <interlock/lookup/asset_source.hh>
#include <interlock/lookup/table_generator.hh>
#include <interlock/lookup/table_io.hh>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <iostream>

using namespace interlock;

int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <asset_root> <style> <out_dir> [config.yaml]\n";
        std::cerr << "Reads <asset_root>/<style>/<variant>/<character>.svg and writes\n";
        std::cerr << "  <out_dir>/<style>.overlap.yaml - pairwise overlap table\n";
        std::cerr << "  <out_dir>/<style>.glyphs.yaml  - precomputed glyph footprints\n";
        return 1;
    }

    const std::filesystem::path asset_root = argv[1];
    const std::string style = argv[2];
    const std::filesystem::path out_dir = argv[3];

    try {
        engine_config config = argc > 4 ? load_config_file(argv[4]) : default_config();
        apply_log_level(config);

        if (!std::filesystem::is_directory(asset_root / style)) {
            std::cerr << "No assets for style '" << style << "' under " << asset_root.string() << '\n';
            return 1;
        }
        std::filesystem::create_directories(out_dir);

        directory_asset_source assets(asset_root);
        footprint_extractor extractor;

        auto options = config.generation();
        options.progress = [](std::size_t done, std::size_t total, std::string_view stage) {
            if (done == total || done % 100 == 0) {
                spdlog::debug("{}: {}/{}", stage, done, total);
            }
        };

        const auto generated = generate_style(assets, extractor, style, config.charset, config.rules,
                                              config.rotation, options);

        const auto overlap_path = out_dir / (style + ".overlap.yaml");
        const auto glyph_path = out_dir / (style + ".glyphs.yaml");
        save_overlap_table(*generated.overlaps, overlap_path);
        save_glyph_table(*generated.glyphs, glyph_path);

        const auto& report = generated.report;
        std::cout << "Style:          " << style << '\n';
        std::cout << "Overlap pairs:  " << report.pairs_computed << " / " << report.pairs_total << '\n';
        std::cout << "Glyphs:         " << report.glyphs_processed << " / " << report.glyphs_attempted << '\n';
        std::cout << "Average glyph:  " << report.average_glyph_ms << " ms\n";
        std::cout << "Total time:     " << report.total_ms << " ms\n";
        std::cout << "Checksum:       " << report.checksum << '\n';
        std::cout << "Wrote " << overlap_path.string() << '\n';
        std::cout << "Wrote " << glyph_path.string() << '\n';

        if (!report.failures.empty()) {
            std::cout << "Failures:\n";
            for (const auto& f : report.failures) {
                std::cout << "  '" << f.character << "' (" << variant_name(f.variant) << "): " << f.reason << '\n';
            }
            return 2;
        }
    } catch (const config_error& e) {
        std::cerr << "Configuration error: " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Generation failed: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
