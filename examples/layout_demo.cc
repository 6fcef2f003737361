//
// Word layout demonstration
//
// Lays out a word from a generated glyph artifact (or, without one, from
// the SVG assets directly) and writes the composed word as a single SVG.
//
// Usage: interlock_layout_demo <asset_root|glyphs.yaml> <style> <text> [out.svg] [overlap.yaml]
//

#include <interlock/config.hh>
#include <interlock/footprint.hh>
#include <interlock/lookup/asset_source.hh>
#include <interlock/lookup/table_io.hh>
#include <interlock/overlap/mode_dispatcher.hh>
#include <interlock/text/word_layout.hh>
#include <filesystem>
#include <iostream>
#include <sstream>

using namespace interlock;

namespace {
    // Drop an XML declaration so glyph markup can be nested
    std::string strip_prolog(const std::string& markup) {
        if (markup.rfind("<?", 0) == 0) {
            const auto end = markup.find("?>");
            if (end != std::string::npos) {
                return markup.substr(end + 2);
            }
        }
        return markup;
    }

    std::string compose_svg(const word_layout& layout) {
        std::ostringstream out;
        out << "<svg xmlns=\"http://www.w3.org/2000/svg\" viewBox=\"0 0 " << layout.content_width << ' '
            << layout.content_height << "\" width=\"" << layout.content_width << "\" height=\""
            << layout.content_height << "\">\n";
        for (const auto& placed : layout.glyphs) {
            if (placed.glyph.is_space) {
                continue;
            }
            const auto& g = placed.glyph;
            const float cx = (g.bounds.left + g.bounds.right) / 2.0f;
            const float cy = (g.bounds.top + g.bounds.bottom) / 2.0f;
            out << "  <g transform=\"translate(" << placed.x << " 0) scale(" << g.scale << ") rotate("
                << placed.rotation << ' ' << cx << ' ' << cy << ")\">" << strip_prolog(g.markup) << "</g>\n";
        }
        out << "</svg>\n";
        return out.str();
    }
}

int main(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Usage: " << argv[0] << " <asset_root|glyphs.yaml> <style> <text> [out.svg] [overlap.yaml]\n";
        return 1;
    }

    const std::filesystem::path source = argv[1];
    const std::string style = argv[2];
    const std::string text = argv[3];
    const std::filesystem::path out_path = argc > 4 ? argv[4] : "word.svg";

    try {
        const auto config = default_config();
        mode_dispatcher dispatcher(config.rules, config.dispatcher(), nullptr, config.rotation);
        if (argc > 5) {
            dispatcher.set_table(std::make_shared<const overlap_table>(load_overlap_table(argv[5])));
        }

        std::vector<processed_glyph> glyphs;
        if (std::filesystem::is_directory(source)) {
            directory_asset_source assets(source);
            footprint_extractor extractor;
            glyphs = assemble_word(text, assets, extractor, style);
        } else {
            const auto table = load_glyph_table(source);
            glyphs = assemble_word(text, table, style);
        }

        const auto layout = layout_word(glyphs, dispatcher);
        for (const auto& placed : layout.glyphs) {
            std::cout << "'" << placed.glyph.character << "' x=" << placed.x << " overlap=" << placed.overlap
                      << " rotation=" << placed.rotation << '\n';
        }
        std::cout << "Content: " << layout.content_width << " x " << layout.content_height << '\n';

        const auto metrics = dispatcher.metrics();
        std::cout << "Lookup hits: " << metrics.lookup_hits << ", misses: " << metrics.lookup_misses
                  << ", runtime: " << metrics.runtime_computations << ", spaces: " << metrics.space_pairs << '\n';

        save_text_file(out_path, compose_svg(layout));
        std::cout << "Wrote " << out_path.string() << '\n';
    } catch (const std::exception& e) {
        std::cerr << "Layout failed: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
