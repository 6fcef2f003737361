//
// YAML serialization of lookup artifacts
//

#include <interlock/lookup/table_io.hh>
#include <interlock/errors.hh>
#include <failsafe/failsafe.hh>
#include <yaml-cpp/yaml.h>
#include <cmath>
#include <fstream>
#include <sstream>

namespace interlock {
    namespace {
        constexpr int DOUBLE_DIGITS = 17;
        constexpr int FLOAT_DIGITS = 9;

        std::string key_of(char ch) {
            return std::string(1, ch);
        }

        // =========================================================================
        // Reading helpers
        // =========================================================================
        template<typename T>
        T read_as(const YAML::Node& node, const std::string& key) {
            THROW_IF(!node, config_error, "Missing key:", key);
            try {
                return node.as<T>();
            } catch (const YAML::Exception& e) {
                throw config_error("Invalid value for key '" + key + "': " + e.what());
            }
        }

        char read_char(const YAML::Node& node, const std::string& key) {
            const auto s = read_as<std::string>(node, key);
            THROW_IF(s.size() != 1, config_error, "Key", key, "must hold a single character, got", s);
            return s[0];
        }

        void check_version(const YAML::Node& root, int expected) {
            const int version = read_as<int>(root["format_version"], "format_version");
            THROW_IF(version != expected, config_error, "Unsupported format_version", version, "expected", expected);
        }

        YAML::Node load_document(std::string_view text) {
            YAML::Node root;
            try {
                root = YAML::Load(std::string(text));
            } catch (const YAML::Exception& e) {
                throw config_error(std::string("Malformed YAML: ") + e.what());
            }
            THROW_IF(!root.IsMap(), config_error, "Artifact root must be a mapping");
            return root;
        }

        pair_map read_pairs(const YAML::Node& node, const std::string& key, bool unit_range) {
            THROW_IF(!node.IsMap(), config_error, "Key", key, "must be a mapping");
            pair_map out;
            for (auto row = node.begin(); row != node.end(); ++row) {
                const std::string row_key = key + "." + read_as<std::string>(row->first, key);
                const char first = read_char(row->first, row_key);
                THROW_IF(!row->second.IsMap(), config_error, "Key", row_key, "must be a mapping");

                for (auto cell = row->second.begin(); cell != row->second.end(); ++cell) {
                    const std::string cell_key = row_key + "." + read_as<std::string>(cell->first, row_key);
                    const char second = read_char(cell->first, cell_key);
                    const double value = read_as<double>(cell->second, cell_key);
                    THROW_IF(!std::isfinite(value), config_error, "Key", cell_key, "is not a finite number");
                    THROW_IF(unit_range && (value < 0.0 || value > 1.0), config_error,
                             "Key", cell_key, "must lie in [0, 1], got", value);
                    out[normalize_char(first)][normalize_char(second)] = value;
                }
            }
            return out;
        }

        // =========================================================================
        // Writing helpers
        // =========================================================================
        void emit_pairs(YAML::Emitter& out, const pair_map& pairs) {
            out << YAML::BeginMap;
            for (const auto& [first, row] : pairs) {
                out << YAML::Key << key_of(first) << YAML::Value << YAML::Flow << YAML::BeginMap;
                for (const auto& [second, value] : row) {
                    out << YAML::Key << key_of(second) << YAML::Value << value;
                }
                out << YAML::EndMap;
            }
            out << YAML::EndMap;
        }

        std::string finish(const YAML::Emitter& out) {
            THROW_IF(!out.good(), std::runtime_error, "YAML emitter failed:", out.GetLastError());
            return std::string(out.c_str()) + "\n";
        }

        void emit_glyph(YAML::Emitter& out, const glyph_record& record) {
            const auto& g = record.glyph;

            out << YAML::BeginMap;
            out << YAML::Key << "style" << YAML::Value << record.key.style;
            out << YAML::Key << "character" << YAML::Value << key_of(record.key.character);
            out << YAML::Key << "variant" << YAML::Value << std::string(variant_name(record.key.variant));
            out << YAML::Key << "glyph_character" << YAML::Value << key_of(g.character);

            out << YAML::Key << "frame" << YAML::Value << YAML::Flow << YAML::BeginSeq
                << g.frame.x << g.frame.y << g.frame.width << g.frame.height << YAML::EndSeq;
            out << YAML::Key << "bounds" << YAML::Value << YAML::Flow << YAML::BeginSeq
                << g.bounds.left << g.bounds.right << g.bounds.top << g.bounds.bottom << YAML::EndSeq;

            out << YAML::Key << "grid" << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "rows" << YAML::Value << g.grid.rows();
            out << YAML::Key << "cols" << YAML::Value << g.grid.cols();
            out << YAML::Key << "cells" << YAML::Value << YAML::BeginSeq;
            for (std::size_t r = 0; r < g.grid.rows(); ++r) {
                std::string row(g.grid.cols(), '.');
                for (std::size_t c = 0; c < g.grid.cols(); ++c) {
                    if (g.grid.cell(r, c)) {
                        row[c] = '#';
                    }
                }
                out << row;
            }
            out << YAML::EndSeq << YAML::EndMap;

            out << YAML::Key << "runs" << YAML::Value << YAML::Flow << YAML::BeginSeq;
            for (const auto& column : g.runs) {
                out << YAML::BeginSeq;
                for (const auto& run : column) {
                    out << YAML::BeginSeq << run.top << run.bottom << run.density << YAML::EndSeq;
                }
                out << YAML::EndSeq;
            }
            out << YAML::EndSeq;

            out << YAML::Key << "scale" << YAML::Value << g.scale;
            out << YAML::Key << "rotation" << YAML::Value << g.rotation;
            out << YAML::Key << "is_space" << YAML::Value << g.is_space;
            out << YAML::Key << "markup" << YAML::Value << g.markup;

            const auto& m = record.metadata;
            out << YAML::Key << "metadata" << YAML::Value << YAML::BeginMap;
            out << YAML::Key << "has_content" << YAML::Value << m.has_content;
            out << YAML::Key << "is_symmetric" << YAML::Value << m.is_symmetric;
            out << YAML::Key << "processing_ms" << YAML::Value << m.processing_ms;
            out << YAML::Key << "byte_size" << YAML::Value << m.byte_size;
            out << YAML::Key << "optimized" << YAML::Value << m.optimized;
            out << YAML::EndMap;

            out << YAML::EndMap;
        }

        std::vector<float> read_floats(const YAML::Node& node, const std::string& key, std::size_t count) {
            THROW_IF(!node || !node.IsSequence() || node.size() != count, config_error,
                     "Key", key, "must be a sequence of", count, "numbers");
            std::vector<float> out;
            for (std::size_t i = 0; i < count; ++i) {
                out.push_back(read_as<float>(node[i], key));
            }
            return out;
        }

        glyph_record read_glyph(const YAML::Node& node, std::size_t index) {
            const std::string ctx = "glyphs[" + std::to_string(index) + "]";
            THROW_IF(!node.IsMap(), config_error, "Key", ctx, "must be a mapping");

            glyph_record record;
            record.key.style = read_as<std::string>(node["style"], ctx + ".style");
            record.key.character = normalize_char(read_char(node["character"], ctx + ".character"));
            try {
                record.key.variant = parse_variant(read_as<std::string>(node["variant"], ctx + ".variant"));
            } catch (const std::invalid_argument& e) {
                throw config_error("Invalid value for key '" + ctx + ".variant': " + e.what());
            }

            auto& g = record.glyph;
            g.character = node["glyph_character"] ? read_char(node["glyph_character"], ctx + ".glyph_character")
                                                  : record.key.character;

            const auto frame = read_floats(node["frame"], ctx + ".frame", 4);
            g.frame = glyph_frame{frame[0], frame[1], frame[2], frame[3]};
            const auto bounds = read_floats(node["bounds"], ctx + ".bounds", 4);
            g.bounds = glyph_bounds{bounds[0], bounds[1], bounds[2], bounds[3]};
            THROW_IF(!(g.bounds.right > g.bounds.left) || !(g.bounds.bottom > g.bounds.top), config_error,
                     "Key", ctx + ".bounds", "must have positive width and height");

            const auto& grid = node["grid"];
            THROW_IF(!grid || !grid.IsMap(), config_error, "Key", ctx + ".grid", "must be a mapping");
            const auto rows = read_as<std::size_t>(grid["rows"], ctx + ".grid.rows");
            const auto cols = read_as<std::size_t>(grid["cols"], ctx + ".grid.cols");
            const auto& cells = grid["cells"];
            THROW_IF(!cells || !cells.IsSequence() || cells.size() != rows, config_error,
                     "Key", ctx + ".grid.cells", "must hold", rows, "rows");
            g.grid = pixel_grid(rows, cols);
            for (std::size_t r = 0; r < rows; ++r) {
                const auto row = read_as<std::string>(cells[r], ctx + ".grid.cells");
                THROW_IF(row.size() != cols, config_error, "Key", ctx + ".grid.cells", "row", r, "must hold", cols,
                         "cells");
                for (std::size_t c = 0; c < cols; ++c) {
                    THROW_IF(row[c] != '#' && row[c] != '.', config_error, "Key", ctx + ".grid.cells",
                             "holds an unknown cell marker");
                    g.grid.set(r, c, row[c] == '#');
                }
            }

            const auto& runs = node["runs"];
            THROW_IF(!runs || !runs.IsSequence(), config_error, "Key", ctx + ".runs", "must be a sequence");
            for (std::size_t c = 0; c < runs.size(); ++c) {
                const std::string run_key = ctx + ".runs[" + std::to_string(c) + "]";
                THROW_IF(!runs[c].IsSequence(), config_error, "Key", run_key, "must be a sequence");
                column_runs column;
                for (std::size_t k = 0; k < runs[c].size(); ++k) {
                    const auto& item = runs[c][k];
                    THROW_IF(!item.IsSequence() || item.size() != 3, config_error,
                             "Key", run_key, "entries must be [top, bottom, density]");
                    vertical_run run{read_as<int>(item[0], run_key), read_as<int>(item[1], run_key),
                                     read_as<double>(item[2], run_key)};
                    THROW_IF(run.bottom < run.top || !(run.density > 0.0) || run.density > 1.0, config_error,
                             "Key", run_key, "holds an invalid run");
                    THROW_IF(!column.empty() && run.top <= column.back().bottom, config_error,
                             "Key", run_key, "runs must be ordered and disjoint");
                    column.push_back(run);
                }
                g.runs.push_back(std::move(column));
            }

            g.scale = node["scale"] ? read_as<float>(node["scale"], ctx + ".scale") : 1.0f;
            g.rotation = node["rotation"] ? read_as<float>(node["rotation"], ctx + ".rotation") : 0.0f;
            g.is_space = node["is_space"] ? read_as<bool>(node["is_space"], ctx + ".is_space") : false;
            g.markup = read_as<std::string>(node["markup"], ctx + ".markup");

            if (const auto& m = node["metadata"]) {
                auto& meta = record.metadata;
                meta.has_content = read_as<bool>(m["has_content"], ctx + ".metadata.has_content");
                meta.is_symmetric = read_as<bool>(m["is_symmetric"], ctx + ".metadata.is_symmetric");
                meta.processing_ms = read_as<double>(m["processing_ms"], ctx + ".metadata.processing_ms");
                meta.byte_size = read_as<std::size_t>(m["byte_size"], ctx + ".metadata.byte_size");
                meta.optimized = read_as<bool>(m["optimized"], ctx + ".metadata.optimized");
            }
            return record;
        }
    } // namespace

    // =============================================================================
    // Overlap tables
    // =============================================================================
    std::string serialize(const overlap_table& table) {
        YAML::Emitter out;
        out.SetDoublePrecision(DOUBLE_DIGITS);
        out << YAML::BeginMap;
        out << YAML::Key << "format_version" << YAML::Value << OVERLAP_TABLE_FORMAT_VERSION;
        out << YAML::Key << "style" << YAML::Value << table.style();
        out << YAML::Key << "overlaps" << YAML::Value;
        emit_pairs(out, table.ratios());
        if (!table.rotations().empty()) {
            out << YAML::Key << "rotations" << YAML::Value;
            emit_pairs(out, table.rotations());
        }
        out << YAML::EndMap;
        return finish(out);
    }

    overlap_table deserialize_overlap_table(std::string_view text) {
        const YAML::Node root = load_document(text);
        check_version(root, OVERLAP_TABLE_FORMAT_VERSION);

        overlap_table_builder builder(read_as<std::string>(root["style"], "style"));

        const auto overlaps = root["overlaps"];
        THROW_IF(!overlaps, config_error, "Missing key:", "overlaps");
        for (const auto& [first, row] : read_pairs(overlaps, "overlaps", true)) {
            for (const auto& [second, ratio] : row) {
                builder.set(first, second, ratio);
            }
        }

        if (const auto rotations = root["rotations"]) {
            for (const auto& [first, row] : read_pairs(rotations, "rotations", false)) {
                for (const auto& [second, degrees] : row) {
                    builder.set_rotation(first, second, degrees);
                }
            }
        }
        return std::move(builder).build();
    }

    // =============================================================================
    // Glyph tables
    // =============================================================================
    std::string serialize(const glyph_table& table) {
        YAML::Emitter out;
        out.SetDoublePrecision(DOUBLE_DIGITS);
        out.SetFloatPrecision(FLOAT_DIGITS);
        out << YAML::BeginMap;
        out << YAML::Key << "format_version" << YAML::Value << GLYPH_TABLE_FORMAT_VERSION;
        out << YAML::Key << "glyphs" << YAML::Value << YAML::BeginSeq;
        for (const auto& [key, record] : table.records()) {
            emit_glyph(out, record);
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;
        return finish(out);
    }

    glyph_table deserialize_glyph_table(std::string_view text) {
        const YAML::Node root = load_document(text);
        check_version(root, GLYPH_TABLE_FORMAT_VERSION);

        const auto glyphs = root["glyphs"];
        THROW_IF(!glyphs || !glyphs.IsSequence(), config_error, "Key glyphs must be a sequence");

        std::vector<glyph_record> records;
        records.reserve(glyphs.size());
        for (std::size_t i = 0; i < glyphs.size(); ++i) {
            records.push_back(read_glyph(glyphs[i], i));
        }
        return glyph_table(std::move(records));
    }

    // =============================================================================
    // Files
    // =============================================================================
    void save_text_file(const std::filesystem::path& path, std::string_view text) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IF(!file, std::runtime_error, "Cannot open file for writing:", path.string());
        file.write(text.data(), static_cast<std::streamsize>(text.size()));
        THROW_IF(!file, std::runtime_error, "Failed to write file:", path.string());
    }

    std::string load_text_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        THROW_IF(!file, std::runtime_error, "Cannot open file:", path.string());
        std::ostringstream ss;
        ss << file.rdbuf();
        THROW_IF(file.bad(), std::runtime_error, "Failed to read file:", path.string());
        return ss.str();
    }

    void save_overlap_table(const overlap_table& table, const std::filesystem::path& path) {
        save_text_file(path, serialize(table));
    }

    overlap_table load_overlap_table(const std::filesystem::path& path) {
        return deserialize_overlap_table(load_text_file(path));
    }

    void save_glyph_table(const glyph_table& table, const std::filesystem::path& path) {
        save_text_file(path, serialize(table));
    }

    glyph_table load_glyph_table(const std::filesystem::path& path) {
        return deserialize_glyph_table(load_text_file(path));
    }
} // namespace interlock
