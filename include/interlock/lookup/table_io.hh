/**
 * @file table_io.hh
 * @brief YAML artifacts for overlap tables and glyph tables.
 *
 * Both artifacts are plain YAML documents so they can be loaded by a
 * renderer that links nothing but a YAML reader.
 *
 * @section table_io_overlap Overlap Artifact
 *
 * @code{.yaml}
 * format_version: 1
 * style: straight
 * overlaps:
 *   a: {a: 0.20000000000000001, b: 0.20000000000000001, ...}
 *   ...
 * rotations:
 *   a: {v: 5, w: 5, y: 5}
 * @endcode
 *
 * @section table_io_glyphs Glyph Artifact
 *
 * @code{.yaml}
 * format_version: 1
 * glyphs:
 *   - style: straight
 *     character: a
 *     variant: standard
 *     frame: [0, 0, 100, 100]
 *     grid: {rows: 10, cols: 10, cells: ["..####....", ...]}
 *     runs: [[[2, 7, 1]], ...]
 *     markup: "<svg ...>"
 *     metadata: {has_content: true, ...}
 * @endcode
 *
 * Doubles are written with 17 significant digits and floats with 9, so
 * deserialize(serialize(t)) == t holds exactly.
 */

#pragma once

#include <interlock/export.h>
#include <interlock/lookup/glyph_table.hh>
#include <interlock/lookup/overlap_table.hh>
#include <filesystem>
#include <string>
#include <string_view>

namespace interlock {
    /// Version written into serialized glyph tables
    inline constexpr int GLYPH_TABLE_FORMAT_VERSION = 1;

    [[nodiscard]] INTERLOCK_EXPORT std::string serialize(const overlap_table& table);

    /**
     * @brief Parse an overlap artifact.
     * @throws config_error naming the offending key if the text is not a valid artifact
     */
    [[nodiscard]] INTERLOCK_EXPORT overlap_table deserialize_overlap_table(std::string_view text);

    [[nodiscard]] INTERLOCK_EXPORT std::string serialize(const glyph_table& table);

    /**
     * @brief Parse a glyph artifact.
     * @throws config_error naming the offending key if the text is not a valid artifact
     */
    [[nodiscard]] INTERLOCK_EXPORT glyph_table deserialize_glyph_table(std::string_view text);

    /**
     * @brief Write text to a file, replacing it.
     * @throws std::runtime_error on I/O failure
     */
    INTERLOCK_EXPORT void save_text_file(const std::filesystem::path& path, std::string_view text);

    /**
     * @brief Read a whole file.
     * @throws std::runtime_error if the file cannot be read
     */
    [[nodiscard]] INTERLOCK_EXPORT std::string load_text_file(const std::filesystem::path& path);

    INTERLOCK_EXPORT void save_overlap_table(const overlap_table& table, const std::filesystem::path& path);
    [[nodiscard]] INTERLOCK_EXPORT overlap_table load_overlap_table(const std::filesystem::path& path);

    INTERLOCK_EXPORT void save_glyph_table(const glyph_table& table, const std::filesystem::path& path);
    [[nodiscard]] INTERLOCK_EXPORT glyph_table load_glyph_table(const std::filesystem::path& path);
} // namespace interlock
