#ifndef CHUNKER_CHUNK_LAYOUT_HPP
#define CHUNKER_CHUNK_LAYOUT_HPP

#include "header.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Naming and discovery of the artifacts in a chunk directory.
namespace ChunkLayout {

/**
 * @brief Number of digits used for chunk indices of a run with `chunk_count` chunks.
 *
 * Never less than MIN_CHUNK_INDEX_WIDTH, and wide enough that every index of
 * the run has the same length, so lexicographic order is stream order.
 */
size_t index_width(uint64_t chunk_count);

// "chunk-" followed by `index` zero-padded to `width` digits.
std::string chunk_file_name(uint64_t index, size_t width);

/**
 * @brief Extracts the index from a chunk file name.
 * @return The index, or std::nullopt if `file_name` is not "chunk-<digits>".
 */
std::optional<uint64_t> parse_chunk_index(const std::string& file_name);

/**
 * @brief Lists the chunk files in `dir` in stream order and checks them
 *        against the header.
 *
 * Files that do not look like chunks are ignored.
 *
 * @return One path per chunk, index 0 first.
 * @throws CorruptChunkError if two files share an index, an index lies past
 *         the end of the stream, or a chunk is longer than expected.
 * @throws MissingChunkError if an index is missing or a chunk is too short.
 */
std::vector<fs::path> scan_chunk_files(const fs::path& dir, const Header& header);

// Removes the header and every chunk file in `dir`; other files are kept.
size_t remove_artifacts(const fs::path& dir);

/**
 * @brief Maps a header entry name to a path below `output_dir`.
 * @throws UnsafePathError if the name is absolute, contains ".." or NUL, or
 *         would otherwise land outside `output_dir`.
 */
fs::path resolve_entry_path(const fs::path& output_dir, const std::string& name);

} // namespace ChunkLayout

#endif //CHUNKER_CHUNK_LAYOUT_HPP
