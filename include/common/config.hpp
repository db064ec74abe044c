#ifndef CHUNKER_CONFIG_HPP
#define CHUNKER_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

// Most platforms with an upload cap allow 25 MB per attachment.
constexpr uint64_t DEFAULT_CHUNK_MB = 25;
constexpr uint64_t BYTES_PER_MB = 1024 * 1024;
constexpr uint64_t DEFAULT_CHUNK_SIZE = DEFAULT_CHUNK_MB * BYTES_PER_MB;

constexpr const char* HEADER_FILE_NAME = "header";
constexpr const char* CHUNK_FILE_PREFIX = "chunk-";
constexpr size_t MIN_CHUNK_INDEX_WIDTH = 2;

// Upper bound on the copy buffer, so tiny chunk sizes do not mean tiny reads
// and huge chunk sizes do not mean huge allocations on decode.
constexpr size_t MAX_COPY_BUFFER = 4 * 1024 * 1024;

struct EncodeOptions {
    fs::path input;        // a regular file or a directory
    fs::path output_dir;   // created if absent
    uint64_t chunk_size = DEFAULT_CHUNK_SIZE;
};

struct DecodeOptions {
    fs::path input_dir;    // holds the header and chunk files
    fs::path output_dir;   // empty means the current working directory
};

#endif // CHUNKER_CONFIG_HPP
