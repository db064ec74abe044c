#ifndef CHUNKER_DECHUNKER_HPP
#define CHUNKER_DECHUNKER_HPP

#include "header.hpp"
#include "../common/config.hpp"
#include <fstream>
#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Serves the logical stream by reading chunk files one after another.
 *
 * Only one chunk file is open at a time; it is closed as soon as it is drained.
 */
class ChunkReader {
public:
    explicit ChunkReader(std::vector<fs::path> chunks);

    // Reads up to `size` bytes. Returns 0 only once every chunk is drained.
    size_t read(char* data, size_t size);

    // The chunk currently being read, or the last one if all are drained.
    const fs::path& current_chunk() const;

    uint64_t position() const { return position_; }

private:
    bool open_next_chunk();

    std::vector<fs::path> chunks_;
    size_t next_chunk_ = 0;
    std::ifstream chunk_;
    uint64_t position_ = 0;
};

class Dechunker {
public:
    explicit Dechunker(DecodeOptions options);

    /**
     * @brief Restores the original files described by the header.
     *
     * The header, every chunk file and every entry name are validated before
     * the first output file is created.
     *
     * @return The header that was decoded.
     * @throws MissingHeaderError, MalformedHeaderError, MissingChunkError,
     *         CorruptChunkError, UnsafePathError, ReadError, WriteError
     */
    Header decode();

    // Reads and validates the header and chunk files without writing anything.
    Header inspect() const;

    const fs::path& output_dir() const { return output_dir_; }

private:
    struct Plan {
        Header header;
        std::vector<fs::path> chunks;
        std::vector<fs::path> targets; // one per header entry
    };

    Plan prepare() const;
    void write_entry(ChunkReader& reader, const FileEntry& entry, const fs::path& target);

    fs::path input_dir_;
    fs::path output_dir_;
    std::vector<char> buffer_;
};

#endif //CHUNKER_DECHUNKER_HPP
