#ifndef CHUNKER_CHUNKER_HPP
#define CHUNKER_CHUNKER_HPP

#include "header.hpp"
#include "../common/config.hpp"
#include <string>
#include <vector>
#include <fstream>
#include <filesystem>

namespace fs = std::filesystem;

// One file to be packed, as found on disk.
struct InputFile {
    fs::path path;     // where to read it from
    std::string name;  // how the header will call it
    uint64_t size;
};

class Chunker {
public:
    explicit Chunker(EncodeOptions options);

    /**
     * @brief Packs the configured input into chunk files plus a header.
     *
     * Creates the output directory if needed and replaces any header and
     * chunk files already in it. The header is written only after every
     * chunk has been written.
     *
     * @return The header that was written.
     * @throws ReadError if the input is missing or a file cannot be read in full.
     * @throws WriteError if a chunk or the header cannot be written.
     * @throws FormatError if a file name cannot be stored in the header.
     */
    Header encode();

    /**
     * @brief Packs an already discovered list of files, in the given order.
     *
     * Each file must still hold at least the number of bytes recorded in
     * its InputFile; extra bytes are ignored with a warning.
     *
     * @throws ReadError if a file cannot be opened or ends early.
     * @throws WriteError, FormatError as for encode().
     */
    Header encode(const std::vector<InputFile>& inputs);

    /**
     * @brief Lists the files to pack, sorted by name.
     *
     * A regular file yields itself, named by its file name. A directory is
     * walked recursively and yields every regular file below it, named by its
     * '/'-separated path relative to the directory. Directories equivalent to
     * `exclude` are skipped.
     *
     * @throws ReadError if `input` does not exist or cannot be walked.
     */
    static std::vector<InputFile> discover_inputs(const fs::path& input, const fs::path& exclude = {});

    // Lays the files out back to back in the logical stream.
    static Header plan_header(const std::vector<InputFile>& inputs, uint64_t chunk_size);

    uint64_t chunks_written() const { return chunks_written_; }

private:
    void check_options() const;
    void prepare_output_dir() const;
    void stream_file(const InputFile& in);
    void append(const char* data, size_t size);
    void open_next_chunk();
    void close_chunk();

    EncodeOptions options_;
    std::vector<char> buffer_;

    size_t index_width_ = 0;
    std::ofstream chunk_;
    fs::path chunk_path_;
    uint64_t chunk_bytes_ = 0;    // bytes in the open chunk
    uint64_t chunks_written_ = 0; // also the index of the next chunk to open
};

#endif //CHUNKER_CHUNKER_HPP
