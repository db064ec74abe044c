#ifndef CHUNKER_ERRORS_HPP
#define CHUNKER_ERRORS_HPP

#include <filesystem>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Base class for every error raised while chunking or dechunking.
 *
 * The message always names the offending file; path() returns it separately
 * so callers can report it without parsing what().
 */
class ChunkerError : public std::runtime_error {
public:
    ChunkerError(const std::string& what, fs::path path)
        : std::runtime_error(what + ": " + path.string()), path_(std::move(path)) {}

    const fs::path& path() const noexcept { return path_; }

private:
    fs::path path_;
};

// An input file could not be opened or read to its expected length.
class ReadError : public ChunkerError {
public:
    using ChunkerError::ChunkerError;
};

// A chunk, the header, or a decoded file could not be written.
class WriteError : public ChunkerError {
public:
    using ChunkerError::ChunkerError;
};

// A header cannot be produced from the given entries.
class FormatError : public ChunkerError {
public:
    using ChunkerError::ChunkerError;
};

// A header file exists but does not follow the schema.
class MalformedHeaderError : public ChunkerError {
public:
    using ChunkerError::ChunkerError;
};

class MissingHeaderError : public ChunkerError {
public:
    using ChunkerError::ChunkerError;
};

// The chunk files do not cover the stream length the header promises.
class MissingChunkError : public ChunkerError {
public:
    using ChunkerError::ChunkerError;
};

// Chunk files exist but their order or size is inconsistent with the header.
class CorruptChunkError : public ChunkerError {
public:
    using ChunkerError::ChunkerError;
};

// A header entry would be written outside the output directory.
class UnsafePathError : public ChunkerError {
public:
    using ChunkerError::ChunkerError;
};

#endif // CHUNKER_ERRORS_HPP
