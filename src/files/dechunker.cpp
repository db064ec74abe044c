#include "files/dechunker.hpp"
#include "files/chunk_layout.hpp"
#include "common/serializer.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <set>
#include <sstream>

ChunkReader::ChunkReader(std::vector<fs::path> chunks) : chunks_(std::move(chunks)) {}

const fs::path& ChunkReader::current_chunk() const {
    static const fs::path none;
    if (chunks_.empty()) return none;
    return chunks_[next_chunk_ == 0 ? 0 : next_chunk_ - 1];
}

bool ChunkReader::open_next_chunk() {
    if (next_chunk_ >= chunks_.size()) {
        return false;
    }
    chunk_.open(chunks_[next_chunk_], std::ios::binary);
    if (!chunk_.is_open()) {
        throw ReadError("Failed to open chunk", chunks_[next_chunk_]);
    }
    ++next_chunk_;
    return true;
}

size_t ChunkReader::read(char* data, size_t size) {
    while (size > 0) {
        if (!chunk_.is_open() && !open_next_chunk()) {
            return 0;
        }
        chunk_.read(data, static_cast<std::streamsize>(size));
        size_t got = static_cast<size_t>(chunk_.gcount());
        if (chunk_.bad()) {
            throw ReadError("Failed to read chunk", current_chunk());
        }
        // Close a drained chunk right away so at most one is ever open
        if (chunk_.peek() == std::ifstream::traits_type::eof()) {
            chunk_.close();
            LOG_INFO("Drained chunk ", next_chunk_ - 1);
        }
        if (got > 0) {
            position_ += got;
            return got;
        }
    }
    return 0;
}

Dechunker::Dechunker(DecodeOptions options)
    : input_dir_(std::move(options.input_dir)), output_dir_(std::move(options.output_dir)) {
    if (output_dir_.empty()) {
        output_dir_ = fs::current_path();
    }
}

Dechunker::Plan Dechunker::prepare() const {
    std::error_code ec;
    if (!fs::is_directory(input_dir_, ec)) {
        throw ReadError("Input directory not found", input_dir_);
    }

    Plan plan;
    const fs::path header_path = input_dir_ / HEADER_FILE_NAME;
    plan.header = Serializer::read_header_file(header_path);
    plan.chunks = ChunkLayout::scan_chunk_files(input_dir_, plan.header);

    // Decoding into the chunk directory must not clobber the inputs mid-run
    std::set<fs::path> inputs;
    inputs.insert(fs::weakly_canonical(header_path, ec));
    for (const auto& chunk : plan.chunks) {
        inputs.insert(fs::weakly_canonical(chunk, ec));
    }

    std::set<fs::path> claimed;
    plan.targets.reserve(plan.header.entries.size());
    for (const auto& entry : plan.header.entries) {
        fs::path target = ChunkLayout::resolve_entry_path(output_dir_, entry.name);
        if (inputs.count(target) > 0) {
            throw UnsafePathError("Entry '" + entry.name + "' would overwrite an input of this run", target);
        }
        if (!claimed.insert(target).second) {
            throw MalformedHeaderError("Entry '" + entry.name + "' resolves to a file already claimed by another entry",
                                       header_path);
        }
        plan.targets.push_back(std::move(target));
    }
    return plan;
}

Header Dechunker::inspect() const {
    return prepare().header;
}

Header Dechunker::decode() {
    auto time_start = std::chrono::steady_clock::now();

    Plan plan = prepare();
    LOG_DEBUG("Header lists ", plan.header.entries.size(), " files, ", plan.header.total_bytes(),
              " bytes in ", plan.chunks.size(), " chunks");

    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec) {
        throw WriteError("Failed to create output directory (" + ec.message() + ")", output_dir_);
    }

    buffer_.assign(static_cast<size_t>(std::min<uint64_t>(plan.header.chunk_size, MAX_COPY_BUFFER)), 0);
    ChunkReader reader(plan.chunks);
    for (size_t i = 0; i < plan.header.entries.size(); ++i) {
        write_entry(reader, plan.header.entries[i], plan.targets[i]);
    }

    char probe;
    if (reader.read(&probe, 1) != 0) {
        throw CorruptChunkError("Chunk data continues past the last file", reader.current_chunk());
    }

    std::chrono::duration<double> delta = std::chrono::steady_clock::now() - time_start;
    std::stringstream took;
    took << std::fixed << std::setprecision(2) << delta.count();
    LOG_INFO("Done, took ", took.str(), " seconds.");
    LOG_INFO("Decoded ", plan.header.entries.size(), " files.");
    return plan.header;
}

void Dechunker::write_entry(ChunkReader& reader, const FileEntry& entry, const fs::path& target) {
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw WriteError("Failed to create directory (" + ec.message() + ")", target.parent_path());
    }

    std::ofstream file(target, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw WriteError("Failed to create output file", target);
    }

    uint64_t remaining = entry.size;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer_.size()));
        size_t got = reader.read(buffer_.data(), want);
        if (got == 0) {
            throw MissingChunkError("Chunk data ended " + std::to_string(remaining) + " bytes before the end of '" +
                                    entry.name + "'", reader.current_chunk());
        }
        file.write(buffer_.data(), static_cast<std::streamsize>(got));
        if (!file) {
            throw WriteError("Failed to write output file", target);
        }
        remaining -= got;
    }

    file.close();
    if (file.fail()) {
        throw WriteError("Failed to flush output file", target);
    }
    LOG_INFO("Wrote '", entry.name, "' as '", target.string(), "'");
}
