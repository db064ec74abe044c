#include "files/chunker.hpp"
#include "files/chunk_layout.hpp"
#include "common/serializer.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

Chunker::Chunker(EncodeOptions options) : options_(std::move(options)) {}

std::vector<InputFile> Chunker::discover_inputs(const fs::path& input, const fs::path& exclude) {
    std::error_code ec;
    auto status = fs::status(input, ec);
    if (ec || !fs::exists(status)) {
        throw ReadError("Input not found", input);
    }

    std::vector<InputFile> files;
    if (fs::is_regular_file(status)) {
        uint64_t size = fs::file_size(input, ec);
        if (ec) {
            throw ReadError("Failed to stat input file (" + ec.message() + ")", input);
        }
        files.push_back(InputFile{input, input.filename().string(), size});
        return files;
    }
    if (!fs::is_directory(status)) {
        throw ReadError("Input is neither a regular file nor a directory", input);
    }

    // "dir/" would otherwise relativize entries against an empty last element
    fs::path root = input;
    if (!root.has_filename()) {
        root = root.parent_path();
    }

    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        throw ReadError("Failed to open input directory (" + ec.message() + ")", root);
    }
    const fs::recursive_directory_iterator end;
    while (it != end) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!exclude.empty() && entry.is_directory(entry_ec) && fs::equivalent(entry.path(), exclude, entry_ec)) {
            LOG_DEBUG("Skipping output directory '", entry.path().string(), "'");
            it.disable_recursion_pending();
        } else if (entry.is_regular_file(entry_ec)) {
            uint64_t size = entry.file_size(entry_ec);
            if (entry_ec) {
                throw ReadError("Failed to stat input file (" + entry_ec.message() + ")", entry.path());
            }
            files.push_back(InputFile{entry.path(), entry.path().lexically_relative(root).generic_string(), size});
        }

        it.increment(ec);
        if (ec) {
            throw ReadError("Failed to walk input directory (" + ec.message() + ")", root);
        }
    }

    std::sort(files.begin(), files.end(), [](const InputFile& a, const InputFile& b) {
        return a.name < b.name;
    });
    return files;
}

Header Chunker::plan_header(const std::vector<InputFile>& inputs, uint64_t chunk_size) {
    Header header;
    header.chunk_size = chunk_size;
    for (const auto& in : inputs) {
        header.add_entry(in.name, in.size);
    }
    return header;
}

Header Chunker::encode() {
    check_options();

    std::error_code ec;
    if (!fs::exists(options_.input, ec)) {
        throw ReadError("Input not found", options_.input);
    }
    prepare_output_dir();
    if (fs::equivalent(options_.input, options_.output_dir, ec)) {
        throw WriteError("Output directory must differ from the input directory", options_.output_dir);
    }

    return encode(discover_inputs(options_.input, options_.output_dir));
}

Header Chunker::encode(const std::vector<InputFile>& inputs) {
    auto time_start = std::chrono::steady_clock::now();

    check_options();
    prepare_output_dir();
    Header header = plan_header(inputs, options_.chunk_size);

    // Reject unencodable names before any chunk is written
    const fs::path header_path = options_.output_dir / HEADER_FILE_NAME;
    const std::string header_text = Serializer::serialize_header(header, header_path);
    if (header_text.size() > options_.chunk_size) {
        LOG_WARN("Header is ", header_text.size(), " bytes, larger than the ", options_.chunk_size,
                 "-byte chunk size; it may exceed the upload limit");
    }

    size_t removed = ChunkLayout::remove_artifacts(options_.output_dir);
    if (removed > 0) {
        LOG_INFO("Removed ", removed, " files left by a previous run in '", options_.output_dir.string(), "'");
    }

    index_width_ = ChunkLayout::index_width(header.chunk_count());
    chunk_bytes_ = 0;
    chunks_written_ = 0;
    buffer_.assign(static_cast<size_t>(std::min<uint64_t>(options_.chunk_size, MAX_COPY_BUFFER)), 0);

    try {
        for (const auto& in : inputs) {
            stream_file(in);
            LOG_INFO("Chunked '", in.path.string(), "' as '", in.name, "'");
        }
        close_chunk();
    } catch (const ChunkerError&) {
        if (chunk_.is_open()) {
            chunk_.close();
        }
        throw;
    }

    Serializer::write_header_file(header, header_path);

    std::chrono::duration<double> delta = std::chrono::steady_clock::now() - time_start;
    std::stringstream took;
    took << std::fixed << std::setprecision(2) << delta.count();
    LOG_INFO("Done, took ", took.str(), " seconds.");
    LOG_INFO("Encoded ", inputs.size(), " files into ", chunks_written_, " chunks.");
    return header;
}

void Chunker::check_options() const {
    if (options_.chunk_size == 0) {
        throw FormatError("Chunk size must be greater than zero", options_.output_dir);
    }
}

void Chunker::prepare_output_dir() const {
    std::error_code ec;
    fs::create_directories(options_.output_dir, ec);
    if (ec) {
        throw WriteError("Failed to create output directory (" + ec.message() + ")", options_.output_dir);
    }
    if (!fs::is_directory(options_.output_dir, ec)) {
        throw WriteError("Output path is not a directory", options_.output_dir);
    }
}

void Chunker::stream_file(const InputFile& in) {
    std::ifstream file(in.path, std::ios::binary);
    if (!file.is_open()) {
        throw ReadError("Failed to open input file", in.path);
    }

    uint64_t remaining = in.size;
    while (remaining > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(remaining, buffer_.size()));
        file.read(buffer_.data(), static_cast<std::streamsize>(want));
        size_t got = static_cast<size_t>(file.gcount());
        if (got == 0) {
            throw ReadError("Input ended " + std::to_string(remaining) + " bytes before its recorded size", in.path);
        }
        append(buffer_.data(), got);
        remaining -= got;
    }

    if (file.peek() != std::ifstream::traits_type::eof()) {
        LOG_WARN("'", in.path.string(), "' grew while being chunked; only the first ", in.size, " bytes were kept");
    }
}

void Chunker::append(const char* data, size_t size) {
    while (size > 0) {
        if (!chunk_.is_open()) {
            open_next_chunk();
        }
        size_t room = static_cast<size_t>(std::min<uint64_t>(options_.chunk_size - chunk_bytes_, size));
        chunk_.write(data, static_cast<std::streamsize>(room));
        if (!chunk_) {
            throw WriteError("Failed to write chunk", chunk_path_);
        }
        chunk_bytes_ += room;
        data += room;
        size -= room;

        // get a new chunk if this one was filled
        if (chunk_bytes_ == options_.chunk_size) {
            close_chunk();
        }
    }
}

void Chunker::open_next_chunk() {
    chunk_path_ = options_.output_dir / ChunkLayout::chunk_file_name(chunks_written_, index_width_);
    chunk_.open(chunk_path_, std::ios::binary | std::ios::trunc);
    if (!chunk_.is_open()) {
        throw WriteError("Failed to create chunk", chunk_path_);
    }
    chunk_bytes_ = 0;
}

void Chunker::close_chunk() {
    if (!chunk_.is_open()) return;
    chunk_.close();
    if (chunk_.fail()) {
        throw WriteError("Failed to flush chunk", chunk_path_);
    }
    LOG_INFO("Filled chunk ", chunks_written_);
    ++chunks_written_;
    chunk_bytes_ = 0;
}
