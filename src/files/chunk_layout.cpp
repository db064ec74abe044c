#include "files/chunk_layout.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <map>
#include <sstream>
#include <iomanip>
#include <cstring>

namespace ChunkLayout {

namespace {
// uint64_t holds any 19-digit decimal number
constexpr size_t MAX_INDEX_DIGITS = 19;
}

size_t index_width(uint64_t chunk_count) {
    size_t digits = 1;
    for (uint64_t last = chunk_count > 0 ? chunk_count - 1 : 0; last >= 10; last /= 10) {
        ++digits;
    }
    return std::max(digits, MIN_CHUNK_INDEX_WIDTH);
}

std::string chunk_file_name(uint64_t index, size_t width) {
    std::stringstream ss;
    ss << CHUNK_FILE_PREFIX << std::setw(static_cast<int>(width)) << std::setfill('0') << index;
    return ss.str();
}

std::optional<uint64_t> parse_chunk_index(const std::string& file_name) {
    const size_t prefix_len = std::strlen(CHUNK_FILE_PREFIX);
    if (file_name.size() <= prefix_len || file_name.compare(0, prefix_len, CHUNK_FILE_PREFIX) != 0) {
        return std::nullopt;
    }
    std::string digits = file_name.substr(prefix_len);
    if (digits.size() > MAX_INDEX_DIGITS) {
        return std::nullopt;
    }
    uint64_t index = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        index = index * 10 + static_cast<uint64_t>(c - '0');
    }
    return index;
}

std::vector<fs::path> scan_chunk_files(const fs::path& dir, const Header& header) {
    const uint64_t expected = header.chunk_count();
    const size_t width = index_width(expected);

    std::map<uint64_t, fs::path> found;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw ReadError("Failed to list chunk directory (" + ec.message() + ")", dir);
    }
    for (const auto& entry : it) {
        auto index = parse_chunk_index(entry.path().filename().string());
        if (!index) continue;
        if (!entry.is_regular_file(ec)) {
            throw CorruptChunkError("Chunk is not a regular file", entry.path());
        }
        auto [pos, inserted] = found.emplace(*index, entry.path());
        if (!inserted) {
            throw CorruptChunkError("Chunk index " + std::to_string(*index) + " is ambiguous, also claimed by " +
                                    pos->second.filename().string(), entry.path());
        }
        if (*index >= expected) {
            throw CorruptChunkError("Chunk lies past the end of a " + std::to_string(expected) +
                                    "-chunk stream", entry.path());
        }
    }

    std::vector<fs::path> chunks;
    // Every found index is below `expected`, so this is never more than the header asks for
    chunks.reserve(found.size());
    for (uint64_t i = 0; i < expected; ++i) {
        auto pos = found.find(i);
        if (pos == found.end()) {
            throw MissingChunkError("Chunk " + std::to_string(i) + " of " + std::to_string(expected) + " is missing",
                                    dir / chunk_file_name(i, width));
        }
        uint64_t actual = fs::file_size(pos->second, ec);
        if (ec) {
            throw ReadError("Failed to stat chunk (" + ec.message() + ")", pos->second);
        }
        uint64_t want = header.chunk_length(i);
        if (actual < want) {
            throw MissingChunkError("Chunk holds " + std::to_string(actual) + " bytes, expected " +
                                    std::to_string(want), pos->second);
        }
        if (actual > want) {
            throw CorruptChunkError("Chunk holds " + std::to_string(actual) + " bytes, expected " +
                                    std::to_string(want), pos->second);
        }
        chunks.push_back(pos->second);
    }
    LOG_DEBUG("Found ", chunks.size(), " chunk files in '", dir.string(), "'");
    return chunks;
}

size_t remove_artifacts(const fs::path& dir) {
    std::vector<fs::path> doomed;
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        throw WriteError("Failed to list output directory (" + ec.message() + ")", dir);
    }
    for (const auto& entry : it) {
        const std::string name = entry.path().filename().string();
        if (name == HEADER_FILE_NAME || parse_chunk_index(name)) {
            if (entry.is_regular_file(ec)) {
                doomed.push_back(entry.path());
            }
        }
    }
    for (const auto& p : doomed) {
        if (!fs::remove(p, ec) && ec) {
            throw WriteError("Failed to remove stale artifact (" + ec.message() + ")", p);
        }
        LOG_DEBUG("Removed stale '", p.string(), "'");
    }
    return doomed.size();
}

fs::path resolve_entry_path(const fs::path& output_dir, const std::string& name) {
    if (name.empty()) {
        throw UnsafePathError("Empty entry name", output_dir);
    }
    if (name.find('\0') != std::string::npos) {
        throw UnsafePathError("Entry name contains a NUL byte", output_dir / name.substr(0, name.find('\0')));
    }

    fs::path rel(name);
    if (rel.is_absolute() || rel.has_root_path()) {
        throw UnsafePathError("Entry name is absolute", rel);
    }
    for (const auto& part : rel) {
        if (part == "..") {
            throw UnsafePathError("Entry name climbs out of the output directory", output_dir / rel);
        }
    }
    fs::path normal = rel.lexically_normal();
    if (normal.empty() || normal == "." || !normal.has_filename()) {
        throw UnsafePathError("Entry name does not name a file", output_dir / rel);
    }

    // Catch symlinks inside output_dir that point elsewhere
    std::error_code ec;
    fs::path base = fs::weakly_canonical(output_dir, ec);
    if (ec) {
        throw UnsafePathError("Failed to resolve output directory (" + ec.message() + ")", output_dir);
    }
    fs::path target = fs::weakly_canonical(base / normal, ec);
    if (ec) {
        throw UnsafePathError("Failed to resolve entry path (" + ec.message() + ")", base / normal);
    }
    fs::path inside = target.lexically_relative(base);
    if (inside.empty() || inside == "." || *inside.begin() == "..") {
        throw UnsafePathError("Entry resolves outside the output directory", target);
    }
    return target;
}

} // namespace ChunkLayout
