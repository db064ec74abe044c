#include "common/serializer.hpp"
#include "common/errors.hpp"
#include "nlohmann/json.hpp"
#include <fstream>
#include <sstream>
#include <unordered_set>
#include <limits>

using json = nlohmann::json;

// JSON serialization for FileEntry
void to_json(json& j, const FileEntry& e) {
    j = json{
        {"name", e.name},
        {"size", e.size},
        {"offset", e.offset}
    };
}

namespace {

void check_name_encodable(const std::string& name, const fs::path& target) {
    if (name.empty()) {
        throw FormatError("Empty file name cannot be stored in header", target);
    }
    if (name.find('\0') != std::string::npos) {
        throw FormatError("File name contains a NUL byte", target / name.substr(0, name.find('\0')));
    }
    try {
        // Throws json::type_error on invalid UTF-8
        (void)json(name).dump();
    } catch (const json::type_error&) {
        throw FormatError("File name is not valid UTF-8", target / name);
    }
}

uint64_t require_u64(const json& obj, const char* key, const fs::path& source) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw MalformedHeaderError(std::string("Missing field '") + key + "'", source);
    }
    if (!it->is_number_unsigned()) {
        throw MalformedHeaderError(std::string("Field '") + key + "' is not a non-negative integer", source);
    }
    return it->get<uint64_t>();
}

std::string require_string(const json& obj, const char* key, const fs::path& source) {
    auto it = obj.find(key);
    if (it == obj.end()) {
        throw MalformedHeaderError(std::string("Missing field '") + key + "'", source);
    }
    if (!it->is_string()) {
        throw MalformedHeaderError(std::string("Field '") + key + "' is not a string", source);
    }
    return it->get<std::string>();
}

} // namespace

namespace Serializer {

std::string serialize_header(const Header& h, const fs::path& target) {
    if (h.chunk_size == 0) {
        throw FormatError("Chunk size must be greater than zero", target);
    }

    std::unordered_set<std::string> seen;
    uint64_t expected_offset = 0;
    for (const auto& e : h.entries) {
        check_name_encodable(e.name, target);
        if (!seen.insert(e.name).second) {
            throw FormatError("Duplicate file name '" + e.name + "'", target);
        }
        if (e.offset != expected_offset) {
            throw FormatError("Entry '" + e.name + "' does not start where the previous one ends", target);
        }
        expected_offset += e.size;
    }

    json j = {
        {"version", HEADER_FORMAT_VERSION},
        {"bytes_per_chunk", h.chunk_size},
        {"total_bytes", h.total_bytes()},
        {"chunk_count", h.chunk_count()},
        {"files", json::array()}
    };
    for (const auto& e : h.entries) {
        j["files"].push_back(json(e));
    }

    try {
        return j.dump(4) + "\n";
    } catch (const json::type_error& e) {
        throw FormatError(std::string("Header could not be encoded (") + e.what() + ")", target);
    }
}

Header deserialize_header(const std::string& text, const fs::path& source) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw MalformedHeaderError(std::string("Header is not valid JSON (") + e.what() + ")", source);
    }
    if (!j.is_object()) {
        throw MalformedHeaderError("Header is not a JSON object", source);
    }

    uint64_t version = require_u64(j, "version", source);
    if (version != HEADER_FORMAT_VERSION) {
        throw MalformedHeaderError("Unsupported header version " + std::to_string(version), source);
    }

    Header h;
    h.chunk_size = require_u64(j, "bytes_per_chunk", source);
    if (h.chunk_size == 0) {
        throw MalformedHeaderError("Field 'bytes_per_chunk' must be greater than zero", source);
    }
    uint64_t total_bytes = require_u64(j, "total_bytes", source);
    uint64_t chunk_count = require_u64(j, "chunk_count", source);

    auto files = j.find("files");
    if (files == j.end() || !files->is_array()) {
        throw MalformedHeaderError("Field 'files' is missing or not an array", source);
    }

    std::unordered_set<std::string> seen;
    uint64_t running = 0;
    for (const auto& item : *files) {
        if (!item.is_object()) {
            throw MalformedHeaderError("File record is not an object", source);
        }
        FileEntry e;
        e.name = require_string(item, "name", source);
        e.size = require_u64(item, "size", source);
        e.offset = require_u64(item, "offset", source);

        if (e.name.empty()) {
            throw MalformedHeaderError("File record has an empty name", source);
        }
        if (!seen.insert(e.name).second) {
            throw MalformedHeaderError("Duplicate file name '" + e.name + "'", source);
        }
        if (e.offset != running) {
            throw MalformedHeaderError("Offset of '" + e.name + "' is " + std::to_string(e.offset) +
                                       ", expected " + std::to_string(running), source);
        }
        if (e.size > std::numeric_limits<uint64_t>::max() - running) {
            throw MalformedHeaderError("Size of '" + e.name + "' overflows the stream length", source);
        }
        running += e.size;
        h.entries.push_back(std::move(e));
    }

    if (total_bytes != running) {
        throw MalformedHeaderError("Field 'total_bytes' is " + std::to_string(total_bytes) +
                                   " but the files add up to " + std::to_string(running), source);
    }
    if (chunk_count != h.chunk_count()) {
        throw MalformedHeaderError("Field 'chunk_count' is " + std::to_string(chunk_count) +
                                   ", expected " + std::to_string(h.chunk_count()), source);
    }
    return h;
}

void write_header_file(const Header& h, const fs::path& path) {
    std::string text = serialize_header(h, path);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw WriteError("Failed to open header for writing", path);
    }
    file.write(text.data(), static_cast<std::streamsize>(text.size()));
    file.close();
    if (file.fail()) {
        throw WriteError("Failed to write header", path);
    }
}

Header read_header_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw MissingHeaderError("No header file found", path);
    }
    if (!fs::is_regular_file(path, ec)) {
        throw MalformedHeaderError("Header is not a regular file", path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw ReadError("Failed to open header", path);
    }
    std::stringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw ReadError("Failed to read header", path);
    }
    return deserialize_header(ss.str(), path);
}

} // namespace Serializer
