#ifndef CHUNKER_HEADER_HPP
#define CHUNKER_HEADER_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <iostream>
#include <iomanip>
#include <algorithm>

// Bumped whenever the serialized layout of the header changes.
constexpr uint32_t HEADER_FORMAT_VERSION = 1;

struct FileEntry {
    std::string name;   // relative, '/'-separated
    uint64_t size = 0;
    uint64_t offset = 0; // position in the logical stream

    bool operator==(const FileEntry& other) const {
        return name == other.name && size == other.size && offset == other.offset;
    }
    bool operator!=(const FileEntry& other) const { return !(*this == other); }
};

struct Header {
    uint64_t chunk_size = 0;
    std::vector<FileEntry> entries;

    // Appends a file at the current end of the logical stream.
    void add_entry(std::string name, uint64_t size) {
        entries.push_back(FileEntry{std::move(name), size, total_bytes()});
    }

    uint64_t total_bytes() const {
        if (entries.empty()) return 0;
        return entries.back().offset + entries.back().size;
    }

    // Written without `total + chunk_size - 1` so huge chunk sizes cannot wrap.
    uint64_t chunk_count() const {
        if (chunk_size == 0) return 0;
        uint64_t total = total_bytes();
        return total / chunk_size + (total % chunk_size != 0 ? 1 : 0);
    }

    // Expected byte length of chunk `index`; only the last one may be short.
    uint64_t chunk_length(uint64_t index) const {
        if (index >= chunk_count()) return 0;
        uint64_t begin = index * chunk_size; // below total_bytes(), so no overflow
        return std::min(chunk_size, total_bytes() - begin);
    }

    bool operator==(const Header& other) const {
        return chunk_size == other.chunk_size && entries == other.entries;
    }
    bool operator!=(const Header& other) const { return !(*this == other); }

    // Helper function to print the header details
    void print(std::ostream& out = std::cout) const {
        out << "--- Header ---\n"
            << "Chunk Size:   " << chunk_size << " bytes\n"
            << "Total Size:   " << total_bytes() << " bytes\n"
            << "Chunk Count:  " << chunk_count() << "\n"
            << "Files:        (" << entries.size() << ")\n";
        for (size_t i = 0; i < entries.size(); ++i) {
            const auto& e = entries[i];
            out << "  [" << std::setw(4) << std::setfill(' ') << i << "]: "
                << "offset " << std::setw(12) << e.offset
                << "  size " << std::setw(12) << e.size
                << "  " << e.name << "\n";
        }
        out << "--------------\n";
    }
};

#endif //CHUNKER_HEADER_HPP
