#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/serializer.hpp"
#include "files/chunk_layout.hpp"
#include "files/dechunker.hpp"
#include "files/header.hpp"
#include "nlohmann/json.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;
using json = nlohmann::json;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

namespace {

Header sample_header() {
    Header h;
    h.chunk_size = 10;
    h.add_entry("a", 7);
    h.add_entry("dir/b", 5);
    h.add_entry("empty", 0);
    return h;
}

// Serializes the sample header and hands it back as a mutable JSON document.
json sample_json() {
    return json::parse(Serializer::serialize_header(sample_header()));
}

void expect_malformed(const json& j) {
    EXPECT_THROW(Serializer::deserialize_header(j.dump()), MalformedHeaderError) << j.dump();
}

} // namespace

// --- Header ---

TEST(HeaderTest, OffsetsFollowInsertionOrder) {
    Header h = sample_header();
    ASSERT_EQ(h.entries.size(), 3u);
    EXPECT_EQ(h.entries[0].offset, 0u);
    EXPECT_EQ(h.entries[1].offset, 7u);
    EXPECT_EQ(h.entries[2].offset, 12u);
    EXPECT_EQ(h.total_bytes(), 12u);
}

TEST(HeaderTest, ChunkCountAndLengths) {
    Header h = sample_header();
    EXPECT_EQ(h.chunk_count(), 2u);
    EXPECT_EQ(h.chunk_length(0), 10u);
    EXPECT_EQ(h.chunk_length(1), 2u);
    EXPECT_EQ(h.chunk_length(2), 0u);
}

TEST(HeaderTest, ExactMultipleHasNoTrailingChunk) {
    Header h;
    h.chunk_size = 10;
    h.add_entry("x", 30);
    EXPECT_EQ(h.chunk_count(), 3u);
    EXPECT_EQ(h.chunk_length(2), 10u);
    EXPECT_EQ(h.chunk_length(3), 0u);
}

TEST(HeaderTest, HugeChunkSizeDoesNotWrapTheCount) {
    const uint64_t max = std::numeric_limits<uint64_t>::max();
    Header h;
    h.chunk_size = max;
    h.add_entry("pair", 2);
    EXPECT_EQ(h.chunk_count(), 1u);
    EXPECT_EQ(h.chunk_length(0), 2u);
    EXPECT_EQ(h.chunk_length(1), 0u);

    h.chunk_size = max - 1;
    h.entries.clear();
    h.add_entry("a", max - 1);
    h.add_entry("b", 1);
    EXPECT_EQ(h.chunk_count(), 2u);
    EXPECT_EQ(h.chunk_length(0), max - 1);
    EXPECT_EQ(h.chunk_length(1), 1u);
    EXPECT_EQ(h.chunk_length(max), 0u);
}

TEST(HeaderTest, EmptyStreamHasNoChunks) {
    Header h;
    h.chunk_size = 10;
    EXPECT_EQ(h.chunk_count(), 0u);
    h.add_entry("zero", 0);
    EXPECT_EQ(h.total_bytes(), 0u);
    EXPECT_EQ(h.chunk_count(), 0u);
}

TEST(HeaderTest, PrintListsEveryEntry) {
    std::stringstream out;
    sample_header().print(out);
    EXPECT_THAT(out.str(), HasSubstr("Chunk Count:  2"));
    EXPECT_THAT(out.str(), HasSubstr("dir/b"));
    EXPECT_THAT(out.str(), HasSubstr("empty"));
}

// --- Serializer ---

TEST(SerializerTest, HeaderRoundTrip) {
    Header h;
    h.chunk_size = 25 * 1024 * 1024;
    h.add_entry("plain.txt", 123456);
    h.add_entry("with \"quotes\" and \\backslash", 1);
    h.add_entry("line\nbreak\ttab", 0);
    h.add_entry("unicode/\xc3\xbc\xc3\xb1\xc3\xaf\xc3\xa7\xc3\xb8\x64\xc3\xa9.bin", 42);
    h.add_entry("zero", 0);

    Header back = Serializer::deserialize_header(Serializer::serialize_header(h));
    ASSERT_EQ(back, h);
    EXPECT_EQ(back.chunk_size, h.chunk_size);
    EXPECT_EQ(back.total_bytes(), h.total_bytes());
}

TEST(SerializerTest, EmptyHeaderRoundTrip) {
    Header h;
    h.chunk_size = 1;
    Header back = Serializer::deserialize_header(Serializer::serialize_header(h));
    EXPECT_EQ(back, h);
    EXPECT_TRUE(back.entries.empty());
}

TEST(SerializerTest, OutputIsDeterministic) {
    EXPECT_EQ(Serializer::serialize_header(sample_header()), Serializer::serialize_header(sample_header()));
}

TEST(SerializerTest, StoresDerivedTotals) {
    json j = sample_json();
    EXPECT_EQ(j.at("version").get<uint32_t>(), HEADER_FORMAT_VERSION);
    EXPECT_EQ(j.at("bytes_per_chunk").get<uint64_t>(), 10u);
    EXPECT_EQ(j.at("total_bytes").get<uint64_t>(), 12u);
    EXPECT_EQ(j.at("chunk_count").get<uint64_t>(), 2u);
    ASSERT_EQ(j.at("files").size(), 3u);
    EXPECT_EQ(j["files"][1].at("name").get<std::string>(), "dir/b");
    EXPECT_EQ(j["files"][1].at("offset").get<uint64_t>(), 7u);
}

TEST(SerializerTest, RejectsZeroChunkSize) {
    Header h = sample_header();
    h.chunk_size = 0;
    EXPECT_THROW(Serializer::serialize_header(h), FormatError);
}

TEST(SerializerTest, RejectsUnencodableNames) {
    Header invalid_utf8;
    invalid_utf8.chunk_size = 10;
    invalid_utf8.add_entry("bad\xff\xfe", 1);
    EXPECT_THROW(Serializer::serialize_header(invalid_utf8), FormatError);

    Header with_nul;
    with_nul.chunk_size = 10;
    with_nul.add_entry(std::string("a\0b", 3), 1);
    EXPECT_THROW(Serializer::serialize_header(with_nul), FormatError);

    Header empty_name;
    empty_name.chunk_size = 10;
    empty_name.add_entry("", 1);
    EXPECT_THROW(Serializer::serialize_header(empty_name), FormatError);
}

TEST(SerializerTest, RejectsDuplicateNamesOnSerialize) {
    Header h;
    h.chunk_size = 10;
    h.add_entry("same", 1);
    h.add_entry("same", 2);
    EXPECT_THROW(Serializer::serialize_header(h), FormatError);
}

TEST(SerializerTest, FormatErrorNamesTheTarget) {
    Header h = sample_header();
    h.chunk_size = 0;
    try {
        Serializer::serialize_header(h, "out/header");
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_EQ(e.path().string(), "out/header");
        EXPECT_THAT(e.what(), HasSubstr("out/header"));
    }
}

TEST(SerializerTest, RejectsTruncatedText) {
    std::string text = Serializer::serialize_header(sample_header());
    for (size_t cut : {size_t{0}, size_t{1}, text.size() / 2, text.size() - 3}) {
        EXPECT_THROW(Serializer::deserialize_header(text.substr(0, cut)), MalformedHeaderError) << "cut at " << cut;
    }
}

TEST(SerializerTest, RejectsNonObjectDocuments) {
    EXPECT_THROW(Serializer::deserialize_header("not json at all"), MalformedHeaderError);
    EXPECT_THROW(Serializer::deserialize_header("[]"), MalformedHeaderError);
    EXPECT_THROW(Serializer::deserialize_header("42"), MalformedHeaderError);
}

TEST(SerializerTest, RejectsMissingFields) {
    for (const char* key : {"version", "bytes_per_chunk", "total_bytes", "chunk_count", "files"}) {
        json j = sample_json();
        j.erase(key);
        expect_malformed(j);
    }
    for (const char* key : {"name", "size", "offset"}) {
        json j = sample_json();
        j["files"][0].erase(key);
        expect_malformed(j);
    }
}

TEST(SerializerTest, RejectsMistypedFields) {
    json negative = sample_json();
    negative["files"][0]["size"] = -7;
    expect_malformed(negative);

    json fractional = sample_json();
    fractional["files"][0]["size"] = 7.5;
    expect_malformed(fractional);

    json textual = sample_json();
    textual["files"][0]["size"] = "7";
    expect_malformed(textual);

    json numeric_name = sample_json();
    numeric_name["files"][0]["name"] = 1;
    expect_malformed(numeric_name);

    json record_not_object = sample_json();
    record_not_object["files"][0] = "a";
    expect_malformed(record_not_object);

    json files_not_array = sample_json();
    files_not_array["files"] = json::object();
    expect_malformed(files_not_array);
}

TEST(SerializerTest, RejectsInconsistentLayout) {
    json bad_offset = sample_json();
    bad_offset["files"][1]["offset"] = 6;
    expect_malformed(bad_offset);

    json bad_total = sample_json();
    bad_total["total_bytes"] = 13;
    expect_malformed(bad_total);

    json bad_count = sample_json();
    bad_count["chunk_count"] = 3;
    expect_malformed(bad_count);

    json zero_chunk = sample_json();
    zero_chunk["bytes_per_chunk"] = 0;
    expect_malformed(zero_chunk);

    json huge_chunk = sample_json();
    huge_chunk["bytes_per_chunk"] = std::numeric_limits<uint64_t>::max();
    huge_chunk["chunk_count"] = 0;
    expect_malformed(huge_chunk);
    huge_chunk["chunk_count"] = 1;
    EXPECT_EQ(Serializer::deserialize_header(huge_chunk.dump()).chunk_count(), 1u);

    json future_version = sample_json();
    future_version["version"] = HEADER_FORMAT_VERSION + 1;
    expect_malformed(future_version);
}

TEST(SerializerTest, RejectsDuplicateAndEmptyNames) {
    json dup = sample_json();
    dup["files"][1]["name"] = "a";
    expect_malformed(dup);

    json empty = sample_json();
    empty["files"][0]["name"] = "";
    expect_malformed(empty);
}

TEST(SerializerTest, ReadHeaderFileReportsMissingFile) {
    fs::path missing = fs::temp_directory_path() / "chunker_no_such_dir" / "header";
    EXPECT_THROW(Serializer::read_header_file(missing), MissingHeaderError);
}

// --- ChunkLayout ---

TEST(ChunkLayoutTest, IndexWidthCoversLastIndex) {
    EXPECT_EQ(ChunkLayout::index_width(0), 2u);
    EXPECT_EQ(ChunkLayout::index_width(1), 2u);
    EXPECT_EQ(ChunkLayout::index_width(100), 2u);
    EXPECT_EQ(ChunkLayout::index_width(101), 3u);
    EXPECT_EQ(ChunkLayout::index_width(1000), 3u);
    EXPECT_EQ(ChunkLayout::index_width(1001), 4u);
}

TEST(ChunkLayoutTest, ChunkFileNames) {
    EXPECT_EQ(ChunkLayout::chunk_file_name(0, 2), "chunk-00");
    EXPECT_EQ(ChunkLayout::chunk_file_name(1, 2), "chunk-01");
    EXPECT_EQ(ChunkLayout::chunk_file_name(7, 3), "chunk-007");
    EXPECT_EQ(ChunkLayout::chunk_file_name(123, 2), "chunk-123");
}

TEST(ChunkLayoutTest, NamesSortInStreamOrder) {
    const uint64_t count = 150;
    const size_t width = ChunkLayout::index_width(count);
    std::vector<std::string> names;
    for (uint64_t i = 0; i < count; ++i) {
        names.push_back(ChunkLayout::chunk_file_name(i, width));
    }
    std::vector<std::string> sorted = names;
    std::sort(sorted.begin(), sorted.end());
    EXPECT_EQ(sorted, names);
}

TEST(ChunkLayoutTest, ParseChunkIndex) {
    EXPECT_EQ(ChunkLayout::parse_chunk_index("chunk-00"), std::optional<uint64_t>(0));
    EXPECT_EQ(ChunkLayout::parse_chunk_index("chunk-017"), std::optional<uint64_t>(17));
    EXPECT_EQ(ChunkLayout::parse_chunk_index("chunk-5"), std::optional<uint64_t>(5));
    EXPECT_FALSE(ChunkLayout::parse_chunk_index("chunk-"));
    EXPECT_FALSE(ChunkLayout::parse_chunk_index("chunk-1a"));
    EXPECT_FALSE(ChunkLayout::parse_chunk_index("chunk--1"));
    EXPECT_FALSE(ChunkLayout::parse_chunk_index("header"));
    EXPECT_FALSE(ChunkLayout::parse_chunk_index("xchunk-01"));
    EXPECT_FALSE(ChunkLayout::parse_chunk_index("chunk-12345678901234567890"));
}

class ResolveEntryPathTest : public ::testing::Test {
protected:
    fs::path root_;

    void SetUp() override {
        root_ = fs::temp_directory_path() /
                ("chunker_resolve_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(root_);
        fs::create_directories(root_ / "out");
    }

    void TearDown() override {
        fs::remove_all(root_);
    }
};

TEST_F(ResolveEntryPathTest, AcceptsNestedRelativeNames) {
    fs::path base = fs::weakly_canonical(root_ / "out");
    EXPECT_EQ(ChunkLayout::resolve_entry_path(root_ / "out", "a/b.txt").string(), (base / "a" / "b.txt").string());
    EXPECT_EQ(ChunkLayout::resolve_entry_path(root_ / "out", "./c").string(), (base / "c").string());
    EXPECT_EQ(ChunkLayout::resolve_entry_path(root_ / "out", "not/yet/created/d").string(),
              (base / "not" / "yet" / "created" / "d").string());
}

TEST_F(ResolveEntryPathTest, RejectsEscapingNames) {
    for (const std::string name : {"../escape", "a/../../escape", "a/..", "/etc/passwd", "", ".", "a/", ".."}) {
        EXPECT_THROW(ChunkLayout::resolve_entry_path(root_ / "out", name), UnsafePathError) << "'" << name << "'";
    }
    EXPECT_THROW(ChunkLayout::resolve_entry_path(root_ / "out", std::string("a\0b", 3)), UnsafePathError);
}

TEST_F(ResolveEntryPathTest, RejectsSymlinkEscape) {
    fs::create_directories(root_ / "elsewhere");
    fs::create_directory_symlink(root_ / "elsewhere", root_ / "out" / "link");
    EXPECT_THROW(ChunkLayout::resolve_entry_path(root_ / "out", "link/file"), UnsafePathError);
}

// --- ChunkReader ---

class ChunkReaderTest : public ResolveEntryPathTest {
protected:
    fs::path make_chunk(const std::string& name, const std::string& data) {
        fs::path p = root_ / name;
        std::ofstream file(p, std::ios::binary);
        file << data;
        return p;
    }
};

TEST_F(ChunkReaderTest, ReadsAcrossChunkBoundaries) {
    Logger::instance().set_level(LogLevel::WARNING);
    ChunkReader reader({make_chunk("chunk-00", "abc"), make_chunk("chunk-01", "de"), make_chunk("chunk-02", "f")});

    std::string stream;
    std::vector<size_t> reads;
    char buffer[4];
    while (size_t got = reader.read(buffer, sizeof(buffer))) {
        stream.append(buffer, got);
        reads.push_back(got);
    }
    EXPECT_EQ(stream, "abcdef");
    EXPECT_THAT(reads, ElementsAre(3u, 2u, 1u));
    EXPECT_EQ(reader.position(), 6u);
    EXPECT_EQ(reader.read(buffer, sizeof(buffer)), 0u);
}

TEST_F(ChunkReaderTest, EmptyChunkListYieldsNothing) {
    ChunkReader reader(std::vector<fs::path>{});
    char buffer[4];
    EXPECT_EQ(reader.read(buffer, sizeof(buffer)), 0u);
    EXPECT_TRUE(reader.current_chunk().empty());
}

TEST_F(ChunkReaderTest, MissingChunkFileIsAReadError) {
    ChunkReader reader({root_ / "chunk-00"});
    char buffer[4];
    EXPECT_THROW(reader.read(buffer, sizeof(buffer)), ReadError);
}

// --- Logger ---

class LoggerTest : public ResolveEntryPathTest {
protected:
    void TearDown() override {
        Logger::instance().close();
        Logger::instance().set_level(LogLevel::WARNING);
        ResolveEntryPathTest::TearDown();
    }
};

TEST_F(LoggerTest, MinimumLevelFiltersLowerSeverities) {
    fs::path log = root_ / "chunker.log";
    Logger::instance().init(log.string());
    Logger::instance().set_level(LogLevel::WARNING);
    LOG_DEBUG("debug line");
    LOG_INFO("info line");
    LOG_WARN("warn line ", 42);

    Logger::instance().set_level(LogLevel::DEBUG);
    LOG_DEBUG("debug after lowering");
    Logger::instance().close();

    std::ifstream file(log);
    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_THAT(text, HasSubstr("[WARN] warn line 42"));
    EXPECT_THAT(text, HasSubstr("[DEBUG] debug after lowering"));
    EXPECT_THAT(text, ::testing::Not(HasSubstr("info line")));
    EXPECT_THAT(text, ::testing::Not(HasSubstr("debug line")));
}
