#include "relay/upload/chunk_source.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using relay::UploadErrorKind;
using relay::upload::ChunkSource;

namespace {

fs::path create_temp_dir() {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path("relay_chunk_source_test_" + std::to_string(id));
    fs::create_directories(dir);
    return dir;
}

std::vector<std::uint8_t> patterned_bytes(std::size_t size) {
    std::vector<std::uint8_t> data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::uint8_t>((i * 31 + 7) & 0xFF);
    }
    return data;
}

void write_file(const fs::path& path, const std::vector<std::uint8_t>& data) {
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

} // namespace

TEST(ChunkSourceTest, ChunksReassembleToSourceFile) {
    const auto dir = create_temp_dir();
    const auto path = dir / "input.bin";
    const auto data = patterned_bytes(10 * 1024 + 123);
    write_file(path, data);

    auto source = ChunkSource::open(path, 1024);
    ASSERT_TRUE(source.is_ok()) << source.error().message;
    EXPECT_EQ(source.value()->total_parts(), 11u);
    EXPECT_EQ(source.value()->file_size(), data.size());

    std::vector<std::uint8_t> reassembled;
    for (std::uint32_t i = 0; i < source.value()->total_parts(); ++i) {
        auto chunk = source.value()->read(i);
        ASSERT_TRUE(chunk.is_ok()) << chunk.error().message;
        EXPECT_EQ(chunk.value().index, i);
        EXPECT_FALSE(chunk.value().bytes.empty());
        reassembled.insert(reassembled.end(), chunk.value().bytes.begin(), chunk.value().bytes.end());
    }
    EXPECT_EQ(reassembled, data);

    fs::remove_all(dir);
}

TEST(ChunkSourceTest, OnlyLastChunkIsShort) {
    const auto dir = create_temp_dir();
    const auto path = dir / "input.bin";
    write_file(path, patterned_bytes(3000));

    auto source = ChunkSource::open(path, 1024);
    ASSERT_TRUE(source.is_ok());

    auto first = source.value()->read(0);
    auto last = source.value()->read(2);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(last.is_ok());
    EXPECT_EQ(first.value().bytes.size(), 1024u);
    EXPECT_FALSE(first.value().is_last);
    EXPECT_EQ(last.value().bytes.size(), 3000u - 2048u);
    EXPECT_TRUE(last.value().is_last);

    fs::remove_all(dir);
}

TEST(ChunkSourceTest, ReadsAreRepeatable) {
    const auto dir = create_temp_dir();
    const auto path = dir / "input.bin";
    write_file(path, patterned_bytes(4096));

    auto source = ChunkSource::open(path, 1024);
    ASSERT_TRUE(source.is_ok());

    auto once = source.value()->read(3);
    auto twice = source.value()->read(3);
    ASSERT_TRUE(once.is_ok());
    ASSERT_TRUE(twice.is_ok());
    EXPECT_EQ(once.value().bytes, twice.value().bytes);

    fs::remove_all(dir);
}

TEST(ChunkSourceTest, IndexPastEndIsEmptyChunk) {
    const auto dir = create_temp_dir();
    const auto path = dir / "input.bin";
    write_file(path, patterned_bytes(2048));

    auto source = ChunkSource::open(path, 1024);
    ASSERT_TRUE(source.is_ok());

    auto chunk = source.value()->read(2);
    ASSERT_TRUE(chunk.is_error());
    EXPECT_EQ(chunk.error().kind, UploadErrorKind::EmptyChunk);

    fs::remove_all(dir);
}

TEST(ChunkSourceTest, MissingFileIsIoError) {
    const auto dir = create_temp_dir();

    auto source = ChunkSource::open(dir / "missing.bin", 1024);
    ASSERT_TRUE(source.is_error());
    EXPECT_EQ(source.error().kind, UploadErrorKind::Io);

    auto directory = ChunkSource::open(dir, 1024);
    ASSERT_TRUE(directory.is_error());
    EXPECT_EQ(directory.error().kind, UploadErrorKind::Io);

    fs::remove_all(dir);
}
