#include "rup/upload/file_source.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using rup::upload::LocalFileSource;
using rup::upload::MemoryFileSource;

namespace {

fs::path create_temp_dir() {
    static std::atomic<int> counter{0};
    auto dir = fs::temp_directory_path() / ("rup_file_source_test_" + std::to_string(counter++));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

} // namespace

TEST(FileSourceTest, ReadsRangesFromDisk) {
    auto dir = create_temp_dir();
    auto path = dir / "report.csv";
    {
        std::ofstream out(path, std::ios::binary);
        out << "0123456789";
    }

    auto source = LocalFileSource::open(path);
    ASSERT_TRUE(source.is_ok()) << source.error().message;
    EXPECT_EQ(source.value()->name(), "report.csv");
    EXPECT_EQ(source.value()->size(), 10u);

    auto middle = source.value()->read(3, 4);
    ASSERT_TRUE(middle.is_ok());
    EXPECT_EQ(std::string(middle.value().begin(), middle.value().end()), "3456");

    auto all = source.value()->read_all();
    ASSERT_TRUE(all.is_ok());
    EXPECT_EQ(all.value().size(), 10u);

    fs::remove_all(dir);
}

TEST(FileSourceTest, RejectsMissingFilesAndDirectories) {
    auto dir = create_temp_dir();

    auto missing = LocalFileSource::open(dir / "nope.bin");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, rup::ErrorKind::InvalidInput);

    EXPECT_TRUE(LocalFileSource::open(dir).is_error());

    fs::remove_all(dir);
}

TEST(FileSourceTest, UploadNameOverride) {
    auto dir = create_temp_dir();
    auto path = dir / "a.txt";
    {
        std::ofstream out(path);
        out << "hello";
    }

    auto source = LocalFileSource::open(path, "b.txt");
    ASSERT_TRUE(source.is_ok());
    EXPECT_EQ(source.value()->name(), "b.txt");
    EXPECT_EQ(source.value()->path().string(), path.string());

    fs::remove_all(dir);
}

TEST(FileSourceTest, MemorySourceBoundsChecks) {
    MemoryFileSource source("notes.txt", std::string("abcdef"));

    auto tail = source.read(4, 2);
    ASSERT_TRUE(tail.is_ok());
    EXPECT_EQ(std::string(tail.value().begin(), tail.value().end()), "ef");

    EXPECT_TRUE(source.read(4, 3).is_error());
    EXPECT_TRUE(source.read(7, 0).is_error());
    EXPECT_TRUE(source.read(6, 0).is_ok());
}
