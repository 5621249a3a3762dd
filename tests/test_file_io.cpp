#include "test_support.hpp"
#include "../common/file_io.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using testing_support::TempDir;
using testing_support::pattern;

TEST(MemorySink, SparseWritesAndCursor) {
    file_io::MemorySink sink;
    sink.open();

    auto a = pattern(0, 10);
    auto c = pattern(20, 10);
    sink.write_at(0, a.data(), a.size(), true);
    EXPECT_EQ(sink.cursor(), 10u);

    sink.write_at(20, c.data(), c.size(), true);
    EXPECT_EQ(sink.cursor(), 30u);
    EXPECT_EQ(sink.extent(), 30u);

    // gap fill leaves the cursor alone
    auto b = pattern(10, 10);
    sink.write_at(10, b.data(), b.size(), false);
    EXPECT_EQ(sink.cursor(), 30u);

    sink.finalize();
    EXPECT_EQ(sink.bytes(), pattern(0, 30));
}

TEST(FileSink, OutOfOrderWritesLandInPlace) {
    TempDir tmp;
    std::string path = tmp.file("nested/dir/out.bin");
    file_io::FileSink sink(path);
    EXPECT_FALSE(sink.is_open());
    sink.open();
    EXPECT_TRUE(sink.is_open());

    auto tail = pattern(100, 50);
    auto head = pattern(0, 100);
    sink.write_at(100, tail.data(), tail.size(), true);
    sink.write_at(0, head.data(), head.size(), false);
    EXPECT_EQ(sink.cursor(), 150u);
    sink.finalize();
    EXPECT_FALSE(sink.is_open());

    EXPECT_EQ(testing_support::read_file(path), pattern(0, 150));
    EXPECT_EQ(sink.describe(), path);
}

TEST(FileSink, OpenTruncatesExistingFile) {
    TempDir tmp;
    std::string path = tmp.file("out.bin");
    testing_support::write_file(path, pattern(0, 300));

    file_io::FileSink sink(path);
    sink.open();
    auto a = pattern(0, 10);
    sink.write_at(0, a.data(), a.size(), true);
    sink.finalize();
    EXPECT_EQ(testing_support::read_file(path), a);
}

TEST(MmapReader, ReadsWholeFile) {
    TempDir tmp;
    std::string path = tmp.file("data.bin");
    testing_support::write_file(path, pattern(0, 1000));

    file_io::MmapReader reader(path);
    ASSERT_EQ(reader.size(), 1000u);
    EXPECT_EQ(std::vector<u8>(reader.data(), reader.data() + reader.size()), pattern(0, 1000));
    EXPECT_EQ(reader.chunk_len(990, 239), 10u);
    EXPECT_EQ(reader.chunk_len(1000, 239), 0u);
}

TEST(RemotePath, ResolvesBelowRoot) {
    std::filesystem::path root("/srv/sdcard");
    EXPECT_EQ(file_io::proto_to_fspath(root, "/APM/LOGS/1.BIN"),
              std::filesystem::path("/srv/sdcard/APM/LOGS/1.BIN"));
    EXPECT_EQ(file_io::proto_to_fspath(root, "@PARAM/param.pck?withdefaults=1"),
              std::filesystem::path("/srv/sdcard/@PARAM/param.pck"));
}

TEST(RemotePath, RejectsTraversal) {
    std::filesystem::path root("/srv/sdcard");
    EXPECT_THROW(file_io::proto_to_fspath(root, "../etc/passwd"), std::runtime_error);
    EXPECT_THROW(file_io::proto_to_fspath(root, "/APM/../../etc/passwd"), std::runtime_error);
    EXPECT_THROW(file_io::proto_to_fspath(root, "/"), std::runtime_error);
}
