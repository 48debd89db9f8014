#include <gtest/gtest.h>
#include "io/SourceFile.hpp"
#include "test_utils.hpp"

TEST(SourceFile, align_to_page) {
    auto w = SourceFile::align_to_page(5000, 4096);
    EXPECT_EQ(4096, w.aligned_offset);
    EXPECT_EQ(904, w.offset_adjustment);

    w = SourceFile::align_to_page(4096, 4096);
    EXPECT_EQ(4096, w.aligned_offset);
    EXPECT_EQ(0, w.offset_adjustment);

    w = SourceFile::align_to_page(4095, 4096);
    EXPECT_EQ(0, w.aligned_offset);
    EXPECT_EQ(4095, w.offset_adjustment);

    w = SourceFile::align_to_page(0x100000003ULL, 0x10000);
    EXPECT_EQ(0x100000000ULL, w.aligned_offset);
    EXPECT_EQ(3, w.offset_adjustment);
}

TEST(SourceFile, align_to_host_page) {
    const size_t page = mio::page_size();
    const auto w = SourceFile::align_to_page(page * 3 + 17);
    EXPECT_EQ(page * 3, w.aligned_offset);
    EXPECT_EQ(17, w.offset_adjustment);
}

TEST(SourceFile, size) {
    SourceFile f(find_fixture("small.fa"));
    EXPECT_EQ(27, f.size());
}

TEST(SourceFile, map) {
    SourceFile f(find_fixture("small.fa"));
    const mio::mmap_source m = f.map(0, f.size());
    ASSERT_EQ(27, m.size());
    EXPECT_EQ(">seq1\nACGT", std::string(m.data(), 10));
}

TEST(SourceFile, map_across_pages) {
    const size_t page = mio::page_size();
    std::string content(page * 2 + 100, 'A');
    content[page] = '>';
    TempFile tmp(content);

    SourceFile f(tmp.path());
    const mio::mmap_source m = f.map(page, page + 100);
    EXPECT_EQ('>', m[0]);
    EXPECT_EQ('A', m[page + 99]);
}

TEST(SourceFile, invalid_mapping) {
    SourceFile f(find_fixture("small.fa"));
    EXPECT_THROW(f.map(0, 0), SourceFile::IOError);
    EXPECT_THROW(f.map(0, 28), SourceFile::IOError);
}

TEST(SourceFile, missing_file) {
    EXPECT_THROW(SourceFile("nonexistent.fa"), SourceFile::IOError);
}

TEST(SourceFile, directory) {
    EXPECT_THROW(SourceFile f(std::filesystem::temp_directory_path()), SourceFile::IOError);
}
