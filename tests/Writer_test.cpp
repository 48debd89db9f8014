#include <gtest/gtest.h>
#include "io/SourceFile.hpp"
#include "io/Writer.hpp"
#include "test_utils.hpp"

#include <fstream>

const char* test_fname = "testfile.tmp";

class WriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::filesystem::remove(test_fname);
    }

    void TearDown() override {
        std::filesystem::remove(test_fname);
    }
};

TEST_F(WriterTest, create_new) {
    {
        Writer w(test_fname);
        w.write("test", 4);
    }
    EXPECT_EQ("test", read_file(test_fname));
}

TEST_F(WriterTest, rewrite_existing) {
    {
        std::ofstream f(test_fname);
        f << "test";
    }

    {
        Writer w(test_fname, false);
        w.write("p", 1);
    }
    EXPECT_EQ("pest", read_file(test_fname));
}

TEST_F(WriterTest, truncate_existing) {
    {
        std::ofstream f(test_fname);
        f << "test";
    }

    {
        Writer w(test_fname);
        w.write("p", 1);
    }
    EXPECT_EQ("p", read_file(test_fname));
}

TEST_F(WriterTest, string_view_and_close) {
    Writer w(test_fname);
    w.write(std::string_view("[]"));
    w.write("\n");
    w.close();
    EXPECT_EQ("[]\n", read_file(test_fname));
}

TEST_F(WriterTest, close_twice) {
    Writer w(test_fname);
    w.close();
    EXPECT_NO_THROW(w.close());
}

TEST_F(WriterTest, open_error) {
    EXPECT_THROW(Writer("nonexistent_dir/testfile.tmp"), SourceFile::IOError);
}
