#include <gtest/gtest.h>
#include "commands/IterateCommand.hpp"
#include "io/WindowReader.hpp"
#include "test_utils.hpp"

class IterateCommandTest : public CmdTestBase<IterateCommand> {};

TEST_F(IterateCommandTest, registers_itself) {
    ASSERT_NE(Command::registry()["iterate"], nullptr);
}

TEST_F(IterateCommandTest, one_window_per_line) {
    EXPECT_EQ("TT\nTT\n", run_cmd_stdout({"iterate", small_fasta(), small_index(), "1", "2"}));
}

TEST_F(IterateCommandTest, raw) {
    EXPECT_EQ("TTTT", run_cmd_stdout({"iterate", small_fasta(), small_index(), "1", "3", "--raw"}));
}

TEST_F(IterateCommandTest, window_larger_than_sequence) {
    EXPECT_EQ("ACGTACGT\n", run_cmd_stdout({"iterate", small_fasta(), small_index(), "0", "100"}));
}

// window starts are raw offsets: the window starting at 3 skips the '\n' at 4
// and the next one starts at 6, so "C" at raw offset 6 is printed twice
TEST_F(IterateCommandTest, windows_overlap_across_line_breaks) {
    EXPECT_EQ("ACG\nTAC\nCGT\n", run_cmd_stdout({"iterate", small_fasta(), small_index(), "0", "3"}));
}

TEST_F(IterateCommandTest, start) {
    EXPECT_EQ("ACGT\n", run_cmd_stdout({"iterate", small_fasta(), small_index(), "0", "4", "--start", "4"}));
}

TEST_F(IterateCommandTest, zero_window_size) {
    EXPECT_THROW(run_cmd({"iterate", small_fasta(), small_index(), "0", "0"}), std::invalid_argument);
    EXPECT_EQ(EXIT_USAGE, run_cmd_checked({"iterate", small_fasta(), small_index(), "0", "0"}));
}

TEST_F(IterateCommandTest, start_out_of_bounds) {
    EXPECT_THROW(run_cmd({"iterate", small_fasta(), small_index(), "0", "4", "--start", "8"}), WindowReader::OutOfBounds);
}

TEST_F(IterateCommandTest, sequence_out_of_range) {
    EXPECT_THROW(run_cmd({"iterate", small_fasta(), small_index(), "5", "4"}), Fasta::Index::OutOfRange);
}

TEST_F(IterateCommandTest, index_of_another_file) {
    TempFile index(R"([{"header":">seq2","position":22,"length":9}])", ".json");
    int rc = EXIT_OK;
    const std::string out = capture_stdout([&]() {
        rc = run_cmd_checked({"iterate", small_fasta(), index.path(), "0", "4", "--raw"});
    });
    EXPECT_EQ(EXIT_IO_ERROR, rc);
    EXPECT_EQ("TTTT", out);
}
