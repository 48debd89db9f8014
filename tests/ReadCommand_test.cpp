#include <gtest/gtest.h>
#include "commands/ReadCommand.hpp"
#include "io/WindowReader.hpp"
#include "test_utils.hpp"

class ReadCommandTest : public CmdTestBase<ReadCommand> {};

TEST_F(ReadCommandTest, registers_itself) {
    ASSERT_NE(Command::registry()["read"], nullptr);
}

TEST_F(ReadCommandTest, whole_sequence) {
    EXPECT_EQ("ACGTACGT\n", run_cmd_stdout({"read", small_fasta(), small_index(), "0"}));
    EXPECT_EQ("TTTT\n", run_cmd_stdout({"read", small_fasta(), small_index(), "1"}));
}

TEST_F(ReadCommandTest, raw) {
    EXPECT_EQ("ACGTACGT", run_cmd_stdout({"read", small_fasta(), small_index(), "0", "--raw"}));
}

TEST_F(ReadCommandTest, window_size) {
    EXPECT_EQ("TT\n", run_cmd_stdout({"read", small_fasta(), small_index(), "1", "2"}));
    EXPECT_EQ("TTTT\n", run_cmd_stdout({"read", small_fasta(), small_index(), "1", "100"}));
}

TEST_F(ReadCommandTest, window_size_and_start) {
    EXPECT_EQ("GT", run_cmd_stdout({"read", small_fasta(), small_index(), "0", "2", "2", "--raw"}));
    EXPECT_EQ("ACG\n", run_cmd_stdout({"read", small_fasta(), small_index(), "0", "3", "5"}));
}

TEST_F(ReadCommandTest, zero_window_size) {
    EXPECT_EQ("", run_cmd_stdout({"read", small_fasta(), small_index(), "0", "0", "--raw"}));
}

TEST_F(ReadCommandTest, sequence_out_of_range) {
    EXPECT_THROW(run_cmd({"read", small_fasta(), small_index(), "2"}), Fasta::Index::OutOfRange);
}

TEST_F(ReadCommandTest, start_out_of_bounds) {
    EXPECT_THROW(run_cmd({"read", small_fasta(), small_index(), "1", "1", "4"}), WindowReader::OutOfBounds);
}

TEST_F(ReadCommandTest, bad_index) {
    TempFile index("{\"header\": 1}", ".json");
    EXPECT_THROW(run_cmd({"read", small_fasta(), index.path(), "0"}), Fasta::Index::ParseError);
}

TEST_F(ReadCommandTest, missing_fasta) {
    EXPECT_THROW(run_cmd({"read", "nonexistent.fa", small_index(), "0"}), SourceFile::IOError);
}

TEST_F(ReadCommandTest, index_of_another_file) {
    TempFile index(R"([{"header":">seq2","position":22,"length":50}])", ".json");
    EXPECT_THROW(run_cmd({"read", small_fasta(), index.path(), "0"}), SourceFile::IOError);
}

TEST_F(ReadCommandTest, exit_codes) {
    TempFile bad_index("[", ".json");
    TempFile stale_index(R"([{"header":">seq2","position":22,"length":50}])", ".json");

    EXPECT_EQ(EXIT_OK, run_cmd_checked({"read", small_fasta(), small_index(), "0", "0", "--raw"}));
    EXPECT_EQ(EXIT_IO_ERROR, run_cmd_checked({"read", "nonexistent.fa", small_index(), "0"}));
    EXPECT_EQ(EXIT_IO_ERROR, run_cmd_checked({"read", small_fasta(), stale_index.path(), "0"}));
    EXPECT_EQ(EXIT_BAD_INDEX, run_cmd_checked({"read", small_fasta(), bad_index.path(), "0"}));
    EXPECT_EQ(EXIT_RECORD_OUT_OF_RANGE, run_cmd_checked({"read", small_fasta(), small_index(), "2"}));
    EXPECT_EQ(EXIT_WINDOW_OUT_OF_BOUNDS, run_cmd_checked({"read", small_fasta(), small_index(), "1", "1", "4"}));
}
