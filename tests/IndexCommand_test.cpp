#include <gtest/gtest.h>
#include "commands/IndexCommand.hpp"
#include "io/SourceFile.hpp"
#include "test_utils.hpp"

using Fasta::SequenceRecord;

class IndexCommandTest : public CmdTestBase<IndexCommand> {};

TEST_F(IndexCommandTest, registers_itself) {
    ASSERT_NE(Command::registry()["index"], nullptr);
    ASSERT_EQ("index", Command::aliases()["scan"]);
}

TEST_F(IndexCommandTest, index_small) {
    TempFile out("", ".json");
    const std::string stdout_str = run_cmd_stdout({"index", small_fasta(), out.path(), "--no-progress"});

    EXPECT_THAT(stdout_str, HasSubstr("FASTA Index Complete:"));
    EXPECT_THAT(stdout_str, HasSubstr("Number of sequences: 2"));
    EXPECT_THAT(stdout_str, HasSubstr("Index written to: " + out.str()));

    EXPECT_EQ(read_file(small_index()), read_file(out.path()));
}

TEST_F(IndexCommandTest, small_chunks) {
    TempFile out("", ".json");
    run_cmd_stdout({"index", small_fasta(), out.path(), "--chunk-size", "3", "--no-progress"});

    const Fasta::Index index = Fasta::Index::load(out.path());
    ASSERT_EQ(2, index.size());
    EXPECT_EQ((SequenceRecord{">seq1", 6, 8}), index.at(0));
    EXPECT_EQ((SequenceRecord{">seq2", 22, 4}), index.at(1));
}

TEST_F(IndexCommandTest, overwrites_existing_index) {
    TempFile out(std::string(1000, 'x'), ".json");
    run_cmd_stdout({"index", small_fasta(), out.path(), "--no-progress"});
    EXPECT_EQ(read_file(small_index()), read_file(out.path()));
}

TEST_F(IndexCommandTest, empty_fasta) {
    TempFile fasta("");
    TempFile out("", ".json");
    const std::string stdout_str = run_cmd_stdout({"index", fasta.path(), out.path(), "--no-progress"});
    EXPECT_THAT(stdout_str, HasSubstr("Number of sequences: 0"));
    EXPECT_EQ("[]\n", read_file(out.path()));
}

TEST_F(IndexCommandTest, missing_fasta) {
    TempFile out("", ".json");
    EXPECT_THROW(run_cmd({"index", "nonexistent.fa", out.path()}), SourceFile::IOError);
}

TEST_F(IndexCommandTest, unwritable_output) {
    EXPECT_THROW(run_cmd({"index", small_fasta(), "nonexistent_dir/out.json", "--no-progress"}), SourceFile::IOError);
}

TEST_F(IndexCommandTest, bad_chunk_size) {
    TempFile out("", ".json");
    EXPECT_THROW(run_cmd({"index", small_fasta(), out.path(), "--chunk-size", "12q"}), std::invalid_argument);
    EXPECT_THROW(run_cmd({"index", small_fasta(), out.path(), "--chunk-size", "0"}), std::invalid_argument);
}
