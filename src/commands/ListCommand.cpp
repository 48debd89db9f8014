/**
 * @file ListCommand.cpp
 * @brief Implementation of the ListCommand that prints the records of an index.
 */

#include "ListCommand.hpp"
#include "Fasta.hpp"

REGISTER_COMMAND(ListCommand);

ListCommand::ListCommand(bool reg) : Command(reg, "list", "list the sequences of an index") {
    m_parser.add_argument("index").help("index file written by \"index\"");
}

/**
 * @brief Prints one line per record: number, raw start offset, logical length and header.
 *
 * @return EXIT_OK on success.
 * @throws Fasta::Index::ParseError If the index is malformed.
 * @throws SourceFile::IOError If the index can't be read.
 */
int ListCommand::run() {
    init_cmd_log();

    const Fasta::Index index = Fasta::Index::load(m_parser.get("index"));

    fmt::print("{:>6} {:>12} {:>12}  {}\n", "#", "position", "length", "header");
    size_t i = 0;
    uint64_t total = 0;
    for( const auto& rec : index ){
        fmt::print("{:>6} {:>12} {:>12}  {}\n", i++, rec.start_offset, rec.logical_length, filter_unprintable(rec.header));
        total += rec.logical_length;
    }
    fmt::print("{} sequences, {} bases\n", index.size(), total);
    return EXIT_OK;
}
