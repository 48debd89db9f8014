/**
 * @file IterateCommand.cpp
 * @brief Implementation of the IterateCommand that prints a sequence window by window.
 *
 * Windows start at --start and advance by window_size until the start leaves
 * the sequence. Window starts are raw byte offsets, like those of "read", so on
 * multi-line sequences consecutive windows overlap by the number of line
 * terminators they skipped.
 */

#include "IterateCommand.hpp"
#include "io/SourceFile.hpp"
#include "io/WindowReader.hpp"

REGISTER_COMMAND(IterateCommand);

/**
 * @brief Constructs an IterateCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
IterateCommand::IterateCommand(bool reg) : Command(reg, "iterate", "print a sequence in consecutive windows") {
    m_parser.add_argument("fasta").help("FASTA file");
    m_parser.add_argument("index").help("index file written by \"index\"");
    m_parser.add_argument("sequence").help("sequence number, 0-based").scan<'u', uint64_t>();
    m_parser.add_argument("window_size").help("bytes per window").scan<'u', uint64_t>();
    m_parser.add_argument("-s", "--start").help("raw byte offset of the first window").scan<'u', uint64_t>().default_value(uint64_t{0});
    m_parser.add_argument("--raw").help("print window bytes only, without newlines between windows").default_value(false).implicit_value(true);
}

/**
 * @brief Prints every window of the sequence.
 *
 * @return EXIT_OK on success.
 * @throws std::invalid_argument If window_size is zero.
 * @throws Fasta::Index::ParseError If the index is malformed.
 * @throws Fasta::Index::OutOfRange If the sequence number is past the end of the index.
 * @throws WindowReader::OutOfBounds If --start is not inside the sequence.
 * @throws SourceFile::IOError On read or write errors.
 */
int IterateCommand::run() {
    init_cmd_log();

    const uint64_t window_size = m_parser.get<uint64_t>("window_size");
    if( window_size == 0 ){
        throw std::invalid_argument("window_size must be positive");
    }

    const Fasta::Index index = Fasta::Index::load(m_parser.get("index"));
    const Fasta::SequenceRecord& record = index.at(m_parser.get<uint64_t>("sequence"));
    logger->debug("{}", record);

    SourceFile source(m_parser.get("fasta"));
    WindowReader reader(source);
    const bool raw = m_parser.get<bool>("--raw");

    uint64_t start = m_parser.get<uint64_t>("--start");
    size_t nwindows = 0;
    do {
        print_window(reader.read(record, start, window_size), raw);
        nwindows++;
        start += window_size;
    } while( start < record.logical_length );

    logger->debug("printed {} windows", nwindows);
    return EXIT_OK;
}
