/**
 * @file ReadCommand.cpp
 * @brief Implementation of the ReadCommand that prints one window of a sequence.
 */

#include "ReadCommand.hpp"
#include "io/SourceFile.hpp"
#include "io/WindowReader.hpp"

REGISTER_COMMAND(ReadCommand);

/**
 * @brief Constructs a ReadCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
ReadCommand::ReadCommand(bool reg) : Command(reg, "read", "print a window of one sequence") {
    m_parser.add_argument("fasta").help("FASTA file");
    m_parser.add_argument("index").help("index file written by \"index\"");
    m_parser.add_argument("sequence").help("sequence number, 0-based").scan<'u', uint64_t>();
    m_parser.add_argument("window_size").help("bytes to read [default: up to the end of the sequence]")
        .scan<'u', uint64_t>().nargs(argparse::nargs_pattern::optional);
    m_parser.add_argument("window_start").help("raw byte offset from the start of the sequence [default: 0]")
        .scan<'u', uint64_t>().nargs(argparse::nargs_pattern::optional);
    m_parser.add_argument("--raw").help("print the window bytes only, without a trailing newline").default_value(false).implicit_value(true);
}

/**
 * @brief Reads the requested window and prints it.
 *
 * @return EXIT_OK on success.
 * @throws Fasta::Index::ParseError If the index is malformed.
 * @throws Fasta::Index::OutOfRange If the sequence number is past the end of the index.
 * @throws WindowReader::OutOfBounds If window_start is not inside the sequence.
 * @throws SourceFile::IOError On read or write errors.
 */
int ReadCommand::run() {
    init_cmd_log();

    const Fasta::Index index = Fasta::Index::load(m_parser.get("index"));
    const Fasta::SequenceRecord& record = index.at(m_parser.get<uint64_t>("sequence"));
    logger->debug("{}", record);

    SourceFile source(m_parser.get("fasta"));
    WindowReader reader(source);
    const buf_t window = reader.read(record,
        m_parser.present<uint64_t>("window_start").value_or(0),
        m_parser.present<uint64_t>("window_size"));

    print_window(window, m_parser.get<bool>("--raw"));
    return EXIT_OK;
}
