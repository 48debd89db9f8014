/**
 * @file IndexCommand.cpp
 * @brief Implementation of the IndexCommand that builds a FASTA index.
 *
 * Scans the source file for record boundaries and writes the resulting index
 * as JSON. "scan" is accepted as an alternative command name.
 */

#include "IndexCommand.hpp"
#include "io/SourceFile.hpp"
#include "scanning/BoundaryScanner.hpp"

#include <unistd.h>

REGISTER_COMMAND(IndexCommand);

/**
 * @brief Constructs an IndexCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
IndexCommand::IndexCommand(bool reg) : Command(reg, "index", "build a sequence index of a FASTA file", "scan") {
    m_parser.add_argument("fasta").help("FASTA file");
    m_parser.add_argument("output").help("index file to write (JSON)");
    m_parser.add_argument("--chunk-size").help("scan chunk size, k/m/g suffixes accepted").default_value(std::string("1M"));
    m_parser.add_argument("--no-progress").help("don't show progress").default_value(false).implicit_value(true);
}

/**
 * @brief Scans the FASTA file and saves its index.
 *
 * Progress is shown only when stderr is a terminal and logging is not quieted.
 *
 * @return EXIT_OK on success.
 * @throws SourceFile::IOError If the source can't be read or the index can't be written.
 * @throws std::invalid_argument If --chunk-size is malformed or zero.
 */
int IndexCommand::run() {
    init_cmd_log();

    const std::string fasta_fname = m_parser.get("fasta");
    const std::string index_fname = m_parser.get("output");
    uint64_t chunk_size = 0;
    try {
        chunk_size = human2bytes(m_parser.get<std::string>("--chunk-size"));
    } catch (const std::exception& e) {
        throw std::invalid_argument(fmt::format("--chunk-size: {}", e.what()));
    }

    SourceFile source(fasta_fname);
    logger->info("indexing {} ({:x} = {}), chunk size {}", fasta_fname, source.size(), bytes2human(source.size()), bytes2human(chunk_size));

    BoundaryScanner scanner(source, chunk_size);
    const bool console_info = logger->should_log(Logger::level::info) && logger->console_level() <= Logger::level::info;
    scanner.show_progress(!m_parser.get<bool>("--no-progress") && console_info && isatty(STDERR_FILENO));
    const Fasta::Index index = scanner.scan();
    logger->info("{}: {} records, {} chunk restarts", fasta_fname, index.size(), scanner.restarts());
    index.save(index_fname);

    fmt::print("\nFASTA Index Complete:\n");
    fmt::print("  Number of sequences: {}\n", index.size());
    fmt::print("  Index written to: {}\n", index_fname);
    fflush(stdout);
    return EXIT_OK;
}
