/**
 * @file Command.cpp
 * @brief Error to exit code mapping and output helpers shared by all commands.
 */

#include "Command.hpp"
#include "Fasta.hpp"
#include "io/SourceFile.hpp"
#include "io/WindowReader.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

/**
 * @brief Writes a window to stdout.
 *
 * Raw mode emits exactly the buffer bytes so that the output can be piped into
 * another program. Otherwise the window is followed by a newline.
 *
 * @param buf Window bytes.
 * @param raw Emit the bytes only.
 * @throws SourceFile::IOError If stdout can't be written.
 */
void Command::print_window(const buf_t& buf, bool raw) {
    if( !buf.empty() && fwrite(buf.data(), 1, buf.size(), stdout) != buf.size() ){
        throw SourceFile::IOError(fmt::format("write to stdout: {}", strerror(errno)));
    }
    if( !raw && fputc('\n', stdout) == EOF ){
        throw SourceFile::IOError(fmt::format("write to stdout: {}", strerror(errno)));
    }
    if( fflush(stdout) != 0 ){
        throw SourceFile::IOError(fmt::format("flush stdout: {}", strerror(errno)));
    }
}

/**
 * @brief Runs a command, turning its exceptions into exit codes.
 *
 * Every error is logged once, as critical, with its message unchanged.
 *
 * @param cmd Command to run.
 * @return The command's exit code, or the code of the error it raised.
 */
int Command::run_checked(Command* cmd) {
    try {
        return cmd->run();
    } catch (const Fasta::Index::OutOfRange& e) {
        logger->critical("{}", e.what());
        return EXIT_RECORD_OUT_OF_RANGE;
    } catch (const WindowReader::OutOfBounds& e) {
        logger->critical("{}", e.what());
        return EXIT_WINDOW_OUT_OF_BOUNDS;
    } catch (const Fasta::Index::ParseError& e) {
        logger->critical("invalid index: {}", e.what());
        return EXIT_BAD_INDEX;
    } catch (const SourceFile::IOError& e) {
        logger->critical("{}", e.what());
        return EXIT_IO_ERROR;
    } catch (const std::invalid_argument& e) {
        logger->critical("{}", e.what());
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        logger->critical("{}", e.what());
        return EXIT_IO_ERROR;
    }
}
