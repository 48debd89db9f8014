/**
 * @file common.cpp
 * @brief Global state and helpers shared by all commands.
 *
 * Defines the global logger and the top-level argument parser, registers the
 * options every command accepts (verbosity, log file, dedup limit) and sets up
 * the optional log file.
 */

#include "common.hpp"
#include "dist/version.h"

#include <spdlog/sinks/stdout_color_sinks.h>

int verbosity = 0;

std::shared_ptr<Logger> logger = std::make_shared<Logger>(spdlog::stderr_color_mt(APP_NAME));
argparse::ArgumentParser program(APP_NAME, APP_VERSION, argparse::default_arguments::help);

std::string filter_unprintable(const std::string& str){
    std::string result;
    result.reserve(str.size());
    for( char c : str ){
        if( c >= 0x20 && c <= 0x7e ){
            result += c;
        } else {
            result += '.';
        }
    }
    return result;
}

/**
 * @brief Attaches the log file (if any) and logs the session banner.
 *
 * Only the first call has an effect. An explicitly requested log file that
 * can't be opened is an error: the caller asked for a log and won't get one.
 *
 * @param log_fname Log pathname, empty for console-only logging.
 * @throws std::runtime_error If log_fname is set but can't be opened.
 */
void init_log(const std::string& log_fname){
    static bool inited = false;
    if( inited ){
        return;
    }
    inited = true;

    if( !log_fname.empty() && !logger->add_file(log_fname) ){
        throw std::runtime_error(fmt::format("explicit log pathname \"{}\" is set, refusing to continue without log", log_fname));
    }
    logger->start();
}

void register_common_args(argparse::ArgumentParser &parser) {
    parser.add_argument("-v", "--verbose")
        .help("increase verbosity")
        .action([&](const auto &) { ++verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-q", "--quiet")
        .help("decrease verbosity")
        .action([&](const auto &) { --verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-L", "--log")
        .help("append log to this file [default: console only]");
    parser.add_argument("--log-dedup-limit")
        .default_value(100)
        .scan<'i', int>()
        .help("limit duplicate log messages, 0 = no limit");
}

void register_program_args(argparse::ArgumentParser &parser) {
    register_common_args(parser);

    parser.add_argument("--version")
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", APP_VERSION);
            exit(0);
        })
        .default_value(false)
        .help("print version information and exit")
        .implicit_value(true)
        .nargs(0);
}
