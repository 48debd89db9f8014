/**
 * @file main.cpp
 * @brief Main entry point for windowpain.
 *
 * This file contains the main function that handles command-line parsing,
 * command aliases (scan -> index), logging initialization, the implicit
 * self-test and the mapping of errors to process exit codes.
 */

#include <argparse/argparse.hpp>

#include "utils/common.hpp"
#include "dist/version.h"

#include "commands/TestCommand.hpp"

#include <iostream>

extern argparse::ArgumentParser program;
extern int verbosity;

/**
 * @brief Main entry point for windowpain.
 *
 * @param argc Argument count.
 * @param argv Argument vector.
 * @return One of ExitCode.
 */
int main(int argc, char*argv[]) {
    register_program_args(program);

    for (const auto& [name, cmd] : Command::registry()) {
        program.add_subparser(cmd->parser());
    }

    std::vector<std::string> args(argv, argv + argc);
    if( args.size() > 1 ){
        // "scan" is an alias for "index"
        auto it = Command::aliases().find(args[1]);
        if( it != Command::aliases().end() ){
            args[1] = it->second;
        }
    }

    try {
        program.parse_args(args);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return EXIT_USAGE;
    }

    logger->set_arguments(argc, argv);
    logger->set_banner(APP_NAME " " APP_VERSION);
    logger->set_verbosity(verbosity); // should be before logger->add_file() call
    logger->set_dedup_limit(program.get<int>("--log-dedup-limit"));
    try {
        if( program.is_used("--log") ){
            init_log(program.get<std::string>("--log"));
        }
    } catch (const std::exception& e) {
        logger->critical("{}", e.what());
        return EXIT_IO_ERROR;
    }

    auto& selfTestCmd = Command::registry()[TEST_CMD_NAME];
    for (const auto& [name, cmd] : Command::registry()) {
        if (program.is_subcommand_used(name)) {
            if( name == TEST_CMD_NAME ){
                // explicit self-test, make it visible
                logger->set_verbosity(9);
            } else {
                // implicit self-test, make it silent
                const int rc = selfTestCmd->run();
                if( rc != EXIT_OK ){
                    logger->critical("self-test failed, exiting");
                    return rc;
                }
            }

            const int rc = Command::run_checked(cmd);
            logger->flush();
            return rc;
        }
    }

    std::cout << program;
    return EXIT_USAGE;
}
