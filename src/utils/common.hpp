#pragma once
#include "io/Logger.hpp"
#include "units.hpp"
#include "core/buf_t.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace fs = std::filesystem;

#include <argparse/argparse.hpp>

#define APP_NAME "windowpain"

#define ANSI_CLEAR_EOL     "\x1b[0K"

// process exit codes, one per error kind
enum ExitCode : int {
    EXIT_OK                   = 0,
    EXIT_USAGE                = 1,
    EXIT_IO_ERROR             = 2,
    EXIT_BAD_INDEX            = 3,
    EXIT_RECORD_OUT_OF_RANGE  = 4,
    EXIT_WINDOW_OUT_OF_BOUNDS = 5,
    EXIT_UNSUPPORTED_PLATFORM = 6,
};

extern std::shared_ptr<Logger> logger;
void init_log(const std::string& log_fname = "");
void register_program_args(argparse::ArgumentParser &parser);
void register_common_args(argparse::ArgumentParser &parser);

std::string filter_unprintable(const std::string& str);
