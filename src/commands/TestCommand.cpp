/**
 * @file TestCommand.cpp
 * @brief Implementation of the TestCommand for system self-testing.
 *
 * Verifies that the host can run the tool at all: file offsets and sizes must
 * be 64-bit so that files larger than 4Gb are indexed correctly, and the page
 * size reported for mappings must be a power of two. The self-test runs
 * silently before every other command, so no file is touched on an unsupported
 * host. Hosts without POSIX memory mapping are rejected when configuring the
 * build.
 */

#include "TestCommand.hpp"
#include "utils/common.hpp"

#include <mio/page.hpp>
#include <sys/types.h>

REGISTER_COMMAND(TestCommand);

/**
 * @brief Constructs a TestCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
TestCommand::TestCommand(bool reg) : Command(reg, TEST_CMD_NAME, "self-test") {
}

/**
 * @brief Executes the self-test.
 *
 * @return EXIT_OK if all checks pass, EXIT_UNSUPPORTED_PLATFORM otherwise.
 */
int TestCommand::run() {
    logger->trace("selftest: sizeof(off_t)     = {}", sizeof(off_t));
    logger->trace("selftest: sizeof(size_t)    = {}", sizeof(size_t));
    logger->trace("selftest: sizeof(uint64_t)  = {}", sizeof(uint64_t));
    logger->trace("selftest: page size         = {}", mio::page_size());

    if( sizeof(off_t) != 8 ){
        logger->critical("selftest: sizeof(off_t) != 8");
        return EXIT_UNSUPPORTED_PLATFORM;
    }

    if( sizeof(size_t) != 8 ){
        logger->critical("selftest: sizeof(size_t) != 8");
        return EXIT_UNSUPPORTED_PLATFORM;
    }

    const size_t page_size = mio::page_size();
    if( page_size == 0 || (page_size & (page_size - 1)) != 0 ){
        logger->critical("selftest: unusable page size {}", page_size);
        return EXIT_UNSUPPORTED_PLATFORM;
    }

    logger->trace("selftest: OK");
    return EXIT_OK;
}
