/**
 * @file Progress.cpp
 * @brief Progress indicator for long-running scans.
 *
 * Displays the current position, completion percentage, throughput, estimated
 * time remaining and the number of records found so far. Output goes to stderr
 * so that it never mixes with data written to stdout.
 */

#include "Progress.hpp"
#include "common.hpp"

#include <array>
#include <cstdio>
#include <string_view>

static constexpr std::array<std::string_view, 10> SPINNER = {
    "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏"
};

/**
 * @brief Updates and displays the progress indicator.
 *
 * Throttled to approximately 10Hz unless final is true.
 *
 * @param offset Current file position.
 * @param nrecords Records found so far.
 * @param final If true, forces update and ends the line.
 */
void Progress::update(uint64_t offset, size_t nrecords, bool final){
    struct timespec cur_time;
    clock_gettime(CLOCK_MONOTONIC, &cur_time);

    uint64_t dt = (cur_time.tv_sec - m_prev_time.tv_sec) * 1000000000L + (cur_time.tv_nsec - m_prev_time.tv_nsec);
    if( dt < 100000000 && !final ){
        return;
    }

    dt = (cur_time.tv_sec - m_start_time.tv_sec) * 1000000000L + (cur_time.tv_nsec - m_start_time.tv_nsec);

    std::string eta;
    m_prev_time = cur_time;
    dt /= 1000000000; // elapsed time in seconds
    if( dt == 0 ) dt = 1;

    const uint64_t remaining_work = m_fsize - offset;
    const uint64_t speed = (offset - m_start_offset) / dt;
    if( speed > 0 ){
        eta = seconds2human(remaining_work / speed, 1);
    } else {
        eta = "?";
    }

    fmt::print(stderr, "[{}] {:012x}/{:012x} = {:.1f}%, {}Mb/s, elapsed: {}, eta: {}, records: {}" ANSI_CLEAR_EOL "{}",
        SPINNER[m_spinner_idx++],
        offset,
        m_fsize,
        m_fsize ? 100.0*offset/m_fsize : 100.0,
        speed/1024/1024,
        seconds2human(dt),
        eta,
        nrecords,
        final ? "\n" : "\r"
        );
    fflush(stderr);

    if( m_spinner_idx >= SPINNER.size() ){
        m_spinner_idx = 0;
    }
}
