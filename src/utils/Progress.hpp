#pragma once
#include <time.h>
#include <cstddef>
#include <cstdint>

// single-line progress indicator on stderr, redrawn at most ~10 times per second
class Progress {
    public:
    Progress(uint64_t fsize, uint64_t start_offset = 0) : m_fsize(fsize), m_start_offset(start_offset) {
        clock_gettime(CLOCK_MONOTONIC, &m_start_time);
        m_prev_time = m_start_time;
    }
    void update(uint64_t offset, size_t nrecords, bool final = false);
    void finish(size_t nrecords) { update(m_fsize, nrecords, true); }

    private:
    timespec m_start_time, m_prev_time;
    uint64_t m_fsize;
    uint64_t m_start_offset;
    size_t m_spinner_idx = 0;
};
