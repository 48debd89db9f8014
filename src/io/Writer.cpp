/**
 * @file Writer.cpp
 * @brief Plain POSIX file writer used to persist indexes.
 */

#include "Writer.hpp"
#include "SourceFile.hpp"
#include "utils/common.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

/**
 * @brief Creates or opens a file for writing.
 *
 * @param fname Path to file to create/open.
 * @param truncate If true, truncates an existing file.
 * @throws SourceFile::IOError If the file can't be created/opened.
 */
Writer::Writer(const std::filesystem::path& fname, bool truncate) : m_fname(fname) {
    int mode = O_WRONLY | O_CREAT | (truncate ? O_TRUNC : 0);
    m_fd = open(fname.c_str(), mode, 0644);
    if (m_fd == -1) {
        throw SourceFile::IOError(fmt::format("Writer: open(\"{}\", {:#x}, 0644): {}", fname, mode, strerror(errno)));
    }
}

/**
 * @brief Writes the whole buffer at the current position.
 *
 * Large writes are split into 1GB pieces; EINTR is retried.
 *
 * @param buf Data to write.
 * @param count Number of bytes.
 * @throws SourceFile::IOError On write error or if write() makes no progress.
 */
void Writer::write(const void* buf, size_t count) const {
    constexpr size_t CHUNK_SIZE = 1ULL << 30; // 1 GB
    const char* ptr = static_cast<const char*>(buf);
    size_t remaining = count;

    while (remaining > 0) {
        ssize_t nwritten = ::write(m_fd, ptr, std::min(remaining, CHUNK_SIZE));
        if (nwritten == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw SourceFile::IOError(fmt::format("Writer: write(\"{}\", {} bytes): {}", m_fname, remaining, strerror(errno)));
        }
        if (nwritten == 0) {
            throw SourceFile::IOError(fmt::format("Writer: write(\"{}\", {} bytes): write returned 0 bytes", m_fname, remaining));
        }
        ptr += nwritten;
        remaining -= nwritten;
    }
}

void Writer::close() {
    if( m_fd == -1 )
        return;

    const int fd = m_fd;
    m_fd = -1;
    if( ::close(fd) == -1 ){
        throw SourceFile::IOError(fmt::format("Writer: close(\"{}\"): {}", m_fname, strerror(errno)));
    }
}

Writer::~Writer() {
    if( m_fd != -1 ){
        ::close(m_fd);
        m_fd = -1;
    }
}
