/**
 * @file SourceFile.cpp
 * @brief Read-only access to a FASTA source file through page-aligned mappings.
 *
 * The file is opened once and sized with fstat(). Regions are mapped with mio
 * on request; callers (the boundary scanner and the window reader) compute a
 * page-aligned start with align_to_page() and keep the returned mapping only
 * for the duration of one chunk or one window.
 */

#include "SourceFile.hpp"
#include "utils/common.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

/**
 * @brief Opens the file for reading and determines its size.
 *
 * @param fname Path to the FASTA file.
 * @throws SourceFile::IOError If the file can't be opened or sized.
 */
SourceFile::SourceFile(const std::filesystem::path& fname) : m_fname(fname) {
    m_fd = open(fname.c_str(), O_RDONLY);
    if( m_fd == -1 ) {
        throw IOError(fmt::format("open(\"{}\", O_RDONLY): {}", fname, strerror(errno)));
    }

    struct stat st;
    if( fstat(m_fd, &st) == -1 ) {
        const int err = errno;
        close(m_fd);
        throw IOError(fmt::format("fstat(\"{}\"): {}", fname, strerror(err)));
    }
    if( !S_ISREG(st.st_mode) ) {
        close(m_fd);
        throw IOError(fmt::format("\"{}\": not a regular file", fname));
    }
    m_size = st.st_size;
    logger->debug("opened {}: {} bytes ({})", fname, m_size, bytes2human(m_size));
}

SourceFile::~SourceFile() {
    if( m_fd != -1 ) {
        close(m_fd);
    }
}

/**
 * @brief Rounds a file position down to the page boundary that a mapping must start at.
 *
 * @param pos Absolute file position.
 * @param page_size Page size of the host.
 * @return aligned_offset = floor(pos / page_size) * page_size, offset_adjustment = pos - aligned_offset.
 */
SourceFile::PageWindow SourceFile::align_to_page(uint64_t pos, size_t page_size) {
    const uint64_t aligned = (pos / page_size) * page_size;
    return PageWindow{ aligned, static_cast<size_t>(pos - aligned) };
}

/**
 * @brief Maps a region of the file read-only.
 *
 * @param aligned_offset Page-aligned start of the region.
 * @param length Number of bytes to map, must be non-zero and within the file.
 * @return Mapping owning the region; unmapped by its destructor.
 * @throws SourceFile::IOError If the region is invalid or mmap() fails.
 */
mio::mmap_source SourceFile::map(uint64_t aligned_offset, size_t length) const {
    // mio treats a zero length as "map the entire file"
    if( length == 0 || aligned_offset + length > m_size ) {
        throw IOError(fmt::format("{}: invalid mapping {:#x}+{:#x} (file size {:#x})", m_fname, aligned_offset, length, m_size));
    }

    std::error_code error;
    mio::mmap_source mapping = mio::make_mmap_source(m_fd, aligned_offset, length, error);
    if( error ) {
        throw IOError(fmt::format("{}: mmap({:#x}+{:#x}): {}", m_fname, aligned_offset, length, error.message()));
    }
    return mapping;
}
