/**
 * @file WindowReader.cpp
 * @brief Reads a window of a record's payload with line terminators removed.
 *
 * The first mapping covers exactly capped_size bytes after the requested
 * position (plus the page offset adjustment). Every '\n' found in it leaves one
 * output byte short, so the reader keeps mapping the bytes that follow until
 * the window is full, the next record's marker is reached or the file ends.
 * Only one mapping exists at a time and each is released before the next one
 * is created. Running out of payload before the window is full means the index
 * was not built from this file, which is reported as an I/O error.
 *
 * Note that `start` is a raw byte offset relative to the record's first payload
 * byte, while the bounds check compares it against the logical (stripped)
 * length. A caller that advances start by the number of bytes returned drifts
 * back by one byte per skipped line terminator.
 */

#include "WindowReader.hpp"
#include "utils/common.hpp"

#include <algorithm>

/**
 * @brief Returns up to `size` payload bytes of `record` starting at raw offset `start`.
 *
 * @param record Record to read from.
 * @param start Raw offset relative to record.start_offset.
 * @param size Requested number of bytes, capped to logical_length - start.
 * @return Buffer with no '\n' bytes; empty if the capped size is zero.
 * @throws WindowReader::OutOfBounds If start >= record.logical_length.
 * @throws SourceFile::IOError If a region can't be mapped, or the record runs
 *         past the end of the file or into the next record.
 */
buf_t WindowReader::read(const Fasta::SequenceRecord& record, uint64_t start, std::optional<uint64_t> size) const {
    if( start >= record.logical_length ){
        throw OutOfBounds(fmt::format("window start {} is out of bounds for \"{}\" (length {})",
            start, filter_unprintable(record.header), record.logical_length));
    }

    const uint64_t remaining = record.logical_length - start;
    const uint64_t capped_size = size ? std::min(*size, remaining) : remaining;

    buf_t result;
    if( capped_size == 0 ){
        return result;
    }
    result.reserve(capped_size);

    const uint64_t file_size = m_file.size();
    uint64_t pos = record.start_offset + start;
    bool stop = false;
    while( !stop && result.size() < capped_size && pos < file_size ){
        const auto [aligned_offset, offset_adjustment] = SourceFile::align_to_page(pos);
        const uint64_t need = capped_size - result.size();
        const size_t length = std::min<uint64_t>(need + offset_adjustment, file_size - aligned_offset);

        const mio::mmap_source window = m_file.map(aligned_offset, length);
        logger->trace("window {:#x}+{:#x}, reading from {:#x}", aligned_offset, length, pos);

        size_t i = offset_adjustment;
        for( ; i < length && result.size() < capped_size; i++ ){
            const char c = window[i];
            if( c == Fasta::TERMINATOR ){
                continue;
            }
            if( c == Fasta::MARKER ){
                stop = true;
                break;
            }
            result.push_back(static_cast<uint8_t>(c));
        }
        pos = aligned_offset + i;
    }

    // a record from a matching index always has capped_size payload bytes here
    if( result.size() < capped_size ){
        throw SourceFile::IOError(fmt::format("{}: \"{}\" window {}+{}: only {} bytes before {}, index does not match the file",
            m_file.path(), filter_unprintable(record.header), start, capped_size, result.size(),
            stop ? "the next record" : "end of file"));
    }
    return result;
}
