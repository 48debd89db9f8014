/**
 * @file BoundaryScanner.cpp
 * @brief Chunked, page-aligned scan of a FASTA file for record boundaries.
 *
 * The file is mapped one chunk at a time so that memory use stays bounded on
 * files of any size. A logical cursor (current_pos) tracks how far the file has
 * been consumed; each chunk mapping starts at the page boundary below it and the
 * scan inside the chunk starts at the cursor, so no byte is processed twice.
 *
 * A header line is only ever read from a single mapping. When its terminator is
 * not inside the current chunk, the chunk is abandoned and the loop restarts at
 * the header's '>' so that the next mapping contains the whole line.
 */

#include "BoundaryScanner.hpp"
#include "utils/common.hpp"
#include "utils/Progress.hpp"

#include <algorithm>
#include <cstring>
#include <memory>

BoundaryScanner::BoundaryScanner(const SourceFile& file, size_t chunk_size)
    : m_file(file), m_chunk_size(chunk_size), m_page_size(mio::page_size())
{
    if( chunk_size == 0 ){
        throw std::invalid_argument("chunk size must be positive");
    }
}

void BoundaryScanner::open_record(std::string header, uint64_t start_offset) {
    logger->trace("{:#x}: {}", start_offset, filter_unprintable(header));

    m_state.open = true;
    m_state.start_offset = start_offset;
    m_state.terminators = 0;
    m_state.header = std::move(header);
}

/**
 * @brief Closes the open record (if any) and appends it to the result.
 *
 * @param end_pos Absolute position of the next record's marker, or the file size.
 */
void BoundaryScanner::close_record(uint64_t end_pos) {
    if( !m_state.open ){
        return;
    }

    const uint64_t raw_span = end_pos - m_state.start_offset;
    m_records.push_back(Fasta::SequenceRecord{
        std::move(m_state.header),
        m_state.start_offset,
        raw_span - m_state.terminators,
    });
    m_state = State{};
}

/**
 * @brief Scans one mapped chunk.
 *
 * '\n' bytes are counted against the open record. A '>' closes the open record
 * at the marker position and opens a new one right after the header line.
 * Reaching the end of the chunk closes nothing: the record stays open in
 * m_state for the next chunk.
 *
 * @param data Start of the mapping (page-aligned in the file).
 * @param aligned_offset File offset of data[0].
 * @param begin Index of the first unconsumed byte (the offset adjustment).
 * @param length Mapped length.
 * @return Absolute marker position to restart from if a header line is cut by
 *         the end of the chunk, nullopt if the chunk was consumed entirely.
 */
std::optional<uint64_t> BoundaryScanner::scan_chunk(const char* data, uint64_t aligned_offset, size_t begin, size_t length) {
    const bool last_chunk = aligned_offset + length == m_file.size();

    size_t i = begin;
    while( i < length ){
        const char c = data[i];
        if( c == Fasta::TERMINATOR ){
            m_state.terminators++;
            i++;
            continue;
        }
        if( c != Fasta::MARKER ){
            i++;
            continue;
        }

        const uint64_t marker_pos = aligned_offset + i;
        const char* eol = static_cast<const char*>(memchr(data + i, Fasta::TERMINATOR, length - i));
        if( !eol && !last_chunk ){
            return marker_pos;
        }

        close_record(marker_pos);
        if( eol ){
            const size_t header_end = eol - data;
            open_record(std::string(data + i, header_end - i), aligned_offset + header_end + 1);
            i = header_end + 1;
        } else {
            // header is the last line of the file and has no terminator
            open_record(std::string(data + i, length - i), aligned_offset + length);
            i = length;
        }
    }
    return std::nullopt;
}

/**
 * @brief Scans the whole file and returns its records in file order.
 *
 * Each chunk is mapped as [aligned_offset, aligned_offset + min(span + offset_adjustment, remaining))
 * and unmapped before the next one is mapped. span is the configured chunk
 * size; it is doubled only when a restart lands on the very position the chunk
 * started at, i.e. when a single header line is longer than the chunk.
 *
 * The scanner is reusable: every call starts from a clean state.
 *
 * @return The index.
 * @throws SourceFile::IOError If a chunk can't be mapped.
 */
Fasta::Index BoundaryScanner::scan() {
    m_state = State{};
    m_records.clear();
    m_restarts = 0;

    const uint64_t file_size = m_file.size();
    std::unique_ptr<Progress> progress;
    if( m_show_progress ){
        progress = std::make_unique<Progress>(file_size);
    }

    uint64_t current_pos = 0;
    size_t span = m_chunk_size;
    while( current_pos < file_size ){
        const auto [aligned_offset, offset_adjustment] = SourceFile::align_to_page(current_pos, m_page_size);
        const size_t length = std::min<uint64_t>(span + offset_adjustment, file_size - aligned_offset);

        std::optional<uint64_t> restart_pos;
        {
            const mio::mmap_source chunk = m_file.map(aligned_offset, length);
            logger->trace("chunk {:#x}+{:#x}, scanning from {:#x}", aligned_offset, length, current_pos);
            restart_pos = scan_chunk(chunk.data(), aligned_offset, offset_adjustment, length);
        }

        if( restart_pos ){
            m_restarts++;
            if( *restart_pos == current_pos ){
                span *= 2;
                logger->debug("{:#x}: header line longer than {:#x} bytes, retrying with a {:#x} byte chunk", *restart_pos, span / 2, span);
            } else {
                span = m_chunk_size;
                logger->debug("{:#x}: header line crosses chunk end {:#x}, restarting chunk at the marker", *restart_pos, aligned_offset + length);
            }
            current_pos = *restart_pos;
            continue;
        }

        span = m_chunk_size;
        current_pos = aligned_offset + length;
        if( progress ){
            progress->update(current_pos, m_records.size());
        }
    }

    close_record(file_size);
    if( progress ){
        progress->finish(m_records.size());
    }

    logger->debug("{}: {} records", m_file.path(), m_records.size());
    return Fasta::Index(std::move(m_records));
}
