#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "Fasta.hpp"
#include "io/SourceFile.hpp"

// builds the record index of a FASTA file by mapping it chunk by chunk
class BoundaryScanner {
    public:
    explicit BoundaryScanner(const SourceFile& file, size_t chunk_size = Fasta::DEFAULT_CHUNK_SIZE);

    Fasta::Index scan();

    void show_progress(bool enable) { m_show_progress = enable; }
    size_t restarts() const { return m_restarts; }

    private:
    // carried from one chunk to the next
    struct State {
        bool open = false;          // a record has been started and not yet closed
        uint64_t start_offset = 0;  // of the open record
        uint64_t terminators = 0;   // '\n' bytes seen inside the open record so far
        std::string header;         // of the open record, committed when it is closed
    };

    // returns the marker position to restart from if a header line runs past the chunk end
    std::optional<uint64_t> scan_chunk(const char* data, uint64_t aligned_offset, size_t begin, size_t length);

    void open_record(std::string header, uint64_t start_offset);
    void close_record(uint64_t end_pos);

    const SourceFile& m_file;
    const size_t m_chunk_size;
    const size_t m_page_size;

    State m_state;
    std::vector<Fasta::SequenceRecord> m_records;
    size_t m_restarts = 0;
    bool m_show_progress = false;
};
