#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

#include "Fasta.hpp"
#include "core/buf_t.hpp"
#include "io/SourceFile.hpp"

// extracts terminator-stripped windows of a record's payload
class WindowReader {
    public:
    explicit WindowReader(const SourceFile& file) : m_file(file) {}

    class OutOfBounds : public std::runtime_error {
        public:
        explicit OutOfBounds(const std::string& msg) : std::runtime_error(msg) {}
    };

    // start is relative to record.start_offset in raw file bytes,
    // size defaults to everything from start to the end of the record
    buf_t read(const Fasta::SequenceRecord& record, uint64_t start = 0, std::optional<uint64_t> size = std::nullopt) const;

    private:
    const SourceFile& m_file;
};
