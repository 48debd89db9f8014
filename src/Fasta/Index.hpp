#pragma once
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "SequenceRecord.hpp"

namespace Fasta {

    // records of one source file, in file order; immutable once built
    class Index {
        public:
        class ParseError : public std::runtime_error {
            public:
            explicit ParseError(const std::string& msg) : std::runtime_error(msg) {}
        };

        class OutOfRange : public std::runtime_error {
            public:
            explicit OutOfRange(const std::string& msg) : std::runtime_error(msg) {}
        };

        Index() = default;
        explicit Index(std::vector<SequenceRecord> records) : m_records(std::move(records)) {}

        size_t size() const { return m_records.size(); }
        bool empty() const { return m_records.empty(); }

        // record at a position, throws OutOfRange with the valid range
        const SequenceRecord& at(size_t pos) const;

        const std::vector<SequenceRecord>& records() const { return m_records; }
        std::vector<SequenceRecord>::const_iterator begin() const { return m_records.begin(); }
        std::vector<SequenceRecord>::const_iterator end() const { return m_records.end(); }

        bool operator==(const Index& other) const = default;

        // [{"header": ..., "position": ..., "length": ...}, ...]
        // indent < 0 gives the compact form
        std::string to_json(int indent = 2) const;
        static Index from_json(std::string_view text);

        void save(const std::filesystem::path& fname) const;
        static Index load(const std::filesystem::path& fname);

        private:
        std::vector<SequenceRecord> m_records;
    };

} // namespace Fasta
