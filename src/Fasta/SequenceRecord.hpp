#pragma once
#include <cstdint>
#include <string>

#include <spdlog/fmt/fmt.h>

namespace Fasta {

    // one sequence of the source file
    //
    // the raw span [start_offset, start_offset + logical_length + <embedded '\n' count>)
    // holds the payload and ends where the next record's '>' starts (or at EOF)
    struct SequenceRecord {
        std::string header;      // ">id description", no trailing '\n'
        uint64_t start_offset;   // first payload byte, right after the header's '\n'
        uint64_t logical_length; // payload bytes, '\n' excluded

        bool operator==(const SequenceRecord& other) const = default;

        std::string to_string() const {
            return fmt::format("<SequenceRecord header: \"{}\", start_offset: {:#x}, logical_length: {}>",
                header, start_offset, logical_length);
        }
    };

} // namespace Fasta

template <>
struct fmt::formatter<Fasta::SequenceRecord> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const Fasta::SequenceRecord& rec, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(rec.to_string(), ctx);
    }
};
