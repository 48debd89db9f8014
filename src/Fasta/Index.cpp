/**
 * @file Index.cpp
 * @brief JSON persistence of the sequence index.
 *
 * The index file is a JSON array with one object per record, fields in this
 * order: "header" (string, including the leading '>'), "position" (raw file
 * offset of the first payload byte) and "length" (payload length without line
 * terminators). Extra fields are ignored on load so that newer writers stay
 * readable; missing or mistyped fields make the whole index invalid.
 */

#include "Index.hpp"
#include "io/SourceFile.hpp"
#include "io/Writer.hpp"
#include "utils/common.hpp"

#include <nlohmann/json.hpp>

namespace Fasta {

void to_json(nlohmann::ordered_json& j, const SequenceRecord& rec) {
    j = nlohmann::ordered_json{
        {"header",   rec.header},
        {"position", rec.start_offset},
        {"length",   rec.logical_length},
    };
}

static const nlohmann::json& required_field(const nlohmann::json& j, const char* name, size_t idx) {
    auto it = j.find(name);
    if (it == j.end()) {
        throw Index::ParseError(fmt::format("record #{}: missing \"{}\"", idx, name));
    }
    return *it;
}

static SequenceRecord parse_record(const nlohmann::json& j, size_t idx) {
    if (!j.is_object()) {
        throw Index::ParseError(fmt::format("record #{}: expected an object, got {}", idx, j.type_name()));
    }

    const auto& header = required_field(j, "header", idx);
    const auto& position = required_field(j, "position", idx);
    const auto& length = required_field(j, "length", idx);

    if (!header.is_string()) {
        throw Index::ParseError(fmt::format("record #{}: \"header\" must be a string", idx));
    }
    if (!position.is_number_unsigned()) {
        throw Index::ParseError(fmt::format("record #{}: \"position\" must be an unsigned integer", idx));
    }
    if (!length.is_number_unsigned()) {
        throw Index::ParseError(fmt::format("record #{}: \"length\" must be an unsigned integer", idx));
    }

    return SequenceRecord{
        header.get<std::string>(),
        position.get<uint64_t>(),
        length.get<uint64_t>(),
    };
}

const SequenceRecord& Index::at(size_t pos) const {
    if (pos >= m_records.size()) {
        if (m_records.empty()) {
            throw OutOfRange(fmt::format("Sequence index {} is out of range (index is empty)", pos));
        }
        throw OutOfRange(fmt::format("Sequence index {} is out of range (valid: 0..{})", pos, m_records.size() - 1));
    }
    return m_records[pos];
}

/**
 * @brief Serializes the index.
 *
 * @param indent Spaces per nesting level, negative for a single line.
 * @return JSON text.
 * @throws std::runtime_error If a header is not valid UTF-8 (JSON strings must be).
 */
std::string Index::to_json(int indent) const {
    nlohmann::ordered_json j = nlohmann::ordered_json::array();
    for (const auto& rec : m_records) {
        j.push_back(rec);
    }

    try {
        return j.dump(indent);
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error(fmt::format("can't serialize index: {}", e.what()));
    }
}

/**
 * @brief Parses an index from JSON text.
 *
 * Either the whole text is a valid index or ParseError is thrown; no partial
 * result is ever returned.
 *
 * @param text JSON text.
 * @return Parsed index.
 * @throws Index::ParseError On malformed JSON or a malformed record.
 */
Index Index::from_json(std::string_view text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(e.what());
    }

    if (!j.is_array()) {
        throw ParseError(fmt::format("expected a JSON array of records, got {}", j.type_name()));
    }

    std::vector<SequenceRecord> records;
    records.reserve(j.size());
    for (size_t i = 0; i < j.size(); i++) {
        records.push_back(parse_record(j[i], i));
    }
    return Index(std::move(records));
}

/**
 * @brief Writes the index as pretty-printed JSON.
 *
 * @param fname Output pathname, truncated if it exists.
 * @throws SourceFile::IOError On any write error.
 */
void Index::save(const std::filesystem::path& fname) const {
    const std::string text = to_json();

    Writer w(fname);
    w.write(text);
    w.write("\n");
    w.close();
    logger->debug("saved {} records ({}) to {}", m_records.size(), bytes2human(text.size() + 1, " bytes"), fname);
}

/**
 * @brief Loads an index written by save().
 *
 * @param fname Index pathname.
 * @return Loaded index.
 * @throws SourceFile::IOError If the file can't be opened or mapped.
 * @throws Index::ParseError If the content is not a valid index.
 */
Index Index::load(const std::filesystem::path& fname) {
    SourceFile file(fname);
    if (file.size() == 0) {
        throw ParseError(fmt::format("{}: empty index file", fname));
    }

    Index index;
    {
        const mio::mmap_source mapping = file.map(0, file.size());
        try {
            index = from_json(std::string_view(mapping.data(), mapping.size()));
        } catch (const ParseError& e) {
            throw ParseError(fmt::format("{}: {}", fname, e.what()));
        }
    }
    logger->debug("loaded {} records from {}", index.size(), fname);
    return index;
}

} // namespace Fasta
