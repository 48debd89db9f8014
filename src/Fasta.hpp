#pragma once
#include <cstdint>
#include <cstddef>

namespace Fasta {

constexpr char MARKER     = '>';  // first byte of a header line
constexpr char TERMINATOR = '\n'; // line terminator; '\r' is payload

constexpr size_t DEFAULT_CHUNK_SIZE = 1024 * 1024; // 1MB

} // namespace Fasta

#include "Fasta/SequenceRecord.hpp"
#include "Fasta/Index.hpp"
