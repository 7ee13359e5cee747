#pragma once

#include "compression/huffman/types.hpp"

#include <cstdint>
#include <vector>

namespace auraseal::compression::huffman {

FrequencyTable countFrequencies(const std::vector<std::uint8_t>& input);

// Optimal prefix code lengths, limited to kMaxCodeLength bits. Identical
// frequency tables always yield identical length tables.
CodeLengthTable buildCodeLengths(const FrequencyTable& frequencies);

// Canonical codes ordered by (length, symbol). Throws CodecCorruptError
// when the lengths are over-subscribed or exceed kMaxCodeLength.
CanonicalCodeTable assignCanonicalCodes(const CodeLengthTable& lengths);

PackedCodeTable packCodeLengths(const CodeLengthTable& lengths);
CodeLengthTable unpackCodeLengths(const PackedCodeTable& packed);

} // namespace auraseal::compression::huffman
