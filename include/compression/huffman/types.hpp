#pragma once

#include <array>
#include <cstdint>
#include <vector>

namespace auraseal::compression::huffman {

inline constexpr std::size_t kAlphabetSize = 256;
inline constexpr std::uint8_t kMaxCodeLength = 15;
inline constexpr std::size_t kPackedTableSize = kAlphabetSize / 2;

using FrequencyTable = std::array<std::uint64_t, kAlphabetSize>;

// Bit length per symbol; 0 means the symbol does not occur.
using CodeLengthTable = std::array<std::uint8_t, kAlphabetSize>;

// Two 4-bit lengths per byte, even symbol in the high nibble.
using PackedCodeTable = std::array<std::uint8_t, kPackedTableSize>;

struct CanonicalCode {
    std::uint16_t bits {0};
    std::uint8_t length {0};
};

using CanonicalCodeTable = std::array<CanonicalCode, kAlphabetSize>;

struct HuffmanMetadata {
    CodeLengthTable codeLengths {};
    std::uint64_t originalSize {0};
};

struct CompressionResult {
    HuffmanMetadata metadata;
    std::vector<std::uint8_t> compressed;
};

} // namespace auraseal::compression::huffman
