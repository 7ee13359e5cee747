#pragma once

#include "compression/huffman/types.hpp"

#include <cstdint>
#include <vector>

namespace auraseal::compression::huffman {

CompressionResult encodeBuffer(const std::vector<std::uint8_t>& input);

// Throws CodecCorruptError when the stream cannot be decoded with the
// given code lengths.
std::vector<std::uint8_t> decodeBuffer(const HuffmanMetadata& metadata, const std::vector<std::uint8_t>& compressed);

} // namespace auraseal::compression::huffman
