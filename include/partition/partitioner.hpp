#pragma once

#include "compression/huffman/types.hpp"
#include "partition/types.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace auraseal::partition {

// Splits an encoded component into sealed data parts numbered in emission
// order. Every part but the last carries exactly maxPartSize bytes; an
// empty stream yields one empty part. `parityCount` is recorded in each
// header for the parity parts generated afterwards.
std::vector<Part> split(const compression::huffman::CompressionResult& encoded,
                        std::uint8_t componentId,
                        std::size_t maxPartSize = kMaxPartPayload,
                        std::uint8_t parityCount = 0);

// Payload length data part `partNumber` must have, given the stripe shard
// size (the first part's payload length).
std::size_t expectedPayloadSize(const PartHeader& header, std::size_t partNumber, std::size_t shardSize);

// Payloads in part_number order; throws std::invalid_argument on gaps.
std::vector<std::uint8_t> concatenatePayloads(const std::vector<Part>& parts);

compression::huffman::HuffmanMetadata metadataOf(const PartHeader& header);

} // namespace auraseal::partition
