#include "partition/partitioner.hpp"

#include "compression/huffman/code_table.hpp"
#include "partition/part_format.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace auraseal::partition {

std::vector<Part> split(const compression::huffman::CompressionResult& encoded,
                        std::uint8_t componentId,
                        std::size_t maxPartSize,
                        std::uint8_t parityCount)
{
    if (maxPartSize == 0U || maxPartSize > kMaxPartPayload) {
        throw std::invalid_argument("Part size must be within 1.." + std::to_string(kMaxPartPayload) + " bytes");
    }

    const auto& compressed = encoded.compressed;
    const auto totalParts = std::max<std::size_t>(1U, (compressed.size() + maxPartSize - 1U) / maxPartSize);
    if (totalParts > kMaxTotalParts) {
        throw std::length_error("Compressed component needs " + std::to_string(totalParts) + " parts, limit is "
                                + std::to_string(kMaxTotalParts));
    }
    if (parityCount > 0U && totalParts + parityCount > kMaxTotalParts) {
        throw std::length_error("Data and parity parts exceed " + std::to_string(kMaxTotalParts));
    }

    PartHeader header {};
    header.kind = PartKind::Data;
    header.componentId = componentId;
    header.totalParts = static_cast<std::uint16_t>(totalParts);
    header.parityCount = parityCount;
    header.fullSize = encoded.metadata.originalSize;
    header.compressedSize = static_cast<std::uint64_t>(compressed.size());
    header.codeTable = compression::huffman::packCodeLengths(encoded.metadata.codeLengths);
    header.recoveryBits = makeRecoveryBits(totalParts, parityCount);

    std::vector<Part> parts;
    parts.reserve(totalParts);
    for (std::size_t index = 0; index < totalParts; ++index) {
        const auto offset = index * maxPartSize;
        const auto length = std::min(maxPartSize, compressed.size() - std::min(offset, compressed.size()));

        Part part {};
        part.header = header;
        part.header.partNumber = static_cast<std::uint8_t>(index);
        part.payload.assign(compressed.begin() + static_cast<std::ptrdiff_t>(offset),
                            compressed.begin() + static_cast<std::ptrdiff_t>(offset + length));
        sealPart(part);
        parts.emplace_back(std::move(part));
    }
    return parts;
}

std::size_t expectedPayloadSize(const PartHeader& header, std::size_t partNumber, std::size_t shardSize)
{
    const auto offset = static_cast<std::uint64_t>(partNumber) * shardSize;
    if (offset >= header.compressedSize) {
        return 0;
    }
    return static_cast<std::size_t>(std::min<std::uint64_t>(shardSize, header.compressedSize - offset));
}

std::vector<std::uint8_t> concatenatePayloads(const std::vector<Part>& parts)
{
    std::vector<std::uint8_t> stream;
    for (std::size_t index = 0; index < parts.size(); ++index) {
        const auto& part = parts[index];
        if (part.header.kind != PartKind::Data || part.header.partNumber != index) {
            throw std::invalid_argument("Parts are not an ordered data sequence at position " + std::to_string(index));
        }
        stream.insert(stream.end(), part.payload.begin(), part.payload.end());
    }
    return stream;
}

compression::huffman::HuffmanMetadata metadataOf(const PartHeader& header)
{
    compression::huffman::HuffmanMetadata metadata {};
    metadata.codeLengths = compression::huffman::unpackCodeLengths(header.codeTable);
    metadata.originalSize = header.fullSize;
    return metadata;
}

} // namespace auraseal::partition
