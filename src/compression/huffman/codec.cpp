#include "compression/huffman/codec.hpp"

#include "compression/huffman/bit_stream.hpp"
#include "compression/huffman/code_index.hpp"
#include "compression/huffman/code_table.hpp"
#include "errors.hpp"

#include <string>

namespace auraseal::compression::huffman {

CompressionResult encodeBuffer(const std::vector<std::uint8_t>& input)
{
    CompressionResult result {};
    result.metadata.originalSize = static_cast<std::uint64_t>(input.size());

    if (input.empty()) {
        return result;
    }

    result.metadata.codeLengths = buildCodeLengths(countFrequencies(input));
    const auto codes = assignCanonicalCodes(result.metadata.codeLengths);

    BitWriter writer;
    for (const auto value : input) {
        const auto& code = codes[static_cast<std::size_t>(value)];
        if (code.length == 0U) {
            throw std::runtime_error("Invalid Huffman code table entry");
        }
        writer.writeBits(code.bits, code.length);
    }

    result.compressed = writer.finish();
    return result;
}

std::vector<std::uint8_t> decodeBuffer(const HuffmanMetadata& metadata, const std::vector<std::uint8_t>& compressed)
{
    std::vector<std::uint8_t> output;
    if (metadata.originalSize == 0U) {
        return output;
    }
    // No symbol is shorter than one bit.
    if (metadata.originalSize > static_cast<std::uint64_t>(compressed.size()) * 8U) {
        throw CodecCorruptError("Compressed stream too short for " + std::to_string(metadata.originalSize) + " symbols");
    }
    output.reserve(static_cast<std::size_t>(metadata.originalSize));

    const CodeIndex index(assignCanonicalCodes(metadata.codeLengths));
    if (index.size() == 0U) {
        throw CodecCorruptError("Empty code table for a non-empty stream");
    }

    BitReader reader(compressed.data(), compressed.size());
    std::uint16_t bits = 0;
    std::uint8_t length = 0;
    while (output.size() < metadata.originalSize) {
        bool bit = false;
        if (!reader.readBit(bit)) {
            throw CodecCorruptError("Unexpected end of compressed stream");
        }
        bits = static_cast<std::uint16_t>((bits << 1U) | static_cast<std::uint16_t>(bit));
        ++length;

        if (length < index.minLength()) {
            continue;
        }
        if (const auto symbol = index.find(bits, length)) {
            output.push_back(*symbol);
            bits = 0;
            length = 0;
            continue;
        }
        if (length >= index.maxLength()) {
            throw CodecCorruptError("Bit sequence matches no code at output offset " + std::to_string(output.size()));
        }
    }

    return output;
}

} // namespace auraseal::compression::huffman
