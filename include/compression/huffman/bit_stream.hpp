#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace auraseal::compression::huffman {

class BitWriter {
public:
    BitWriter() = default;

    void writeBit(bool bit);
    // Writes the low `length` bits of `bits`, most significant first.
    void writeBits(std::uint32_t bits, std::uint8_t length);
    std::uint64_t bitCount() const noexcept;
    std::vector<std::uint8_t> finish();

private:
    std::vector<std::uint8_t> buffer_;
    std::uint8_t current_ {0};
    std::uint8_t pending_ {0};
    std::uint64_t written_ {0};
};

class BitReader {
public:
    BitReader(const std::uint8_t* data, std::size_t size);

    bool readBit(bool& bit);

private:
    const std::uint8_t* data_ {nullptr};
    std::size_t size_ {0};
    std::size_t byteIndex_ {0};
    std::uint8_t bitIndex_ {0};
};

} // namespace auraseal::compression::huffman
