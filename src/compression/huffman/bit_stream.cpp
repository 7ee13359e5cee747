#include "compression/huffman/bit_stream.hpp"

#include <utility>

namespace auraseal::compression::huffman {

void BitWriter::writeBit(bool bit)
{
    current_ = static_cast<std::uint8_t>((current_ << 1U) | static_cast<std::uint8_t>(bit));
    ++pending_;
    ++written_;
    if (pending_ == 8U) {
        buffer_.push_back(current_);
        current_ = 0;
        pending_ = 0;
    }
}

void BitWriter::writeBits(std::uint32_t bits, std::uint8_t length)
{
    for (std::uint8_t shift = length; shift > 0U; --shift) {
        writeBit(((bits >> (shift - 1U)) & 0x1U) != 0U);
    }
}

std::uint64_t BitWriter::bitCount() const noexcept
{
    return written_;
}

std::vector<std::uint8_t> BitWriter::finish()
{
    if (pending_ > 0U) {
        current_ <<= (8U - pending_);
        buffer_.push_back(current_);
        current_ = 0;
        pending_ = 0;
    }
    return std::move(buffer_);
}

BitReader::BitReader(const std::uint8_t* data, std::size_t size)
    : data_(data)
    , size_(size)
{
}

bool BitReader::readBit(bool& bit)
{
    if (byteIndex_ >= size_) {
        return false;
    }

    const auto current = data_[byteIndex_];
    bit = static_cast<bool>((current >> (7U - bitIndex_)) & 0x1U);
    ++bitIndex_;
    if (bitIndex_ == 8U) {
        bitIndex_ = 0;
        ++byteIndex_;
    }
    return true;
}

} // namespace auraseal::compression::huffman
