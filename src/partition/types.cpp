#include "partition/types.hpp"

namespace auraseal::partition {
namespace {

constexpr std::size_t kParityBitOffset = kMaxTotalParts;

void setBit(RecoveryBits& bits, std::size_t index) noexcept
{
    bits[index / 8U] = static_cast<std::uint8_t>(bits[index / 8U] | (0x80U >> (index % 8U)));
}

bool testBit(const RecoveryBits& bits, std::size_t index) noexcept
{
    return (bits[index / 8U] & (0x80U >> (index % 8U))) != 0U;
}

} // namespace

RecoveryBits makeRecoveryBits(std::size_t dataParts, std::size_t parityParts)
{
    RecoveryBits bits {};
    for (std::size_t index = 0; index < dataParts && index < kMaxTotalParts; ++index) {
        setBit(bits, index);
    }
    for (std::size_t index = 0; index < parityParts && index < kMaxTotalParts; ++index) {
        setBit(bits, kParityBitOffset + index);
    }
    return bits;
}

bool testDataBit(const RecoveryBits& bits, std::size_t partNumber) noexcept
{
    return partNumber < kMaxTotalParts && testBit(bits, partNumber);
}

bool testParityBit(const RecoveryBits& bits, std::size_t parityIndex) noexcept
{
    return parityIndex < kMaxTotalParts && testBit(bits, kParityBitOffset + parityIndex);
}

} // namespace auraseal::partition
