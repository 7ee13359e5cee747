#pragma once

#include "compression/huffman/types.hpp"
#include "integrity/digest.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace auraseal::partition {

inline constexpr std::uint32_t kPartMagic = 0xD17A4C00U;
inline constexpr std::uint8_t kFormatVersion = 1;

inline constexpr std::size_t kHeaderSize = 256;
inline constexpr std::size_t kFooterSize = 128;
inline constexpr std::size_t kMaxPartPayload = 5120;
inline constexpr std::size_t kMaxTotalParts = 256;
inline constexpr std::size_t kRecoveryBitsSize = 64;

// Bits 0..255 flag data parts of the stripe, bits 256..511 parity indices.
using RecoveryBits = std::array<std::uint8_t, kRecoveryBitsSize>;

enum class PartKind : std::uint8_t {
    Data = 0,
    Parity = 1
};

struct PartHeader {
    PartKind kind {PartKind::Data};
    std::uint8_t componentId {0};
    // Parity index for parity parts.
    std::uint8_t partNumber {0};
    // Number of data parts in the component, for both kinds.
    std::uint16_t totalParts {0};
    std::uint8_t parityCount {0};
    std::uint64_t fullSize {0};
    std::uint64_t compressedSize {0};
    compression::huffman::PackedCodeTable codeTable {};
    RecoveryBits recoveryBits {};
};

struct PartFooter {
    integrity::Digest digest {};
    std::uint32_t crc {0};
    float coherence {1.0F};
};

struct Part {
    PartHeader header;
    std::vector<std::uint8_t> payload;
    PartFooter footer;
};

RecoveryBits makeRecoveryBits(std::size_t dataParts, std::size_t parityParts);
bool testDataBit(const RecoveryBits& bits, std::size_t partNumber) noexcept;
bool testParityBit(const RecoveryBits& bits, std::size_t parityIndex) noexcept;

} // namespace auraseal::partition
