#include "partition/part_format.hpp"

#include "errors.hpp"

#include <algorithm>
#include <cstring>
#include <string>

namespace auraseal::partition {
namespace {

// Header field offsets.
constexpr std::size_t kMagicOffset = 0;
constexpr std::size_t kPartNumberOffset = 4;
constexpr std::size_t kTotalPartsOffset = 5;
constexpr std::size_t kFullSizeOffset = 6;
constexpr std::size_t kCodeTableOffset = 14;
constexpr std::size_t kRecoveryBitsOffset = kCodeTableOffset + compression::huffman::kPackedTableSize;
constexpr std::size_t kVersionOffset = kRecoveryBitsOffset + kRecoveryBitsSize;
constexpr std::size_t kKindOffset = 207;
constexpr std::size_t kComponentIdOffset = 208;
constexpr std::size_t kParityCountOffset = 209;
constexpr std::size_t kPayloadSizeOffset = 210;
constexpr std::size_t kCompressedSizeOffset = 212;
constexpr std::size_t kReservedOffset = 220;

// Footer field offsets.
constexpr std::size_t kDigestOffset = 0;
constexpr std::size_t kCrcOffset = integrity::kDigestSize;
constexpr std::size_t kCoherenceOffset = kCrcOffset + 4;
constexpr std::size_t kFooterPaddingOffset = kCoherenceOffset + 4;

static_assert(kVersionOffset == 206, "Header layout drifted");
static_assert(kReservedOffset < kHeaderSize, "Header fields overflow 256 bytes");
static_assert(kFooterPaddingOffset <= kFooterSize, "Footer fields overflow 128 bytes");

template <class T>
void writeValue(std::uint8_t* output, T value)
{
    for (std::size_t index = 0; index < sizeof(T); ++index) {
        output[index] = static_cast<std::uint8_t>(value >> (8U * (sizeof(T) - 1U - index)));
    }
}

template <class T>
T readValue(const std::uint8_t* input)
{
    T value {};
    for (std::size_t index = 0; index < sizeof(T); ++index) {
        value = static_cast<T>((value << 8U) | input[index]);
    }
    return value;
}

bool allZero(const std::uint8_t* data, std::size_t size)
{
    return std::all_of(data, data + size, [](std::uint8_t value) { return value == 0U; });
}

} // namespace

std::size_t WireDiagnostics::passed() const noexcept
{
    return static_cast<std::size_t>(magicValid) + static_cast<std::size_t>(versionSupported)
        + static_cast<std::size_t>(kindValid) + static_cast<std::size_t>(reservedClear)
        + static_cast<std::size_t>(payloadWithinBound) + static_cast<std::size_t>(payloadLengthMatches);
}

std::array<std::uint8_t, kHeaderSize> encodeHeader(const PartHeader& header, std::uint16_t payloadSize)
{
    if (header.totalParts == 0U || header.totalParts > kMaxTotalParts) {
        throw std::invalid_argument("Part header total_parts out of range: " + std::to_string(header.totalParts));
    }
    if (payloadSize > kMaxPartPayload) {
        throw std::length_error("Part payload exceeds " + std::to_string(kMaxPartPayload) + " bytes");
    }

    std::array<std::uint8_t, kHeaderSize> encoded {};
    writeValue<std::uint32_t>(encoded.data() + kMagicOffset, kPartMagic);
    encoded[kPartNumberOffset] = header.partNumber;
    // 256 parts wrap to 0; a component never has zero parts.
    encoded[kTotalPartsOffset] = static_cast<std::uint8_t>(header.totalParts & 0xFFU);
    writeValue<std::uint64_t>(encoded.data() + kFullSizeOffset, header.fullSize);
    std::memcpy(encoded.data() + kCodeTableOffset, header.codeTable.data(), header.codeTable.size());
    std::memcpy(encoded.data() + kRecoveryBitsOffset, header.recoveryBits.data(), header.recoveryBits.size());
    encoded[kVersionOffset] = kFormatVersion;
    encoded[kKindOffset] = static_cast<std::uint8_t>(header.kind);
    encoded[kComponentIdOffset] = header.componentId;
    encoded[kParityCountOffset] = header.parityCount;
    writeValue<std::uint16_t>(encoded.data() + kPayloadSizeOffset, payloadSize);
    writeValue<std::uint64_t>(encoded.data() + kCompressedSizeOffset, header.compressedSize);
    return encoded;
}

std::uint32_t computePartCrc(const Part& part)
{
    if (part.payload.size() > kMaxPartPayload) {
        throw std::length_error("Part payload exceeds " + std::to_string(kMaxPartPayload) + " bytes");
    }
    const auto header = encodeHeader(part.header, static_cast<std::uint16_t>(part.payload.size()));
    const auto crc = integrity::crc32(header.data(), header.size());
    return integrity::crc32(part.payload.data(), part.payload.size(), crc);
}

void sealPart(Part& part)
{
    part.footer.digest = integrity::digest(part.payload);
    part.footer.crc = computePartCrc(part);
    part.footer.coherence = 1.0F;
}

std::vector<std::uint8_t> serializePart(const Part& part)
{
    if (part.payload.size() > kMaxPartPayload) {
        throw std::length_error("Part payload exceeds " + std::to_string(kMaxPartPayload) + " bytes");
    }

    const auto header = encodeHeader(part.header, static_cast<std::uint16_t>(part.payload.size()));
    std::vector<std::uint8_t> bytes;
    bytes.reserve(kHeaderSize + part.payload.size() + kFooterSize);
    bytes.insert(bytes.end(), header.begin(), header.end());
    bytes.insert(bytes.end(), part.payload.begin(), part.payload.end());

    std::array<std::uint8_t, kFooterSize> footer {};
    std::memcpy(footer.data() + kDigestOffset, part.footer.digest.data(), part.footer.digest.size());
    writeValue<std::uint32_t>(footer.data() + kCrcOffset, part.footer.crc);
    std::uint32_t coherenceBits = 0;
    static_assert(sizeof(coherenceBits) == sizeof(part.footer.coherence), "IEEE-754 single precision expected");
    std::memcpy(&coherenceBits, &part.footer.coherence, sizeof(coherenceBits));
    writeValue<std::uint32_t>(footer.data() + kCoherenceOffset, coherenceBits);
    bytes.insert(bytes.end(), footer.begin(), footer.end());
    return bytes;
}

DecodedPart decodePart(const std::vector<std::uint8_t>& bytes)
{
    if (bytes.size() < kHeaderSize + kFooterSize) {
        throw ChunkCorruptError("Part truncated: " + std::to_string(bytes.size()) + " bytes");
    }

    const std::uint8_t* header = bytes.data();
    const std::uint8_t* footer = bytes.data() + bytes.size() - kFooterSize;
    const auto actualPayload = bytes.size() - kHeaderSize - kFooterSize;

    DecodedPart decoded {};
    auto& part = decoded.part;
    auto& diagnostics = decoded.diagnostics;

    diagnostics.magicValid = readValue<std::uint32_t>(header + kMagicOffset) == kPartMagic;
    diagnostics.versionSupported = header[kVersionOffset] == kFormatVersion;
    diagnostics.kindValid = header[kKindOffset] <= static_cast<std::uint8_t>(PartKind::Parity);
    diagnostics.reservedClear = allZero(header + kReservedOffset, kHeaderSize - kReservedOffset)
        && allZero(footer + kFooterPaddingOffset, kFooterSize - kFooterPaddingOffset);

    const auto declaredPayload = readValue<std::uint16_t>(header + kPayloadSizeOffset);
    diagnostics.payloadWithinBound = declaredPayload <= kMaxPartPayload && actualPayload <= kMaxPartPayload;
    diagnostics.payloadLengthMatches = declaredPayload == actualPayload;

    part.header.kind = diagnostics.kindValid ? static_cast<PartKind>(header[kKindOffset]) : PartKind::Data;
    part.header.componentId = header[kComponentIdOffset];
    part.header.partNumber = header[kPartNumberOffset];
    part.header.totalParts = header[kTotalPartsOffset] == 0U ? static_cast<std::uint16_t>(kMaxTotalParts)
                                                             : header[kTotalPartsOffset];
    part.header.parityCount = header[kParityCountOffset];
    part.header.fullSize = readValue<std::uint64_t>(header + kFullSizeOffset);
    part.header.compressedSize = readValue<std::uint64_t>(header + kCompressedSizeOffset);
    std::memcpy(part.header.codeTable.data(), header + kCodeTableOffset, part.header.codeTable.size());
    std::memcpy(part.header.recoveryBits.data(), header + kRecoveryBitsOffset, part.header.recoveryBits.size());

    part.payload.assign(bytes.begin() + static_cast<std::ptrdiff_t>(kHeaderSize),
                        bytes.begin() + static_cast<std::ptrdiff_t>(kHeaderSize + actualPayload));

    std::memcpy(part.footer.digest.data(), footer + kDigestOffset, part.footer.digest.size());
    part.footer.crc = readValue<std::uint32_t>(footer + kCrcOffset);
    const auto coherenceBits = readValue<std::uint32_t>(footer + kCoherenceOffset);
    std::memcpy(&part.footer.coherence, &coherenceBits, sizeof(coherenceBits));
    return decoded;
}

Part parsePart(const std::vector<std::uint8_t>& bytes)
{
    auto decoded = decodePart(bytes);
    const auto& diagnostics = decoded.diagnostics;
    if (!diagnostics.magicValid) {
        throw ChunkCorruptError("Invalid part magic");
    }
    if (!diagnostics.versionSupported) {
        throw ChunkCorruptError("Unsupported part format version");
    }
    if (!diagnostics.kindValid) {
        throw ChunkCorruptError("Unknown part kind");
    }
    if (!diagnostics.payloadWithinBound || !diagnostics.payloadLengthMatches) {
        throw ChunkCorruptError("Part payload length does not match its header");
    }
    if (!diagnostics.reservedClear) {
        throw ChunkCorruptError("Part reserved bytes are not zero");
    }
    return std::move(decoded.part);
}

} // namespace auraseal::partition
