#pragma once

#include "partition/types.hpp"

#include <array>
#include <cstdint>
#include <vector>

namespace auraseal::partition {

// Structural facts gathered while decoding, kept apart from hard failures
// so callers can score a damaged part instead of rejecting it outright.
struct WireDiagnostics {
    bool magicValid {false};
    bool versionSupported {false};
    bool kindValid {false};
    bool reservedClear {false};
    bool payloadWithinBound {false};
    bool payloadLengthMatches {false};

    std::size_t passed() const noexcept;
    static constexpr std::size_t total() noexcept { return 6; }
};

struct DecodedPart {
    Part part;
    WireDiagnostics diagnostics;
};

std::array<std::uint8_t, kHeaderSize> encodeHeader(const PartHeader& header, std::uint16_t payloadSize);

// CRC-32 over the encoded header followed by the payload.
std::uint32_t computePartCrc(const Part& part);

// Fills the footer: SHA-512 of the payload, crc and full coherence.
void sealPart(Part& part);

std::vector<std::uint8_t> serializePart(const Part& part);

// Throws ChunkCorruptError only when the buffer cannot hold a header and
// footer.
DecodedPart decodePart(const std::vector<std::uint8_t>& bytes);

// Throws ChunkCorruptError on any structural defect.
Part parsePart(const std::vector<std::uint8_t>& bytes);

} // namespace auraseal::partition
