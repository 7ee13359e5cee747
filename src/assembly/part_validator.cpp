#include "assembly/part_validator.hpp"

#include "errors.hpp"
#include "integrity/digest.hpp"
#include "partition/part_format.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace auraseal::assembly {
namespace {

constexpr std::size_t kExpectationChecks = 6;

bool recoveryBitsConsistent(const partition::PartHeader& header)
{
    const auto dataParts = static_cast<std::size_t>(header.totalParts);
    const auto parityParts = static_cast<std::size_t>(header.parityCount);
    for (std::size_t index = 0; index < partition::kMaxTotalParts; ++index) {
        if (partition::testDataBit(header.recoveryBits, index) != (index < dataParts)) {
            return false;
        }
        if (partition::testParityBit(header.recoveryBits, index) != (index < parityParts)) {
            return false;
        }
    }
    return true;
}

double clampCoherence(float sealed)
{
    if (!std::isfinite(sealed)) {
        return 0.0;
    }
    return std::clamp(static_cast<double>(sealed), 0.0, 1.0);
}

} // namespace

PartAssessment assessPart(const std::vector<std::uint8_t>& bytes,
                          const PartExpectation& expectation,
                          double minCoherence)
{
    PartAssessment assessment {};
    assessment.checksTotal = partition::WireDiagnostics::total() + kExpectationChecks;

    partition::DecodedPart decoded;
    try {
        decoded = partition::decodePart(bytes);
    } catch (const ChunkCorruptError& ex) {
        assessment.reason = ex.what();
        return assessment;
    }

    const auto& header = decoded.part.header;
    std::size_t passed = decoded.diagnostics.passed();
    passed += header.kind == expectation.kind ? 1U : 0U;
    passed += header.componentId == expectation.componentId ? 1U : 0U;
    passed += header.partNumber == expectation.index ? 1U : 0U;
    passed += header.totalParts == expectation.totalParts ? 1U : 0U;
    passed += header.fullSize == expectation.fullSize ? 1U : 0U;
    passed += recoveryBitsConsistent(header) ? 1U : 0U;
    assessment.checksPassed = passed;

    assessment.coherence = static_cast<double>(passed) / static_cast<double>(assessment.checksTotal)
        * clampCoherence(decoded.part.footer.coherence);

    assessment.digestMatches = integrity::digestEquals(integrity::digest(decoded.part.payload),
                                                       decoded.part.footer.digest);
    // Over the bytes as received, not a re-encoding of the parsed header.
    assessment.crcMatches
        = integrity::crc32(bytes.data(), bytes.size() - partition::kFooterSize) == decoded.part.footer.crc;

    if (!assessment.digestMatches) {
        assessment.reason = "payload digest mismatch";
    } else if (!assessment.crcMatches) {
        assessment.reason = "crc mismatch";
    } else if (assessment.coherence < minCoherence) {
        char buffer[96];
        std::snprintf(buffer, sizeof(buffer), "coherence %.3f below %.3f (%zu/%zu checks)", assessment.coherence,
                      minCoherence, passed, assessment.checksTotal);
        assessment.reason = buffer;
    } else {
        assessment.accepted = true;
    }

    assessment.part = std::move(decoded.part);
    return assessment;
}

} // namespace auraseal::assembly
