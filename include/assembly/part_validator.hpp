#pragma once

#include "partition/types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace auraseal::assembly {

inline constexpr double kDefaultMinCoherence = 0.954;

// What the manifest says a part must look like.
struct PartExpectation {
    partition::PartKind kind {partition::PartKind::Data};
    std::uint8_t componentId {0};
    std::size_t index {0};
    std::size_t totalParts {0};
    std::uint64_t fullSize {0};
};

struct PartAssessment {
    std::optional<partition::Part> part;
    double coherence {0.0};
    std::size_t checksPassed {0};
    std::size_t checksTotal {0};
    bool digestMatches {false};
    bool crcMatches {false};
    bool accepted {false};
    // Empty when accepted.
    std::string reason;
};

// Scores a serialized part: the share of structural checks that pass,
// scaled by the coherence the producer sealed into the footer. A part is
// accepted when its digest and crc match and the score reaches
// `minCoherence`.
PartAssessment assessPart(const std::vector<std::uint8_t>& bytes,
                          const PartExpectation& expectation,
                          double minCoherence = kDefaultMinCoherence);

} // namespace auraseal::assembly
