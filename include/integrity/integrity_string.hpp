#pragma once

#include "integrity/digest.hpp"

#include <optional>
#include <string>
#include <vector>

namespace auraseal::integrity {

inline constexpr const char* kIntegrityScheme = "auraseal";
inline constexpr const char* kIntegrityAlgorithm = "sha512";

struct ParsedIntegrity {
    Digest primary {};
    std::optional<Digest> secondary;

    bool isDual() const noexcept { return secondary.has_value(); }
};

std::string singleIntegrityString(const std::vector<std::uint8_t>& bytes);
std::string dualIntegrityString(const std::vector<std::uint8_t>& primaryBytes,
                                const std::vector<std::uint8_t>& secondaryBytes);

// Throws MalformedIntegrityStringError unless the string has exactly three
// or four hyphen-separated segments with the expected labels and digests.
ParsedIntegrity parseIntegrityString(const std::string& integrity);

// Three segments: candidate must match. Four segments: candidate must match
// the first digest, otherwise a supplied fallback must match the second.
bool verify(const std::string& integrity,
            const std::vector<std::uint8_t>& candidate,
            const std::vector<std::uint8_t>* fallback = nullptr);

} // namespace auraseal::integrity
