#include "integrity/integrity_string.hpp"

#include "errors.hpp"
#include "utils/base64.hpp"

#include <algorithm>

namespace auraseal::integrity {
namespace {

std::vector<std::string> splitSegments(const std::string& text)
{
    std::vector<std::string> segments;
    std::string::size_type start = 0;
    while (true) {
        const auto position = text.find('-', start);
        if (position == std::string::npos) {
            segments.emplace_back(text.substr(start));
            return segments;
        }
        segments.emplace_back(text.substr(start, position - start));
        start = position + 1U;
    }
}

std::string encodeDigest(const Digest& value)
{
    return utils::binaryToBase64(std::vector<std::uint8_t>(value.begin(), value.end()));
}

Digest decodeDigest(const std::string& segment, const std::string& integrity)
{
    const auto bytes = utils::base64ToBinary(segment);
    if (!bytes || bytes->size() != kDigestSize) {
        throw MalformedIntegrityStringError("Integrity string carries an invalid SHA-512 digest: " + integrity);
    }
    Digest result {};
    std::copy(bytes->begin(), bytes->end(), result.begin());
    return result;
}

std::string prefix()
{
    return std::string(kIntegrityScheme) + "-" + kIntegrityAlgorithm + "-";
}

} // namespace

std::string singleIntegrityString(const std::vector<std::uint8_t>& bytes)
{
    return prefix() + encodeDigest(digest(bytes));
}

std::string dualIntegrityString(const std::vector<std::uint8_t>& primaryBytes,
                                const std::vector<std::uint8_t>& secondaryBytes)
{
    return prefix() + encodeDigest(digest(primaryBytes)) + "-" + encodeDigest(digest(secondaryBytes));
}

ParsedIntegrity parseIntegrityString(const std::string& integrity)
{
    const auto segments = splitSegments(integrity);
    if (segments.size() != 3U && segments.size() != 4U) {
        throw MalformedIntegrityStringError("Integrity string must have 3 or 4 segments, found "
                                            + std::to_string(segments.size()) + ": " + integrity);
    }
    if (segments[0] != kIntegrityScheme || segments[1] != kIntegrityAlgorithm) {
        throw MalformedIntegrityStringError("Unsupported integrity scheme: " + integrity);
    }

    ParsedIntegrity parsed {};
    parsed.primary = decodeDigest(segments[2], integrity);
    if (segments.size() == 4U) {
        parsed.secondary = decodeDigest(segments[3], integrity);
    }
    return parsed;
}

bool verify(const std::string& integrity,
            const std::vector<std::uint8_t>& candidate,
            const std::vector<std::uint8_t>* fallback)
{
    const auto parsed = parseIntegrityString(integrity);
    if (digestEquals(digest(candidate), parsed.primary)) {
        return true;
    }
    if (parsed.isDual() && fallback != nullptr) {
        return digestEquals(digest(*fallback), *parsed.secondary);
    }
    return false;
}

} // namespace auraseal::integrity
