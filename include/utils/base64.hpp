#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace auraseal::utils {

std::string binaryToBase64(const std::vector<std::uint8_t>& binaryData);

// Returns nullopt when the input is not canonical, unwrapped base64.
std::optional<std::vector<std::uint8_t>> base64ToBinary(const std::string& base64Str);

} // namespace auraseal::utils
