#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace auraseal::integrity {

inline constexpr std::size_t kDigestSize = 64;

using Digest = std::array<std::uint8_t, kDigestSize>;

// SHA-512 of the exact byte content.
Digest digest(const std::uint8_t* data, std::size_t size);
Digest digest(const std::vector<std::uint8_t>& data);

bool digestEquals(const Digest& lhs, const Digest& rhs) noexcept;

std::uint32_t crc32(const std::uint8_t* data, std::size_t size, std::uint32_t seed = 0);

} // namespace auraseal::integrity
