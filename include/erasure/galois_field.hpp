#pragma once

#include <array>
#include <cstdint>

namespace auraseal::erasure {

// GF(2^8) with primitive polynomial x^8 + x^4 + x^3 + x^2 + 1 (0x11d).
class GF256 {
public:
    static std::uint8_t add(std::uint8_t a, std::uint8_t b) noexcept { return static_cast<std::uint8_t>(a ^ b); }
    static std::uint8_t mul(std::uint8_t a, std::uint8_t b) noexcept;
    // Throws std::domain_error when dividing by zero.
    static std::uint8_t div(std::uint8_t a, std::uint8_t b);
    static std::uint8_t inv(std::uint8_t a);

private:
    static constexpr std::uint16_t kPrimitivePoly = 0x11d;

    struct Tables {
        Tables();
        std::array<std::uint8_t, 256> log {};
        std::array<std::uint8_t, 512> exp {};
    };

    static const Tables& tables();
};

} // namespace auraseal::erasure
