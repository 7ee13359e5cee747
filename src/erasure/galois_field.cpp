#include "erasure/galois_field.hpp"

#include <stdexcept>

namespace auraseal::erasure {

GF256::Tables::Tables()
{
    std::uint16_t value = 1;
    for (std::size_t power = 0; power < 255; ++power) {
        exp[power] = static_cast<std::uint8_t>(value);
        log[value] = static_cast<std::uint8_t>(power);
        value <<= 1U;
        if (value & 0x100U) {
            value ^= kPrimitivePoly;
        }
    }
    // Doubled so mul() can index log(a) + log(b) without a modulo.
    for (std::size_t power = 255; power < exp.size(); ++power) {
        exp[power] = exp[power - 255];
    }
}

const GF256::Tables& GF256::tables()
{
    static const Tables instance;
    return instance;
}

std::uint8_t GF256::mul(std::uint8_t a, std::uint8_t b) noexcept
{
    if (a == 0U || b == 0U) {
        return 0;
    }
    const auto& t = tables();
    return t.exp[static_cast<std::size_t>(t.log[a]) + t.log[b]];
}

std::uint8_t GF256::div(std::uint8_t a, std::uint8_t b)
{
    if (b == 0U) {
        throw std::domain_error("Division by zero in GF(256)");
    }
    if (a == 0U) {
        return 0;
    }
    const auto& t = tables();
    return t.exp[static_cast<std::size_t>(t.log[a]) + 255U - t.log[b]];
}

std::uint8_t GF256::inv(std::uint8_t a)
{
    return div(1, a);
}

} // namespace auraseal::erasure
