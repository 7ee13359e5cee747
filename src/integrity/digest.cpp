#include "integrity/digest.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <stdexcept>

namespace auraseal::integrity {
namespace {

std::array<std::uint32_t, 256> makeCrcTable()
{
    std::array<std::uint32_t, 256> table {};
    for (std::uint32_t index = 0; index < table.size(); ++index) {
        std::uint32_t value = index;
        for (int bit = 0; bit < 8; ++bit) {
            value = (value & 1U) ? (0xEDB88320U ^ (value >> 1U)) : (value >> 1U);
        }
        table[index] = value;
    }
    return table;
}

} // namespace

Digest digest(const std::uint8_t* data, std::size_t size)
{
    Digest result {};
    unsigned int length = 0;
    static const std::uint8_t kEmpty = 0;
    if (EVP_Digest(size == 0U ? &kEmpty : data, size, result.data(), &length, EVP_sha512(), nullptr) != 1
        || length != kDigestSize) {
        throw std::runtime_error("SHA-512 digest computation failed");
    }
    return result;
}

Digest digest(const std::vector<std::uint8_t>& data)
{
    return digest(data.data(), data.size());
}

bool digestEquals(const Digest& lhs, const Digest& rhs) noexcept
{
    return CRYPTO_memcmp(lhs.data(), rhs.data(), kDigestSize) == 0;
}

std::uint32_t crc32(const std::uint8_t* data, std::size_t size, std::uint32_t seed)
{
    static const auto table = makeCrcTable();
    std::uint32_t crc = ~seed;
    for (std::size_t index = 0; index < size; ++index) {
        crc = table[(crc ^ data[index]) & 0xFFU] ^ (crc >> 8U);
    }
    return ~crc;
}

} // namespace auraseal::integrity
