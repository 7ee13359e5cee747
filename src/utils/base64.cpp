#include "utils/base64.hpp"

#include <openssl/bio.h>
#include <openssl/buffer.h>
#include <openssl/evp.h>

#include <limits>
#include <memory>
#include <stdexcept>

namespace auraseal::utils {
namespace {

struct BioDeleter {
    void operator()(BIO* bio) const noexcept { BIO_free_all(bio); }
};

using BioPtr = std::unique_ptr<BIO, BioDeleter>;

bool isBase64Char(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '+' || c == '/';
}

bool isWellFormed(const std::string& text)
{
    if (text.empty() || text.size() % 4U != 0U) {
        return false;
    }
    std::size_t padding = 0;
    for (std::size_t index = 0; index < text.size(); ++index) {
        const char c = text[index];
        if (c == '=') {
            ++padding;
            continue;
        }
        if (padding > 0U || !isBase64Char(c)) {
            return false;
        }
    }
    return padding <= 2U;
}

} // namespace

std::string binaryToBase64(const std::vector<std::uint8_t>& binaryData)
{
    if (binaryData.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::length_error("Buffer too large for base64 encoding");
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new(BIO_s_mem());
    if (b64 == nullptr || mem == nullptr) {
        BIO_free(b64);
        BIO_free(mem);
        throw std::runtime_error("Failed to allocate OpenSSL BIO");
    }
    BioPtr chain(BIO_push(b64, mem));

    // Integrity strings are single-line tokens.
    BIO_set_flags(chain.get(), BIO_FLAGS_BASE64_NO_NL);

    if (!binaryData.empty()
        && BIO_write(chain.get(), binaryData.data(), static_cast<int>(binaryData.size())) != static_cast<int>(binaryData.size())) {
        throw std::runtime_error("Failed to base64-encode buffer");
    }
    if (BIO_flush(chain.get()) != 1) {
        throw std::runtime_error("Failed to flush base64 encoder");
    }

    BUF_MEM* bufferPtr = nullptr;
    BIO_get_mem_ptr(chain.get(), &bufferPtr);
    return std::string(bufferPtr->data, bufferPtr->length);
}

std::optional<std::vector<std::uint8_t>> base64ToBinary(const std::string& base64Str)
{
    if (!isWellFormed(base64Str) || base64Str.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return std::nullopt;
    }

    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* mem = BIO_new_mem_buf(base64Str.data(), static_cast<int>(base64Str.size()));
    if (b64 == nullptr || mem == nullptr) {
        BIO_free(b64);
        BIO_free(mem);
        throw std::runtime_error("Failed to allocate OpenSSL BIO");
    }
    BioPtr chain(BIO_push(b64, mem));
    BIO_set_flags(chain.get(), BIO_FLAGS_BASE64_NO_NL);

    std::vector<std::uint8_t> binaryData(base64Str.size());
    const int length = BIO_read(chain.get(), binaryData.data(), static_cast<int>(binaryData.size()));
    if (length <= 0) {
        return std::nullopt;
    }
    binaryData.resize(static_cast<std::size_t>(length));

    std::size_t padding = 0;
    for (auto it = base64Str.rbegin(); it != base64Str.rend() && *it == '='; ++it) {
        ++padding;
    }
    if (binaryData.size() != base64Str.size() / 4U * 3U - padding) {
        return std::nullopt;
    }
    return binaryData;
}

} // namespace auraseal::utils
