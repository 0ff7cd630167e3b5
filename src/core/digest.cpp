/**
 * @file digest.cpp
 * @brief Hex helpers and OpenSSL-backed SHA-256.
 */

#include "core/digest.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace verified_compute {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

}  // anonymous namespace

std::string to_hex(std::span<const uint8_t> data) {
    static constexpr char DIGITS[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (uint8_t b : data) {
        out.push_back(DIGITS[b >> 4]);
        out.push_back(DIGITS[b & 0x0F]);
    }
    return out;
}

Result<Bytes> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Error{ErrorCode::ConfigurationError, "Hex string has odd length"};
    }
    Bytes out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            return Error{ErrorCode::ConfigurationError,
                         "Invalid hex character at offset " + std::to_string(i)};
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

Bytes sha256(std::span<const uint8_t> data) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    Bytes digest(EVP_MAX_MD_SIZE);
    unsigned int len = 0;

    if (!ctx
        || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1
        || EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1) {
        throw std::runtime_error("OpenSSL SHA-256 failure");
    }
    digest.resize(len);
    return digest;
}

std::string sha256_hex(std::span<const uint8_t> data) {
    return to_hex(sha256(data));
}

}  // namespace verified_compute
