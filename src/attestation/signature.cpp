/**
 * @file signature.cpp
 * @brief Ed25519 signing and verification through the OpenSSL EVP API.
 */

#include "attestation/signature.hpp"

#include <openssl/evp.h>

namespace verified_compute {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

struct PkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const noexcept { EVP_PKEY_CTX_free(ctx); }
};

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

}  // anonymous namespace

// ── Ed25519Verifier ──────────────────────────

bool Ed25519Verifier::verify(std::span<const uint8_t> public_key,
                             std::span<const uint8_t> message,
                             std::span<const uint8_t> signature) const {
    if (public_key.size() != PUBLIC_KEY_SIZE || signature.size() != SIGNATURE_SIZE) {
        return false;
    }

    std::unique_ptr<EVP_PKEY, PkeyDeleter> key(EVP_PKEY_new_raw_public_key(
        EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()));
    if (!key) return false;

    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) return false;

    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return false;
    }
    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                            message.data(), message.size()) == 1;
}

// ── Ed25519Signer ────────────────────────────

void Ed25519Signer::KeyDeleter::operator()(evp_pkey_st* key) const noexcept {
    EVP_PKEY_free(key);
}

Ed25519Signer::Ed25519Signer(std::unique_ptr<evp_pkey_st, KeyDeleter> key)
    : key_(std::move(key)) {}

Result<Ed25519Signer> Ed25519Signer::generate() {
    std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter> ctx(
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr));
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
        return Error{ErrorCode::ConfigurationError, "Ed25519 keygen init failed"};
    }

    EVP_PKEY* raw = nullptr;
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1 || raw == nullptr) {
        return Error{ErrorCode::ConfigurationError, "Ed25519 key generation failed"};
    }
    return Ed25519Signer(std::unique_ptr<evp_pkey_st, KeyDeleter>(raw));
}

Result<Ed25519Signer> Ed25519Signer::from_private_key(std::span<const uint8_t> raw_key) {
    EVP_PKEY* raw = EVP_PKEY_new_raw_private_key(
        EVP_PKEY_ED25519, nullptr, raw_key.data(), raw_key.size());
    if (raw == nullptr) {
        return Error{ErrorCode::ConfigurationError, "Invalid Ed25519 private key"};
    }
    return Ed25519Signer(std::unique_ptr<evp_pkey_st, KeyDeleter>(raw));
}

Bytes Ed25519Signer::public_key() const {
    Bytes out(Ed25519Verifier::PUBLIC_KEY_SIZE);
    size_t len = out.size();
    if (EVP_PKEY_get_raw_public_key(key_.get(), out.data(), &len) != 1) {
        return {};
    }
    out.resize(len);
    return out;
}

Result<Bytes> Ed25519Signer::sign(std::span<const uint8_t> message) const {
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) != 1) {
        return Error{ErrorCode::VerificationFailure, "Ed25519 sign init failed"};
    }

    Bytes signature(Ed25519Verifier::SIGNATURE_SIZE);
    size_t len = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &len,
                       message.data(), message.size()) != 1) {
        return Error{ErrorCode::VerificationFailure, "Ed25519 signing failed"};
    }
    signature.resize(len);
    return signature;
}

}  // namespace verified_compute
