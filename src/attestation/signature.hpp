/**
 * @file signature.hpp
 * @brief Signature schemes for attestation payloads.
 *
 * ISignatureVerifier is the seam where a vendor-specific scheme can be
 * plugged in. Ed25519 (OpenSSL EVP) is the shipped implementation.
 */

#pragma once

#include "core/digest.hpp"
#include "core/result.hpp"

#include <memory>
#include <span>
#include <string_view>

// OpenSSL forward declaration
struct evp_pkey_st;

namespace verified_compute {

/**
 * @brief Checks a detached signature against a raw public key.
 */
class ISignatureVerifier {
public:
    virtual ~ISignatureVerifier() = default;

    [[nodiscard]] virtual bool verify(std::span<const uint8_t> public_key,
                                      std::span<const uint8_t> message,
                                      std::span<const uint8_t> signature) const = 0;
    [[nodiscard]] virtual std::string_view scheme() const noexcept = 0;
};

class Ed25519Verifier : public ISignatureVerifier {
public:
    static constexpr size_t PUBLIC_KEY_SIZE = 32;
    static constexpr size_t SIGNATURE_SIZE = 64;

    [[nodiscard]] bool verify(std::span<const uint8_t> public_key,
                              std::span<const uint8_t> message,
                              std::span<const uint8_t> signature) const override;
    [[nodiscard]] std::string_view scheme() const noexcept override { return "ed25519"; }
};

/**
 * @brief Holds an Ed25519 private key and signs messages with it.
 *
 * Movable, non-copyable. sign() is safe to call from several threads.
 */
class Ed25519Signer {
public:
    static Result<Ed25519Signer> generate();
    static Result<Ed25519Signer> from_private_key(std::span<const uint8_t> raw_key);

    Ed25519Signer(Ed25519Signer&&) noexcept = default;
    Ed25519Signer& operator=(Ed25519Signer&&) noexcept = default;
    Ed25519Signer(const Ed25519Signer&) = delete;
    Ed25519Signer& operator=(const Ed25519Signer&) = delete;
    ~Ed25519Signer() = default;

    [[nodiscard]] Bytes public_key() const;
    [[nodiscard]] Result<Bytes> sign(std::span<const uint8_t> message) const;

private:
    struct KeyDeleter {
        void operator()(evp_pkey_st* key) const noexcept;
    };

    explicit Ed25519Signer(std::unique_ptr<evp_pkey_st, KeyDeleter> key);

    std::unique_ptr<evp_pkey_st, KeyDeleter> key_;
};

}  // namespace verified_compute
