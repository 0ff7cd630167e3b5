/**
 * @file attestation.hpp
 * @brief TEE attestation record, trust policy and verification verdict.
 *
 * An attestation binds a code measurement and a signer identity to one
 * job execution. The signature covers the canonical payload produced by
 * AttestationCodec::payload().
 */

#pragma once

#include "core/digest.hpp"
#include "core/types.hpp"

#include <chrono>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace verified_compute {

struct Attestation {
    JobId subject_job_id;
    std::string measurement;        ///< Hex code measurement of the executed image
    std::string signer_identity;
    Timestamp issued_at;
    std::string result_digest;      ///< Hex SHA-256 of the produced output (may be empty)
    Bytes signature;

    bool operator==(const Attestation&) const = default;
};

/**
 * @brief Which signers, measurements and ages are acceptable.
 */
struct TrustPolicy {
    std::map<std::string, Bytes> signer_keys;            ///< identity → public key
    std::set<std::string> allowed_signers;
    std::set<std::string> approved_measurements;
    std::map<std::string, double> deprecated_measurements;  ///< measurement → confidence
    std::chrono::seconds max_staleness{300};
    std::chrono::seconds clock_skew{5};
};

enum class VerificationReason : uint8_t {
    Verified,
    SignatureInvalid,
    UntrustedSigner,
    MeasurementMismatch,
    StaleAttestation,
    SubjectMismatch
};

[[nodiscard]] constexpr std::string_view to_string(VerificationReason reason) noexcept {
    switch (reason) {
        case VerificationReason::Verified:            return "verified";
        case VerificationReason::SignatureInvalid:    return "signature_invalid";
        case VerificationReason::UntrustedSigner:     return "untrusted_signer";
        case VerificationReason::MeasurementMismatch: return "measurement_mismatch";
        case VerificationReason::StaleAttestation:    return "stale_attestation";
        case VerificationReason::SubjectMismatch:     return "subject_mismatch";
    }
    return "unknown";
}

struct VerificationVerdict {
    bool valid = false;
    VerificationReason reason = VerificationReason::SignatureInvalid;
    double confidence = 0.0;

    bool operator==(const VerificationVerdict&) const = default;
};

/**
 * @brief Canonical byte encoding of the signed part of an attestation.
 *
 * Wire format (all multi-byte values big-endian):
 *   [4B len][subject_job_id][4B len][measurement][4B len][signer_identity]
 *   [8B issued_at unix millis][4B len][result_digest]
 */
struct AttestationCodec {
    static Bytes payload(const Attestation& attestation);

    static void put_u64(Bytes& buf, uint64_t val);
    static void put_u32(Bytes& buf, uint32_t val);
    static void put_string(Bytes& buf, std::string_view text);
};

}  // namespace verified_compute
