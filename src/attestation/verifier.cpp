/**
 * @file verifier.cpp
 * @brief AttestationVerifier implementation.
 */

#include "attestation/verifier.hpp"

#include <algorithm>

namespace verified_compute {

namespace {

VerificationVerdict reject(VerificationReason reason) {
    return VerificationVerdict{.valid = false, .reason = reason, .confidence = 0.0};
}

}  // anonymous namespace

AttestationVerifier::AttestationVerifier(const ISignatureVerifier& signatures)
    : signatures_(signatures) {}

VerificationVerdict AttestationVerifier::verify(const Attestation& attestation,
                                                const TrustPolicy& policy,
                                                Timestamp now) const {
    // 1. Signature
    auto key = policy.signer_keys.find(attestation.signer_identity);
    if (key == policy.signer_keys.end()) {
        return reject(VerificationReason::SignatureInvalid);
    }
    auto payload = AttestationCodec::payload(attestation);
    if (!signatures_.verify(key->second, payload, attestation.signature)) {
        return reject(VerificationReason::SignatureInvalid);
    }

    // 2. Signer
    if (!policy.allowed_signers.contains(attestation.signer_identity)) {
        return reject(VerificationReason::UntrustedSigner);
    }

    // 3. Measurement
    double confidence = 0.0;
    if (policy.approved_measurements.contains(attestation.measurement)) {
        confidence = 1.0;
    } else if (auto dep = policy.deprecated_measurements.find(attestation.measurement);
               dep != policy.deprecated_measurements.end()) {
        confidence = std::clamp(dep->second, 0.0, 1.0);
    } else {
        return reject(VerificationReason::MeasurementMismatch);
    }

    // 4. Freshness
    auto age = now - attestation.issued_at;
    if (age > policy.max_staleness || age < -policy.clock_skew) {
        return reject(VerificationReason::StaleAttestation);
    }

    return VerificationVerdict{
        .valid = true,
        .reason = VerificationReason::Verified,
        .confidence = confidence
    };
}

VerificationVerdict AttestationVerifier::verify_for_job(const Attestation& attestation,
                                                        const JobId& expected_job,
                                                        const TrustPolicy& policy,
                                                        Timestamp now) const {
    auto verdict = verify(attestation, policy, now);
    if (verdict.valid && attestation.subject_job_id != expected_job) {
        return reject(VerificationReason::SubjectMismatch);
    }
    return verdict;
}

}  // namespace verified_compute
