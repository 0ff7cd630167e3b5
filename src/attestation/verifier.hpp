/**
 * @file verifier.hpp
 * @brief Attestation verification against a trust policy.
 */

#pragma once

#include "attestation/attestation.hpp"
#include "attestation/signature.hpp"

namespace verified_compute {

/**
 * @brief Validates attestations. Stateless and deterministic for a given
 *        verification time.
 *
 * Checks run in this order and stop at the first failure:
 *   1. signature over the canonical payload with the signer's key
 *   2. signer is allowed by the policy
 *   3. measurement is approved (confidence 1.0) or deprecated-but-accepted
 *      (policy-defined confidence)
 *   4. issued_at lies within [now - max_staleness, now + clock_skew]
 */
class AttestationVerifier {
public:
    explicit AttestationVerifier(const ISignatureVerifier& signatures);

    [[nodiscard]] VerificationVerdict verify(const Attestation& attestation,
                                             const TrustPolicy& policy,
                                             Timestamp now) const;

    /// verify() plus a check that the attestation names the expected job.
    [[nodiscard]] VerificationVerdict verify_for_job(const Attestation& attestation,
                                                     const JobId& expected_job,
                                                     const TrustPolicy& policy,
                                                     Timestamp now) const;

private:
    const ISignatureVerifier& signatures_;
};

}  // namespace verified_compute
