/**
 * @file attestation_codec.cpp
 * @brief Canonical attestation payload encoding.
 *
 * Length-prefixed fields keep the encoding injective: no two distinct
 * attestations share a payload, so a signature cannot be replayed onto a
 * different subject or measurement.
 */

#include "attestation/attestation.hpp"

namespace verified_compute {

void AttestationCodec::put_u64(Bytes& buf, uint64_t val) {
    for (int i = 7; i >= 0; --i) {
        buf.push_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
    }
}

void AttestationCodec::put_u32(Bytes& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

void AttestationCodec::put_string(Bytes& buf, std::string_view text) {
    put_u32(buf, static_cast<uint32_t>(text.size()));
    buf.insert(buf.end(), text.begin(), text.end());
}

Bytes AttestationCodec::payload(const Attestation& attestation) {
    Bytes buf;
    buf.reserve(4 * 4 + 8
                + attestation.subject_job_id.size()
                + attestation.measurement.size()
                + attestation.signer_identity.size()
                + attestation.result_digest.size());

    put_string(buf, attestation.subject_job_id);
    put_string(buf, attestation.measurement);
    put_string(buf, attestation.signer_identity);
    put_u64(buf, static_cast<uint64_t>(to_unix_millis(attestation.issued_at)));
    put_string(buf, attestation.result_digest);

    return buf;
}

}  // namespace verified_compute
