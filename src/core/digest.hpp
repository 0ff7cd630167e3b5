/**
 * @file digest.hpp
 * @brief Hex encoding and SHA-256 digests (OpenSSL EVP).
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace verified_compute {

using Bytes = std::vector<uint8_t>;

/// Lower-case hex encoding.
std::string to_hex(std::span<const uint8_t> data);

/// Decode a hex string (either case). Odd length or non-hex characters fail.
Result<Bytes> from_hex(std::string_view hex);

/// Raw 32-byte SHA-256 digest.
Bytes sha256(std::span<const uint8_t> data);

/// Hex SHA-256 digest.
std::string sha256_hex(std::span<const uint8_t> data);

}  // namespace verified_compute
