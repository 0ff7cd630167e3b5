/**
 * @file config.hpp
 * @brief Orchestrator configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "attestation/attestation.hpp"
#include "core/digest.hpp"
#include "core/result.hpp"
#include "environment/environment_catalog.hpp"
#include "partition/partitioner.hpp"

namespace verified_compute {

struct OrchestratorConfig {
    uint32_t io_threads = 8;                ///< Shared pool for worker RPCs
    uint32_t poll_interval_ms = 1000;
    uint32_t poll_timeout_ms = 60000;
    uint32_t status_timeout_ms = 2000;      ///< Per status() call
    uint32_t dispatch_timeout_ms = 5000;    ///< Per submit() call
    std::filesystem::path staging_dir = "./staging";
};

struct SignerConfig {
    std::string identity;
    Bytes public_key;                       ///< Raw Ed25519 key, hex in the file
    bool allowed = true;
};

struct TrustConfig {
    std::vector<std::string> approved_measurements;
    std::map<std::string, double> deprecated_measurements;   ///< measurement → score
    uint32_t max_staleness_s = 300;
    uint32_t clock_skew_s = 5;
    std::vector<SignerConfig> signers;
};

struct LedgerConfig {
    std::string recipient = "compute-provider";
    double fee_per_partition = 10.0;
    double distributed_premium = 0.2;       ///< Surcharge for multi-partition runs
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level orchestrator configuration.
 */
struct Config {
    OrchestratorConfig orchestrator;
    PartitionConfig partitioning;           ///< Defaults for requests that omit them
    TrustConfig trust;
    std::vector<EnvironmentSpec> environments;
    LedgerConfig ledger;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. A file that does not parse or holds
 * invalid values yields ConfigurationError.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration (built-in environment catalog,
 *        empty trust policy).
 */
Config default_config();

/**
 * @brief Check value ranges across all sections.
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Build the verifier's trust policy from the [trust] section.
 */
TrustPolicy make_trust_policy(const TrustConfig& trust);

}  // namespace verified_compute
