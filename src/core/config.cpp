/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include "attestation/signature.hpp"
#include "core/logger.hpp"

#include <set>

#include <toml++/toml.hpp>

namespace verified_compute {

namespace {

Error config_error(std::string message) {
    return Error{ErrorCode::ConfigurationError, std::move(message)};
}

std::vector<std::string> string_array(const toml::array* arr) {
    std::vector<std::string> out;
    if (arr) {
        for (const auto& el : *arr) {
            if (auto s = el.value<std::string>()) out.push_back(*s);
        }
    }
    return out;
}

Result<EnvironmentSpec> parse_environment(const toml::table& env) {
    EnvironmentSpec spec;
    spec.name = env["name"].value_or(std::string{});
    if (spec.name.empty()) {
        return config_error("[[environments]] entry without a name");
    }
    spec.runtime_image = env["runtime_image"].value_or(std::string{});
    spec.resources.cpu_cores = static_cast<uint32_t>(env["cpu_cores"].value_or(int64_t{0}));
    spec.resources.memory_gb = static_cast<uint32_t>(env["memory_gb"].value_or(int64_t{0}));
    spec.resources.accelerator_count =
        static_cast<uint32_t>(env["accelerator_count"].value_or(int64_t{0}));
    spec.resources.accelerator_type = env["accelerator_type"].value_or(std::string{});
    spec.allowed_frameworks = string_array(env["allowed_frameworks"].as_array());

    if (auto* rc = env["runtime_config"].as_table()) {
        for (const auto& [key, value] : *rc) {
            if (auto s = value.value<std::string>()) {
                spec.runtime_config[std::string(key.str())] = *s;
            }
        }
    }
    return spec;
}

}  // anonymous namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return config_error("Configuration file not found: " + path.string());
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config = default_config();

        // [orchestrator]
        if (auto orch = tbl["orchestrator"]; orch.is_table()) {
            auto& o = config.orchestrator;
            o.io_threads = static_cast<uint32_t>(
                orch["io_threads"].value_or(int64_t{o.io_threads}));
            o.poll_interval_ms = static_cast<uint32_t>(
                orch["poll_interval_ms"].value_or(int64_t{o.poll_interval_ms}));
            o.poll_timeout_ms = static_cast<uint32_t>(
                orch["poll_timeout_ms"].value_or(int64_t{o.poll_timeout_ms}));
            o.status_timeout_ms = static_cast<uint32_t>(
                orch["status_timeout_ms"].value_or(int64_t{o.status_timeout_ms}));
            o.dispatch_timeout_ms = static_cast<uint32_t>(
                orch["dispatch_timeout_ms"].value_or(int64_t{o.dispatch_timeout_ms}));
            o.staging_dir = orch["staging_dir"].value_or(o.staging_dir.string());
        }

        // [partitioning]
        if (auto part = tbl["partitioning"]; part.is_table()) {
            auto& p = config.partitioning;
            p.strategy = part["strategy"].value_or(p.strategy);
            p.num_partitions = static_cast<uint32_t>(
                part["num_partitions"].value_or(int64_t{p.num_partitions}));
            auto key = part["key_field"].value_or(std::string{});
            if (!key.empty()) p.key_field = key;
        }

        // [trust]
        if (auto trust = tbl["trust"]; trust.is_table()) {
            auto& t = config.trust;
            t.approved_measurements = string_array(trust["approved_measurements"].as_array());
            t.max_staleness_s = static_cast<uint32_t>(
                trust["max_staleness_s"].value_or(int64_t{t.max_staleness_s}));
            t.clock_skew_s = static_cast<uint32_t>(
                trust["clock_skew_s"].value_or(int64_t{t.clock_skew_s}));

            // [[trust.deprecated_measurements]]
            if (auto* deprecated = trust["deprecated_measurements"].as_array()) {
                for (const auto& el : *deprecated) {
                    const auto* entry = el.as_table();
                    if (!entry) return config_error("trust.deprecated_measurements must hold tables");
                    auto measurement = (*entry)["measurement"].value_or(std::string{});
                    if (measurement.empty()) {
                        return config_error("Deprecated measurement without a value");
                    }
                    t.deprecated_measurements[measurement] = (*entry)["score"].value_or(0.5);
                }
            }

            // [[trust.signers]]
            if (auto* signers = trust["signers"].as_array()) {
                for (const auto& el : *signers) {
                    const auto* entry = el.as_table();
                    if (!entry) return config_error("trust.signers must hold tables");
                    SignerConfig signer;
                    signer.identity = (*entry)["identity"].value_or(std::string{});
                    signer.allowed = (*entry)["allowed"].value_or(true);
                    auto key = from_hex((*entry)["public_key"].value_or(std::string{}));
                    if (!key) {
                        return config_error("Signer '" + signer.identity +
                                            "' public_key: " + key.error().message);
                    }
                    signer.public_key = std::move(*key);
                    t.signers.push_back(std::move(signer));
                }
            }
        }

        // [[environments]]
        if (auto* envs = tbl["environments"].as_array()) {
            config.environments.clear();
            for (const auto& el : *envs) {
                const auto* entry = el.as_table();
                if (!entry) return config_error("environments must be an array of tables");
                auto spec = parse_environment(*entry);
                if (!spec) return spec.error();
                config.environments.push_back(std::move(*spec));
            }
        }

        // [ledger]
        if (auto ledger = tbl["ledger"]; ledger.is_table()) {
            auto& l = config.ledger;
            l.recipient = ledger["recipient"].value_or(l.recipient);
            l.fee_per_partition = ledger["fee_per_partition"].value_or(l.fee_per_partition);
            l.distributed_premium = ledger["distributed_premium"].value_or(l.distributed_premium);
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            auto& tc = config.telemetry;
            tc.log_dir = telemetry["log_dir"].value_or(tc.log_dir.string());
            tc.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{tc.max_file_size_mb}));
            tc.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{tc.rotate_count}));
            tc.log_level = telemetry["log_level"].value_or(tc.log_level);
        }

        if (auto valid = validate_config(config); !valid) {
            return valid.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return config_error(std::string{"TOML parse error: "} + std::string{err.description()});
    }
}

Config default_config() {
    Config config;
    config.environments = builtin_environments();
    return config;
}

Result<void> validate_config(const Config& config) {
    const auto& o = config.orchestrator;
    if (o.io_threads == 0) return config_error("orchestrator.io_threads must be > 0");
    if (o.poll_interval_ms == 0) return config_error("orchestrator.poll_interval_ms must be > 0");
    if (o.poll_timeout_ms == 0) return config_error("orchestrator.poll_timeout_ms must be > 0");
    if (o.status_timeout_ms == 0) return config_error("orchestrator.status_timeout_ms must be > 0");
    if (o.dispatch_timeout_ms == 0) {
        return config_error("orchestrator.dispatch_timeout_ms must be > 0");
    }

    if (auto strategy = validate_partition_config(config.partitioning); !strategy) {
        return strategy.error();
    }

    for (const auto& [measurement, score] : config.trust.deprecated_measurements) {
        if (score < 0.0 || score > 1.0) {
            return config_error("Deprecated measurement score outside [0, 1]: " + measurement);
        }
    }
    for (const auto& signer : config.trust.signers) {
        if (signer.identity.empty()) return config_error("trust.signers entry without identity");
        if (signer.public_key.size() != Ed25519Verifier::PUBLIC_KEY_SIZE) {
            return config_error("Signer '" + signer.identity + "' public_key must be " +
                                std::to_string(Ed25519Verifier::PUBLIC_KEY_SIZE) + " bytes");
        }
    }

    if (config.environments.empty()) return config_error("No compute environments configured");
    std::set<std::string> names;
    for (const auto& env : config.environments) {
        if (!names.insert(env.name).second) {
            return config_error("Duplicate environment: " + env.name);
        }
    }

    if (config.ledger.fee_per_partition < 0.0 || config.ledger.distributed_premium < 0.0) {
        return config_error("Ledger fees must be non-negative");
    }

    if (auto level = parse_log_level(config.telemetry.log_level); !level) {
        return level.error();
    }
    if (config.telemetry.rotate_count == 0) return config_error("telemetry.rotate_count must be > 0");

    return {};
}

TrustPolicy make_trust_policy(const TrustConfig& trust) {
    TrustPolicy policy;
    for (const auto& signer : trust.signers) {
        policy.signer_keys[signer.identity] = signer.public_key;
        if (signer.allowed) policy.allowed_signers.insert(signer.identity);
    }
    policy.approved_measurements.insert(trust.approved_measurements.begin(),
                                        trust.approved_measurements.end());
    policy.deprecated_measurements = trust.deprecated_measurements;
    policy.max_staleness = std::chrono::seconds{trust.max_staleness_s};
    policy.clock_skew = std::chrono::seconds{trust.clock_skew_s};
    return policy;
}

}  // namespace verified_compute
