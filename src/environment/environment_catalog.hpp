/**
 * @file environment_catalog.hpp
 * @brief Static catalog of TEE compute environments and request validation.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace verified_compute {

/**
 * @brief Resource amounts, used both for declared capacity and for requests.
 */
struct ResourceSpec {
    uint32_t cpu_cores = 0;
    uint32_t memory_gb = 0;
    uint32_t accelerator_count = 0;
    std::string accelerator_type;           ///< Empty = any / none

    bool operator==(const ResourceSpec&) const = default;
};

struct EnvironmentSpec {
    std::string name;
    ResourceSpec resources;
    std::string runtime_image;
    std::map<std::string, std::string> runtime_config;
    std::vector<std::string> allowed_frameworks;

    bool operator==(const EnvironmentSpec&) const = default;
};

/**
 * @brief What the caller asks of an environment for one job group.
 */
struct ComputeConfig {
    ResourceSpec resources;
    std::string framework;                  ///< Empty = no framework constraint
    std::vector<std::string> metrics;       ///< Metric names computed per partition
    uint32_t batch_size = 32;
    uint32_t max_runtime_s = 3600;
};

/**
 * @brief Catalog of environments selectable by name.
 *
 * Populated once at startup; read-only afterwards.
 */
class EnvironmentCatalog {
public:
    EnvironmentCatalog() = default;
    explicit EnvironmentCatalog(std::vector<EnvironmentSpec> environments);

    void add(EnvironmentSpec spec);

    [[nodiscard]] const EnvironmentSpec* find(const std::string& name) const;
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] size_t size() const noexcept { return environments_.size(); }

    /**
     * @brief Resolve an environment and check a request against its capacity.
     *
     * Fails with EnvironmentUnsupported when the name is unknown, any
     * requested amount exceeds the declared capacity, the accelerator type
     * differs, or the framework is not allowed.
     */
    Result<EnvironmentSpec> validate(const std::string& name,
                                     const ComputeConfig& request) const;

private:
    std::map<std::string, EnvironmentSpec> environments_;
};

/**
 * @brief The stock environments: pytorch-gpu, tensorflow-gpu, sklearn-cpu,
 *        r-analytics.
 */
std::vector<EnvironmentSpec> builtin_environments();

}  // namespace verified_compute
