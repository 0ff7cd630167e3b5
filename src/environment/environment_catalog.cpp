/**
 * @file environment_catalog.cpp
 * @brief EnvironmentCatalog implementation and the built-in catalog.
 */

#include "environment/environment_catalog.hpp"

#include <algorithm>

namespace verified_compute {

namespace {

Error unsupported(const std::string& message) {
    return Error{ErrorCode::EnvironmentUnsupported, message};
}

}  // anonymous namespace

EnvironmentCatalog::EnvironmentCatalog(std::vector<EnvironmentSpec> environments) {
    for (auto& env : environments) {
        add(std::move(env));
    }
}

void EnvironmentCatalog::add(EnvironmentSpec spec) {
    auto name = spec.name;
    environments_[name] = std::move(spec);
}

const EnvironmentSpec* EnvironmentCatalog::find(const std::string& name) const {
    auto it = environments_.find(name);
    return it == environments_.end() ? nullptr : &it->second;
}

std::vector<std::string> EnvironmentCatalog::names() const {
    std::vector<std::string> out;
    out.reserve(environments_.size());
    for (const auto& [name, spec] : environments_) {
        out.push_back(name);
    }
    return out;
}

Result<EnvironmentSpec> EnvironmentCatalog::validate(const std::string& name,
                                                     const ComputeConfig& request) const {
    const auto* env = find(name);
    if (!env) {
        return unsupported("Unsupported environment: " + name);
    }

    const auto& have = env->resources;
    const auto& want = request.resources;

    auto check = [&](const char* resource, uint32_t required, uint32_t capacity)
        -> Result<void> {
        if (required > capacity) {
            return unsupported(std::string{"Insufficient "} + resource + " in environment "
                               + name + ": requested " + std::to_string(required)
                               + ", capacity " + std::to_string(capacity));
        }
        return Result<void>{};
    };

    if (auto r = check("cpu_cores", want.cpu_cores, have.cpu_cores); !r) return r.error();
    if (auto r = check("memory_gb", want.memory_gb, have.memory_gb); !r) return r.error();
    if (auto r = check("accelerator_count", want.accelerator_count, have.accelerator_count); !r) {
        return r.error();
    }

    if (!want.accelerator_type.empty() && want.accelerator_type != have.accelerator_type) {
        return unsupported("Environment " + name + " provides accelerator type '"
                           + have.accelerator_type + "', requested '"
                           + want.accelerator_type + "'");
    }

    if (!request.framework.empty()) {
        const auto& allowed = env->allowed_frameworks;
        if (std::find(allowed.begin(), allowed.end(), request.framework) == allowed.end()) {
            return unsupported("Framework " + request.framework
                               + " is not allowed in environment " + name);
        }
    }

    return *env;
}

std::vector<EnvironmentSpec> builtin_environments() {
    return {
        EnvironmentSpec{
            .name = "pytorch-gpu",
            .resources = {.cpu_cores = 8, .memory_gb = 32, .accelerator_count = 1,
                          .accelerator_type = "NVIDIA-T4"},
            .runtime_image = "oceanprotocol/pytorch:latest",
            .runtime_config = {{"cuda_version", "11.4"}, {"pytorch_version", "1.9"},
                               {"allow_network", "false"}},
            .allowed_frameworks = {"pytorch", "torchvision"}
        },
        EnvironmentSpec{
            .name = "tensorflow-gpu",
            .resources = {.cpu_cores = 8, .memory_gb = 32, .accelerator_count = 1,
                          .accelerator_type = "NVIDIA-T4"},
            .runtime_image = "oceanprotocol/tensorflow:latest",
            .runtime_config = {{"cuda_version", "11.4"}, {"tensorflow_version", "2.6"},
                               {"allow_network", "false"}},
            .allowed_frameworks = {"tensorflow", "keras"}
        },
        EnvironmentSpec{
            .name = "sklearn-cpu",
            .resources = {.cpu_cores = 16, .memory_gb = 64, .accelerator_count = 0,
                          .accelerator_type = ""},
            .runtime_image = "oceanprotocol/sklearn:latest",
            .runtime_config = {{"sklearn_version", "0.24"}, {"allow_network", "false"}},
            .allowed_frameworks = {"sklearn", "pandas", "numpy"}
        },
        EnvironmentSpec{
            .name = "r-analytics",
            .resources = {.cpu_cores = 8, .memory_gb = 32, .accelerator_count = 0,
                          .accelerator_type = ""},
            .runtime_image = "oceanprotocol/r-analytics:latest",
            .runtime_config = {{"r_version", "4.1"}, {"allow_network", "false"}},
            .allowed_frameworks = {"r-base", "tidyverse", "caret"}
        },
    };
}

}  // namespace verified_compute
