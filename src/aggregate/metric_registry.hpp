/**
 * @file metric_registry.hpp
 * @brief Named evaluation metrics computed on (predicted, actual) series.
 *
 * Each metric is a pure function looked up by name. Classification
 * metrics treat values >= 0.5 as the positive class; regression metrics
 * use the raw values.
 */

#pragma once

#include "core/result.hpp"

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace verified_compute {

enum class MetricKind : uint8_t {
    Accuracy,
    Precision,
    Recall,
    F1Score,
    BalancedAccuracy,
    MatthewsCorrelation,
    MeanSquaredError,
    RootMeanSquaredError,
    MeanAbsoluteError,
    MeanAbsolutePercentageError,
    R2Score,
    MaxError,
    ExplainedVariance
};

enum class MetricFamily : uint8_t {
    Classification,
    Regression
};

[[nodiscard]] constexpr std::string_view to_string(MetricFamily family) noexcept {
    switch (family) {
        case MetricFamily::Classification: return "classification";
        case MetricFamily::Regression:     return "regression";
    }
    return "unknown";
}

using MetricFn = double (*)(std::span<const double> predicted,
                            std::span<const double> actual);

struct MetricDescriptor {
    MetricKind kind;
    std::string_view name;
    MetricFamily family;
    MetricFn fn;
};

/// Every shipped metric, in declaration order of MetricKind.
std::span<const MetricDescriptor> metric_catalog() noexcept;

/// Look up a metric by name. Unknown names fail with ConfigurationError.
Result<MetricDescriptor> find_metric(std::string_view name);

/// Check that every name resolves; reports the first unknown one.
Result<void> validate_metric_names(const std::vector<std::string>& names);

/**
 * @brief Evaluate one metric.
 *
 * Fails with ConfigurationError on an unknown name, empty input or
 * series of different lengths.
 */
Result<double> compute_metric(std::string_view name,
                              std::span<const double> predicted,
                              std::span<const double> actual);

}  // namespace verified_compute
