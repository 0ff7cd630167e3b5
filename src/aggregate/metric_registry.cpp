/**
 * @file metric_registry.cpp
 * @brief Metric function implementations and the name table.
 */

#include "aggregate/metric_registry.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace verified_compute {

namespace {

constexpr double POSITIVE_THRESHOLD = 0.5;

struct Confusion {
    double tp = 0, tn = 0, fp = 0, fn = 0;
};

Confusion confusion(std::span<const double> predicted, std::span<const double> actual) {
    Confusion c;
    for (size_t i = 0; i < predicted.size(); ++i) {
        bool p = predicted[i] >= POSITIVE_THRESHOLD;
        bool a = actual[i] >= POSITIVE_THRESHOLD;
        if (p && a) c.tp += 1;
        else if (!p && !a) c.tn += 1;
        else if (p && !a) c.fp += 1;
        else c.fn += 1;
    }
    return c;
}

double safe_div(double num, double den) {
    return den == 0.0 ? 0.0 : num / den;
}

double mean(std::span<const double> values) {
    double sum = 0.0;
    for (double v : values) sum += v;
    return sum / static_cast<double>(values.size());
}

double variance(std::span<const double> values) {
    double m = mean(values);
    double acc = 0.0;
    for (double v : values) acc += (v - m) * (v - m);
    return acc / static_cast<double>(values.size());
}

// ── Classification ───────────────────────────

double accuracy(std::span<const double> p, std::span<const double> a) {
    auto c = confusion(p, a);
    return safe_div(c.tp + c.tn, static_cast<double>(p.size()));
}

double precision(std::span<const double> p, std::span<const double> a) {
    auto c = confusion(p, a);
    return safe_div(c.tp, c.tp + c.fp);
}

double recall(std::span<const double> p, std::span<const double> a) {
    auto c = confusion(p, a);
    return safe_div(c.tp, c.tp + c.fn);
}

double f1_score(std::span<const double> p, std::span<const double> a) {
    auto c = confusion(p, a);
    return safe_div(2.0 * c.tp, 2.0 * c.tp + c.fp + c.fn);
}

// Mean per-class recall over the classes present in `actual`.
double balanced_accuracy(std::span<const double> p, std::span<const double> a) {
    auto c = confusion(p, a);
    double sum = 0.0;
    int classes = 0;
    if (c.tp + c.fn > 0) { sum += c.tp / (c.tp + c.fn); ++classes; }
    if (c.tn + c.fp > 0) { sum += c.tn / (c.tn + c.fp); ++classes; }
    return classes == 0 ? 0.0 : sum / classes;
}

double matthews_correlation(std::span<const double> p, std::span<const double> a) {
    auto c = confusion(p, a);
    double den = std::sqrt((c.tp + c.fp) * (c.tp + c.fn) * (c.tn + c.fp) * (c.tn + c.fn));
    return safe_div(c.tp * c.tn - c.fp * c.fn, den);
}

// ── Regression ───────────────────────────────

double mse(std::span<const double> p, std::span<const double> a) {
    double acc = 0.0;
    for (size_t i = 0; i < p.size(); ++i) acc += (p[i] - a[i]) * (p[i] - a[i]);
    return acc / static_cast<double>(p.size());
}

double rmse(std::span<const double> p, std::span<const double> a) {
    return std::sqrt(mse(p, a));
}

double mae(std::span<const double> p, std::span<const double> a) {
    double acc = 0.0;
    for (size_t i = 0; i < p.size(); ++i) acc += std::abs(p[i] - a[i]);
    return acc / static_cast<double>(p.size());
}

// Fraction, not percent. Samples with a zero actual value are skipped.
double mape(std::span<const double> p, std::span<const double> a) {
    double acc = 0.0;
    size_t n = 0;
    for (size_t i = 0; i < p.size(); ++i) {
        if (a[i] == 0.0) continue;
        acc += std::abs((a[i] - p[i]) / a[i]);
        ++n;
    }
    return n == 0 ? 0.0 : acc / static_cast<double>(n);
}

double r2_score(std::span<const double> p, std::span<const double> a) {
    double m = mean(a);
    double ss_res = 0.0, ss_tot = 0.0;
    for (size_t i = 0; i < p.size(); ++i) {
        ss_res += (a[i] - p[i]) * (a[i] - p[i]);
        ss_tot += (a[i] - m) * (a[i] - m);
    }
    if (ss_tot == 0.0) return ss_res == 0.0 ? 1.0 : 0.0;
    return 1.0 - ss_res / ss_tot;
}

double max_error(std::span<const double> p, std::span<const double> a) {
    double worst = 0.0;
    for (size_t i = 0; i < p.size(); ++i) worst = std::max(worst, std::abs(p[i] - a[i]));
    return worst;
}

double explained_variance(std::span<const double> p, std::span<const double> a) {
    std::vector<double> residual(p.size());
    for (size_t i = 0; i < p.size(); ++i) residual[i] = a[i] - p[i];
    double var_a = variance(a);
    double var_r = variance(residual);
    if (var_a == 0.0) return var_r == 0.0 ? 1.0 : 0.0;
    return 1.0 - var_r / var_a;
}

constexpr std::array<MetricDescriptor, 13> CATALOG{{
    {MetricKind::Accuracy,                    "accuracy",             MetricFamily::Classification, &accuracy},
    {MetricKind::Precision,                   "precision",            MetricFamily::Classification, &precision},
    {MetricKind::Recall,                      "recall",               MetricFamily::Classification, &recall},
    {MetricKind::F1Score,                     "f1_score",             MetricFamily::Classification, &f1_score},
    {MetricKind::BalancedAccuracy,            "balanced_accuracy",    MetricFamily::Classification, &balanced_accuracy},
    {MetricKind::MatthewsCorrelation,         "matthews_correlation", MetricFamily::Classification, &matthews_correlation},
    {MetricKind::MeanSquaredError,            "mse",                  MetricFamily::Regression,     &mse},
    {MetricKind::RootMeanSquaredError,        "rmse",                 MetricFamily::Regression,     &rmse},
    {MetricKind::MeanAbsoluteError,           "mae",                  MetricFamily::Regression,     &mae},
    {MetricKind::MeanAbsolutePercentageError, "mape",                 MetricFamily::Regression,     &mape},
    {MetricKind::R2Score,                     "r2_score",             MetricFamily::Regression,     &r2_score},
    {MetricKind::MaxError,                    "max_error",            MetricFamily::Regression,     &max_error},
    {MetricKind::ExplainedVariance,           "explained_variance",   MetricFamily::Regression,     &explained_variance},
}};

}  // anonymous namespace

std::span<const MetricDescriptor> metric_catalog() noexcept {
    return CATALOG;
}

Result<MetricDescriptor> find_metric(std::string_view name) {
    auto it = std::find_if(CATALOG.begin(), CATALOG.end(),
                           [name](const MetricDescriptor& d) { return d.name == name; });
    if (it == CATALOG.end()) {
        return make_error<MetricDescriptor>(
            ErrorCode::ConfigurationError, "Unknown metric: " + std::string(name));
    }
    return *it;
}

Result<void> validate_metric_names(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        auto found = find_metric(name);
        if (!found) return found.error();
    }
    return {};
}

Result<double> compute_metric(std::string_view name,
                              std::span<const double> predicted,
                              std::span<const double> actual) {
    auto metric = find_metric(name);
    if (!metric) return metric.error();

    if (predicted.empty() || predicted.size() != actual.size()) {
        return make_error<double>(
            ErrorCode::ConfigurationError,
            "Metric " + std::string(name) + " needs two non-empty series of equal length");
    }
    return metric->fn(predicted, actual);
}

}  // namespace verified_compute
