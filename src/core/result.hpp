/**
 * @file result.hpp
 * @brief Monadic error handling type for VerifiedCompute.
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Errors
 * carry an ErrorCode from the orchestrator's error taxonomy so callers can
 * branch on the kind of failure without parsing messages.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace verified_compute {

// ─────────────────────────────────────────────
// Error Taxonomy
// ─────────────────────────────────────────────

enum class ErrorCode : uint8_t {
    ConfigurationError,      ///< Bad input, caller's fault, raised before dispatch
    EnvironmentUnsupported,  ///< Requested resources exceed the catalog entry
    AssetUnavailable,        ///< Data asset service failure, retryable by caller
    DispatchFailure,         ///< Per-job submit failure
    VerificationFailure,     ///< Attestation rejected
    Timeout,                 ///< Deadline exceeded
    GroupNotTerminal,        ///< Aggregation requested too early
    LedgerSubmissionFailed   ///< Post-aggregation ledger failure
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ConfigurationError:     return "configuration_error";
        case ErrorCode::EnvironmentUnsupported: return "environment_unsupported";
        case ErrorCode::AssetUnavailable:       return "asset_unavailable";
        case ErrorCode::DispatchFailure:        return "dispatch_failure";
        case ErrorCode::VerificationFailure:    return "verification_failure";
        case ErrorCode::Timeout:                return "timeout";
        case ErrorCode::GroupNotTerminal:       return "group_not_terminal";
        case ErrorCode::LedgerSubmissionFailed: return "ledger_submission_failed";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a taxonomy code and a descriptive message.
 */
struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

/**
 * @brief Result<T, E>, a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T>
Result<T> make_error(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

}  // namespace verified_compute
