/**
 * @file result.hpp
 * @brief Monadic error handling type for ExecEngine.
 * @author Dimitris Kafetzis
 *
 * Result<T, E> is the error channel of every engine operation. User-code
 * failures never travel through it; they are data inside ExecutionResult.
 * Only engine faults and admission rejections do.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace exec_engine {

/**
 * @brief Error type carrying a descriptive message.
 */
struct Error {
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
};

// ─────────────────────────────────────────────
// Admission rejection
// ─────────────────────────────────────────────

enum class RejectReason : uint8_t {
    UnknownEnvironment,
    EnvironmentUnavailable,
    MalformedSubmission,
    LimitAboveCeiling,
    QueueFull,
    ShuttingDown
};

[[nodiscard]] constexpr std::string_view to_string(RejectReason reason) noexcept {
    switch (reason) {
        case RejectReason::UnknownEnvironment:     return "unknown_environment";
        case RejectReason::EnvironmentUnavailable: return "environment_unavailable";
        case RejectReason::MalformedSubmission:    return "malformed_submission";
        case RejectReason::LimitAboveCeiling:      return "limit_above_ceiling";
        case RejectReason::QueueFull:              return "queue_full";
        case RejectReason::ShuttingDown:           return "shutting_down";
    }
    return "unknown";
}

/**
 * @brief Synchronous admission failure; the submission never entered the queue.
 */
struct Rejection {
    RejectReason reason;
    std::string detail;

    Rejection(RejectReason r, std::string d = {}) : reason(r), detail(std::move(d)) {}

    [[nodiscard]] std::string_view code() const noexcept { return to_string(reason); }
};

/**
 * @brief Result<T, E>: holds either a success value or an error.
 */
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept { return has_value(); }

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

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) return func(value());
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) return func(value());
        return error();
    }

    [[nodiscard]] T value_or(T fallback) const& {
        if (has_value()) return value();
        return fallback;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Result for operations with no success payload.
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
template <typename T, typename E = Error>
Result<T, E> make_error(std::string message) {
    return Result<T, E>(E{std::move(message)});
}

/// Convenience factory for rejections.
template <typename T>
Result<T, Rejection> reject(RejectReason reason, std::string detail = {}) {
    return Result<T, Rejection>(Rejection{reason, std::move(detail)});
}

}  // namespace exec_engine
