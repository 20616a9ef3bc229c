/**
 * @file status.h
 * @brief Status and value-or-error result types used across the ssdet API.
 *
 * ssdet reports failures through return values rather than exceptions:
 * - @ref ssdet::Status carries a compact code plus a diagnostic message,
 * - @ref ssdet::Result wraps either a value or a non-OK status.
 *
 * Configuration errors (mismatched per-layer lists, non-square image for size bounds,
 * zero batch size in the loss, undetermined class count) are all reported as
 * @ref ssdet::Status::Code::InvalidArgument with a message naming the offending field.
 *
 * @ingroup ssdet_status
 */

/**
 * @defgroup ssdet_status Status and Result
 * @brief Error handling primitives used across the ssdet API.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

/**
 * @def SSDET_STATUS_TRY
 * @brief Evaluate an expression returning ::ssdet::Status and return it from the caller on error.
 *
 * An OK status that carries a message is treated as a warning and copied into @p stat.message
 * with a @c "warning: " prefix (the last warning wins).
 *
 * @code
 * ::ssdet::Status f() {
 *   ::ssdet::Status st = ::ssdet::Status::Ok();
 *   SSDET_STATUS_TRY(st, cfg.validate());
 *   SSDET_STATUS_TRY(st, check_layers(cfg));
 *   return st;
 * }
 * @endcode
 */
#ifndef SSDET_STATUS_TRY
    #define SSDET_STATUS_TRY(stat, expr)                                                                               \
        do {                                                                                                           \
            ::ssdet::Status _ssdet_st = (expr);                                                                        \
            if (!_ssdet_st.ok()) return _ssdet_st;                                                                     \
            if (!_ssdet_st.message.empty()) stat.message = std::string("warning: ") + _ssdet_st.message;               \
        } while (0)
#endif

namespace ssdet {

/**
 * @ingroup ssdet_status
 * @brief Outcome of an operation: success or a typed error with a message.
 */
struct Status final {
    /**
     * @brief Canonical error codes.
     *
     * Numeric values are stable; new codes are appended only.
     */
    enum class Code : std::uint8_t {
        /** Operation completed successfully. */
        Ok = 0,
        /** Invalid argument, inconsistent configuration or violated precondition. */
        InvalidArgument = 1,
        /** Requested resource was not found (model file, output tensor, layer name). */
        NotFound = 2,
        /** Operation is not supported by this build or by the given model export. */
        Unsupported = 3,
        /** Input data could not be decoded (e.g. empty or non-BGR image). */
        DecodeError = 4,
        /** Unexpected internal failure (third-party library error, broken invariant). */
        Internal = 5,
        /** Memory allocation failed. */
        OutOfMemory = 6,
    };

    /** @brief Machine-readable status code. */
    Code code = Code::Ok;

    /** @brief Human-readable diagnostic (empty for plain success). */
    std::string message{};

    static Status Ok() {
        return {Code::Ok, {}};
    }

    static Status Invalid(std::string msg) {
        return {Code::InvalidArgument, std::move(msg)};
    }

    static Status NotFound(std::string msg) {
        return {Code::NotFound, std::move(msg)};
    }

    static Status Unsupported(std::string msg) {
        return {Code::Unsupported, std::move(msg)};
    }

    static Status DecodeError(std::string msg) {
        return {Code::DecodeError, std::move(msg)};
    }

    static Status Internal(std::string msg) {
        return {Code::Internal, std::move(msg)};
    }

    static Status OutOfMemory(std::string msg) {
        return {Code::OutOfMemory, std::move(msg)};
    }

    /** @brief True if @ref code is @ref Code::Ok. */
    bool ok() const noexcept {
        return code == Code::Ok;
    }
};

/**
 * @ingroup ssdet_status
 * @brief Holds either a value of type @c T or a non-OK @ref Status.
 *
 * @code
 * auto r = ssdet::anchor::size_bounds_to_absolute({0.15f, 0.90f}, 6, {300, 300});
 * if (!r.ok()) {
 *   std::cerr << r.status().message << "\n";
 *   return;
 * }
 * auto sizes = std::move(r).value();
 * @endcode
 *
 * @warning @ref value() does not check; call it only when @ref ok() is true.
 */
template <class T> class Result final {
  public:
    static Result Ok(T v) {
        Result r;
        r.value_.emplace(std::move(v));
        r.status_ = Status::Ok();
        return r;
    }

    /** @brief Error result; @p s must be non-OK. */
    static Result Err(Status s) {
        Result r;
        r.status_ = std::move(s);
        return r;
    }

    bool ok() const noexcept {
        return status_.ok();
    }

    const Status& status() const noexcept {
        return status_;
    }

    T& value() & {
        return *value_;
    }

    const T& value() const& {
        return *value_;
    }

    T&& value() && {
        return std::move(*value_);
    }

  private:
    Result() = default;

    Status status_{};
    std::optional<T> value_{};
};

} // namespace ssdet
