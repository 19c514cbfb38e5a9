//===----------------------------------------------------------------------===//
//
// Part of the Quasar project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/result.hpp
// Purpose: Result<T, E> type for explicit error handling across the IPC core.
// Key invariants: A Result holds exactly one of a value or an error.
// Ownership/Lifetime: Result owns the contained value or error.
// Links: src/support/error.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/error.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <variant>

/**
 * @file result.hpp
 * @brief Result<T, E> type for explicit error handling.
 *
 * @details
 * Functions that can fail return Result<T, E> where T is the success value
 * type and E is the error type (defaults to @ref Error). The caller must
 * check the outcome before touching the value.
 *
 * Usage:
 * @code
 * Result<int> parse(std::string_view text) {
 *     if (text.empty()) {
 *         return Err(Error::InvalidArg);
 *     }
 *     return Result<int>::Ok(42);
 * }
 *
 * auto result = parse("42");
 * if (result.is_ok()) {
 *     int value = result.unwrap();
 * }
 * @endcode
 */
namespace quasar::support
{

/// @brief Error payload produced by @ref Err; converts into any Result.
template <typename E> struct Failure
{
    E error;
};

/// @brief Build a failure that converts into a Result with a compatible error type.
template <typename E> Failure<E> Err(E error)
{
    return Failure<E>{std::move(error)};
}

/**
 * @brief Result type for operations that can fail.
 *
 * @tparam T Success value type
 * @tparam E Error type (defaults to Error enum)
 */
template <typename T, typename E = Error> class Result
{
  public:
    /// Create a success result
    static Result Ok(T value)
    {
        return Result(std::in_place_index<0>, std::move(value));
    }

    /// Create an error result
    static Result Err(E error)
    {
        return Result(std::in_place_index<1>, std::move(error));
    }

    /// Adopt a failure built by the free @ref Err helper.
    template <typename F> Result(Failure<F> failure)
        : storage_(std::in_place_index<1>, E(std::move(failure.error)))
    {
    }

    /// Check if result is success
    [[nodiscard]] bool is_ok() const
    {
        return storage_.index() == 0;
    }

    /// Check if result is error
    [[nodiscard]] bool is_err() const
    {
        return storage_.index() == 1;
    }

    /// Access the success value. @pre is_ok().
    T &value()
    {
        return std::get<0>(storage_);
    }

    /// Access the success value. @pre is_ok().
    const T &value() const
    {
        return std::get<0>(storage_);
    }

    /// Copy out the success value. @pre is_ok().
    [[nodiscard]] T unwrap() const
    {
        return std::get<0>(storage_);
    }

    /// Move out the success value, leaving it moved-from. @pre is_ok().
    [[nodiscard]] T take()
    {
        return std::move(std::get<0>(storage_));
    }

    /// Get the success value or a default
    [[nodiscard]] T unwrap_or(T default_value) const
    {
        return is_ok() ? std::get<0>(storage_) : std::move(default_value);
    }

    /// Get the error. @pre is_err().
    [[nodiscard]] const E &error() const
    {
        return std::get<1>(storage_);
    }

    /// Convert to bool (true = success)
    explicit operator bool() const
    {
        return is_ok();
    }

  private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U &&payload) : storage_(tag, std::forward<U>(payload))
    {
    }

    std::variant<T, E> storage_;
};

/**
 * @brief Result specialization for void success type.
 *
 * @tparam E Error type
 */
template <typename E> class Result<void, E>
{
  public:
    /// Create a success result
    static Result Ok()
    {
        return Result();
    }

    /// Create an error result
    static Result Err(E error)
    {
        Result r;
        r.error_.emplace(std::move(error));
        return r;
    }

    /// Adopt a failure built by the free @ref Err helper.
    template <typename F> Result(Failure<F> failure) : error_(E(std::move(failure.error))) {}

    /// Check if result is success
    [[nodiscard]] bool is_ok() const
    {
        return !error_.has_value();
    }

    /// Check if result is error
    [[nodiscard]] bool is_err() const
    {
        return error_.has_value();
    }

    /// Get the error. @pre is_err().
    [[nodiscard]] const E &error() const
    {
        return *error_;
    }

    /// Convert to bool (true = success)
    explicit operator bool() const
    {
        return is_ok();
    }

  private:
    Result() = default;

    std::optional<E> error_;
};

/// Helper to create Ok result for void
inline Result<void, Error> Ok()
{
    return Result<void, Error>::Ok();
}

} // namespace quasar::support
