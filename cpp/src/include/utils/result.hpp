/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for operations that can fail in expected ways.
 *
 * Design:
 * - Distinguishes between success (T) and expected failures (E + integer detail code)
 * - Forces explicit error handling at call sites
 * - No implicit conversions to bool (prevents accidental misuse)
 * - [[nodiscard]] prevents ignoring errors
 *
 * Operations with no success value use `Result<std::monostate, E>` (alias `Status<E>`)
 * and `Status<E>::ok()`.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace plushlink::utils
{

/**
 * @class Result
 * @brief Holds either a success value of type T or an error enum E with a detail code.
 *
 * @tparam T Success value type
 * @tparam E Error enum type
 *
 * @code
 * Result<UploadReport, TransferError> r = controller.upload(2, bytes);
 * if (r.is_ok()) {
 *     use(r.content());
 * } else {
 *     LOGGER_WARN("upload failed: {} ({})", to_string(r.error()), r.error_code());
 * }
 * @endcode
 *
 * Thread Safety: Result objects are not thread-safe.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    /**
     * @brief Create a successful Result containing a value.
     */
    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    /**
     * @brief Create a successful Result for value-less operations.
     */
    [[nodiscard]] static Result ok()
        requires std::is_same_v<T, std::monostate>
    {
        return ok(std::monostate{});
    }

    /**
     * @brief Create a failed Result.
     * @param err The error enum value
     * @param code Optional detail (byte offset, opcode, errno...). Default 0.
     */
    [[nodiscard]] static Result error(E err, int code = 0)
    {
        Result result;
        result.m_data = ErrorData{err, code};
        return result;
    }

    // Default constructible (starts in error state with default error)
    Result() : m_data(ErrorData{E{}, 0}) {}

    // Movable but not copyable
    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    /**
     * @brief Get the success content.
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(std::move(m_data));
    }

    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

    /**
     * @brief Get the error enum value.
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] E error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<ErrorData>(m_data).error_enum;
    }

    /**
     * @brief Get the detail code attached to the error (0 if not set).
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return std::get<ErrorData>(m_data).error_code;
    }

    /**
     * @brief Re-wrap this error as a Result of another value type.
     * @throws std::logic_error if Result is in success state
     */
    template <typename U> [[nodiscard]] Result<U, E> forward_error() const
    {
        return Result<U, E>::error(error(), error_code());
    }

  private:
    struct ErrorData
    {
        E error_enum;
        int error_code;
    };

    std::variant<T, ErrorData> m_data;
};

/// Result for operations that only report success or failure.
template <typename E> using Status = Result<std::monostate, E>;

} // namespace plushlink::utils
