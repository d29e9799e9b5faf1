/**
 * @file result.hpp
 * @brief `Result<T, E>`: a value, or an error kind with a code and a message.
 *
 * Failures a caller is expected to handle (a rejected submission, a lock
 * timeout, a failed rename) come back as a Result; exceptions are kept for
 * programming errors. Accessing the wrong side throws `std::logic_error`.
 *
 * @code
 * BusResult<Manifest> m = Manifest::load(path);
 * if (!m.is_ok())
 *     return BusStatus::error_from(m);
 * use(std::move(m).content());
 * @endcode
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace artbus::utils
{

template <typename T, typename E> class Result
{
    struct Failure
    {
        E kind;
        int code;
        std::string message;
    };

  public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) { return Result(std::move(value)); }

    /// `code` is an errno or library status, `message` is meant for people.
    [[nodiscard]] static Result error(E kind, int code = 0, std::string message = {})
    {
        return Result(Failure{kind, code, std::move(message)});
    }

    /// Carries the failure of `other` over to this value type.
    template <typename U> [[nodiscard]] static Result error_from(const Result<U, E> &other)
    {
        return error(other.error(), other.error_code(), other.error_message());
    }

    /// An error with a default-constructed kind; only useful as a placeholder.
    Result() : m_state(Failure{E{}, 0, {}}) {}

    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return m_state.index() == 0; }
    [[nodiscard]] bool is_error() const noexcept { return m_state.index() == 1; }

    [[nodiscard]] T &content() & { return value("content"); }
    [[nodiscard]] const T &content() const & { return const_cast<Result *>(this)->value("content"); }
    [[nodiscard]] T &&content() && { return std::move(value("content")); }

    [[nodiscard]] T value_or(T fallback) const &
    {
        if (is_ok())
        {
            return std::get<0>(m_state);
        }
        return fallback;
    }

    [[nodiscard]] E error() const { return failure("error").kind; }
    [[nodiscard]] int error_code() const { return failure("error_code").code; }
    [[nodiscard]] const std::string &error_message() const { return failure("error_message").message; }

  private:
    explicit Result(T value) : m_state(std::in_place_index<0>, std::move(value)) {}
    explicit Result(Failure failure) : m_state(std::in_place_index<1>, std::move(failure)) {}

    T &value(const char *accessor)
    {
        if (!is_ok())
        {
            throw std::logic_error(std::string("Result::") + accessor + "() on an error");
        }
        return std::get<0>(m_state);
    }

    const Failure &failure(const char *accessor) const
    {
        if (!is_error())
        {
            throw std::logic_error(std::string("Result::") + accessor + "() on a value");
        }
        return std::get<1>(m_state);
    }

    std::variant<T, Failure> m_state;
};

} // namespace artbus::utils
