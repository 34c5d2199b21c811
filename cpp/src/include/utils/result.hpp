/**
 * @file result.hpp
 * @brief Result<T, E>: a value, or an enum explaining why there is none.
 *
 * For outcomes the caller is expected to branch on (nothing queued, a wait that elapsed).
 * Protocol violations are exceptions, not Results.
 *
 * @code
 * auto r = channel.recv_from_any(false);
 * if (r.is_ok())
 *     handle(r.content());
 * else if (r.error() == relay::RecvError::NoMessage)
 *     idle();
 * @endcode
 */
#pragma once

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <variant>

namespace relayhub
{

template <typename T, typename E> class Result
{
  public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value)
    {
        return Result(std::in_place_index<0>, std::move(value));
    }
    [[nodiscard]] static Result error(E err)
    {
        return Result(std::in_place_index<1>, Failure{err});
    }

    [[nodiscard]] bool is_ok() const noexcept { return m_data.index() == 0; }
    [[nodiscard]] bool is_error() const noexcept { return m_data.index() == 1; }

    /// @throws std::logic_error if this holds an error.
    [[nodiscard]] T &content() &
    {
        require_ok();
        return std::get<0>(m_data);
    }
    [[nodiscard]] const T &content() const &
    {
        require_ok();
        return std::get<0>(m_data);
    }
    [[nodiscard]] T &&content() &&
    {
        require_ok();
        return std::get<0>(std::move(m_data));
    }

    [[nodiscard]] T value_or(T fallback) const &
    {
        return is_ok() ? std::get<0>(m_data) : std::move(fallback);
    }

    /// @throws std::logic_error if this holds a value.
    [[nodiscard]] E error() const
    {
        if (is_ok())
            throw std::logic_error("Result::error() on a value");
        return std::get<1>(m_data).reason;
    }

  private:
    // Wrapped so that T and E may be the same type.
    struct Failure
    {
        E reason;
    };

    template <std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V &&v) : m_data(tag, std::forward<V>(v))
    {
    }

    void require_ok() const
    {
        if (!is_ok())
            throw std::logic_error("Result::content() on an error");
    }

    std::variant<T, Failure> m_data;
};

} // namespace relayhub
