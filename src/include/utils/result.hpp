#pragma once
/**
 * @file result.hpp
 * @brief Result<T, E>: a value, or an error enum, for failures that are routine.
 *
 * Two places in the bridge report failures this way instead of throwing:
 *  - decoding wire frames (a malformed frame is expected on a long-lived channel);
 *  - adapter commands (an unknown adapter or device id is expected).
 *
 * @code
 * auto r = decode_gateway_message(frame);
 * if (r.is_error())
 *     LOGGER_DEBUG("Relay: dropped frame ({})", to_string(r.error()));
 * else
 *     inbound.send(std::move(r).content());
 * @endcode
 *
 * Accessing the wrong side throws std::logic_error; that is a programming
 * error, not a runtime condition.
 */
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <variant>

namespace gwbridge::utils
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
        return Result(std::in_place_index<1>, err);
    }

    [[nodiscard]] bool is_ok() const noexcept { return m_state.index() == 0; }
    [[nodiscard]] bool is_error() const noexcept { return m_state.index() == 1; }

    [[nodiscard]] T &content() &
    {
        require_value();
        return std::get<0>(m_state);
    }

    [[nodiscard]] const T &content() const &
    {
        require_value();
        return std::get<0>(m_state);
    }

    [[nodiscard]] T &&content() &&
    {
        require_value();
        return std::get<0>(std::move(m_state));
    }

    [[nodiscard]] E error() const
    {
        if (!is_error())
            throw std::logic_error("Result: error() on a success value");
        return std::get<1>(m_state);
    }

    [[nodiscard]] T value_or(T fallback) const &
    {
        return is_ok() ? std::get<0>(m_state) : std::move(fallback);
    }

  private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U &&v) : m_state(tag, std::forward<U>(v))
    {
    }

    void require_value() const
    {
        if (!is_ok())
            throw std::logic_error("Result: content() on an error");
    }

    // Index 0 holds the value, index 1 the error; T and E may be the same type.
    std::variant<T, E> m_state;
};

} // namespace gwbridge::utils
