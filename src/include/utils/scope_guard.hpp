#pragma once
/**
 * @file scope_guard.hpp
 * @brief Deferred teardown for scopes that have no RAII owner.
 *
 * main() uses it to shut the logger and the shared ZeroMQ context down on
 * every return path; tests use it to stop a loop thread when an assertion
 * leaves the test body early.
 *
 * @code
 *  zmq_context_startup();
 *  auto ctx_guard = gwbridge::basics::make_scope_guard([] { zmq_context_shutdown(); });
 * @endcode
 *
 * The cleanup runs from the (noexcept) destructor: a cleanup that throws
 * terminates the process, so cleanups must handle their own errors.
 */
#include <type_traits>
#include <utility>

namespace gwbridge::basics
{

template <typename Fn> class ScopeGuard
{
  public:
    explicit ScopeGuard(Fn fn) : m_fn(std::move(fn)) {}

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Fn>)
        : m_fn(std::move(other.m_fn)), m_armed(std::exchange(other.m_armed, false))
    {
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    ~ScopeGuard() { fire(); }

    /** @brief Drops the pending cleanup. */
    void dismiss() noexcept { m_armed = false; }

    [[nodiscard]] bool armed() const noexcept { return m_armed; }

    /** @brief Runs the cleanup now; the destructor then does nothing. */
    void fire()
    {
        if (std::exchange(m_armed, false))
            m_fn();
    }

  private:
    Fn m_fn;
    bool m_armed = true;
};

template <typename Fn> [[nodiscard]] ScopeGuard<std::decay_t<Fn>> make_scope_guard(Fn &&fn)
{
    return ScopeGuard<std::decay_t<Fn>>(std::forward<Fn>(fn));
}

} // namespace gwbridge::basics
