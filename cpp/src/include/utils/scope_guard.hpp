#pragma once

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace plushlink::basics
{

/**
 * @class ScopeGuard
 * @brief An RAII-style guard that executes a callable on scope exit.
 *
 * The cleanup action runs when the scope is left, by falling off the end of the
 * block, an early return, or an exception. It is movable but not copyable.
 *
 * The callable must be `noexcept`: a cleanup that can fail belongs in explicit code,
 * not in a destructor.
 *
 * @code
 *  auto revert = plushlink::basics::make_scope_guard([&]() noexcept {
 *      registry.end_upload(slot, previous_state);
 *  });
 *  ...
 *  registry.commit_upload(slot);
 *  revert.dismiss();
 * @endcode
 */
template <typename Callable>
requires std::invocable<Callable &>
class ScopeGuard
{
  public:
    static_assert(!std::is_reference_v<Callable>, "ScopeGuard cannot hold a reference to a callable.");
    static_assert(std::is_nothrow_invocable_v<Callable &>,
                  "ScopeGuard's callable must be noexcept.");

    explicit ScopeGuard(Callable fn) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(fn))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Callable>)
        : m_func(std::move(other.m_func)), m_active(other.m_active)
    {
        other.dismiss();
    }

    ~ScopeGuard() noexcept
    {
        if (m_active)
        {
            std::invoke(m_func);
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    [[nodiscard]] explicit operator bool() const noexcept { return m_active; }

    /// Deactivates the guard; the callable will not run.
    constexpr void dismiss() noexcept { m_active = false; }

    /// Runs the callable now (once) and deactivates the guard.
    void invoke() noexcept
    {
        if (m_active)
        {
            m_active = false; // dismiss before invoke to prevent double execution
            std::invoke(m_func);
        }
    }

  private:
    Callable m_func;
    bool m_active{true};
};

/**
 * @brief Factory for ScopeGuard; the callable is stored by value.
 */
template <typename F> auto make_scope_guard(F &&f) -> ScopeGuard<std::decay_t<F>>
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(f));
}

} // namespace plushlink::basics
