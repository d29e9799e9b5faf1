#pragma once
/**
 * @file scope_guard.hpp
 * @brief Undo action that runs when the scope is left early.
 *
 * Register the undo right after the side effect it reverses and `dismiss()` it
 * once the whole operation has succeeded:
 *
 * @code
 * auto unlink_tmp = artbus::basics::make_scope_guard([&] { ::unlink(tmp.c_str()); });
 * ... // steps that may return early
 * unlink_tmp.dismiss();
 * @endcode
 *
 * The action runs from a destructor and must not throw.
 */
#include <concepts>
#include <type_traits>
#include <utility>

namespace artbus::basics
{

template <std::invocable Action> class ScopeGuard
{
  public:
    explicit ScopeGuard(Action action) noexcept(std::is_nothrow_move_constructible_v<Action>)
        : m_action(std::move(action))
    {
    }

    ScopeGuard(ScopeGuard &&other) noexcept(std::is_nothrow_move_constructible_v<Action>)
        : m_action(std::move(other.m_action)), m_armed(std::exchange(other.m_armed, false))
    {
    }

    ~ScopeGuard()
    {
        if (m_armed)
        {
            m_action();
        }
    }

    ScopeGuard(const ScopeGuard &) = delete;
    ScopeGuard &operator=(const ScopeGuard &) = delete;
    ScopeGuard &operator=(ScopeGuard &&) = delete;

    void dismiss() noexcept { m_armed = false; }

  private:
    Action m_action;
    bool m_armed{true};
};

template <typename F> [[nodiscard]] ScopeGuard<std::decay_t<F>> make_scope_guard(F &&action)
{
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(action));
}

} // namespace artbus::basics
