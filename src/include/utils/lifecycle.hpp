#pragma once
/**
 * @file lifecycle.hpp
 * @brief Starts process-wide modules in dependency order and stops them in
 *        reverse.
 *
 * Services (Logger, FileLock, CryptoUtils, CatalogStore) each provide a
 * `GetLifecycleModule()` factory. An executable hands them to one
 * `LifecycleGuard` at the top of `main()`:
 *
 * @code
 * LifecycleGuard lifecycle(make_module_list(Logger::GetLifecycleModule(),
 *                                           FileLock::GetLifecycleModule(),
 *                                           artbus::crypto::GetLifecycleModule(),
 *                                           CatalogStore::GetLifecycleModule()));
 * @endcode
 *
 * A duplicate name, a missing dependency, a cycle or a start callback that
 * throws is a fatal configuration error: the process reports it and aborts.
 */
#include "abus_base.hpp"

#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace artbus::utils
{

class ARTBUS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /// Adds a module. Registering after `start()` is fatal.
    void register_module(ModuleDef &&module);

    /// Runs every start callback, dependencies first. Later calls do nothing.
    void start();

    /// Runs the stop callbacks of started modules in reverse start order. Later
    /// calls, or a call before `start()`, do nothing.
    void stop();

    [[nodiscard]] bool started() const noexcept;
    [[nodiscard]] bool stopped() const noexcept;

    /// Module names in the order they were started.
    [[nodiscard]] std::vector<std::string> start_order() const;

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();

    struct State;
    std::unique_ptr<State> m_state;
};

/// Moves the given ModuleDef values into a vector.
template <typename... Mods> std::vector<ModuleDef> make_module_list(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "make_module_list takes ModuleDef values");
    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.push_back(std::forward<Mods>(mods)), ...);
    return modules;
}

/**
 * @brief Owns the process lifecycle for its scope.
 *
 * Only the first guard in a process registers its modules and starts them; its
 * destructor stops them. Guards created while an owner exists do nothing.
 */
class LifecycleGuard
{
  public:
    explicit LifecycleGuard(std::vector<ModuleDef> modules)
    {
        bool expected = false;
        if (!owner_taken().compare_exchange_strong(expected, true))
        {
            ABUS_DEBUG("LifecycleGuard: lifecycle already owned; {} module(s) ignored",
                       modules.size());
            return;
        }
        m_owner = true;
        auto &manager = LifecycleManager::instance();
        for (auto &m : modules)
        {
            manager.register_module(std::move(m));
        }
        manager.start();
    }

    ~LifecycleGuard()
    {
        if (m_owner)
        {
            LifecycleManager::instance().stop();
        }
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;

    [[nodiscard]] bool is_owner() const noexcept { return m_owner; }

  private:
    static std::atomic<bool> &owner_taken()
    {
        static std::atomic<bool> taken{false};
        return taken;
    }

    bool m_owner{false};
};

} // namespace artbus::utils
