#pragma once
/**
 * @file module_def.hpp
 * @brief One process-wide module as the LifecycleManager sees it: a name, the
 *        modules it needs, and its start and stop callbacks.
 *
 * @code
 * ModuleDef CatalogStore::GetLifecycleModule()
 * {
 *     ModuleDef module("CatalogStore");
 *     module.depends_on("Logger").on_start(&start_sqlite).on_stop(&stop_sqlite, 1s);
 *     return module;
 * }
 * @endcode
 */
#include "artbus_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace artbus::utils
{

class LifecycleManager;

/// Start/stop callback. `arg` is the string given to `on_start`, or nullptr.
using LifecycleCallback = void (*)(const char *arg);

class ARTBUS_EXPORT ModuleDef
{
  public:
    static constexpr size_t kMaxNameLength = 128;
    static constexpr size_t kMaxArgLength = 512;

    /**
     * @throws std::invalid_argument if `name` is empty.
     * @throws std::length_error     if `name` is longer than kMaxNameLength.
     */
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /// `module` is started before this one and stopped after it.
    /// @throws std::invalid_argument / std::length_error as for the constructor.
    ModuleDef &depends_on(std::string_view module);

    /// @throws std::length_error if `arg` is longer than kMaxArgLength.
    ModuleDef &on_start(LifecycleCallback fn, std::string_view arg = {});

    /// A stop callback still running after `budget` is left behind and reported.
    ModuleDef &on_stop(LifecycleCallback fn, std::chrono::milliseconds budget);

    [[nodiscard]] const std::string &name() const;

  private:
    friend class LifecycleManager;
    struct Spec;
    std::unique_ptr<Spec> m_spec;
};

} // namespace artbus::utils
