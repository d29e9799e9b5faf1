/**
 * @file lifecycle.cpp
 * @brief ModuleDef and the LifecycleManager.
 *
 * The start order is a depth-first post-order over the dependency graph, so a
 * module is only reached once everything it depends on has been emitted. Stop
 * callbacks run on a detached thread and are waited for up to their budget.
 */
#include "abus_base.hpp"

#include "utils/lifecycle.hpp"

#include <fmt/ranges.h>

#include <algorithm>
#include <future>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace artbus::utils
{

namespace
{
void check_name(std::string_view name, std::string_view what)
{
    if (name.empty())
    {
        throw std::invalid_argument(fmt::format("ModuleDef: {} is empty", what));
    }
    if (name.size() > ModuleDef::kMaxNameLength)
    {
        throw std::length_error(fmt::format("ModuleDef: {} '{}...' is longer than {} characters",
                                            what, name.substr(0, 32), ModuleDef::kMaxNameLength));
    }
}
} // namespace

// ============================================================================
// ModuleDef
// ============================================================================

struct ModuleDef::Spec
{
    std::string name;
    std::vector<std::string> depends_on;
    LifecycleCallback start{nullptr};
    std::string start_arg;
    bool has_start_arg{false};
    LifecycleCallback stop{nullptr};
    std::chrono::milliseconds stop_budget{0};
};

ModuleDef::ModuleDef(std::string_view name) : m_spec(std::make_unique<Spec>())
{
    check_name(name, "module name");
    m_spec->name = std::string(name);
}

ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

ModuleDef &ModuleDef::depends_on(std::string_view module)
{
    check_name(module, "dependency name");
    m_spec->depends_on.emplace_back(module);
    return *this;
}

ModuleDef &ModuleDef::on_start(LifecycleCallback fn, std::string_view arg)
{
    if (arg.size() > kMaxArgLength)
    {
        throw std::length_error(fmt::format("ModuleDef '{}': start argument is longer than {}",
                                            m_spec->name, kMaxArgLength));
    }
    m_spec->start = fn;
    m_spec->start_arg = std::string(arg);
    m_spec->has_start_arg = !arg.empty();
    return *this;
}

ModuleDef &ModuleDef::on_stop(LifecycleCallback fn, std::chrono::milliseconds budget)
{
    m_spec->stop = fn;
    m_spec->stop_budget = budget;
    return *this;
}

const std::string &ModuleDef::name() const
{
    return m_spec->name;
}

// ============================================================================
// LifecycleManager
// ============================================================================

struct LifecycleManager::State
{
    mutable std::mutex mutex;
    std::map<std::string, ModuleDef::Spec> modules;
    std::vector<std::string> order;
    std::vector<std::string> running;
    std::vector<std::string> config_errors;
    std::atomic<bool> started{false};
    std::atomic<bool> stopped{false};

    enum class Mark
    {
        None,
        Visiting,
        Done
    };

    /// Appends `name` after its dependencies. Returns false on a cycle; `path`
    /// then holds the modules that form it.
    bool visit(const std::string &name, std::map<std::string, Mark> &marks,
               std::vector<std::string> &path)
    {
        Mark &mark = marks[name];
        if (mark == Mark::Done)
        {
            return true;
        }
        if (mark == Mark::Visiting)
        {
            path.erase(path.begin(), std::find(path.begin(), path.end(), name));
            path.push_back(name);
            return false;
        }
        mark = Mark::Visiting;
        path.push_back(name);
        for (const auto &dep : modules.at(name).depends_on)
        {
            if (!visit(dep, marks, path))
            {
                return false;
            }
        }
        path.pop_back();
        mark = Mark::Done;
        order.push_back(name);
        return true;
    }

    /// Fills `order`. Returns a description of what is wrong, or an empty string.
    std::string resolve_order()
    {
        if (!config_errors.empty())
        {
            return fmt::format("{}", fmt::join(config_errors, "; "));
        }
        for (const auto &[name, spec] : modules)
        {
            for (const auto &dep : spec.depends_on)
            {
                if (modules.count(dep) == 0)
                {
                    return fmt::format("module '{}' depends on unknown module '{}'", name, dep);
                }
            }
        }
        std::map<std::string, Mark> marks;
        for (const auto &entry : modules)
        {
            std::vector<std::string> path;
            if (!visit(entry.first, marks, path))
            {
                return fmt::format("dependency cycle: {}", fmt::join(path, " -> "));
            }
        }
        return {};
    }
};

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager manager;
    return manager;
}

LifecycleManager::LifecycleManager() : m_state(std::make_unique<State>()) {}

LifecycleManager::~LifecycleManager() = default;

void LifecycleManager::register_module(ModuleDef &&module)
{
    if (!module.m_spec)
    {
        return;
    }
    std::lock_guard<std::mutex> lock(m_state->mutex);
    if (m_state->started.load())
    {
        ABUS_PANIC("Lifecycle: module '{}' registered after start", module.m_spec->name);
    }
    const std::string name = module.m_spec->name;
    if (!m_state->modules.emplace(name, std::move(*module.m_spec)).second)
    {
        m_state->config_errors.push_back(fmt::format("module '{}' registered twice", name));
    }
}

void LifecycleManager::start()
{
    std::lock_guard<std::mutex> lock(m_state->mutex);
    if (m_state->started.exchange(true))
    {
        return;
    }

    if (const std::string problem = m_state->resolve_order(); !problem.empty())
    {
        ABUS_PANIC("Lifecycle: cannot start: {}", problem);
    }

    for (const auto &name : m_state->order)
    {
        const ModuleDef::Spec &spec = m_state->modules.at(name);
        if (spec.start != nullptr)
        {
            try
            {
                spec.start(spec.has_start_arg ? spec.start_arg.c_str() : nullptr);
            }
            catch (const std::exception &e)
            {
                ABUS_PANIC("Lifecycle: module '{}' failed to start: {} (running: {})", name,
                           e.what(), fmt::join(m_state->running, ", "));
            }
        }
        m_state->running.push_back(name);
        ABUS_DEBUG("Lifecycle: started '{}'", name);
    }
}

void LifecycleManager::stop()
{
    std::lock_guard<std::mutex> lock(m_state->mutex);
    if (!m_state->started.load() || m_state->stopped.exchange(true))
    {
        return;
    }

    for (auto it = m_state->running.rbegin(); it != m_state->running.rend(); ++it)
    {
        const ModuleDef::Spec &spec = m_state->modules.at(*it);
        if (spec.stop == nullptr)
        {
            continue;
        }

        auto task = std::make_shared<std::packaged_task<void()>>([fn = spec.stop] { fn(nullptr); });
        std::future<void> done = task->get_future();
        std::thread([task] { (*task)(); }).detach();

        if (done.wait_for(spec.stop_budget) == std::future_status::timeout)
        {
            fmt::print(stderr, "Lifecycle: module '{}' did not stop within {} ms; left running\n",
                       *it, spec.stop_budget.count());
            continue;
        }
        try
        {
            done.get();
        }
        catch (const std::exception &e)
        {
            fmt::print(stderr, "Lifecycle: module '{}' failed to stop: {}\n", *it, e.what());
        }
        ABUS_DEBUG("Lifecycle: stopped '{}'", *it);
    }
    m_state->running.clear();
}

bool LifecycleManager::started() const noexcept
{
    return m_state->started.load();
}

bool LifecycleManager::stopped() const noexcept
{
    return m_state->stopped.load();
}

std::vector<std::string> LifecycleManager::start_order() const
{
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->order;
}

} // namespace artbus::utils
