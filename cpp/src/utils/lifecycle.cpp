/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Module registry, dependency ordering and timed shutdown.
 *
 * Startup order is a depth-first post-order over the dependency edges, so every module
 * starts after the modules it names. Shutdown walks the same list backwards; each
 * shutdown callback gets its own thread and is abandoned (detached) at its deadline.
 ******************************************************************************/
#include "rlh_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/module_def.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <fmt/ranges.h>

namespace relayhub::utils
{

struct ModuleRecord
{
    std::string name;
    std::vector<std::string> dependencies;
    std::function<void()> startup;
    std::function<void()> shutdown;
    std::chrono::milliseconds shutdown_timeout{0};
};

class ModuleDefImpl
{
  public:
    ModuleRecord record;
};

namespace
{

void check_name_length(std::string_view name, const char *what)
{
    if (name.size() > ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(fmt::format("Lifecycle: {} '{}...' is longer than {} characters",
                                            what, name.substr(0, 32),
                                            ModuleDef::MAX_MODULE_NAME_LEN));
    }
}

enum class StopResult
{
    Done,
    Threw,
    TimedOut
};

// The state block is shared with the callback thread so an abandoned callback that
// finishes late still writes into live memory.
StopResult run_with_deadline(const std::function<void()> &fn, std::chrono::milliseconds timeout,
                             std::string &error)
{
    if (!fn)
        return StopResult::Done;

    struct State
    {
        std::mutex mutex;
        std::condition_variable cv;
        bool finished = false;
        std::string error;
    };
    auto state = std::make_shared<State>();

    std::thread runner(
        [state, fn]
        {
            std::string failure;
            try
            {
                fn();
            }
            catch (const std::exception &e)
            {
                failure = e.what();
            }
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->finished = true;
                state->error = std::move(failure);
            }
            state->cv.notify_all();
        });

    std::unique_lock<std::mutex> lock(state->mutex);
    const auto finished = [&state] { return state->finished; };
    if (timeout.count() > 0)
    {
        if (!state->cv.wait_for(lock, timeout, finished))
        {
            lock.unlock();
            runner.detach();
            return StopResult::TimedOut;
        }
    }
    else
    {
        state->cv.wait(lock, finished);
    }
    lock.unlock();
    runner.join();
    if (!state->error.empty())
    {
        error = state->error;
        return StopResult::Threw;
    }
    return StopResult::Done;
}

} // namespace

// ----------------------------------------------------------------------------
// ModuleDef
// ----------------------------------------------------------------------------

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    if (name.empty())
        throw std::invalid_argument("Lifecycle: module name must not be empty");
    check_name_length(name, "module name");
    pImpl->record.name = std::string(name);
}

ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (!pImpl || dependency_name.empty())
        return;
    check_name_length(dependency_name, "dependency name");
    pImpl->record.dependencies.emplace_back(dependency_name);
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    if (pImpl && startup_func != nullptr)
        pImpl->record.startup = [startup_func] { startup_func(nullptr); };
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    if (!pImpl || startup_func == nullptr)
        return;
    if (arg.size() > MAX_CALLBACK_PARAM_STRLEN)
        throw std::length_error("Lifecycle: startup argument is too long");
    pImpl->record.startup = [startup_func, text = std::string(arg)]
    { startup_func(text.c_str()); };
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    if (!pImpl || shutdown_func == nullptr)
        return;
    pImpl->record.shutdown = [shutdown_func] { shutdown_func(nullptr); };
    pImpl->record.shutdown_timeout = timeout;
}

// ----------------------------------------------------------------------------
// LifecycleManagerImpl
// ----------------------------------------------------------------------------

class LifecycleManagerImpl
{
  public:
    void add(ModuleRecord record);
    void initialize(std::source_location loc);
    void finalize(std::source_location loc);

    std::atomic<bool> initialized{false};
    std::atomic<bool> finalized{false};

  private:
    std::vector<size_t> order_modules() const;
    void visit(size_t index, std::vector<int> &mark, std::vector<size_t> &order,
               std::vector<std::string> &path) const;
    size_t index_of(const std::string &name) const;
    [[noreturn]] void fatal(const std::string &what, const std::string &module = {}) const;
    std::string tag() const;

    std::mutex m_mutex;
    std::vector<ModuleRecord> m_modules;
    std::vector<size_t> m_started; // startup order, indices into m_modules
};

std::string LifecycleManagerImpl::tag() const
{
    return fmt::format("[RLH_LifeCycle] [{}:{}]", platform::get_executable_name(),
                       platform::get_pid());
}

void LifecycleManagerImpl::add(ModuleRecord record)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (initialized.load(std::memory_order_acquire))
    {
        RLH_PANIC("{} FATAL: register_module('{}') called after initialization.", tag(),
                  record.name);
    }
    m_modules.push_back(std::move(record));
}

size_t LifecycleManagerImpl::index_of(const std::string &name) const
{
    for (size_t i = 0; i < m_modules.size(); ++i)
    {
        if (m_modules[i].name == name)
            return i;
    }
    throw std::runtime_error("Undefined dependency: " + name);
}

// mark: 0 unvisited, 1 on the current path, 2 placed in the order.
void LifecycleManagerImpl::visit(size_t index, std::vector<int> &mark, std::vector<size_t> &order,
                                 std::vector<std::string> &path) const
{
    if (mark[index] == 2)
        return;
    path.push_back(m_modules[index].name);
    if (mark[index] == 1)
    {
        throw std::runtime_error(
            fmt::format("Circular dependency detected: {}", fmt::join(path, " -> ")));
    }
    mark[index] = 1;
    for (const auto &dep : m_modules[index].dependencies)
        visit(index_of(dep), mark, order, path);
    mark[index] = 2;
    order.push_back(index);
    path.pop_back();
}

std::vector<size_t> LifecycleManagerImpl::order_modules() const
{
    for (size_t i = 0; i < m_modules.size(); ++i)
    {
        for (size_t j = i + 1; j < m_modules.size(); ++j)
        {
            if (m_modules[i].name == m_modules[j].name)
                throw std::runtime_error("Duplicate module name: " + m_modules[i].name);
        }
    }
    std::vector<int> mark(m_modules.size(), 0);
    std::vector<size_t> order;
    std::vector<std::string> path;
    for (size_t i = 0; i < m_modules.size(); ++i)
        visit(i, mark, order, path);
    return order;
}

void LifecycleManagerImpl::fatal(const std::string &what, const std::string &module) const
{
    fmt::print(stderr, "\n{} FATAL: {}. Aborting.\n", tag(), what);
    if (!module.empty())
        fmt::print(stderr, "{} failing module: '{}'\n", tag(), module);
    fmt::print(stderr, "{} registered modules:\n", tag());
    for (const auto &m : m_modules)
        fmt::print(stderr, "    '{}'\n", m.name);
    debug::print_stack_trace();
    std::fflush(stderr);
    std::abort();
}

void LifecycleManagerImpl::initialize(std::source_location loc)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (initialized.exchange(true, std::memory_order_acq_rel))
        return;

    std::string trace = fmt::format("{} initialize() from {} ({}:{})\n", tag(),
                                    loc.function_name(),
                                    format_tools::filename_only(loc.file_name()), loc.line());
    std::vector<size_t> order;
    try
    {
        order = order_modules();
    }
    catch (const std::runtime_error &e)
    {
        fatal(e.what());
    }

    for (size_t index : order)
    {
        const ModuleRecord &mod = m_modules[index];
        try
        {
            if (mod.startup)
                mod.startup();
        }
        catch (const std::exception &e)
        {
            RLH_DEBUG("{}", trace);
            fatal(fmt::format("startup threw: {}", e.what()), mod.name);
        }
        m_started.push_back(index);
        trace += fmt::format("    started '{}'\n", mod.name);
    }
    RLH_DEBUG("{}", trace);
}

void LifecycleManagerImpl::finalize(std::source_location loc)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!initialized.load(std::memory_order_acquire) ||
        finalized.exchange(true, std::memory_order_acq_rel))
        return;

    std::string trace = fmt::format("{} finalize() from {} ({}:{})\n", tag(),
                                    loc.function_name(),
                                    format_tools::filename_only(loc.file_name()), loc.line());
    for (auto it = m_started.rbegin(); it != m_started.rend(); ++it)
    {
        const ModuleRecord &mod = m_modules[*it];
        std::string error;
        switch (run_with_deadline(mod.shutdown, mod.shutdown_timeout, error))
        {
        case StopResult::Done:
            trace += fmt::format("    stopped '{}'\n", mod.name);
            break;
        case StopResult::Threw:
            fmt::print(stderr, "{} WARNING: shutdown of '{}' threw: {}\n", tag(), mod.name, error);
            break;
        case StopResult::TimedOut:
            fmt::print(stderr, "{} WARNING: shutdown of '{}' timed out after {}ms.\n", tag(),
                       mod.name, mod.shutdown_timeout.count());
            break;
        }
    }
    m_started.clear();
    RLH_DEBUG("{}", trace);
}

// ----------------------------------------------------------------------------
// LifecycleManager
// ----------------------------------------------------------------------------

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager manager;
    return manager;
}

void LifecycleManager::register_module(ModuleDef &&module_def)
{
    if (module_def.pImpl)
        pImpl->add(std::move(module_def.pImpl->record));
}

void LifecycleManager::initialize(std::source_location loc)
{
    pImpl->initialize(loc);
}

void LifecycleManager::finalize(std::source_location loc)
{
    pImpl->finalize(loc);
}

bool LifecycleManager::is_initialized()
{
    return pImpl->initialized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_finalized()
{
    return pImpl->finalized.load(std::memory_order_acquire);
}

} // namespace relayhub::utils
