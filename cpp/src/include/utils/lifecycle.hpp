#pragma once
/**
 * @file lifecycle.hpp
 * @brief Ordered startup and shutdown of process-wide services.
 *
 * The logger, the ZeroMQ context and RelayConfig each provide a `ModuleDef`. A
 * `LifecycleGuard` at the top of `main()` registers them, starts each one after the
 * modules it depends on, and stops them in the opposite order when it goes out of scope:
 *
 * @code
 * relayhub::utils::LifecycleGuard guard(relayhub::utils::MakeModDefList(
 *     relayhub::utils::Logger::GetLifecycleModule(), relayhub::utils::GetZMQContextModule()));
 * @endcode
 *
 * A dependency cycle, an unknown dependency, a duplicate name or a throwing startup
 * callback aborts the process after printing the registered modules.
 */
#include "rlh_base.hpp"

#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace relayhub::utils
{

class LifecycleManagerImpl;

/// Moves each ModuleDef argument into a vector, for the LifecycleGuard constructor.
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList takes ModuleDef values only");
    std::vector<ModuleDef> modules;
    modules.reserve(sizeof...(mods));
    (modules.emplace_back(std::forward<Mods>(mods)), ...);
    return modules;
}

class RELAYHUB_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /// Panics once initialize() has run.
    void register_module(ModuleDef &&module_def);

    /// Starts every registered module. Only the first call does anything.
    void initialize(std::source_location loc);

    /// Stops the started modules, last started first. Only the first call does anything.
    void finalize(std::source_location loc);

    [[nodiscard]] bool is_initialized();
    [[nodiscard]] bool is_finalized();

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();
    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    LifecycleManager::instance().register_module(std::move(module_def));
}

inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

inline bool IsAppFinalized()
{
    return LifecycleManager::instance().is_finalized();
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}

/**
 * @brief Scoped owner of the process lifecycle.
 *
 * Only the first guard in a process registers its modules and initializes; it finalizes
 * in its destructor. Any later guard is inert and its modules are discarded.
 */
class LifecycleGuard
{
  public:
    explicit LifecycleGuard(ModuleDef &&module,
                            std::source_location loc = std::source_location::current())
        : LifecycleGuard(MakeModDefList(std::move(module)), loc)
    {
    }

    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        static std::atomic_bool claimed{false};
        if (claimed.exchange(true, std::memory_order_acq_rel))
        {
            RLH_DEBUG("[RLH_LifeCycle] [{}:{}] extra LifecycleGuard at {}:{} ignored",
                      platform::get_executable_name(), platform::get_pid(),
                      format_tools::filename_only(loc.file_name()), loc.line());
            return;
        }
        m_is_owner = true;
        for (auto &m : modules)
            RegisterModule(std::move(m));
        InitializeApp(m_loc);
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
            FinalizeApp(m_loc);
    }

    [[nodiscard]] bool is_owner() const noexcept { return m_is_owner; }

  private:
    std::source_location m_loc;
    bool m_is_owner{false};
};

} // namespace relayhub::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
