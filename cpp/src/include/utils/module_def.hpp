#pragma once
/**
 * @file module_def.hpp
 * @brief Registration record for a lifecycle module.
 */
#include "relayhub_utils_export.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string_view>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace relayhub::utils
{

class ModuleDefImpl;
class LifecycleManager;

/// Plain function pointers cross the shared-library boundary safely. `arg` may be null.
using LifecycleCallback = void (*)(const char *arg);

/**
 * @brief Describes one lifecycle module: its name, what it depends on, and how it starts
 *        and stops. Move-only; `LifecycleManager::register_module()` consumes it.
 */
class RELAYHUB_UTILS_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;
    static constexpr size_t MAX_CALLBACK_PARAM_STRLEN = 1024;

    /// @throws std::invalid_argument for an empty name, std::length_error for a long one.
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /// The named module starts before this one and stops after it. Empty names are ignored.
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);

    /// @p arg is copied and handed to @p startup_func as a C string.
    void set_startup(LifecycleCallback startup_func, std::string_view arg);

    /// A shutdown still running after @p timeout is left behind on a detached thread.
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace relayhub::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
