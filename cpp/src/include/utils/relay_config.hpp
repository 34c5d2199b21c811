#pragma once

/**
 * @file relay_config.hpp
 * @brief RelayConfig: process-wide configuration singleton lifecycle module.
 *
 * ## Lifecycle
 *
 * @code
 *   LifecycleGuard lifecycle(MakeModDefList(
 *       Logger::GetLifecycleModule(),
 *       RelayConfig::GetLifecycleModule(),
 *       GetZMQContextModule()));
 * @endcode
 *
 * Startup order: `Logger → RelayConfig`. At startup the logging section is applied to
 * the Logger (level and optional log file).
 *
 * ## Config loading, layered (priority low → high)
 *
 *  1. Built-in C++ defaults
 *  2. `<config_dir>/relayhub.default.json`
 *  3. `<config_dir>/relayhub.user.json`, deep-merged on top of (2)
 *  4. An explicit file from `set_config_path()` or `RELAYHUB_CONFIG_FILE`. It replaces
 *     (2) and (3).
 *  5. `RELAYHUB_STORE_ENDPOINT` / `RELAYHUB_LOG_LEVEL` environment overrides
 *
 * The config directory is `RELAYHUB_CONFIG_DIR` if set, otherwise `<binary_dir>/../config`
 * or `<binary_dir>/config`. Missing or unreadable files fall back to the lower layers.
 *
 * ## Recognised keys
 *
 * @code{.json}
 * {
 *   "store":   { "endpoint": "tcp://127.0.0.1:5580", "request_timeout_ms": 5000 },
 *   "logging": { "level": "info", "file": "" }
 * }
 * @endcode
 */

#include "rlh_service.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <string>

namespace relayhub
{

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

/**
 * @class RelayConfig
 * @brief Singleton lifecycle module that owns the merged JSON configuration.
 *
 * Values are resolved once at startup; getters are const and lock-free afterwards.
 */
class RELAYHUB_UTILS_EXPORT RelayConfig
{
  public:
    /**
     * @brief Optional: call before LifecycleGuard to load one explicit file.
     * Must be called before the lifecycle module starts.
     */
    static void set_config_path(const std::filesystem::path &path);

    /// Module "relayhub::RelayConfig", depends on the Logger.
    static utils::ModuleDef GetLifecycleModule();

    /// @pre The lifecycle module is started.
    static RelayConfig &get_instance();

    /// ZeroMQ endpoint of the store service (e.g. "tcp://127.0.0.1:5580").
    const std::string &store_endpoint() const noexcept;

    /// How long a store client waits for a reply before raising StoreError.
    std::chrono::milliseconds request_timeout() const noexcept;

    const std::string &log_level() const noexcept;

    /// Log file path; empty means the console sink stays active.
    const std::string &log_file() const noexcept;

    /// Directory the layered files were read from (empty if none was found).
    const std::filesystem::path &config_dir() const noexcept;

    /// The merged JSON document, for keys without a typed getter.
    const nlohmann::json &raw() const noexcept;

    RelayConfig(const RelayConfig &) = delete;
    RelayConfig &operator=(const RelayConfig &) = delete;
    RelayConfig(RelayConfig &&) = delete;
    RelayConfig &operator=(RelayConfig &&) = delete;

    /// @internal Called by the lifecycle startup function.
    void load_(const std::filesystem::path &override_path);

  private:
    RelayConfig();
    ~RelayConfig();

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

namespace config_detail
{
/// Recursively merges `overrides` into `base` (object keys override, arrays replace).
RELAYHUB_UTILS_EXPORT void json_merge(nlohmann::json &base, const nlohmann::json &overrides);
} // namespace config_detail

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

} // namespace relayhub
