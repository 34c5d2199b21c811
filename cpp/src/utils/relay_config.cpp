/**
 * @file relay_config.cpp
 * @brief RelayConfig singleton lifecycle module implementation.
 */
#include "rlh_service.hpp"
#include "utils/relay_config.hpp"

#include <atomic>
#include <cstdlib>
#include <fstream>
#include <mutex>

namespace relayhub
{

namespace fs = std::filesystem;

static std::atomic<bool> g_relay_config_initialized{false};

static std::mutex g_config_path_mu;
static fs::path g_config_path_override;

namespace
{

fs::path discover_config_dir()
{
    if (const char *env = std::getenv("RELAYHUB_CONFIG_DIR"))
    {
        return fs::path(env);
    }
    std::error_code ec;
    const fs::path bin = fs::path(platform::get_executable_name(true)).parent_path();
    if (bin.empty())
        return {};

    // Staged layout: <root>/bin/ + <root>/config/
    fs::path candidate = bin / ".." / "config";
    if (fs::is_directory(candidate, ec))
        return fs::weakly_canonical(candidate, ec);

    // Flat layout: config/ next to the binary
    candidate = bin / "config";
    if (fs::is_directory(candidate, ec))
        return fs::weakly_canonical(candidate, ec);
    return {};
}

/// Returns a null JSON value when the file is missing or does not parse.
nlohmann::json read_json_file(const fs::path &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        return nlohmann::json{};
    try
    {
        nlohmann::json j;
        f >> j;
        return j;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        LOGGER_WARN("RelayConfig: '{}' is not valid JSON: {}", path.string(), e.what());
    }
    return nlohmann::json{};
}

} // namespace

void config_detail::json_merge(nlohmann::json &base, const nlohmann::json &overrides)
{
    if (!overrides.is_object())
        return;
    if (!base.is_object())
        base = nlohmann::json::object();
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
        {
            json_merge(base[it.key()], it.value());
        }
        else
        {
            base[it.key()] = it.value();
        }
    }
}

struct RelayConfig::Impl
{
    std::string store_endpoint{"tcp://127.0.0.1:5580"};
    std::chrono::milliseconds request_timeout{5000};
    std::string log_level{"info"};
    std::string log_file{};
    fs::path config_dir;
    nlohmann::json merged = nlohmann::json::object();

    // Type mismatches throw nlohmann::json::type_error, which aborts module startup.
    void apply_json(const nlohmann::json &j)
    {
        if (j.contains("store"))
        {
            const auto &s = j.at("store");
            if (s.contains("endpoint"))
                store_endpoint = s.at("endpoint").get<std::string>();
            if (s.contains("request_timeout_ms"))
                request_timeout = std::chrono::milliseconds(s.at("request_timeout_ms").get<int>());
        }
        if (j.contains("logging"))
        {
            const auto &l = j.at("logging");
            if (l.contains("level"))
                log_level = l.at("level").get<std::string>();
            if (l.contains("file") && l.at("file").is_string())
                log_file = l.at("file").get<std::string>();
        }
    }

    void load_single_file(const fs::path &file, const char *origin)
    {
        config_dir = file.parent_path();
        nlohmann::json j = read_json_file(file);
        if (j.is_object())
        {
            LOGGER_INFO("RelayConfig: loading {} '{}'", origin, file.string());
            config_detail::json_merge(merged, j);
        }
        else
        {
            LOGGER_WARN("RelayConfig: {} '{}' not readable; using defaults", origin, file.string());
        }
    }

    void load(const fs::path &override_path)
    {
        if (!override_path.empty())
        {
            load_single_file(override_path, "override file");
        }
        else if (const char *env = std::getenv("RELAYHUB_CONFIG_FILE"))
        {
            load_single_file(fs::path(env), "RELAYHUB_CONFIG_FILE");
        }
        else
        {
            config_dir = discover_config_dir();
            if (config_dir.empty())
            {
                LOGGER_INFO("RelayConfig: no config directory found; using built-in defaults");
            }
            else
            {
                for (const char *name : {"relayhub.default.json", "relayhub.user.json"})
                {
                    const fs::path file = config_dir / name;
                    nlohmann::json j = read_json_file(file);
                    if (j.is_object())
                    {
                        LOGGER_INFO("RelayConfig: merging '{}'", file.string());
                        config_detail::json_merge(merged, j);
                    }
                }
            }
        }

        apply_json(merged);

        if (const char *env = std::getenv("RELAYHUB_STORE_ENDPOINT"))
            store_endpoint = env;
        if (const char *env = std::getenv("RELAYHUB_LOG_LEVEL"))
            log_level = env;

        LOGGER_INFO("RelayConfig: store_endpoint     = {}", store_endpoint);
        LOGGER_INFO("RelayConfig: request_timeout_ms = {}", request_timeout.count());
        LOGGER_INFO("RelayConfig: log_level          = {}", log_level);
        LOGGER_INFO("RelayConfig: config_dir         = {}", config_dir.string());
    }

    void apply_logging() const
    {
        auto &logger = utils::Logger::instance();
        if (auto lvl = utils::Logger::level_from_string(log_level))
        {
            logger.set_level(*lvl);
        }
        else
        {
            LOGGER_WARN("RelayConfig: unknown logging.level '{}'; keeping current level",
                        log_level);
        }
        if (!log_file.empty() && !logger.set_logfile(log_file))
        {
            LOGGER_ERROR("RelayConfig: could not open log file '{}'; staying on console",
                         log_file);
        }
    }
};

RelayConfig::RelayConfig() : pImpl(std::make_unique<Impl>()) {}
RelayConfig::~RelayConfig() = default;

void RelayConfig::set_config_path(const fs::path &path)
{
    std::lock_guard lock(g_config_path_mu);
    g_config_path_override = path;
}

RelayConfig &RelayConfig::get_instance()
{
    static RelayConfig instance;
    return instance;
}

void RelayConfig::load_(const fs::path &override_path)
{
    pImpl->load(override_path);
    pImpl->apply_logging();
}

const std::string &RelayConfig::store_endpoint() const noexcept { return pImpl->store_endpoint; }
std::chrono::milliseconds RelayConfig::request_timeout() const noexcept { return pImpl->request_timeout; }
const std::string &RelayConfig::log_level() const noexcept { return pImpl->log_level; }
const std::string &RelayConfig::log_file() const noexcept { return pImpl->log_file; }
const fs::path &RelayConfig::config_dir() const noexcept { return pImpl->config_dir; }
const nlohmann::json &RelayConfig::raw() const noexcept { return pImpl->merged; }

namespace
{
void do_relay_config_startup(const char * /*arg*/)
{
    fs::path override_path;
    {
        std::lock_guard lock(g_config_path_mu);
        override_path = g_config_path_override;
    }
    RelayConfig::get_instance().load_(override_path);
    g_relay_config_initialized.store(true, std::memory_order_release);
}

void do_relay_config_shutdown(const char * /*arg*/)
{
    g_relay_config_initialized.store(false, std::memory_order_release);
}
} // namespace

utils::ModuleDef RelayConfig::GetLifecycleModule()
{
    utils::ModuleDef module("relayhub::RelayConfig");
    module.add_dependency("relayhub::utils::Logger");
    module.set_startup(&do_relay_config_startup);
    module.set_shutdown(&do_relay_config_shutdown, std::chrono::milliseconds(500));
    return module;
}

} // namespace relayhub
