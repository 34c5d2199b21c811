/**
 * @file config_workers.cpp
 * @brief Worker scenarios for RelayConfig. Environment variables are set inside the worker,
 *        before its lifecycle starts, so they never leak into other tests.
 */
#include "rlh_service.hpp"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <string>

using namespace relayhub::tests::helper;
using namespace relayhub::utils;
using relayhub::RelayConfig;
using namespace std::chrono_literals;

namespace relayhub::tests::worker::config
{
namespace
{
void set_env(const char *name, const std::string &value)
{
    ::setenv(name, value.c_str(), 1);
}

void clear_env(const char *name)
{
    ::unsetenv(name);
}

// Isolates a worker from the developer's environment and points discovery at `dir`.
void isolate_env(const std::string &dir)
{
    clear_env("RELAYHUB_CONFIG_FILE");
    clear_env("RELAYHUB_STORE_ENDPOINT");
    clear_env("RELAYHUB_LOG_LEVEL");
    set_env("RELAYHUB_CONFIG_DIR", dir);
}
} // namespace

int defaults_without_files(const std::string &dir)
{
    isolate_env(dir);
    return run_gtest_worker(
        [&]()
        {
            const auto &cfg = RelayConfig::get_instance();
            EXPECT_EQ(cfg.store_endpoint(), "tcp://127.0.0.1:5580");
            EXPECT_EQ(cfg.request_timeout(), 5000ms);
            EXPECT_EQ(cfg.log_level(), "info");
            EXPECT_TRUE(cfg.log_file().empty());
            EXPECT_EQ(Logger::instance().level(), Logger::Level::L_INFO);
        },
        "config::defaults_without_files", Logger::GetLifecycleModule(),
        RelayConfig::GetLifecycleModule());
}

int user_file_overrides_default_file(const std::string &dir)
{
    isolate_env(dir);
    return run_gtest_worker(
        [&]()
        {
            const auto &cfg = RelayConfig::get_instance();
            EXPECT_EQ(cfg.store_endpoint(), "ipc:///tmp/from_user");
            EXPECT_EQ(cfg.request_timeout(), 1500ms);
            EXPECT_EQ(cfg.log_level(), "warn");
            EXPECT_EQ(cfg.config_dir(), fs::path(dir));
            // Objects merge recursively, arrays are replaced.
            EXPECT_EQ(cfg.raw().at("extra").at("kept").get<int>(), 1);
            EXPECT_EQ(cfg.raw().at("extra").at("list"), nlohmann::json::array({3}));
            EXPECT_EQ(Logger::instance().level(), Logger::Level::L_WARNING);
        },
        "config::user_file_overrides_default_file", Logger::GetLifecycleModule(),
        RelayConfig::GetLifecycleModule());
}

int explicit_path_replaces_layers(const std::string &dir, const std::string &file)
{
    isolate_env(dir);
    RelayConfig::set_config_path(file);
    return run_gtest_worker(
        [&]()
        {
            const auto &cfg = RelayConfig::get_instance();
            EXPECT_EQ(cfg.store_endpoint(), "tcp://127.0.0.1:6001");
            // Not taken from relayhub.default.json in `dir`.
            EXPECT_EQ(cfg.request_timeout(), 5000ms);
            EXPECT_FALSE(cfg.raw().contains("extra"));
        },
        "config::explicit_path_replaces_layers", Logger::GetLifecycleModule(),
        RelayConfig::GetLifecycleModule());
}

int environment_overrides(const std::string &dir, const std::string &file)
{
    isolate_env(dir);
    set_env("RELAYHUB_CONFIG_FILE", file);
    set_env("RELAYHUB_STORE_ENDPOINT", "tcp://10.0.0.1:7000");
    set_env("RELAYHUB_LOG_LEVEL", "error");
    return run_gtest_worker(
        [&]()
        {
            const auto &cfg = RelayConfig::get_instance();
            EXPECT_EQ(cfg.store_endpoint(), "tcp://10.0.0.1:7000");
            EXPECT_EQ(cfg.log_level(), "error");
            EXPECT_EQ(Logger::instance().level(), Logger::Level::L_ERROR);
        },
        "config::environment_overrides", Logger::GetLifecycleModule(),
        RelayConfig::GetLifecycleModule());
}

int malformed_file_falls_back(const std::string &dir)
{
    isolate_env(dir);
    return run_gtest_worker(
        [&]()
        {
            const auto &cfg = RelayConfig::get_instance();
            EXPECT_EQ(cfg.store_endpoint(), "tcp://127.0.0.1:5580");
            EXPECT_EQ(cfg.log_level(), "info");
        },
        "config::malformed_file_falls_back", Logger::GetLifecycleModule(),
        RelayConfig::GetLifecycleModule());
}

int logging_section_is_applied(const std::string &dir, const std::string &log_path)
{
    isolate_env(dir);
    return run_gtest_worker(
        [&]()
        {
            EXPECT_EQ(RelayConfig::get_instance().log_file(), log_path);
            EXPECT_EQ(Logger::instance().level(), Logger::Level::L_DEBUG);
            LOGGER_DEBUG("config check {}", 7);
            Logger::instance().flush();

            std::string contents;
            ASSERT_TRUE(read_file_contents(log_path, contents));
            EXPECT_NE(contents.find("config check 7"), std::string::npos);
        },
        "config::logging_section_is_applied", Logger::GetLifecycleModule(),
        RelayConfig::GetLifecycleModule());
}

} // namespace relayhub::tests::worker::config

namespace
{
struct ConfigWorkerRegistrar
{
    ConfigWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 3)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "config")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                using namespace relayhub::tests::worker::config;
                if (scenario == "defaults_without_files")
                    return defaults_without_files(argv[2]);
                if (scenario == "user_file_overrides_default_file")
                    return user_file_overrides_default_file(argv[2]);
                if (scenario == "malformed_file_falls_back")
                    return malformed_file_falls_back(argv[2]);
                if (scenario == "explicit_path_replaces_layers" && argc > 3)
                    return explicit_path_replaces_layers(argv[2], argv[3]);
                if (scenario == "environment_overrides" && argc > 3)
                    return environment_overrides(argv[2], argv[3]);
                if (scenario == "logging_section_is_applied" && argc > 3)
                    return logging_section_is_applied(argv[2], argv[3]);
                fmt::print(stderr, "ERROR: Unknown config scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static ConfigWorkerRegistrar g_config_registrar;
} // namespace
