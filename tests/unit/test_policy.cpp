// Portico Policy Tests
// Unit tests for cache sizing, backend policy and server settings resolution

#include <catch2/catch_test_macros.hpp>
#include <string>

#include "../../src/control/policy.hpp"
#include "../../src/control/settings.hpp"

using namespace portico::control;

// ============================
// Cache Config
// ============================

TEST_CASE("Cache config defaults", "[policy][cache]") {
    FatalError error;
    auto config = resolve_cache_config(Settings{}, error);

    REQUIRE(config.has_value());
    REQUIRE_FALSE(error);
    REQUIRE(config->ttl == std::chrono::seconds(300));
    REQUIRE(config->refresh_interval == std::chrono::seconds(180));
    REQUIRE(config->max_size == 1000);
    REQUIRE(config->refresh_retries == 1);
}

TEST_CASE("Cache config fields resolve independently", "[policy][cache]") {
    // Bit i set => override field i
    for (int mask = 0; mask < 16; ++mask) {
        Settings::Values values;
        if (mask & 1) {
            values["cache_ttl_seconds"] = "11";
        }
        if (mask & 2) {
            values["cache_refresh_seconds"] = "22";
        }
        if (mask & 4) {
            values["cache_entries_max"] = "33";
        }
        if (mask & 8) {
            values["cache_refresh_retries"] = "4";
        }

        FatalError error;
        auto config = resolve_cache_config(Settings(values), error);

        INFO("mask = " << mask);
        REQUIRE(config.has_value());
        REQUIRE(config->ttl == std::chrono::seconds((mask & 1) ? 11 : 300));
        REQUIRE(config->refresh_interval == std::chrono::seconds((mask & 2) ? 22 : 180));
        REQUIRE(config->max_size == ((mask & 4) ? 33 : 1000));
        REQUIRE(config->refresh_retries == ((mask & 8) ? 4 : 1));
    }
}

TEST_CASE("Cache config explicit zero overrides the default", "[policy][cache]") {
    FatalError error;
    auto config = resolve_cache_config(
        Settings(Settings::Values{{"cache_entries_max", "0"}, {"cache_refresh_retries", "0"}}),
        error);

    REQUIRE(config.has_value());
    REQUIRE(config->max_size == 0);
    REQUIRE(config->refresh_retries == 0);
}

TEST_CASE("Cache config rejects negative values", "[policy][cache]") {
    FatalError error;
    auto config = resolve_cache_config(Settings(Settings::Values{{"cache_ttl_seconds", "-5"}}),
                                       error);

    REQUIRE_FALSE(config.has_value());
    REQUIRE(error.code == StartupErrc::InvalidSetting);
    REQUIRE(error.message.find("cache_ttl_seconds") != std::string::npos);
}

// ============================
// Backend Config
// ============================

TEST_CASE("Backend caching disabled", "[policy][backend]") {
    SECTION("Unset") {
        auto config = resolve_backend_config(Settings{});
        REQUIRE_FALSE(config.caching_enabled);
        REQUIRE(config.flush_interval == std::chrono::seconds::zero());
        REQUIRE(config.logger != nullptr);
    }

    SECTION("Explicit false ignores the flush interval") {
        auto config = resolve_backend_config(
            Settings(Settings::Values{{"use_cached_backend", "false"},
                                      {"backend_cache_flush_interval_seconds", "0"}}));
        REQUIRE_FALSE(config.caching_enabled);
        REQUIRE(config.flush_interval == std::chrono::seconds::zero());
    }
}

TEST_CASE("Backend flush interval", "[policy][backend]") {
    SECTION("Unset resolves to 15 seconds") {
        auto config =
            resolve_backend_config(Settings(Settings::Values{{"use_cached_backend", "true"}}));
        REQUIRE(config.caching_enabled);
        REQUIRE(config.flush_interval == std::chrono::seconds(15));
    }

    SECTION("Explicit zero resolves to 15 seconds") {
        auto config = resolve_backend_config(
            Settings(Settings::Values{{"use_cached_backend", "true"},
                                      {"backend_cache_flush_interval_seconds", "0"}}));
        REQUIRE(config.flush_interval == std::chrono::seconds(15));
    }

    SECTION("Explicit value is kept") {
        auto config = resolve_backend_config(
            Settings(Settings::Values{{"use_cached_backend", "true"},
                                      {"backend_cache_flush_interval_seconds", "42"}}));
        REQUIRE(config.flush_interval == std::chrono::seconds(42));
    }
}

TEST_CASE("Backend failure policy", "[policy][backend]") {
    SECTION("Absent defaults to fail closed") {
        REQUIRE(resolve_failure_policy(Settings{}) == FailurePolicy::FailClosed);
    }

    SECTION("Explicit true is fail closed") {
        Settings settings(Settings::Values{{"backend_cache_policy_fail_closed", "true"}});
        REQUIRE(resolve_failure_policy(settings) == FailurePolicy::FailClosed);
    }

    SECTION("Explicit false is fail open") {
        Settings settings(Settings::Values{{"backend_cache_policy_fail_closed", "false"}});
        REQUIRE(resolve_failure_policy(settings) == FailurePolicy::FailOpen);
    }

    SECTION("Carried into the enabled backend config") {
        auto config = resolve_backend_config(
            Settings(Settings::Values{{"use_cached_backend", "1"},
                                      {"backend_cache_policy_fail_closed", "0"}}));
        REQUIRE(config.policy == FailurePolicy::FailOpen);
        REQUIRE(to_string(config.policy) == "open");
    }
}

// ============================
// Server Settings
// ============================

TEST_CASE("Server settings", "[policy][server]") {
    SECTION("Defaults") {
        auto server = resolve_server_settings(Settings{});
        REQUIRE(server.listen_addr == "3333");
        REQUIRE(server.conn_max_age == std::chrono::seconds(60));
    }

    SECTION("Overrides") {
        auto server = resolve_server_settings(Settings(
            Settings::Values{{"listen_addr", "127.0.0.1:4000"}, {"grpc_conn_max_seconds", "5"}}));
        REQUIRE(server.listen_addr == "127.0.0.1:4000");
        REQUIRE(server.conn_max_age == std::chrono::seconds(5));
    }
}

TEST_CASE("Resolved config serializes to JSON", "[policy][json]") {
    nlohmann::json disabled = BackendConfig{};
    REQUIRE(disabled["caching_enabled"] == false);
    REQUIRE_FALSE(disabled.contains("flush_interval_seconds"));

    nlohmann::json cache = CacheConfig{};
    REQUIRE(cache["max_size"] == 1000);
}
