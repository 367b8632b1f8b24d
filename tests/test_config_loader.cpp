#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace nlsql;

TEST_CASE("Config: empty document takes every default", "[config]") {
    const auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "info");
    CHECK(cfg.pool.max_connections == 10);
    CHECK(cfg.pool.acquire_timeout_ms == 5000);
    CHECK(cfg.pool.idle_timeout_ms == 30000);
    CHECK(cfg.pool.connect_timeout_ms == 5000);
    CHECK(cfg.pool.max_lifetime_seconds == 3600);
    CHECK(cfg.executor.max_result_rows == 10000);
    CHECK(cfg.executor.statement_timeout_ms == 10000);
    CHECK(cfg.stream.max_buffer_bytes == 1024 * 1024);
    CHECK(cfg.tenants.empty());
}

TEST_CASE("Config: sections and tenants are read", "[config]") {
    const auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "debug"

[pool]
max_connections = 4
acquire_timeout_ms = 250
max_lifetime_seconds = 0

[executor]
max_result_rows = 500

[[tenants]]
id = "acme"
dsn = "postgresql://acme@db/acme"

[[tenants]]
id = "globex"
dsn = "host=globex-db dbname=globex"
)");
    REQUIRE(result.success);

    const auto& cfg = result.config;
    CHECK(cfg.logging.level == "debug");
    CHECK(cfg.pool.max_connections == 4);
    CHECK(cfg.pool.acquire_timeout_ms == 250);
    CHECK(cfg.pool.idle_timeout_ms == 30000);
    CHECK(cfg.pool.max_lifetime_seconds == 0);
    CHECK(cfg.executor.max_result_rows == 500);
    REQUIRE(cfg.tenants.size() == 2);

    const auto* globex = cfg.find_tenant("globex");
    REQUIRE(globex != nullptr);
    CHECK(globex->dsn == "host=globex-db dbname=globex");
    CHECK(cfg.find_tenant("initech") == nullptr);
}

TEST_CASE("Config: ${VAR} in strings expands from the environment", "[config][env]") {
    ::setenv("NLSQL_TEST_ACME_DSN", "postgresql://u:p@acme-db/acme", 1);
    ::unsetenv("NLSQL_TEST_UNSET");

    const auto result = ConfigLoader::load_from_string(R"(
[[tenants]]
id = "acme"
dsn = "${NLSQL_TEST_ACME_DSN}"

[[tenants]]
id = "ghost"
dsn = "prefix-${NLSQL_TEST_UNSET}-suffix"
)");
    REQUIRE(result.success);
    CHECK(result.config.tenants[0].dsn == "postgresql://u:p@acme-db/acme");
    CHECK(result.config.tenants[1].dsn == "prefix--suffix");

    ::unsetenv("NLSQL_TEST_ACME_DSN");
}

TEST_CASE("Config: unclosed ${ is an error", "[config][env]") {
    const auto result = ConfigLoader::load_from_string(R"(
[[tenants]]
id = "acme"
dsn = "${BROKEN"
)");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed") != std::string::npos);
}

TEST_CASE("Config: invalid TOML is reported", "[config]") {
    const auto result = ConfigLoader::load_from_string("[pool\nmax_connections = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to parse config"));
}

TEST_CASE("Config: validation lists every violation", "[config][validation]") {
    const auto result = ConfigLoader::load_from_string(R"(
[logging]
level = "loud"

[pool]
max_connections = 0
acquire_timeout_ms = -1

[executor]
max_result_rows = 0

[[tenants]]
id = "acme"
dsn = "x"

[[tenants]]
id = "acme"
dsn = "y"

[[tenants]]
dsn = "z"
)");
    REQUIRE_FALSE(result.success);
    const auto& msg = result.error_message;
    CHECK(msg.find("logging.level") != std::string::npos);
    CHECK(msg.find("pool.max_connections") != std::string::npos);
    CHECK(msg.find("pool.acquire_timeout_ms") != std::string::npos);
    CHECK(msg.find("executor.max_result_rows") != std::string::npos);
    CHECK(msg.find("duplicated") != std::string::npos);
    CHECK(msg.find("tenants[2].id is required") != std::string::npos);
}

TEST_CASE("Config: validate_config accepts the defaults", "[config][validation]") {
    CHECK(ConfigLoader::validate_config(GatewayConfig{}).empty());
}

TEST_CASE("Config: load_from_file reads a file and reports a missing one", "[config]") {
    const auto path = std::filesystem::temp_directory_path() / "nlsql_test_config.toml";
    {
        std::ofstream out(path);
        out << "[stream]\nmax_buffer_bytes = 4096\n";
    }

    const auto loaded = ConfigLoader::load_from_file(path.string());
    REQUIRE(loaded.success);
    CHECK(loaded.config.stream.max_buffer_bytes == 4096);
    std::filesystem::remove(path);

    const auto missing = ConfigLoader::load_from_file("/nonexistent/nlsql.toml");
    CHECK_FALSE(missing.success);
    CHECK(missing.error_message.starts_with("Failed to load config"));
}
