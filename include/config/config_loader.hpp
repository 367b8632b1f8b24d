#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace nlsql {

// ============================================================================
// Config sections (mirror the TOML hierarchy)
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

struct PoolSettings {
    int64_t max_connections = 10;
    int64_t acquire_timeout_ms = 5000;
    int64_t idle_timeout_ms = 30000;
    int64_t connect_timeout_ms = 5000;
    int64_t drain_timeout_ms = 5000;
    int64_t max_lifetime_seconds = 3600;    // 0 = never recycle
};

struct ExecutorSettings {
    int64_t max_result_rows = 10000;
    int64_t statement_timeout_ms = 10000;
};

struct StreamSettings {
    int64_t max_buffer_bytes = 1024 * 1024;
};

struct TenantEntry {
    std::string id;
    std::string dsn;
};

struct GatewayConfig {
    LoggingConfig logging;
    PoolSettings pool;
    ExecutorSettings executor;
    StreamSettings stream;
    std::vector<TenantEntry> tenants;

    [[nodiscard]] const TenantEntry* find_tenant(const std::string& id) const {
        for (const auto& t : tenants) {
            if (t.id == id) return &t;
        }
        return nullptr;
    }
};

/**
 * @brief Loads nlsql.toml
 *
 * String values may reference environment variables as ${NAME}; unset
 * variables expand to the empty string. Missing keys take the defaults above.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        GatewayConfig config;

        static LoadResult ok(GatewayConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /// Every rule violation, one message each; empty when the config is usable
    [[nodiscard]] static std::vector<std::string> validate_config(const GatewayConfig& config);

private:
    static LoadResult validate_and_return(GatewayConfig config);
};

} // namespace nlsql
