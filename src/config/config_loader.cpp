#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <cstdlib>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace nlsql {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            auto expanded = expand_env_vars(s.get());
            if (expanded != s.get()) {
                s = std::move(expanded);
            }
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

// ---- Section extractors ----------------------------------------------------

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

PoolSettings extract_pool(const toml::table& root) {
    PoolSettings cfg;
    const auto* pool = root["pool"].as_table();
    if (!pool) return cfg;
    const auto& p = *pool;

    cfg.max_connections = p["max_connections"].value_or(cfg.max_connections);
    cfg.acquire_timeout_ms = p["acquire_timeout_ms"].value_or(cfg.acquire_timeout_ms);
    cfg.idle_timeout_ms = p["idle_timeout_ms"].value_or(cfg.idle_timeout_ms);
    cfg.connect_timeout_ms = p["connect_timeout_ms"].value_or(cfg.connect_timeout_ms);
    cfg.drain_timeout_ms = p["drain_timeout_ms"].value_or(cfg.drain_timeout_ms);
    cfg.max_lifetime_seconds = p["max_lifetime_seconds"].value_or(cfg.max_lifetime_seconds);
    return cfg;
}

ExecutorSettings extract_executor(const toml::table& root) {
    ExecutorSettings cfg;
    const auto* executor = root["executor"].as_table();
    if (!executor) return cfg;

    cfg.max_result_rows = (*executor)["max_result_rows"].value_or(cfg.max_result_rows);
    cfg.statement_timeout_ms = (*executor)["statement_timeout_ms"].value_or(cfg.statement_timeout_ms);
    return cfg;
}

StreamSettings extract_stream(const toml::table& root) {
    StreamSettings cfg;
    const auto* stream = root["stream"].as_table();
    if (!stream) return cfg;

    cfg.max_buffer_bytes = (*stream)["max_buffer_bytes"].value_or(cfg.max_buffer_bytes);
    return cfg;
}

std::vector<TenantEntry> extract_tenants(const toml::table& root) {
    std::vector<TenantEntry> result;
    const auto* arr = root["tenants"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* t = elem.as_table();
        if (!t) continue;

        TenantEntry entry;
        entry.id = (*t)["id"].value_or(""s);
        entry.dsn = (*t)["dsn"].value_or(""s);
        result.emplace_back(std::move(entry));
    }
    return result;
}

GatewayConfig extract_all_sections(const toml::table& root) {
    GatewayConfig config;
    config.logging = extract_logging(root);
    config.pool = extract_pool(root);
    config.executor = extract_executor(root);
    config.stream = extract_stream(root);
    config.tenants = extract_tenants(root);
    return config;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(GatewayConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const GatewayConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got '{}'",
            config.logging.level));
    }

    const auto& pool = config.pool;
    if (pool.max_connections < 1) {
        errors.push_back(std::format("pool.max_connections must be >= 1, got {}", pool.max_connections));
    }
    if (pool.acquire_timeout_ms <= 0) {
        errors.push_back(std::format("pool.acquire_timeout_ms must be > 0, got {}", pool.acquire_timeout_ms));
    }
    if (pool.idle_timeout_ms <= 0) {
        errors.push_back(std::format("pool.idle_timeout_ms must be > 0, got {}", pool.idle_timeout_ms));
    }
    if (pool.connect_timeout_ms <= 0) {
        errors.push_back(std::format("pool.connect_timeout_ms must be > 0, got {}", pool.connect_timeout_ms));
    }
    if (pool.drain_timeout_ms <= 0) {
        errors.push_back(std::format("pool.drain_timeout_ms must be > 0, got {}", pool.drain_timeout_ms));
    }
    if (pool.max_lifetime_seconds < 0) {
        errors.push_back(std::format("pool.max_lifetime_seconds must be >= 0, got {}", pool.max_lifetime_seconds));
    }

    if (config.executor.max_result_rows < 1) {
        errors.push_back(std::format("executor.max_result_rows must be >= 1, got {}",
            config.executor.max_result_rows));
    }
    if (config.executor.statement_timeout_ms <= 0) {
        errors.push_back(std::format("executor.statement_timeout_ms must be > 0, got {}",
            config.executor.statement_timeout_ms));
    }

    if (config.stream.max_buffer_bytes <= 0) {
        errors.push_back(std::format("stream.max_buffer_bytes must be > 0, got {}",
            config.stream.max_buffer_bytes));
    }

    std::unordered_set<std::string> seen;
    for (size_t i = 0; i < config.tenants.size(); ++i) {
        const auto& tenant = config.tenants[i];
        if (tenant.id.empty()) {
            errors.push_back(std::format("tenants[{}].id is required", i));
            continue;
        }
        if (!seen.insert(tenant.id).second) {
            errors.push_back(std::format("tenants[{}].id '{}' is duplicated", i, tenant.id));
        }
    }

    return errors;
}

} // namespace nlsql
