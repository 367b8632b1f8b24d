#include "db/tenant_pool_registry.hpp"
#include "core/utils.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "security/dsn_redactor.hpp"

#include <format>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace nlsql {

TenantPoolRegistry::TenantPoolRegistry(Config config,
                                       std::shared_ptr<IConnectionFactory> connection_factory)
    : config_(std::move(config)),
      connection_factory_(std::move(connection_factory)) {

    factory_ = [conn_factory = connection_factory_](const std::string& tenant_id,
                                                    const PoolConfig& pool_config) {
        return std::make_shared<GenericConnectionPool>(tenant_id, pool_config, conn_factory);
    };
}

TenantPoolRegistry::~TenantPoolRegistry() {
    close_all();
}

void TenantPoolRegistry::set_pool_factory(PoolFactory factory) {
    std::unique_lock lock(mutex_);
    factory_ = std::move(factory);
}

Result<std::shared_ptr<IConnectionPool>> TenantPoolRegistry::acquire(
    const std::string& tenant_id, const std::string& dsn) {

    using PoolResult = Result<std::shared_ptr<IConnectionPool>>;

    if (tenant_id.empty()) {
        return PoolResult::error(ErrorCode::INVALID_REQUEST, "Tenant id must not be empty");
    }
    if (utils::trim(dsn).empty()) {
        return PoolResult::error(ErrorCode::INVALID_REQUEST,
            std::format("No connection descriptor for tenant '{}'", tenant_id));
    }

    const size_t fingerprint = std::hash<std::string>{}(dsn);

    // Fast path: shared lock (read-only)
    {
        std::shared_lock lock(mutex_);
        const auto it = pools_.find(tenant_id);
        if (it != pools_.end()) {
            if (it->second.dsn_fingerprint != fingerprint) {
                utils::log::warn(std::format(
                    "Tenant '{}' requested with a different descriptor ({}); keeping the existing pool",
                    tenant_id, DsnRedactor::redact(dsn)));
            }
            return PoolResult::ok(it->second.pool);
        }
    }

    // Slow path: unique lock with double-checked locking
    std::unique_lock lock(mutex_);

    // Double-check: another thread may have created it
    const auto existing = pools_.find(tenant_id);
    if (existing != pools_.end()) {
        return PoolResult::ok(existing->second.pool);
    }

    PoolConfig pool_config = config_.pool_defaults;
    pool_config.dsn = dsn;

    // Pool construction does no I/O; connections open lazily on first lease
    auto pool = factory_ ? factory_(tenant_id, pool_config) : nullptr;
    if (!pool) {
        return PoolResult::error(ErrorCode::DATABASE_ERROR,
            std::format("Could not create connection pool for tenant '{}'", tenant_id));
    }

    pools_.emplace(tenant_id, Entry{pool, fingerprint});
    utils::log::info(std::format("Pool registered for tenant '{}' ({} active)", tenant_id, pools_.size()));
    return PoolResult::ok(std::move(pool));
}

bool TenantPoolRegistry::close_pool(const std::string& tenant_id) {
    std::shared_ptr<IConnectionPool> pool;
    {
        std::unique_lock lock(mutex_);
        const auto it = pools_.find(tenant_id);
        if (it == pools_.end()) {
            return false;
        }
        pool = std::move(it->second.pool);
        pools_.erase(it);
    }

    // Drain outside the lock so other tenants are not blocked
    const auto report = pool->drain();
    utils::log::info(std::format("Pool closed for tenant '{}' (clean={})",
        tenant_id, utils::booltostr(report.drained_cleanly)));
    return true;
}

TenantPoolRegistry::CloseAllReport TenantPoolRegistry::close_all() {
    CloseAllReport report;

    std::unordered_map<std::string, Entry> pools;
    {
        std::unique_lock lock(mutex_);
        pools.swap(pools_);
    }

    if (pools.empty()) {
        return report;
    }

    // Drain concurrently: each pool may wait up to its drain_timeout
    std::vector<std::pair<std::string, std::future<DrainReport>>> futures;
    futures.reserve(pools.size());

    for (auto& [tenant_id, entry] : pools) {
        futures.emplace_back(tenant_id, std::async(std::launch::async,
            [pool = entry.pool] { return pool->drain(); }));
    }

    for (auto& [tenant_id, future] : futures) {
        try {
            const auto drained = future.get();
            ++report.pools_closed;
            report.leases_cancelled += drained.outstanding_at_timeout;
        } catch (const std::exception& e) {
            report.errors.push_back(std::format("tenant '{}': {}", tenant_id, e.what()));
            utils::log::error(std::format("Failed to close pool for tenant '{}': {}", tenant_id, e.what()));
        }
    }

    utils::log::info(std::format("All pools closed: {} closed, {} failed, {} lease(s) cancelled",
        report.pools_closed, report.errors.size(), report.leases_cancelled));
    return report;
}

std::vector<std::string> TenantPoolRegistry::active_tenants() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> tenants;
    tenants.reserve(pools_.size());
    for (const auto& [tenant_id, _] : pools_) {
        tenants.push_back(tenant_id);
    }
    return tenants;
}

TenantPoolRegistry::Stats TenantPoolRegistry::get_stats() const {
    std::shared_lock lock(mutex_);

    Stats stats;
    stats.total_pools = pools_.size();
    for (const auto& [_, entry] : pools_) {
        const auto pool_stats = entry.pool->get_stats();
        stats.total_connections += pool_stats.total_connections;
        stats.active_connections += pool_stats.active_connections;
        stats.failed_acquires += pool_stats.failed_acquires;
    }
    return stats;
}

Result<bool> TenantPoolRegistry::test_connection(const std::string& dsn) const {
    auto conn = connection_factory_->create(dsn);
    if (conn.is_error()) {
        return Result<bool>::error(conn.error_code(), conn.error_message());
    }

    auto& db = conn.value();
    const bool healthy = db->is_healthy(config_.pool_defaults.health_check_query);
    db->close();

    if (!healthy) {
        return Result<bool>::error(ErrorCode::DATABASE_ERROR,
            std::format("Connection to {} opened but the health check failed", DsnRedactor::redact(dsn)));
    }
    return Result<bool>::ok(true);
}

} // namespace nlsql
