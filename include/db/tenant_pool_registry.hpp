#pragma once

#include "core/error.hpp"
#include "db/iconnection_pool.hpp"

#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace nlsql {

class IConnectionFactory;

/**
 * @brief Owns one connection pool per tenant
 *
 * Pools are created lazily on the first acquire for a tenant and live until
 * close_pool() or close_all(). The registry is an explicit object handed to
 * whoever needs it; there is no process-wide instance.
 */
class TenantPoolRegistry {
public:
    struct Config {
        PoolConfig pool_defaults;          // dsn is filled in per tenant
    };

    using PoolFactory = std::function<std::shared_ptr<IConnectionPool>(
        const std::string& tenant_id, const PoolConfig& config)>;

    struct Stats {
        size_t total_pools = 0;
        size_t total_connections = 0;
        size_t active_connections = 0;
        size_t failed_acquires = 0;
    };

    struct CloseAllReport {
        size_t pools_closed = 0;
        size_t leases_cancelled = 0;
        std::vector<std::string> errors;   // one entry per pool that failed to close
    };

    /**
     * @param config Defaults applied to every pool
     * @param connection_factory Used by the default pool factory and test_connection()
     */
    TenantPoolRegistry(Config config, std::shared_ptr<IConnectionFactory> connection_factory);

    ~TenantPoolRegistry();

    TenantPoolRegistry(const TenantPoolRegistry&) = delete;
    TenantPoolRegistry& operator=(const TenantPoolRegistry&) = delete;

    /// Replace how pools are built (tests inject counting or failing pools)
    void set_pool_factory(PoolFactory factory);

    /**
     * @brief Get the tenant's pool, creating it on first use
     *
     * Concurrent first calls for one tenant construct exactly one pool. The
     * dsn is only read when the pool is created; a later call with a
     * different dsn still gets the existing pool.
     */
    [[nodiscard]] Result<std::shared_ptr<IConnectionPool>> acquire(
        const std::string& tenant_id, const std::string& dsn);

    /**
     * @brief Remove and drain one tenant's pool
     * @return false if the tenant had no pool
     */
    bool close_pool(const std::string& tenant_id);

    /// Drain every pool. Failures are collected, never abort the sweep.
    CloseAllReport close_all();

    [[nodiscard]] std::vector<std::string> active_tenants() const;

    [[nodiscard]] Stats get_stats() const;

    /// Open a throwaway connection, run the health check query, close it
    [[nodiscard]] Result<bool> test_connection(const std::string& dsn) const;

private:
    struct Entry {
        std::shared_ptr<IConnectionPool> pool;
        size_t dsn_fingerprint = 0;
    };

    Config config_;
    std::shared_ptr<IConnectionFactory> connection_factory_;
    PoolFactory factory_;
    std::unordered_map<std::string, Entry> pools_;
    mutable std::shared_mutex mutex_;
};

} // namespace nlsql
