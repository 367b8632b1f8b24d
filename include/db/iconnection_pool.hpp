#pragma once

#include "core/error.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace nlsql {

class PooledConnection;

/**
 * @brief Pool configuration
 */
struct PoolConfig {
    std::string dsn;
    size_t max_connections = 10;
    std::chrono::milliseconds acquire_timeout{5000};
    std::chrono::milliseconds idle_timeout{30000};
    std::chrono::milliseconds drain_timeout{5000};
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{3600};  // 0 = disabled
};

/**
 * @brief Pool statistics for monitoring
 */
struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t total_releases = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;
    size_t broken_discarded = 0;        // closed on return because the link was down
};

/**
 * @brief What happened when a pool was closed
 */
struct DrainReport {
    size_t idle_closed = 0;
    size_t outstanding_at_timeout = 0;   // leases still out when drain_timeout expired
    bool drained_cleanly = true;
};

/**
 * @brief Abstract bounded connection pool for one tenant
 */
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Acquire a connection (blocking with timeout)
     *
     * Fails with POOL_EXHAUSTED when every slot stays busy for the whole
     * timeout, or with the connect error when a new connection cannot be
     * opened. Never blocks longer than the timeout.
     */
    [[nodiscard]] virtual Result<std::unique_ptr<PooledConnection>> acquire(
        std::chrono::milliseconds timeout) = 0;

    /// Acquire with the pool's configured acquire timeout
    [[nodiscard]] virtual Result<std::unique_ptr<PooledConnection>> acquire() = 0;

    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /**
     * @brief Close the pool
     *
     * New acquires fail at once, idle connections are closed, then the call
     * waits up to drain_timeout for outstanding leases. Leases still out
     * after that get their running statement cancelled and are closed when
     * handed back. Idempotent.
     */
    virtual DrainReport drain() = 0;

    [[nodiscard]] virtual bool is_closed() const = 0;

    /// Tenant this pool serves
    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace nlsql
