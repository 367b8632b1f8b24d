#pragma once

#include "db/iconnection_pool.hpp"
#include "db/iconnection_factory.hpp"
#include "db/pooled_connection.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>

namespace nlsql {

/**
 * @brief Bounded connection pool for one tenant
 *
 * Design:
 * - Bounded pool: max_connections enforced via counting_semaphore
 * - Lazy initialization: connections created on-demand up to max
 * - Health checking: connections idle longer than idle_timeout run the
 *   health check query before being handed out
 * - Lifetime: connections older than max_lifetime are replaced on acquire
 * - Broken links: a connection handed back disconnected is closed, not parked
 * - RAII: PooledConnection returns the connection on destruction
 *
 * Pool state lives in a shared block captured by every lease, so a lease may
 * outlive the pool object itself. A connection handed back after the pool
 * closed is closed instead of being parked.
 */
class GenericConnectionPool : public IConnectionPool {
public:
    /**
     * @param tenant_id Tenant this pool serves (for logging)
     * @param config Pool configuration, including the dsn
     * @param factory Connection factory
     */
    GenericConnectionPool(
        std::string tenant_id,
        const PoolConfig& config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    GenericConnectionPool(const GenericConnectionPool&) = delete;
    GenericConnectionPool& operator=(const GenericConnectionPool&) = delete;

    [[nodiscard]] Result<std::unique_ptr<PooledConnection>> acquire(
        std::chrono::milliseconds timeout) override;

    [[nodiscard]] Result<std::unique_ptr<PooledConnection>> acquire() override {
        return acquire(config_.acquire_timeout);
    }

    [[nodiscard]] PoolStats get_stats() const override;

    DrainReport drain() override;

    [[nodiscard]] bool is_closed() const override;

    [[nodiscard]] const std::string& name() const override { return tenant_id_; }

private:
    using Clock = std::chrono::steady_clock;

    struct IdleEntry {
        std::unique_ptr<IDbConnection> conn;
        Clock::time_point created_at;
        Clock::time_point last_used;
    };

    struct State {
        explicit State(size_t max_connections) : semaphore(static_cast<std::ptrdiff_t>(max_connections)) {}

        std::string tenant_id;
        mutable std::mutex mutex;
        std::condition_variable leases_returned;
        std::deque<IdleEntry> idle;
        // Connections currently leased, with their creation time
        std::unordered_map<IDbConnection*, Clock::time_point> leased;
        std::counting_semaphore<> semaphore;
        bool closed = false;

        std::atomic<size_t> total_connections{0};
        std::atomic<size_t> total_acquires{0};
        std::atomic<size_t> total_releases{0};
        std::atomic<size_t> failed_acquires{0};
        std::atomic<size_t> health_check_failures{0};
        std::atomic<size_t> connections_recycled{0};
        std::atomic<size_t> broken_discarded{0};
    };

    /// Open a connection through the factory, counting it on success
    Result<std::unique_ptr<IDbConnection>> create_connection();

    Result<std::unique_ptr<PooledConnection>> fail_acquire(ErrorCode code, std::string message);

    /// Called by PooledConnection on release
    static void return_connection(const std::shared_ptr<State>& state,
                                  std::unique_ptr<IDbConnection> conn);

    std::string tenant_id_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;
    std::shared_ptr<State> state_;
    std::atomic<bool> drained_{false};
};

} // namespace nlsql
