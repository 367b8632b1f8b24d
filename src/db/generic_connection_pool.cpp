#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include "security/dsn_redactor.hpp"
#include <format>

namespace nlsql {

GenericConnectionPool::GenericConnectionPool(
    std::string tenant_id,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : tenant_id_(std::move(tenant_id)),
      config_(config),
      factory_(std::move(factory)),
      state_(std::make_shared<State>(config.max_connections)) {

    state_->tenant_id = tenant_id_;

    utils::log::info(std::format("ConnectionPool created for tenant '{}' -> {} (max={})",
        tenant_id_, DsnRedactor::redact(config_.dsn), config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

Result<std::unique_ptr<PooledConnection>> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (is_closed()) {
        return fail_acquire(ErrorCode::POOL_EXHAUSTED,
            std::format("Connection pool for tenant '{}' is closed", tenant_id_));
    }

    // Acquire semaphore slot (blocks if pool full)
    if (!state_->semaphore.try_acquire_for(timeout)) {
        return fail_acquire(ErrorCode::POOL_EXHAUSTED,
            std::format("Connection pool exhausted: all {} connections busy for {} ms",
                config_.max_connections, timeout.count()));
    }

    // Re-check after the wait: drain() wakes blocked acquirers on close
    if (is_closed()) {
        state_->semaphore.release();
        return fail_acquire(ErrorCode::POOL_EXHAUSTED,
            std::format("Connection pool for tenant '{}' is closed", tenant_id_));
    }

    state_->total_acquires.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    Clock::time_point birth{};
    Clock::time_point last_used{};

    {
        std::lock_guard lock(state_->mutex);
        if (!state_->idle.empty()) {
            auto& entry = state_->idle.front();
            conn = std::move(entry.conn);
            birth = entry.created_at;
            last_used = entry.last_used;
            state_->idle.pop_front();
        }
    }

    bool replace = false;
    if (conn) {
        const auto now = Clock::now();
        if (config_.max_lifetime.count() > 0 && now - birth > config_.max_lifetime) {
            state_->connections_recycled.fetch_add(1, std::memory_order_relaxed);
            replace = true;
        } else if (now - last_used > config_.idle_timeout &&
                   !conn->is_healthy(config_.health_check_query)) {
            // Only connections parked longer than idle_timeout pay for the round trip
            state_->health_check_failures.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Health check failed for idle connection of tenant '{}'", tenant_id_));
            replace = true;
        }
        if (replace) {
            conn->close();
            conn.reset();
            state_->total_connections.fetch_sub(1, std::memory_order_relaxed);
        }
    }

    if (!conn) {
        auto created = create_connection();
        if (created.is_error()) {
            state_->semaphore.release();
            return fail_acquire(created.error_code(), created.error_message());
        }
        conn = std::move(created.value());
        birth = Clock::now();
    }

    {
        std::lock_guard lock(state_->mutex);
        state_->leased[conn.get()] = birth;
    }

    auto return_fn = [state = state_](std::unique_ptr<IDbConnection> c) {
        return_connection(state, std::move(c));
    };

    return Result<std::unique_ptr<PooledConnection>>::ok(
        std::make_unique<PooledConnection>(std::move(conn), std::move(return_fn)));
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(state_->mutex);

    PoolStats stats;
    stats.total_connections = state_->total_connections.load(std::memory_order_relaxed);
    stats.idle_connections = state_->idle.size();
    stats.active_connections = state_->leased.size();
    stats.total_acquires = state_->total_acquires.load(std::memory_order_relaxed);
    stats.total_releases = state_->total_releases.load(std::memory_order_relaxed);
    stats.failed_acquires = state_->failed_acquires.load(std::memory_order_relaxed);
    stats.health_check_failures = state_->health_check_failures.load(std::memory_order_relaxed);
    stats.connections_recycled = state_->connections_recycled.load(std::memory_order_relaxed);
    stats.broken_discarded = state_->broken_discarded.load(std::memory_order_relaxed);
    return stats;
}

bool GenericConnectionPool::is_closed() const {
    std::lock_guard lock(state_->mutex);
    return state_->closed;
}

DrainReport GenericConnectionPool::drain() {
    DrainReport report;

    if (drained_.exchange(true)) {
        std::lock_guard lock(state_->mutex);
        report.drained_cleanly = state_->leased.empty();
        return report;
    }

    std::deque<IdleEntry> idle;
    {
        std::lock_guard lock(state_->mutex);
        state_->closed = true;
        idle.swap(state_->idle);
    }

    // Wake acquirers blocked on the semaphore so they fail fast
    state_->semaphore.release(static_cast<std::ptrdiff_t>(config_.max_connections));

    for (auto& entry : idle) {
        if (entry.conn) {
            entry.conn->close();
            state_->total_connections.fetch_sub(1, std::memory_order_relaxed);
            ++report.idle_closed;
        }
    }

    std::unique_lock lock(state_->mutex);
    const bool clean = state_->leases_returned.wait_for(lock, config_.drain_timeout,
        [this] { return state_->leased.empty(); });

    if (!clean) {
        report.drained_cleanly = false;
        report.outstanding_at_timeout = state_->leased.size();
        for (const auto& [conn, created_at] : state_->leased) {
            if (!conn->cancel()) {
                utils::log::warn(std::format("Cancel request failed for a connection of tenant '{}'", tenant_id_));
            }
        }
        utils::log::warn(std::format(
            "ConnectionPool for tenant '{}' closed with {} lease(s) outstanding after {} ms; statements cancelled",
            tenant_id_, report.outstanding_at_timeout, config_.drain_timeout.count()));
    } else {
        utils::log::info(std::format("ConnectionPool drained for tenant '{}' ({} idle closed)",
            tenant_id_, report.idle_closed));
    }

    return report;
}

Result<std::unique_ptr<IDbConnection>> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.dsn);
    if (conn.is_ok()) {
        state_->total_connections.fetch_add(1, std::memory_order_relaxed);
    } else {
        utils::log::warn(std::format("Connection for tenant '{}' failed: {}",
            tenant_id_, conn.error_message()));
    }
    return conn;
}

Result<std::unique_ptr<PooledConnection>> GenericConnectionPool::fail_acquire(
    ErrorCode code, std::string message) {
    state_->failed_acquires.fetch_add(1, std::memory_order_relaxed);
    return Result<std::unique_ptr<PooledConnection>>::error(code, std::move(message));
}

void GenericConnectionPool::return_connection(const std::shared_ptr<State>& state,
                                              std::unique_ptr<IDbConnection> conn) {
    if (!conn) {
        return;
    }

    state->total_releases.fetch_add(1, std::memory_order_relaxed);

    // Dropped links (server restart, broken socket) are closed, not parked
    const bool broken = !conn->is_connected();

    bool close_now = false;
    {
        std::lock_guard lock(state->mutex);
        const auto now = Clock::now();
        auto birth = now;
        const auto it = state->leased.find(conn.get());
        if (it != state->leased.end()) {
            birth = it->second;
            state->leased.erase(it);
        }
        close_now = state->closed || broken;
        if (!close_now) {
            state->idle.push_back(IdleEntry{std::move(conn), birth, now});
        }
    }

    if (close_now) {
        conn->close();
        state->total_connections.fetch_sub(1, std::memory_order_relaxed);
        if (broken) {
            state->broken_discarded.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Discarded disconnected connection of tenant '{}'",
                state->tenant_id));
        } else {
            utils::log::debug(std::format("Connection returned to closed pool of tenant '{}' was closed",
                state->tenant_id));
        }
    }

    state->leases_returned.notify_all();
    state->semaphore.release();
}

} // namespace nlsql
