#pragma once

#include "db/idb_connection.hpp"
#include <functional>
#include <memory>

namespace nlsql {

/**
 * @brief RAII lease on a pooled database connection
 *
 * Returns the connection to its pool on destruction or on release().
 * Move-only to prevent accidental copying.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);

    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /**
     * @brief Hand the connection back to the pool now
     *
     * Safe to call more than once; the lease is empty afterwards.
     */
    void release();

private:
    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
};

} // namespace nlsql
