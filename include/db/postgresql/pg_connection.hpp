#pragma once

#include "db/idb_connection.hpp"
#include "db/iconnection_factory.hpp"
#include <libpq-fe.h>
#include <mutex>
#include <string>

namespace nlsql {

/**
 * @brief PostgreSQL connection implementing IDbConnection
 *
 * Wraps PGconn* and keeps a PGcancel handle so cancel() can be issued from
 * another thread while execute() is blocked in PQexecParams.
 */
class PgConnection : public IDbConnection {
public:
    /**
     * @brief Construct from existing PGconn* (takes ownership)
     */
    explicit PgConnection(PGconn* conn);

    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    bool cancel() override;
    void close() override;

private:
    DbResultSet process_tuples_result(PGresult* res);

    /// Failure result carrying SQLSTATE and the primary message
    DbResultSet error_result(PGresult* res);

    PGconn* conn_;
    PGcancel* cancel_ = nullptr;
    std::mutex cancel_mutex_;  // guards cancel_ against close() racing cancel()
};

/**
 * @brief PostgreSQL connection factory
 *
 * Creates PgConnection instances using PQconnectdbParams. Connect errors are
 * classified and scrubbed of the descriptor before they leave the factory.
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    explicit PgConnectionFactory(uint32_t connect_timeout_ms = 5000)
        : connect_timeout_ms_(connect_timeout_ms) {}

    Result<std::unique_ptr<IDbConnection>> create(const std::string& dsn) override;

private:
    uint32_t connect_timeout_ms_;
};

} // namespace nlsql
