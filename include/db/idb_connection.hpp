#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <memory>

namespace nlsql {

/**
 * @brief Result set from a query execution
 *
 * Returned by IDbConnection::execute().
 * Owns the result data (copied from native result handles).
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;
    std::string sql_state;      // five-character SQLSTATE when the server sent one

    std::vector<std::string> column_names;
    std::vector<Row> rows;

    bool has_rows = false;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle (PGconn*).
 * Implementations are not thread-safe; thread safety comes from the pool.
 * The one exception is cancel(), which may be called from any thread while
 * another thread is inside execute().
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    /**
     * @brief Execute a SQL statement
     * @param sql SQL text, sent unmodified
     */
    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Check if the connection is healthy
     * @param health_check_query SQL to run (e.g., "SELECT 1")
     */
    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set statement timeout for subsequent statements
     * @param timeout_ms Timeout in milliseconds (0 = no timeout)
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /**
     * @brief Ask the server to abandon the statement currently running
     * @return true if the cancel request was delivered
     */
    virtual bool cancel() = 0;

    virtual void close() = 0;
};

} // namespace nlsql
