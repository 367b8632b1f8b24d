#pragma once

#include "core/error.hpp"
#include "db/idb_connection.hpp"
#include <memory>
#include <string>

namespace nlsql {

/**
 * @brief Abstract factory for creating database connections
 *
 * Wraps the native connect call (PQconnectdb). Tests substitute a mock.
 */
class IConnectionFactory {
public:
    virtual ~IConnectionFactory() = default;

    /**
     * @brief Open a new database connection
     * @param dsn Connection descriptor
     * @return Connection, or a classified error whose message is already redacted
     */
    [[nodiscard]] virtual Result<std::unique_ptr<IDbConnection>> create(
        const std::string& dsn) = 0;
};

} // namespace nlsql
