#pragma once

#include "core/types.hpp"
#include <string>

namespace nlsql {

/**
 * @brief Abstract query executor interface
 *
 * Pipeline and SchemaIntrospector hold shared_ptr<IQueryExecutor>.
 */
class IQueryExecutor {
public:
    virtual ~IQueryExecutor() = default;

    /**
     * @brief Run one statement against the tenant's database
     * @param tenant_id Pool key
     * @param dsn Connection descriptor, used only when the tenant has no pool yet
     * @param sql Statement, sent unmodified
     */
    [[nodiscard]] virtual ExecutionOutcome execute(
        const std::string& tenant_id, const std::string& dsn, const std::string& sql) = 0;
};

} // namespace nlsql
