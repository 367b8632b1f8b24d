#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include <memory>
#include <string>

namespace nlsql {

class IQueryExecutor;

/**
 * @brief Reads a tenant's table/column layout from information_schema
 *
 * One fixed read-only query per call, run through the query executor so it
 * shares pooling, the row cap and error classification. Nothing is cached.
 */
class SchemaIntrospector {
public:
    static constexpr const char* kSchemaQuery =
        "SELECT table_name, column_name, data_type, is_nullable "
        "FROM information_schema.columns "
        "WHERE table_schema = 'public' "
        "ORDER BY table_name, ordinal_position";

    explicit SchemaIntrospector(std::shared_ptr<IQueryExecutor> executor);

    [[nodiscard]] Result<SchemaMap> fetch_schema(const std::string& tenant_id, const std::string& dsn);

    /**
     * @brief Render the schema as model context
     *
     *   Table: users
     *     - id (integer) not null
     *     - email (text) nullable
     */
    [[nodiscard]] static std::string format_context(const SchemaMap& schema);

private:
    std::shared_ptr<IQueryExecutor> executor_;
};

} // namespace nlsql
