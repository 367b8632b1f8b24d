#include "db/schema_introspector.hpp"
#include "core/utils.hpp"
#include "db/iquery_executor.hpp"
#include <format>

namespace nlsql {

namespace {

// Column positions in kSchemaQuery's select list
constexpr size_t kTableName = 0;
constexpr size_t kColumnName = 1;
constexpr size_t kDataType = 2;
constexpr size_t kIsNullable = 3;

const std::string& cell_text(const Row& row, size_t index) {
    static const std::string empty;
    return (index < row.size() && row[index]) ? *row[index] : empty;
}

} // anonymous namespace

SchemaIntrospector::SchemaIntrospector(std::shared_ptr<IQueryExecutor> executor)
    : executor_(std::move(executor)) {}

Result<SchemaMap> SchemaIntrospector::fetch_schema(const std::string& tenant_id, const std::string& dsn) {
    auto outcome = executor_->execute(tenant_id, dsn, kSchemaQuery);
    if (!outcome.success) {
        return Result<SchemaMap>::error(outcome.error_code, outcome.error_message);
    }

    SchemaMap schema;
    for (const auto& row : outcome.rows) {
        const auto& table = cell_text(row, kTableName);
        if (table.empty()) {
            continue;
        }
        schema.add_column(table, ColumnDescriptor{
            .name = cell_text(row, kColumnName),
            .data_type = cell_text(row, kDataType),
            .nullable = utils::to_lower(cell_text(row, kIsNullable)) == "yes",
        });
    }

    utils::log::debug(std::format("Tenant '{}': schema has {} table(s)", tenant_id, schema.table_count()));
    return Result<SchemaMap>::ok(std::move(schema));
}

std::string SchemaIntrospector::format_context(const SchemaMap& schema) {
    std::string out;
    for (const auto& table : schema.tables()) {
        if (!out.empty()) {
            out += '\n';
        }
        out += std::format("Table: {}\n", table.name);
        for (const auto& col : table.columns) {
            out += std::format("  - {} ({}) {}\n", col.name, col.data_type,
                col.nullable ? "nullable" : "not null");
        }
    }
    return out;
}

} // namespace nlsql
