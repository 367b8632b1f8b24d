#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nlsql {

// ============================================================================
// Tenant Target
// ============================================================================

/**
 * @brief Where a tenant's database lives. Supplied per call, never persisted.
 *
 * The dsn carries credentials; it must only ever reach logs and messages
 * through DsnRedactor.
 */
struct TenantTarget {
    std::string tenant_id;
    std::string dsn;
};

// ============================================================================
// Schema
// ============================================================================

struct ColumnDescriptor {
    std::string name;
    std::string data_type;
    bool nullable = true;

    bool operator==(const ColumnDescriptor&) const = default;
};

struct TableSchema {
    std::string name;
    std::vector<ColumnDescriptor> columns;

    bool operator==(const TableSchema&) const = default;
};

/**
 * @brief Ordered table -> columns mapping
 *
 * Tables keep the order in which they were first added, columns keep the
 * order in which they were appended (the introspection query's row order).
 */
class SchemaMap {
public:
    void add_column(const std::string& table, ColumnDescriptor column) {
        auto [it, inserted] = index_.try_emplace(table, tables_.size());
        if (inserted) {
            tables_.push_back(TableSchema{table, {}});
        }
        tables_[it->second].columns.push_back(std::move(column));
    }

    [[nodiscard]] const TableSchema* find(const std::string& table) const {
        const auto it = index_.find(table);
        return it == index_.end() ? nullptr : &tables_[it->second];
    }

    [[nodiscard]] const std::vector<TableSchema>& tables() const { return tables_; }
    [[nodiscard]] size_t table_count() const { return tables_.size(); }
    [[nodiscard]] bool empty() const { return tables_.empty(); }

    bool operator==(const SchemaMap& other) const { return tables_ == other.tables_; }

private:
    std::vector<TableSchema> tables_;
    std::unordered_map<std::string, size_t> index_;
};

// ============================================================================
// Execution Outcome
// ============================================================================

// nullopt = SQL NULL, otherwise the server's text rendering of the value
using CellValue = std::optional<std::string>;
using Row = std::vector<CellValue>;

/**
 * @brief Result of one statement execution
 *
 * Rows are positional; column_names gives the mapping key for each position.
 * Created fresh per execution and handed to the caller.
 */
struct ExecutionOutcome {
    bool success = false;
    ErrorCode error_code = ErrorCode::NONE;
    std::string error_message;

    std::vector<std::string> column_names;
    std::vector<Row> rows;
    uint64_t row_count = 0;

    // Wall clock from just before pool acquire to just after the statement returns
    std::chrono::milliseconds elapsed{0};

    static ExecutionOutcome failure(ErrorCode code, std::string message,
                                    std::chrono::milliseconds elapsed = {}) {
        ExecutionOutcome outcome;
        outcome.success = false;
        outcome.error_code = code;
        outcome.error_message = std::move(message);
        outcome.elapsed = elapsed;
        return outcome;
    }
};

} // namespace nlsql
