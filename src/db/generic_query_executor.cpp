#include "db/generic_query_executor.hpp"
#include "core/utils.hpp"
#include "db/error_classifier.hpp"
#include "db/iconnection_pool.hpp"
#include "db/pooled_connection.hpp"
#include "db/tenant_pool_registry.hpp"
#include "security/dsn_redactor.hpp"
#include <format>

namespace nlsql {

GenericQueryExecutor::GenericQueryExecutor(
    std::shared_ptr<TenantPoolRegistry> registry,
    const Config& config)
    : registry_(std::move(registry)),
      config_(config) {}

ExecutionOutcome GenericQueryExecutor::execute(
    const std::string& tenant_id, const std::string& dsn, const std::string& sql) {

    utils::Timer timer;

    auto pool = registry_->acquire(tenant_id, dsn);
    if (pool.is_error()) {
        return ExecutionOutcome::failure(pool.error_code(), pool.error_message(), timer.elapsed_ms());
    }

    auto lease = pool.value()->acquire();
    if (lease.is_error()) {
        utils::log::warn(std::format("Tenant '{}': connection acquire failed: {}",
            tenant_id, lease.error_message()));
        return ExecutionOutcome::failure(lease.error_code(), lease.error_message(), timer.elapsed_ms());
    }

    auto& conn_handle = lease.value();

    try {
        auto* conn = conn_handle->get();

        if (config_.enable_statement_timeout && !conn->set_query_timeout(config_.statement_timeout_ms)) {
            utils::log::warn(std::format("Tenant '{}': could not apply statement_timeout of {} ms",
                tenant_id, config_.statement_timeout_ms));
        }

        auto db_result = conn->execute(sql);
        const auto elapsed = timer.elapsed_ms();

        conn_handle->release();

        if (!db_result.success) {
            const ErrorCode code = ErrorClassifier::classify(db_result.sql_state, db_result.error_message);
            std::string message = DsnRedactor::scrub(db_result.error_message, dsn);
            utils::log::warn(std::format("Tenant '{}': statement failed [{}]: {}",
                tenant_id, error_code_to_string(code), message));
            if (code != ErrorCode::DATABASE_ERROR) {
                message = std::format("{}: {}", ErrorClassifier::describe(code), message);
            }
            return ExecutionOutcome::failure(code, std::move(message), elapsed);
        }

        // Checked after the fact; the statement text is never rewritten
        if (config_.max_result_rows > 0 && db_result.rows.size() > config_.max_result_rows) {
            return ExecutionOutcome::failure(ErrorCode::RESULT_TOO_LARGE,
                std::format("Query result exceeds maximum allowed rows ({}). "
                            "Please add LIMIT clause or use pagination to reduce result set size.",
                            config_.max_result_rows),
                elapsed);
        }

        ExecutionOutcome outcome;
        outcome.success = true;
        outcome.column_names = std::move(db_result.column_names);
        outcome.rows = std::move(db_result.rows);
        outcome.row_count = outcome.rows.size();
        outcome.elapsed = elapsed;

        utils::log::debug(std::format("Tenant '{}': {} row(s) in {} ms",
            tenant_id, outcome.row_count, outcome.elapsed.count()));
        return outcome;

    } catch (const std::exception& e) {
        // The lease destructor hands the connection back
        const std::string message = DsnRedactor::scrub(e.what(), dsn);
        utils::log::error(std::format("Tenant '{}': execution error: {}", tenant_id, message));
        return ExecutionOutcome::failure(ErrorCode::DATABASE_ERROR,
            std::format("Database error: {}", message), timer.elapsed_ms());
    }
}

} // namespace nlsql
