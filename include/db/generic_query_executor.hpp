#pragma once

#include "db/iquery_executor.hpp"
#include <cstdint>
#include <memory>

namespace nlsql {

class TenantPoolRegistry;

/**
 * @brief Executes one statement on a leased connection
 *
 * Acquires from the tenant's pool, applies the statement timeout, runs the
 * statement, enforces the row cap and classifies failures. The lease goes
 * back to the pool on every exit path.
 */
class GenericQueryExecutor : public IQueryExecutor {
public:
    struct Config {
        uint32_t statement_timeout_ms = 10000;
        uint32_t max_result_rows = 10000;
        bool enable_statement_timeout = true;
    };

    GenericQueryExecutor(std::shared_ptr<TenantPoolRegistry> registry, const Config& config);

    explicit GenericQueryExecutor(std::shared_ptr<TenantPoolRegistry> registry)
        : GenericQueryExecutor(std::move(registry), Config{}) {}

    ~GenericQueryExecutor() override = default;

    ExecutionOutcome execute(
        const std::string& tenant_id, const std::string& dsn, const std::string& sql) override;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    std::shared_ptr<TenantPoolRegistry> registry_;
    Config config_;
};

} // namespace nlsql
