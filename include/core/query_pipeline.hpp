#pragma once

#include "core/answer_source.hpp"
#include "core/error.hpp"
#include "core/stream_event.hpp"
#include "core/types.hpp"
#include "db/schema_introspector.hpp"
#include "security/statement_validator.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace nlsql {

class IQueryExecutor;
class RunNotifier;

struct AskRequest {
    std::string tenant_id;
    std::string dsn;
    std::string question;
};

struct AskResult {
    std::string sql;
    std::string explanation;
    std::vector<std::string> column_names;
    std::vector<Row> rows;
    uint64_t row_count = 0;
    std::chrono::milliseconds elapsed{0};   // statement execution, from the executor
};

/**
 * @brief Question -> schema -> answer -> validated SQL -> rows
 *
 * Flow:
 * 1. Request check (tenant id, dsn, question present)
 * 2. Schema introspection, rendered as model context
 * 3. Answer from the IAnswerSource (structured, or streamed fragments)
 * 4. Section extraction
 * 5. Statement validation; rejected SQL never reaches the database
 * 6. Execution
 * 7. RunRecord to the notifier
 *
 * Holds no per-request state; one instance serves concurrent requests.
 */
class QueryPipeline {
public:
    struct Config {
        size_t max_stream_buffer_bytes = 1024 * 1024;
    };

    /**
     * @param executor Runs both the schema query and the generated statement
     * @param notifier Optional; receives one RunRecord per ask
     */
    QueryPipeline(std::shared_ptr<IQueryExecutor> executor,
                  std::shared_ptr<RunNotifier> notifier,
                  Config config);

    QueryPipeline(std::shared_ptr<IQueryExecutor> executor,
                  std::shared_ptr<RunNotifier> notifier = nullptr)
        : QueryPipeline(std::move(executor), std::move(notifier), Config{}) {}

    /**
     * @brief Non-streaming path: structured {"sql","explanation"} answer
     * @param rejection If non-null, receives the validator's verdict when the
     *        generated SQL is rejected (left untouched otherwise)
     */
    [[nodiscard]] Result<AskResult> ask(const AskRequest& request, IAnswerSource& source,
                                        ValidationVerdict* rejection = nullptr);

    /**
     * @brief Streaming path: labelled free-text answer, progress as events
     *
     * Events go to the sink in order; an error event ends the stream. If the
     * sink closes while fragments are arriving, consumption stops. If it
     * closes while the statement runs, the statement finishes and its rows
     * are dropped. A rejection's error event carries the verdict's reason,
     * keyword and pattern; `rejection` receives the verdict as in ask().
     */
    Result<AskResult> ask_streaming(const AskRequest& request, IAnswerSource& source, IEventSink& sink,
                                    ValidationVerdict* rejection = nullptr);

    /// Schema alone
    [[nodiscard]] Result<SchemaMap> describe(const std::string& tenant_id, const std::string& dsn);

    [[nodiscard]] const StatementValidator& validator() const { return validator_; }

    struct Stats {
        uint64_t total_requests;
        uint64_t requests_rejected;     // failed validation
        uint64_t requests_failed;       // any other failure
    };

    [[nodiscard]] Stats get_stats() const {
        return {
            total_requests_.load(std::memory_order_relaxed),
            requests_rejected_.load(std::memory_order_relaxed),
            requests_failed_.load(std::memory_order_relaxed),
        };
    }

private:
    [[nodiscard]] static Result<bool> check_request(const AskRequest& request);

    Result<AskResult> fail(const AskRequest& request, bool streamed, ErrorCode code,
                           std::string message, std::string sql = {});

    void record_run(const AskRequest& request, bool streamed, const AskResult* result,
                    ErrorCode code, const std::string& sql);

    std::shared_ptr<IQueryExecutor> executor_;
    std::shared_ptr<RunNotifier> notifier_;
    Config config_;
    SchemaIntrospector introspector_;
    StatementValidator validator_;

    std::atomic<uint64_t> total_requests_{0};
    std::atomic<uint64_t> requests_rejected_{0};
    std::atomic<uint64_t> requests_failed_{0};
};

} // namespace nlsql
