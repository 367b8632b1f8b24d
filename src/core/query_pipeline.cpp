#include "core/query_pipeline.hpp"
#include "core/utils.hpp"
#include "db/iquery_executor.hpp"
#include "notify/run_notifier.hpp"
#include "stream/json_section_extractor.hpp"
#include "stream/labeled_section_extractor.hpp"

#include <format>
#include <optional>

namespace nlsql {

QueryPipeline::QueryPipeline(std::shared_ptr<IQueryExecutor> executor,
                             std::shared_ptr<RunNotifier> notifier,
                             Config config)
    : executor_(std::move(executor)),
      notifier_(std::move(notifier)),
      config_(config),
      introspector_(executor_) {}

// ============================================================================
// Non-streaming
// ============================================================================

Result<AskResult> QueryPipeline::ask(const AskRequest& request, IAnswerSource& source,
                                     ValidationVerdict* rejection) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    if (auto check = check_request(request); check.is_error()) {
        return fail(request, false, check.error_code(), check.error_message());
    }

    auto schema = introspector_.fetch_schema(request.tenant_id, request.dsn);
    if (schema.is_error()) {
        return fail(request, false, schema.error_code(), schema.error_message());
    }

    const AnswerRequest answer_request{request.question, SchemaIntrospector::format_context(schema.value())};
    auto answer = source.generate(answer_request);
    if (answer.is_error()) {
        return fail(request, false, ErrorCode::GENERATION_FAILED,
            std::format("Answer generation failed: {}", answer.error_message()));
    }

    JsonSectionExtractor extractor(config_.max_stream_buffer_bytes);
    if (auto appended = extractor.append(answer.value()); appended.is_error()) {
        return fail(request, false, appended.error_code(), appended.error_message());
    }
    auto sections = extractor.finish();
    if (sections.is_error()) {
        return fail(request, false, sections.error_code(), sections.error_message());
    }
    const auto& sql = sections.value().sql;

    auto verdict = validator_.validate(sql);
    if (!verdict.accepted) {
        auto message = verdict.message;
        if (rejection) {
            *rejection = std::move(verdict);
        }
        return fail(request, false, ErrorCode::VALIDATION_FAILED, std::move(message), sql);
    }

    auto outcome = executor_->execute(request.tenant_id, request.dsn, sql);
    if (!outcome.success) {
        return fail(request, false, outcome.error_code, outcome.error_message, sql);
    }

    AskResult result;
    result.sql = sql;
    result.explanation = sections.value().explanation;
    result.column_names = std::move(outcome.column_names);
    result.rows = std::move(outcome.rows);
    result.row_count = outcome.row_count;
    result.elapsed = outcome.elapsed;

    record_run(request, false, &result, ErrorCode::NONE, sql);
    return Result<AskResult>::ok(std::move(result));
}

// ============================================================================
// Streaming
// ============================================================================

Result<AskResult> QueryPipeline::ask_streaming(const AskRequest& request, IAnswerSource& source,
                                               IEventSink& sink, ValidationVerdict* rejection) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);

    auto emit = [&sink](const StreamEvent& event) {
        if (sink.is_open()) {
            sink.send(event);
        }
    };
    auto emit_failure = [&](ErrorCode code, std::string message, std::string sql = {}) {
        emit(StreamEvent::error(code, message));
        return fail(request, true, code, std::move(message), std::move(sql));
    };

    if (auto check = check_request(request); check.is_error()) {
        return emit_failure(check.error_code(), check.error_message());
    }

    auto schema = introspector_.fetch_schema(request.tenant_id, request.dsn);
    if (schema.is_error()) {
        return emit_failure(schema.error_code(), schema.error_message());
    }
    emit(StreamEvent::schema_ready(schema.value().table_count()));

    LabeledSectionExtractor extractor(config_.max_stream_buffer_bytes);
    std::optional<Result<std::vector<SectionSnapshot>>> extract_error;

    const AnswerRequest answer_request{request.question, SchemaIntrospector::format_context(schema.value())};
    auto streamed = source.stream(answer_request, [&](std::string_view fragment) {
        if (!sink.is_open()) {
            return false;
        }
        auto snapshots = extractor.append(fragment);
        if (snapshots.is_error()) {
            extract_error = std::move(snapshots);
            return false;
        }
        for (auto& snap : snapshots.value()) {
            emit(snap.section == Section::SQL
                ? StreamEvent::sql(std::move(snap.content), true)
                : StreamEvent::explanation(std::move(snap.content), true));
        }
        return true;
    });

    if (streamed.is_error()) {
        return emit_failure(ErrorCode::GENERATION_FAILED,
            std::format("Answer generation failed: {}", streamed.error_message()));
    }
    if (extract_error) {
        return emit_failure(extract_error->error_code(), extract_error->error_message());
    }
    if (!sink.is_open()) {
        utils::log::info(std::format("Tenant '{}': client went away during answer stream", request.tenant_id));
        return fail(request, true, ErrorCode::GENERATION_FAILED, "Client disconnected before the answer completed");
    }

    auto sections = extractor.finish();
    if (sections.is_error()) {
        return emit_failure(sections.error_code(), sections.error_message());
    }
    const auto& sql = sections.value().sql;
    if (sql.empty()) {
        return emit_failure(ErrorCode::GENERATION_FAILED, "The answer did not contain an SQL section");
    }

    auto verdict = validator_.validate(sql);
    if (!verdict.accepted) {
        emit(StreamEvent::rejected(verdict));
        auto message = verdict.message;
        if (rejection) {
            *rejection = std::move(verdict);
        }
        return fail(request, true, ErrorCode::VALIDATION_FAILED, std::move(message), sql);
    }

    emit(StreamEvent::sql(sql, false));
    emit(StreamEvent::explanation(sections.value().explanation, false));
    emit(StreamEvent::status("Executing query..."));

    auto outcome = executor_->execute(request.tenant_id, request.dsn, sql);
    if (!outcome.success) {
        return emit_failure(outcome.error_code, outcome.error_message, sql);
    }

    if (!sink.is_open()) {
        utils::log::info(std::format("Tenant '{}': client went away; {} row(s) discarded",
            request.tenant_id, outcome.row_count));
    }

    emit(StreamEvent::results(outcome));
    emit(StreamEvent::complete());

    AskResult result;
    result.sql = sql;
    result.explanation = sections.value().explanation;
    result.column_names = std::move(outcome.column_names);
    result.rows = std::move(outcome.rows);
    result.row_count = outcome.row_count;
    result.elapsed = outcome.elapsed;

    record_run(request, true, &result, ErrorCode::NONE, sql);
    return Result<AskResult>::ok(std::move(result));
}

Result<SchemaMap> QueryPipeline::describe(const std::string& tenant_id, const std::string& dsn) {
    if (tenant_id.empty() || utils::trim(dsn).empty()) {
        return Result<SchemaMap>::error(ErrorCode::INVALID_REQUEST, "Tenant id and connection descriptor are required");
    }
    return introspector_.fetch_schema(tenant_id, dsn);
}

// ============================================================================
// Helpers
// ============================================================================

Result<bool> QueryPipeline::check_request(const AskRequest& request) {
    if (request.tenant_id.empty()) {
        return Result<bool>::error(ErrorCode::INVALID_REQUEST, "Tenant id is required");
    }
    if (utils::trim(request.dsn).empty()) {
        return Result<bool>::error(ErrorCode::INVALID_REQUEST,
            std::format("Tenant '{}' is missing a database connection descriptor", request.tenant_id));
    }
    if (utils::trim(request.question).empty()) {
        return Result<bool>::error(ErrorCode::INVALID_REQUEST, "Question is required");
    }
    return Result<bool>::ok(true);
}

Result<AskResult> QueryPipeline::fail(const AskRequest& request, bool streamed, ErrorCode code,
                                      std::string message, std::string sql) {
    if (code == ErrorCode::VALIDATION_FAILED) {
        requests_rejected_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Tenant '{}': generated SQL rejected: {}", request.tenant_id, message));
    } else {
        requests_failed_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Tenant '{}': request failed [{}]: {}",
            request.tenant_id, error_code_to_string(code), message));
    }

    record_run(request, streamed, nullptr, code, sql);
    return Result<AskResult>::error(code, std::move(message));
}

void QueryPipeline::record_run(const AskRequest& request, bool streamed, const AskResult* result,
                               ErrorCode code, const std::string& sql) {
    if (!notifier_) {
        return;
    }

    RunRecord record;
    record.tenant_id = request.tenant_id;
    record.question = request.question;
    record.sql = sql;
    record.streamed = streamed;
    record.success = (result != nullptr);
    record.error_code = code;
    if (result) {
        record.row_count = result->row_count;
        record.elapsed = result->elapsed;
    }
    record.finished_at = std::chrono::system_clock::now();
    notifier_->notify(std::move(record));
}

} // namespace nlsql
