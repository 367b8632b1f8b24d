#include <catch2/catch_test_macros.hpp>
#include "core/stream_event.hpp"

using namespace nlsql;

TEST_CASE("StreamEvent: section events carry content and partial flag", "[events]") {
    CHECK(StreamEvent::sql("SELECT 1", true).to_json() ==
          R"({"type":"sql","content":"SELECT 1","partial":true})");
    CHECK(StreamEvent::explanation("Counts \"rows\".", false).to_json() ==
          R"({"type":"explanation","content":"Counts \"rows\".","partial":false})");
}

TEST_CASE("StreamEvent: schema-ready reports the table count", "[events]") {
    CHECK(StreamEvent::schema_ready(3).to_json() ==
          R"({"type":"schema-ready","message":"Found 3 tables in database","tableCount":3})");
}

TEST_CASE("StreamEvent: status, complete and error", "[events]") {
    CHECK(StreamEvent::status("Executing query...").to_json() ==
          R"({"type":"status","message":"Executing query..."})");
    CHECK(StreamEvent::complete().to_json() == R"({"type":"complete"})");
    CHECK(StreamEvent::error(ErrorCode::VALIDATION_FAILED, "Only SELECT queries are allowed").to_json() ==
          R"({"type":"error","code":"VALIDATION_FAILED","message":"Only SELECT queries are allowed"})");
}

TEST_CASE("StreamEvent: rejection carries the verdict details", "[events]") {
    ValidationVerdict keyword_verdict;
    keyword_verdict.reason = RejectionKind::DISALLOWED_KEYWORD;
    keyword_verdict.keyword = "drop";
    keyword_verdict.message = "Query contains disallowed keyword: DROP";
    CHECK(StreamEvent::rejected(keyword_verdict).to_json() ==
          R"({"type":"error","code":"VALIDATION_FAILED","message":"Query contains disallowed keyword: DROP","reason":"DISALLOWED_KEYWORD","keyword":"drop"})");

    ValidationVerdict pattern_verdict;
    pattern_verdict.reason = RejectionKind::INJECTION_PATTERN;
    pattern_verdict.pattern = "TAUTOLOGY";
    pattern_verdict.message = "Potential SQL injection detected";
    const auto event = StreamEvent::rejected(pattern_verdict);
    CHECK(event.error_code == ErrorCode::VALIDATION_FAILED);
    CHECK(event.to_json() ==
          R"({"type":"error","code":"VALIDATION_FAILED","message":"Potential SQL injection detected","reason":"INJECTION_PATTERN","pattern":"TAUTOLOGY"})");
}

TEST_CASE("StreamEvent: results render rows as objects", "[events]") {
    ExecutionOutcome outcome;
    outcome.success = true;
    outcome.column_names = {"id", "note"};
    outcome.rows = {{"1", "a\nb"}, {"2", std::nullopt}};
    outcome.row_count = 2;
    outcome.elapsed = std::chrono::milliseconds(12);

    CHECK(StreamEvent::results(outcome).to_json() ==
          R"({"type":"results","data":[{"id":"1","note":"a\nb"},{"id":"2","note":null}],"rowCount":2,"elapsedMillis":12})");
}

TEST_CASE("StreamEvent: SSE framing", "[events]") {
    CHECK(StreamEvent::complete().to_sse() == "data: {\"type\":\"complete\"}\n\n");
}

TEST_CASE("rows_to_json: empty result is an empty array", "[events]") {
    CHECK(rows_to_json({"id"}, {}) == "[]");
}

TEST_CASE("rows_to_json: short rows pad with null", "[events]") {
    CHECK(rows_to_json({"a", "b"}, {{"x"}}) == R"([{"a":"x","b":null}])");
}
