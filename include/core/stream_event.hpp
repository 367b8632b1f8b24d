#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "security/statement_validator.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace nlsql {

enum class EventType {
    SCHEMA_READY,
    SQL,
    EXPLANATION,
    STATUS,
    RESULTS,
    COMPLETE,
    ERROR
};

[[nodiscard]] inline const char* event_type_to_string(EventType type) {
    switch (type) {
        case EventType::SCHEMA_READY: return "schema-ready";
        case EventType::SQL:          return "sql";
        case EventType::EXPLANATION:  return "explanation";
        case EventType::STATUS:       return "status";
        case EventType::RESULTS:      return "results";
        case EventType::COMPLETE:     return "complete";
        case EventType::ERROR:        return "error";
        default:                      return "unknown";
    }
}

/**
 * @brief One progress event of a streamed question
 *
 * Only the fields relevant to the event type are serialized.
 */
struct StreamEvent {
    EventType type = EventType::STATUS;

    std::string content;            // SQL, EXPLANATION
    bool partial = false;           // SQL, EXPLANATION
    std::string message;            // SCHEMA_READY, STATUS, ERROR
    size_t table_count = 0;         // SCHEMA_READY
    ErrorCode error_code = ErrorCode::NONE;  // ERROR

    // ERROR from the statement validator
    RejectionKind rejection = RejectionKind::NONE;
    std::string keyword;
    std::string pattern;

    // RESULTS
    std::vector<std::string> column_names;
    std::vector<Row> rows;
    uint64_t row_count = 0;
    std::chrono::milliseconds elapsed{0};

    static StreamEvent schema_ready(size_t table_count);
    static StreamEvent sql(std::string content, bool partial);
    static StreamEvent explanation(std::string content, bool partial);
    static StreamEvent status(std::string message);
    static StreamEvent results(const ExecutionOutcome& outcome);
    static StreamEvent complete();
    static StreamEvent error(ErrorCode code, std::string message);

    /// VALIDATION_FAILED error carrying the verdict's reason, keyword and pattern
    static StreamEvent rejected(const ValidationVerdict& verdict);

    /// Single-line JSON object, e.g. {"type":"sql","content":"SELECT 1","partial":true}
    [[nodiscard]] std::string to_json() const;

    /// Server-sent-event framing: "data: {json}\n\n"
    [[nodiscard]] std::string to_sse() const;
};

/**
 * @brief Render rows as an array of objects keyed by column name
 *
 * Column order is preserved; SQL NULL becomes JSON null.
 */
[[nodiscard]] std::string rows_to_json(const std::vector<std::string>& column_names,
                                       const std::vector<Row>& rows);

/**
 * @brief Receives the events of one streamed question, in order
 */
class IEventSink {
public:
    virtual ~IEventSink() = default;

    virtual void send(const StreamEvent& event) = 0;

    /// false once the client has gone away; later events are dropped
    [[nodiscard]] virtual bool is_open() const = 0;
};

} // namespace nlsql
