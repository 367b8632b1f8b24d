#include "core/stream_event.hpp"
#include "core/utils.hpp"

#include <format>

namespace nlsql {

StreamEvent StreamEvent::schema_ready(size_t table_count) {
    StreamEvent e;
    e.type = EventType::SCHEMA_READY;
    e.table_count = table_count;
    e.message = std::format("Found {} tables in database", table_count);
    return e;
}

StreamEvent StreamEvent::sql(std::string content, bool partial) {
    StreamEvent e;
    e.type = EventType::SQL;
    e.content = std::move(content);
    e.partial = partial;
    return e;
}

StreamEvent StreamEvent::explanation(std::string content, bool partial) {
    StreamEvent e;
    e.type = EventType::EXPLANATION;
    e.content = std::move(content);
    e.partial = partial;
    return e;
}

StreamEvent StreamEvent::status(std::string message) {
    StreamEvent e;
    e.type = EventType::STATUS;
    e.message = std::move(message);
    return e;
}

StreamEvent StreamEvent::results(const ExecutionOutcome& outcome) {
    StreamEvent e;
    e.type = EventType::RESULTS;
    e.column_names = outcome.column_names;
    e.rows = outcome.rows;
    e.row_count = outcome.row_count;
    e.elapsed = outcome.elapsed;
    return e;
}

StreamEvent StreamEvent::complete() {
    StreamEvent e;
    e.type = EventType::COMPLETE;
    return e;
}

StreamEvent StreamEvent::error(ErrorCode code, std::string message) {
    StreamEvent e;
    e.type = EventType::ERROR;
    e.error_code = code;
    e.message = std::move(message);
    return e;
}

StreamEvent StreamEvent::rejected(const ValidationVerdict& verdict) {
    StreamEvent e = error(ErrorCode::VALIDATION_FAILED, verdict.message);
    e.rejection = verdict.reason;
    e.keyword = verdict.keyword;
    e.pattern = verdict.pattern;
    return e;
}

std::string StreamEvent::to_json() const {
    const char* type_name = event_type_to_string(type);

    switch (type) {
        case EventType::SCHEMA_READY:
            return std::format(R"({{"type":"{}","message":"{}","tableCount":{}}})",
                type_name, utils::escape_json(message), table_count);

        case EventType::SQL:
        case EventType::EXPLANATION:
            return std::format(R"({{"type":"{}","content":"{}","partial":{}}})",
                type_name, utils::escape_json(content), utils::booltostr(partial));

        case EventType::STATUS:
            return std::format(R"({{"type":"{}","message":"{}"}})",
                type_name, utils::escape_json(message));

        case EventType::RESULTS:
            return std::format(R"({{"type":"{}","data":{},"rowCount":{},"elapsedMillis":{}}})",
                type_name, rows_to_json(column_names, rows), row_count, elapsed.count());

        case EventType::ERROR: {
            std::string out = std::format(R"({{"type":"{}","code":"{}","message":"{}")",
                type_name, error_code_to_string(error_code), utils::escape_json(message));
            if (rejection != RejectionKind::NONE) {
                out += std::format(R"(,"reason":"{}")", rejection_kind_to_string(rejection));
                if (!keyword.empty()) {
                    out += std::format(R"(,"keyword":"{}")", utils::escape_json(keyword));
                }
                if (!pattern.empty()) {
                    out += std::format(R"(,"pattern":"{}")", utils::escape_json(pattern));
                }
            }
            out += '}';
            return out;
        }

        case EventType::COMPLETE:
        default:
            return std::format(R"({{"type":"{}"}})", type_name);
    }
}

std::string StreamEvent::to_sse() const {
    return std::format("data: {}\n\n", to_json());
}

std::string rows_to_json(const std::vector<std::string>& column_names,
                         const std::vector<Row>& rows) {
    std::string out = "[";
    for (size_t r = 0; r < rows.size(); ++r) {
        if (r > 0) out += ',';
        out += '{';
        const auto& row = rows[r];
        for (size_t c = 0; c < column_names.size(); ++c) {
            if (c > 0) out += ',';
            out += std::format(R"("{}":)", utils::escape_json(column_names[c]));
            if (c < row.size() && row[c]) {
                out += std::format(R"("{}")", utils::escape_json(*row[c]));
            } else {
                out += "null";
            }
        }
        out += '}';
    }
    out += ']';
    return out;
}

} // namespace nlsql
