#include "db/error_classifier.hpp"
#include "core/utils.hpp"

#include <string>
#include <unordered_map>

namespace nlsql {

namespace {

bool contains(const std::string& haystack, std::string_view needle) {
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

ErrorCode ErrorClassifier::classify(std::string_view sql_state, std::string_view message) {
    static const std::unordered_map<std::string_view, ErrorCode> kBySqlState = {
        {"28P01", ErrorCode::AUTHENTICATION_FAILED},   // invalid_password
        {"28000", ErrorCode::AUTHENTICATION_FAILED},   // invalid_authorization_specification
        {"3D000", ErrorCode::DATABASE_NOT_FOUND},      // invalid_catalog_name
        {"42P01", ErrorCode::TABLE_NOT_FOUND},         // undefined_table
        {"42601", ErrorCode::SYNTAX_ERROR},            // syntax_error
        {"23505", ErrorCode::UNIQUE_CONSTRAINT_VIOLATION},
        {"23503", ErrorCode::FOREIGN_KEY_VIOLATION},
        {"57014", ErrorCode::TIMEOUT},                 // query_canceled (statement_timeout)
    };

    if (!sql_state.empty()) {
        const auto it = kBySqlState.find(sql_state);
        if (it != kBySqlState.end()) {
            return it->second;
        }
    }

    const std::string lower = utils::to_lower(message);

    if (contains(lower, "connection refused")) {
        return ErrorCode::CONNECTION_REFUSED;
    }
    if (contains(lower, "could not translate host name") ||
        contains(lower, "name or service not known") ||
        contains(lower, "temporary failure in name resolution") ||
        contains(lower, "nodename nor servname")) {
        return ErrorCode::HOST_NOT_FOUND;
    }
    if (contains(lower, "password authentication failed") ||
        contains(lower, "authentication failed") ||
        contains(lower, "no password supplied")) {
        return ErrorCode::AUTHENTICATION_FAILED;
    }
    if (contains(lower, "database \"") && contains(lower, "does not exist")) {
        return ErrorCode::DATABASE_NOT_FOUND;
    }
    if (contains(lower, "relation \"") && contains(lower, "does not exist")) {
        return ErrorCode::TABLE_NOT_FOUND;
    }
    if (contains(lower, "syntax error")) {
        return ErrorCode::SYNTAX_ERROR;
    }
    if (contains(lower, "timeout") || contains(lower, "timed out")) {
        return ErrorCode::TIMEOUT;
    }

    return ErrorCode::DATABASE_ERROR;
}

const char* ErrorClassifier::describe(ErrorCode code) {
    switch (code) {
        case ErrorCode::CONNECTION_REFUSED:
            return "Database connection refused - check if database is running";
        case ErrorCode::HOST_NOT_FOUND:
            return "Database host not found - check connection string";
        case ErrorCode::AUTHENTICATION_FAILED:
            return "Database authentication failed - check username/password";
        case ErrorCode::DATABASE_NOT_FOUND:
            return "Database does not exist - check database name";
        case ErrorCode::TABLE_NOT_FOUND:
            return "Table does not exist - check table name";
        case ErrorCode::SYNTAX_ERROR:
            return "SQL syntax error - check query syntax";
        case ErrorCode::UNIQUE_CONSTRAINT_VIOLATION:
            return "Duplicate key violation - unique constraint failed";
        case ErrorCode::FOREIGN_KEY_VIOLATION:
            return "Foreign key violation - referenced record does not exist";
        case ErrorCode::TIMEOUT:
            return "Query timeout - query took too long to execute";
        case ErrorCode::POOL_EXHAUSTED:
            return "Connection pool exhausted - try again later";
        case ErrorCode::RESULT_TOO_LARGE:
            return "Query result too large";
        default:
            return "Database error";
    }
}

} // namespace nlsql
