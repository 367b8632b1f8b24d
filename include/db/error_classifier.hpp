#pragma once

#include "core/error.hpp"
#include <string_view>

namespace nlsql {

/**
 * @brief Maps native PostgreSQL failures onto the closed ErrorCode taxonomy
 *
 * SQLSTATE wins when the server sent one; connection-phase failures carry no
 * SQLSTATE and are recognised by libpq's message text. Anything unrecognised
 * is DATABASE_ERROR.
 */
class ErrorClassifier {
public:
    [[nodiscard]] static ErrorCode classify(std::string_view sql_state, std::string_view message);

    /// Short caller-facing description, e.g. "Table does not exist - check table name"
    [[nodiscard]] static const char* describe(ErrorCode code);
};

} // namespace nlsql
