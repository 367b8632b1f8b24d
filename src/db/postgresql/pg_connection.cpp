#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"
#include "db/error_classifier.hpp"
#include "security/dsn_redactor.hpp"
#include <array>
#include <format>

namespace nlsql {

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn) {
    if (conn_) {
        cancel_ = PQgetCancel(conn_);
    }
}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    DbResultSet result;
    if (!conn_) {
        result.error_message = "Connection is closed";
        return result;
    }

    // Extended protocol: the server refuses a string holding more than one command
    PGresult* res = PQexecParams(conn_, sql.c_str(), 0, nullptr, nullptr, nullptr, nullptr, 0);

    if (!res) {
        result.error_message = PQerrorMessage(conn_);
        return result;
    }

    switch (PQresultStatus(res)) {
        case PGRES_TUPLES_OK:
            result = process_tuples_result(res);
            break;
        case PGRES_COMMAND_OK:
            result.success = true;
            break;
        default:
            result = error_result(res);
            break;
    }

    PQclear(res);
    return result;
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!conn_ || PQstatus(conn_) != CONNECTION_OK) {
        return false;
    }

    PGresult* res = PQexec(conn_, health_check_query.c_str());
    if (!res) {
        return false;
    }

    const ExecStatusType status = PQresultStatus(res);
    PQclear(res);

    return (status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK);
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }

    const std::string timeout_sql = std::format("SET statement_timeout = {}", timeout_ms);

    PGresult* res = PQexec(conn_, timeout_sql.c_str());
    if (!res) {
        return false;
    }

    const bool success = (PQresultStatus(res) == PGRES_COMMAND_OK);
    PQclear(res);
    return success;
}

bool PgConnection::cancel() {
    std::lock_guard lock(cancel_mutex_);
    if (!cancel_) {
        return false;
    }

    std::array<char, 256> errbuf{};
    if (PQcancel(cancel_, errbuf.data(), static_cast<int>(errbuf.size())) == 0) {
        utils::log::warn(std::format("PQcancel failed: {}", errbuf.data()));
        return false;
    }
    return true;
}

void PgConnection::close() {
    {
        std::lock_guard lock(cancel_mutex_);
        if (cancel_) {
            PQfreeCancel(cancel_);
            cancel_ = nullptr;
        }
    }
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

DbResultSet PgConnection::process_tuples_result(PGresult* res) {
    DbResultSet result;
    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res);
    result.column_names.reserve(static_cast<size_t>(ncols));
    for (int i = 0; i < ncols; i++) {
        result.column_names.emplace_back(PQfname(res, i));
    }

    const int nrows = PQntuples(res);
    result.rows.reserve(static_cast<size_t>(nrows));

    for (int i = 0; i < nrows; i++) {
        Row row;
        row.reserve(static_cast<size_t>(ncols));
        for (int j = 0; j < ncols; j++) {
            if (PQgetisnull(res, i, j)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res, i, j),
                    static_cast<size_t>(PQgetlength(res, i, j))));
            }
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

DbResultSet PgConnection::error_result(PGresult* res) {
    DbResultSet result;
    result.success = false;

    const char* state = PQresultErrorField(res, PG_DIAG_SQLSTATE);
    if (state) {
        result.sql_state = state;
    }

    const char* primary = PQresultErrorField(res, PG_DIAG_MESSAGE_PRIMARY);
    result.error_message = primary ? primary : utils::trim(PQerrorMessage(conn_));
    return result;
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

Result<std::unique_ptr<IDbConnection>> PgConnectionFactory::create(const std::string& dsn) {
    using ConnResult = Result<std::unique_ptr<IDbConnection>>;

    // libpq takes whole seconds; round up so a sub-second setting still applies
    const std::string timeout_s = std::to_string((connect_timeout_ms_ + 999) / 1000);

    // expand_dbname=1: the dsn (URI or keyword/value) is expanded in place,
    // later keywords override anything it sets
    const char* keywords[] = {"dbname", "connect_timeout", nullptr};
    const char* values[] = {dsn.c_str(), timeout_s.c_str(), nullptr};

    PGconn* conn = PQconnectdbParams(keywords, values, 1);

    if (!conn) {
        utils::log::error("Failed to allocate PGconn");
        return ConnResult::error(ErrorCode::DATABASE_ERROR, "Failed to allocate connection handle");
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        const std::string raw = utils::trim(PQerrorMessage(conn));
        PQfinish(conn);

        const ErrorCode code = ErrorClassifier::classify({}, raw);
        const std::string scrubbed = DsnRedactor::scrub(raw, dsn);
        utils::log::error(std::format("Failed to connect to {}: {}", DsnRedactor::redact(dsn), scrubbed));
        return ConnResult::error(code, std::format("{} ({})", ErrorClassifier::describe(code), scrubbed));
    }

    return ConnResult::ok(std::make_unique<PgConnection>(conn));
}

} // namespace nlsql
