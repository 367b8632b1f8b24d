#include <catch2/catch_test_macros.hpp>
#include "security/statement_validator.hpp"

#include <string>

using namespace nlsql;

namespace {

ValidationVerdict check(std::string_view sql) {
    const StatementValidator validator;
    return validator.validate(sql);
}

} // namespace

// ============================================================================
// Clean SQL - should pass through
// ============================================================================

TEST_CASE("Plain SELECT is accepted", "[validator]") {
    const auto v = check("SELECT * FROM users WHERE active = true");
    CHECK(v.accepted);
    CHECK(v.reason == RejectionKind::NONE);
    CHECK(v.message.empty());
}

TEST_CASE("Leading whitespace and lowercase are fine", "[validator]") {
    CHECK(check("  \n\tselect id from orders").accepted);
    CHECK(check("Select count(*) From orders").accepted);
}

TEST_CASE("Denylisted word inside a longer identifier is accepted", "[validator]") {
    CHECK(check("SELECT dropdown_id FROM widgets").accepted);
    CHECK(check("SELECT updated_at, created_by FROM orders").accepted);
    CHECK(check("SELECT * FROM executions WHERE callback_url IS NULL").accepted);
    CHECK(check("SELECT * FROM t WHERE status = 'created'").accepted);
}

TEST_CASE("Subquery is accepted", "[validator]") {
    CHECK(check("SELECT a FROM t WHERE a IN (SELECT a FROM u)").accepted);
}

TEST_CASE("Trailing semicolon and whitespace are accepted", "[validator]") {
    CHECK(check("SELECT 1;").accepted);
    CHECK(check("SELECT 1 ;  \n").accepted);
    CHECK(check("SELECT intonation FROM phrases").accepted);
}

// ============================================================================
// Shape
// ============================================================================

TEST_CASE("Empty statement is rejected", "[validator]") {
    for (const auto* sql : {"", "   ", "\n\t "}) {
        const auto v = check(sql);
        CHECK_FALSE(v.accepted);
        CHECK(v.reason == RejectionKind::EMPTY_STATEMENT);
    }
}

TEST_CASE("Statement must begin with SELECT", "[validator]") {
    for (const auto* sql : {"DROP TABLE users", "DELETE FROM users", "EXPLAIN SELECT 1",
                            "selected_rows", "(SELECT 1)"}) {
        INFO(sql);
        const auto v = check(sql);
        CHECK_FALSE(v.accepted);
        CHECK(v.reason == RejectionKind::NOT_SELECT);
        CHECK(v.message == "Only SELECT queries are allowed");
    }
}

// ============================================================================
// Denylist
// ============================================================================

TEST_CASE("Stacked DROP is rejected with the keyword", "[validator][denylist]") {
    const auto v = check("SELECT * FROM users; DROP TABLE users;");
    CHECK_FALSE(v.accepted);
    CHECK(v.reason == RejectionKind::DISALLOWED_KEYWORD);
    CHECK(v.keyword == "drop");
    CHECK(v.message.find("DROP") != std::string::npos);
}

TEST_CASE("Keyword match is case-insensitive", "[validator][denylist]") {
    const auto v = check("select 1; TrUnCaTe orders");
    CHECK(v.reason == RejectionKind::DISALLOWED_KEYWORD);
    CHECK(v.keyword == "truncate");
}

TEST_CASE("First keyword in denylist order is reported", "[validator][denylist]") {
    // delete appears first in the text, drop comes first in the list
    const auto v = check("SELECT 1; DELETE FROM t; DROP TABLE t");
    CHECK(v.keyword == "drop");
}

TEST_CASE("Every listed keyword is rejected as a whole word", "[validator][denylist]") {
    for (const auto* word : {"insert", "update", "delete", "drop", "alter", "truncate", "create",
                             "grant", "revoke", "merge", "copy", "into", "exec", "execute", "call",
                             "backup", "restore", "shutdown", "kill", "dbcc", "bulk",
                             "openrowset", "opendatasource"}) {
        INFO(word);
        const auto v = check(std::string("SELECT 1 ") + word);
        CHECK(v.reason == RejectionKind::DISALLOWED_KEYWORD);
        CHECK(v.keyword == word);
    }
}

TEST_CASE("Stored procedure prefixes match any word starting with them", "[validator][denylist]") {
    CHECK(check("SELECT * FROM sp_who").keyword == "sp_");
    CHECK(check("SELECT xp_cmdshell('dir')").keyword == "xp_");
    CHECK(check("SELECT * FROM dblink('host=x', 'SELECT 1') AS t(a int)").keyword == "dblink");
}

TEST_CASE("Server file and process functions are rejected", "[validator][denylist]") {
    CHECK(check("SELECT pg_read_file('/etc/passwd')").keyword == "pg_read_file");
    CHECK(check("SELECT pg_sleep(30)").keyword == "pg_sleep");
    CHECK(check("SELECT pg_terminate_backend(42)").keyword == "pg_terminate_backend");
    CHECK(check("SELECT set_config('role', 'admin', false)").keyword == "set_config");
}

TEST_CASE("SELECT INTO is rejected because it creates a table", "[validator][denylist]") {
    const auto v = check("SELECT * INTO stolen_users FROM users");
    CHECK_FALSE(v.accepted);
    CHECK(v.reason == RejectionKind::DISALLOWED_KEYWORD);
    CHECK(v.keyword == "into");
}

TEST_CASE("UNION ALL is rejected as a phrase", "[validator][denylist]") {
    const auto v = check("SELECT a FROM t UNION ALL SELECT a FROM u");
    CHECK(v.reason == RejectionKind::DISALLOWED_KEYWORD);
    CHECK(v.keyword == "union all");

    // Separated by something other than whitespace, it is not the phrase
    CHECK(check("SELECT \"union\", \"all\" FROM t").accepted);
}

// ============================================================================
// Injection heuristics
// ============================================================================

TEST_CASE("Any statement after a separator is rejected", "[validator][injection]") {
    for (const auto* sql : {"SELECT 1; BEGIN; LOCK TABLE users IN ACCESS EXCLUSIVE MODE",
                            "SELECT 1; SET ROLE postgres",
                            "SELECT 1; VACUUM FULL users",
                            "SELECT 1; COMMENT ON TABLE users IS 'x'",
                            "SELECT 1;SELECT 2"}) {
        INFO(sql);
        const auto v = check(sql);
        CHECK_FALSE(v.accepted);
        CHECK(v.reason == RejectionKind::INJECTION_PATTERN);
        CHECK(v.pattern == "MULTIPLE_STATEMENTS");
    }
}

TEST_CASE("UNION SELECT is an injection pattern", "[validator][injection]") {
    const auto v = check("SELECT name FROM users WHERE id = 1 UNION SELECT password FROM admin");
    CHECK(v.reason == RejectionKind::INJECTION_PATTERN);
    CHECK(v.pattern == "UNION_SELECT");
    CHECK(v.message == "Potential SQL injection detected. Query blocked for security.");
}

TEST_CASE("Numeric tautologies are detected with any spacing", "[validator][injection]") {
    for (const auto* sql : {"SELECT * FROM users WHERE id = 1 OR 1=1",
                            "SELECT * FROM users WHERE id = 1 or 2 = 2",
                            "SELECT * FROM users WHERE a = 1 AND 7  =  7"}) {
        INFO(sql);
        const auto v = check(sql);
        CHECK(v.reason == RejectionKind::INJECTION_PATTERN);
        CHECK(v.pattern == "TAUTOLOGY");
    }
    // Different numbers are not a tautology
    CHECK(check("SELECT * FROM users WHERE id = 1 OR 1=2").accepted);
}

TEST_CASE("Quoted string tautology is detected", "[validator][injection]") {
    const auto v = check("SELECT * FROM users WHERE name = '' OR 'a'='a'");
    CHECK(v.reason == RejectionKind::INJECTION_PATTERN);
    CHECK(v.pattern == "TAUTOLOGY");
}

TEST_CASE("Quote glued to a commented tautology is detected", "[validator][injection]") {
    const auto v = check("SELECT * FROM users WHERE name = ''or1=1--'");
    CHECK(v.reason == RejectionKind::INJECTION_PATTERN);
    CHECK(v.pattern == "COMMENT_TAUTOLOGY");
}

// ============================================================================
// Known limits of the heuristic
// ============================================================================

TEST_CASE("False positive: denylisted word inside a string literal", "[validator][limits]") {
    const auto v = check("SELECT * FROM audit_log WHERE action = 'delete'");
    CHECK_FALSE(v.accepted);
    CHECK(v.keyword == "delete");
}

TEST_CASE("False positive: locking clause and comments", "[validator][limits]") {
    CHECK(check("SELECT * FROM users FOR UPDATE").keyword == "update");
    CHECK(check("SELECT 1 -- never drop this").keyword == "drop");
}

TEST_CASE("False positive: semicolon inside a string literal", "[validator][limits]") {
    CHECK(check("SELECT * FROM notes WHERE body = 'a; b'").pattern == "MULTIPLE_STATEMENTS");
}

TEST_CASE("False positive: CTE does not begin with SELECT", "[validator][limits]") {
    CHECK(check("WITH recent AS (SELECT 1) SELECT * FROM recent").reason == RejectionKind::NOT_SELECT);
}

TEST_CASE("False negative: side-effecting functions outside the list", "[validator][limits]") {
    CHECK(check("SELECT nextval('orders_id_seq')").accepted);
    CHECK(check("SELECT lo_unlink(16403)").accepted);
}
