#include "security/statement_validator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>
#include <regex>
#include <unordered_set>
#include <utility>
#include <vector>

namespace nlsql {

namespace {

// Checked in this order; the first hit is the one reported
constexpr std::array<std::string_view, 34> kDeniedWords = {
    // mutation / DDL / DCL
    "drop", "delete", "insert", "update", "alter", "truncate", "create",
    "grant", "revoke", "merge", "copy",
    // SELECT ... INTO creates a table
    "into",
    // execution primitives
    "exec", "execute", "call",
    // administrative
    "backup", "restore", "shutdown", "kill", "dbcc", "bulk",
    "openrowset", "opendatasource",
    // server-side file / process access (PostgreSQL)
    "pg_read_file", "pg_read_binary_file", "pg_ls_dir", "pg_sleep",
    "pg_terminate_backend", "pg_cancel_backend", "lo_import", "lo_export",
    "set_config", "pg_reload_conf", "pg_rotate_logfile",
};

// Any word beginning with one of these is denied
constexpr std::array<std::string_view, 3> kDeniedPrefixes = {
    "sp_", "xp_", "dblink",
};

// Two-word phrases (words separated only by whitespace)
constexpr std::array<std::pair<std::string_view, std::string_view>, 1> kDeniedPhrases = {{
    {"union", "all"},
}};

struct Word {
    std::string text;       // lowercased
    size_t begin = 0;
    size_t end = 0;
};

std::vector<Word> split_words(std::string_view sql) {
    std::vector<Word> words;
    size_t i = 0;
    while (i < sql.size()) {
        if (!utils::is_word_char(sql[i])) {
            ++i;
            continue;
        }
        const size_t start = i;
        while (i < sql.size() && utils::is_word_char(sql[i])) ++i;
        words.push_back(Word{utils::to_lower(sql.substr(start, i - start)), start, i});
    }
    return words;
}

bool only_whitespace(std::string_view sql, size_t from, size_t to) {
    for (size_t i = from; i < to; ++i) {
        if (!std::isspace(static_cast<unsigned char>(sql[i]))) return false;
    }
    return true;
}

struct InjectionPattern {
    const char* name;
    std::regex re;
};

const std::vector<InjectionPattern>& injection_patterns() {
    static const auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
    static const std::vector<InjectionPattern> patterns = {
        {"STACKED_MUTATION",
         std::regex(R"(;\s*(drop|delete|insert|update|alter|truncate|create|grant|revoke|merge|copy|call|exec|execute)\b)", flags)},
        // anything after a statement separator other than whitespace
        {"MULTIPLE_STATEMENTS",
         std::regex(R"(;\s*\S)", flags)},
        {"UNION_SELECT",
         std::regex(R"(\bunion\s+(all\s+|distinct\s+)?select\b)", flags)},
        // or 1=1, and 2 = 2
        {"TAUTOLOGY",
         std::regex(R"(\b(or|and)\s+(\d+)\s*=\s*\2\b)", flags)},
        // ' or 'x'='x, or '1' = '1'
        {"TAUTOLOGY",
         std::regex(R"(\b(or|and)\s*'([^']*)'\s*=\s*'\2(?:'|$))", flags)},
        // ' or 1=1 -- / # / /* with the quote glued to the keyword
        {"COMMENT_TAUTOLOGY",
         std::regex(R"('\s*(or|and)\s*1\s*=\s*1\s*(--|#|/\*))", flags)},
    };
    return patterns;
}

} // anonymous namespace

bool StatementValidator::starts_with_select(std::string_view trimmed) {
    constexpr std::string_view kSelect = "select";
    if (trimmed.size() < kSelect.size()) return false;
    if (utils::to_lower(trimmed.substr(0, kSelect.size())) != kSelect) return false;
    return trimmed.size() == kSelect.size() || !utils::is_word_char(trimmed[kSelect.size()]);
}

bool StatementValidator::find_denied_keyword(std::string_view sql, std::string& keyword) {
    const auto words = split_words(sql);

    std::unordered_set<std::string_view> present;
    present.reserve(words.size());
    for (const auto& w : words) {
        present.insert(w.text);
    }

    for (const auto denied : kDeniedWords) {
        if (present.contains(denied)) {
            keyword = std::string(denied);
            return true;
        }
    }

    for (const auto prefix : kDeniedPrefixes) {
        for (const auto& w : words) {
            if (w.text.starts_with(prefix)) {
                keyword = std::string(prefix);
                return true;
            }
        }
    }

    for (const auto& [first, second] : kDeniedPhrases) {
        for (size_t i = 0; i + 1 < words.size(); ++i) {
            if (words[i].text == first && words[i + 1].text == second &&
                only_whitespace(sql, words[i].end, words[i + 1].begin)) {
                keyword = std::format("{} {}", first, second);
                return true;
            }
        }
    }

    return false;
}

bool StatementValidator::find_injection_pattern(std::string_view sql, std::string& pattern) {
    for (const auto& p : injection_patterns()) {
        if (std::regex_search(sql.begin(), sql.end(), p.re)) {
            pattern = p.name;
            return true;
        }
    }
    return false;
}

ValidationVerdict StatementValidator::validate(std::string_view sql) const {
    ValidationVerdict verdict;

    const std::string trimmed = utils::trim(sql);
    if (trimmed.empty()) {
        verdict.reason = RejectionKind::EMPTY_STATEMENT;
        verdict.message = "SQL query must be a non-empty string";
        return verdict;
    }

    if (!starts_with_select(trimmed)) {
        verdict.reason = RejectionKind::NOT_SELECT;
        verdict.message = "Only SELECT queries are allowed";
        return verdict;
    }

    std::string keyword;
    if (find_denied_keyword(sql, keyword)) {
        std::string upper = keyword;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        verdict.reason = RejectionKind::DISALLOWED_KEYWORD;
        verdict.message = std::format(
            "Dangerous SQL keyword detected: {}. Only SELECT queries are allowed.", upper);
        verdict.keyword = std::move(keyword);
        return verdict;
    }

    std::string pattern;
    if (find_injection_pattern(sql, pattern)) {
        verdict.reason = RejectionKind::INJECTION_PATTERN;
        verdict.pattern = std::move(pattern);
        verdict.message = "Potential SQL injection detected. Query blocked for security.";
        return verdict;
    }

    verdict.accepted = true;
    return verdict;
}

} // namespace nlsql
