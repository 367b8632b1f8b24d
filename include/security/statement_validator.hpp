#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace nlsql {

enum class RejectionKind : uint8_t {
    NONE,
    EMPTY_STATEMENT,
    NOT_SELECT,
    DISALLOWED_KEYWORD,
    INJECTION_PATTERN
};

[[nodiscard]] inline const char* rejection_kind_to_string(RejectionKind kind) {
    switch (kind) {
        case RejectionKind::NONE:               return "NONE";
        case RejectionKind::EMPTY_STATEMENT:    return "EMPTY_STATEMENT";
        case RejectionKind::NOT_SELECT:         return "NOT_SELECT";
        case RejectionKind::DISALLOWED_KEYWORD: return "DISALLOWED_KEYWORD";
        case RejectionKind::INJECTION_PATTERN:  return "INJECTION_PATTERN";
        default:                                return "UNKNOWN";
    }
}

struct ValidationVerdict {
    bool accepted = false;
    RejectionKind reason = RejectionKind::NONE;
    std::string keyword;    // DISALLOWED_KEYWORD only, lowercased
    std::string pattern;    // INJECTION_PATTERN only, e.g. "TAUTOLOGY"
    std::string message;    // caller-facing explanation
};

/**
 * @brief Static read-only gate for generated SQL
 *
 * Runs before any network call, so it never parses SQL grammar: it works on
 * the word sequence of the text plus a handful of injection heuristics.
 * Accepted text is never rewritten.
 *
 * This is a heuristic. Unsafe statements that avoid every listed word and
 * pattern get through, and a denylisted word inside a string literal is
 * still rejected.
 */
class StatementValidator {
public:
    [[nodiscard]] ValidationVerdict validate(std::string_view sql) const;

private:
    [[nodiscard]] static bool starts_with_select(std::string_view trimmed);
    [[nodiscard]] static bool find_denied_keyword(std::string_view sql, std::string& keyword);
    [[nodiscard]] static bool find_injection_pattern(std::string_view sql, std::string& pattern);
};

} // namespace nlsql
