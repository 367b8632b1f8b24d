#pragma once

#include "core/error.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace nlsql {

enum class Section { SQL, EXPLANATION };

[[nodiscard]] inline const char* section_to_string(Section s) {
    return s == Section::SQL ? "sql" : "explanation";
}

/**
 * @brief Current content of one answer section
 */
struct SectionSnapshot {
    Section section = Section::SQL;
    std::string content;
    bool partial = true;
};

/**
 * @brief Authoritative sections once the answer is complete
 */
struct ExtractedAnswer {
    std::string sql;            // empty when the answer carried no SQL section
    std::string explanation;
};

/**
 * @brief Splits a model answer into its SQL and explanation sections
 *
 * Fed fragment by fragment in delivery order. One instance per answer.
 */
class ISectionExtractor {
public:
    virtual ~ISectionExtractor() = default;

    /**
     * @brief Consume the next fragment
     * @return Snapshots of the sections whose visible content changed
     */
    [[nodiscard]] virtual Result<std::vector<SectionSnapshot>> append(std::string_view fragment) = 0;

    /**
     * @brief Stream ended: compute the final sections from the whole text
     *
     * Calling it again returns the same answer.
     */
    [[nodiscard]] virtual Result<ExtractedAnswer> finish() = 0;

    /// Forget everything and start a new answer
    virtual void reset() = 0;
};

} // namespace nlsql
