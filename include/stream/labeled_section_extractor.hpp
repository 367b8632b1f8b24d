#pragma once

#include "stream/section_extractor.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace nlsql {

/**
 * @brief Section extractor for free-text answers labelled "SQL:" / "Explanation:"
 *
 * Labels match case-insensitively and only at a word boundary. Every append
 * rescans from just before the previous end of text, so a label split across
 * fragments is still found. Markdown emphasis around labels ("**SQL:**",
 * "### Explanation:") is dropped.
 *
 * Partition rules:
 *   - SQL runs from the first "sql:" label to the first "explanation:" label
 *     after it, or to the end of the text.
 *   - If the only explanation label sits before the SQL label, the
 *     explanation runs up to the SQL label.
 *   - No SQL label means an empty SQL section.
 *
 * finish() re-partitions the entire text, so final values never depend on
 * how the answer was chunked.
 */
class LabeledSectionExtractor : public ISectionExtractor {
public:
    enum class State { SEEKING, IN_SQL, IN_EXPLANATION, DONE };

    static constexpr size_t kDefaultMaxBufferBytes = 1024 * 1024;

    explicit LabeledSectionExtractor(size_t max_buffer_bytes = kDefaultMaxBufferBytes);

    [[nodiscard]] Result<std::vector<SectionSnapshot>> append(std::string_view fragment) override;
    [[nodiscard]] Result<ExtractedAnswer> finish() override;
    void reset() override;

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] const std::string& text() const { return text_; }

private:
    // Start offsets of the labels that decide the partition
    struct Labels {
        std::optional<size_t> sql;
        std::optional<size_t> first_explanation;
        std::optional<size_t> explanation_after_sql;

        void scan(const std::string& text, size_t from);
    };

    struct Regions {
        std::string sql;
        std::string explanation;
    };

    [[nodiscard]] static Regions partition(const std::string& text, const Labels& labels);

    void update_state();

    size_t max_buffer_bytes_;
    std::string text_;
    Labels labels_;
    State state_ = State::SEEKING;
    bool failed_ = false;

    std::string last_sql_;
    std::string last_explanation_;
    std::optional<ExtractedAnswer> final_;
};

} // namespace nlsql
