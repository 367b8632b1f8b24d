#include "stream/labeled_section_extractor.hpp"
#include "core/utils.hpp"
#include <cctype>
#include <format>

namespace nlsql {

namespace {

constexpr std::string_view kSqlLabel = "sql:";
constexpr std::string_view kExplanationLabel = "explanation:";
constexpr std::string_view kCodeFence = "```";

// A label split across fragments starts at most this far before the old end
constexpr size_t kRescanOverlap = kExplanationLabel.size() - 1;

bool iequals_at(std::string_view text, size_t pos, std::string_view label) {
    if (pos + label.size() > text.size()) {
        return false;
    }
    for (size_t i = 0; i < label.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[pos + i])) != label[i]) {
            return false;
        }
    }
    return true;
}

bool is_ci_prefix_of(std::string_view candidate, std::string_view label) {
    return !candidate.empty() && candidate.size() <= label.size() && iequals_at(label, 0, utils::to_lower(candidate));
}

bool at_word_boundary(std::string_view text, size_t pos) {
    return pos == 0 || !utils::is_word_char(text[pos - 1]);
}

bool is_emphasis(char c) {
    return c == '*' || c == '#';
}

// "**Explanation:" ends the previous region before the asterisks
size_t absorb_emphasis(std::string_view text, size_t label_start) {
    while (label_start > 0 && is_emphasis(text[label_start - 1])) {
        --label_start;
    }
    return label_start;
}

std::string clean_region(std::string_view region) {
    for (;;) {
        size_t i = 0;
        while (i < region.size() &&
               (is_emphasis(region[i]) || std::isspace(static_cast<unsigned char>(region[i])))) {
            ++i;
        }
        region.remove_prefix(i);
        if (!iequals_at(region, 0, kSqlLabel)) {
            break;
        }
        region.remove_prefix(kSqlLabel.size());
    }
    return std::string(region);
}

// "```sql\nSELECT 1\n```" -> "SELECT 1"; the info string runs to the end of the opening line
std::string strip_code_fence(const std::string& region) {
    std::string_view text(region);
    if (!text.starts_with(kCodeFence)) {
        return region;
    }
    text.remove_prefix(kCodeFence.size());
    if (const size_t nl = text.find('\n'); nl != std::string_view::npos) {
        text.remove_prefix(nl + 1);
    }
    if (const size_t close = text.rfind(kCodeFence); close != std::string_view::npos) {
        text = text.substr(0, close);
    }
    return utils::trim(text);
}

// Drop a trailing word that may turn out to be the start of the explanation label
void hold_back_label_prefix(std::string& content) {
    const size_t ws = content.find_last_of(" \t\r\n");
    const size_t token_start = (ws == std::string::npos) ? 0 : ws + 1;
    std::string_view token = std::string_view(content).substr(token_start);
    if (token.empty()) {
        return;
    }

    size_t emphasis = 0;
    while (emphasis < token.size() && is_emphasis(token[emphasis])) {
        ++emphasis;
    }
    const std::string_view word = token.substr(emphasis);

    if ((word.empty() && emphasis >= 2) || is_ci_prefix_of(word, kExplanationLabel)) {
        content.resize(token_start);
    }
}

} // anonymous namespace

// ============================================================================
// Label scanning
// ============================================================================

void LabeledSectionExtractor::Labels::scan(const std::string& text, size_t from) {
    for (size_t p = from; p < text.size(); ++p) {
        if (!at_word_boundary(text, p)) {
            continue;
        }
        if (!sql && iequals_at(text, p, kSqlLabel)) {
            sql = p;
        } else if (iequals_at(text, p, kExplanationLabel)) {
            if (!first_explanation) {
                first_explanation = p;
            }
            if (sql && p > *sql && !explanation_after_sql) {
                explanation_after_sql = p;
            }
        }
    }
}

LabeledSectionExtractor::Regions LabeledSectionExtractor::partition(
    const std::string& text, const Labels& labels) {

    const std::string_view view(text);
    auto region = [&](size_t begin, size_t end) {
        return clean_region(end > begin ? view.substr(begin, end - begin) : std::string_view{});
    };

    Regions regions;
    if (labels.sql) {
        const size_t sql_begin = *labels.sql + kSqlLabel.size();
        if (labels.explanation_after_sql) {
            const size_t label = *labels.explanation_after_sql;
            regions.sql = region(sql_begin, absorb_emphasis(view, label));
            regions.explanation = region(label + kExplanationLabel.size(), view.size());
        } else {
            regions.sql = region(sql_begin, view.size());
            if (labels.first_explanation) {
                regions.explanation = region(*labels.first_explanation + kExplanationLabel.size(),
                                             absorb_emphasis(view, *labels.sql));
            }
        }
    } else if (labels.first_explanation) {
        regions.explanation = region(*labels.first_explanation + kExplanationLabel.size(), view.size());
    }
    return regions;
}

// ============================================================================
// LabeledSectionExtractor
// ============================================================================

LabeledSectionExtractor::LabeledSectionExtractor(size_t max_buffer_bytes)
    : max_buffer_bytes_(max_buffer_bytes) {}

Result<std::vector<SectionSnapshot>> LabeledSectionExtractor::append(std::string_view fragment) {
    using SnapshotResult = Result<std::vector<SectionSnapshot>>;

    if (failed_ || state_ == State::DONE) {
        return SnapshotResult::error(ErrorCode::GENERATION_FAILED, "Answer stream already finished");
    }

    if (text_.size() + fragment.size() > max_buffer_bytes_) {
        failed_ = true;
        state_ = State::DONE;
        return SnapshotResult::error(ErrorCode::GENERATION_FAILED,
            std::format("Answer stream exceeds the {} byte buffer limit", max_buffer_bytes_));
    }

    const size_t rescan_from = text_.size() > kRescanOverlap ? text_.size() - kRescanOverlap : 0;
    text_.append(fragment);
    labels_.scan(text_, rescan_from);
    update_state();

    auto regions = partition(text_, labels_);
    if (state_ == State::IN_SQL) {
        hold_back_label_prefix(regions.sql);
    }

    std::vector<SectionSnapshot> snapshots;
    if (!regions.sql.empty() && regions.sql != last_sql_) {
        last_sql_ = regions.sql;
        snapshots.push_back(SectionSnapshot{Section::SQL, last_sql_, true});
    }
    if (!regions.explanation.empty() && regions.explanation != last_explanation_) {
        last_explanation_ = regions.explanation;
        snapshots.push_back(SectionSnapshot{Section::EXPLANATION, last_explanation_, true});
    }
    return SnapshotResult::ok(std::move(snapshots));
}

Result<ExtractedAnswer> LabeledSectionExtractor::finish() {
    if (final_) {
        return Result<ExtractedAnswer>::ok(*final_);
    }
    if (failed_) {
        return Result<ExtractedAnswer>::error(ErrorCode::GENERATION_FAILED,
            std::format("Answer stream exceeds the {} byte buffer limit", max_buffer_bytes_));
    }

    // Authoritative pass over the whole text
    Labels labels;
    labels.scan(text_, 0);
    const auto regions = partition(text_, labels);

    state_ = State::DONE;
    final_ = ExtractedAnswer{strip_code_fence(utils::trim(regions.sql)), utils::trim(regions.explanation)};

    if (final_->sql.empty()) {
        utils::log::debug("Answer stream ended without an SQL section");
    }
    return Result<ExtractedAnswer>::ok(*final_);
}

void LabeledSectionExtractor::reset() {
    text_.clear();
    labels_ = Labels{};
    state_ = State::SEEKING;
    failed_ = false;
    last_sql_.clear();
    last_explanation_.clear();
    final_.reset();
}

void LabeledSectionExtractor::update_state() {
    if (labels_.sql) {
        state_ = labels_.explanation_after_sql ? State::IN_EXPLANATION : State::IN_SQL;
    } else if (labels_.first_explanation) {
        state_ = State::IN_EXPLANATION;
    } else {
        state_ = State::SEEKING;
    }
}

} // namespace nlsql
