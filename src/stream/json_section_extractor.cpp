#include "stream/json_section_extractor.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"
#include <format>

namespace nlsql {

Result<std::vector<SectionSnapshot>> JsonSectionExtractor::append(std::string_view fragment) {
    using SnapshotResult = Result<std::vector<SectionSnapshot>>;

    if (final_) {
        return SnapshotResult::error(ErrorCode::GENERATION_FAILED, "Answer stream already finished");
    }
    if (overflowed_ || buffer_.size() + fragment.size() > max_buffer_bytes_) {
        overflowed_ = true;
        return SnapshotResult::error(ErrorCode::GENERATION_FAILED,
            std::format("Answer stream exceeds the {} byte buffer limit", max_buffer_bytes_));
    }

    buffer_.append(fragment);
    return SnapshotResult::ok({});
}

Result<ExtractedAnswer> JsonSectionExtractor::finish() {
    if (final_) {
        return *final_;
    }

    if (overflowed_) {
        final_ = Result<ExtractedAnswer>::error(ErrorCode::GENERATION_FAILED,
            std::format("Answer stream exceeds the {} byte buffer limit", max_buffer_bytes_));
        return *final_;
    }

    JsonValue doc;
    try {
        doc = JsonValue::parse(utils::trim(buffer_));
    } catch (const JsonValue::parse_error& e) {
        final_ = Result<ExtractedAnswer>::error(ErrorCode::GENERATION_FAILED,
            std::format("Failed to parse answer as JSON: {}", e.what()));
        return *final_;
    }

    const auto sql = utils::trim(doc.string_or("sql", ""));
    const auto explanation = doc.string_or("explanation", "");

    if (!doc.is_object() || sql.empty() || explanation.empty()) {
        final_ = Result<ExtractedAnswer>::error(ErrorCode::GENERATION_FAILED,
            "Answer missing required fields: sql and explanation");
        return *final_;
    }

    final_ = Result<ExtractedAnswer>::ok(ExtractedAnswer{sql, explanation});
    return *final_;
}

void JsonSectionExtractor::reset() {
    buffer_.clear();
    overflowed_ = false;
    final_.reset();
}

} // namespace nlsql
