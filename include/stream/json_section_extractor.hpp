#pragma once

#include "stream/section_extractor.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace nlsql {

/**
 * @brief Section extractor for structured answers: {"sql": "...", "explanation": "..."}
 *
 * A JSON document cannot be split into sections before it is complete, so
 * append() only buffers; finish() parses and requires both fields.
 */
class JsonSectionExtractor : public ISectionExtractor {
public:
    static constexpr size_t kDefaultMaxBufferBytes = 1024 * 1024;

    explicit JsonSectionExtractor(size_t max_buffer_bytes = kDefaultMaxBufferBytes)
        : max_buffer_bytes_(max_buffer_bytes) {}

    [[nodiscard]] Result<std::vector<SectionSnapshot>> append(std::string_view fragment) override;
    [[nodiscard]] Result<ExtractedAnswer> finish() override;
    void reset() override;

private:
    size_t max_buffer_bytes_;
    std::string buffer_;
    bool overflowed_ = false;
    std::optional<Result<ExtractedAnswer>> final_;
};

} // namespace nlsql
