#pragma once

#include "core/error.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace nlsql {

/**
 * @brief What the model is asked to answer
 */
struct AnswerRequest {
    std::string question;
    std::string schema_context;     // SchemaIntrospector::format_context output
};

/**
 * @brief Produces model answers for a question
 *
 * generate() returns one structured answer: {"sql": "...", "explanation": "..."}.
 * stream() delivers a free-text answer labelled "SQL:" / "Explanation:" in
 * fragments, in order. The callback returns false to stop early.
 */
class IAnswerSource {
public:
    using FragmentCallback = std::function<bool(std::string_view fragment)>;

    virtual ~IAnswerSource() = default;

    [[nodiscard]] virtual Result<std::string> generate(const AnswerRequest& request) = 0;

    /// @return number of fragments delivered
    [[nodiscard]] virtual Result<size_t> stream(const AnswerRequest& request,
                                                const FragmentCallback& on_fragment) = 0;
};

/**
 * @brief Replays a recorded answer
 *
 * Recordings come from files: a structured answer is a JSON document, a
 * fragment stream is JSON Lines with one JSON string per line.
 */
class ReplayAnswerSource : public IAnswerSource {
public:
    ReplayAnswerSource(std::string answer, std::vector<std::string> fragments)
        : answer_(std::move(answer)), fragments_(std::move(fragments)) {}

    [[nodiscard]] static Result<ReplayAnswerSource> from_answer_file(const std::string& path);
    [[nodiscard]] static Result<ReplayAnswerSource> from_fragment_file(const std::string& path);

    /// Parse JSON Lines of string fragments; blank lines are skipped
    [[nodiscard]] static Result<std::vector<std::string>> parse_fragments(std::string_view jsonl);

    [[nodiscard]] Result<std::string> generate(const AnswerRequest& request) override;
    [[nodiscard]] Result<size_t> stream(const AnswerRequest& request,
                                        const FragmentCallback& on_fragment) override;

    /// Question of the most recent request (tests check what was asked)
    [[nodiscard]] const AnswerRequest& last_request() const { return last_request_; }

private:
    std::string answer_;
    std::vector<std::string> fragments_;
    AnswerRequest last_request_;
};

} // namespace nlsql
