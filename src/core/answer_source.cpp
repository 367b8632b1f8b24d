#include "core/answer_source.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <format>
#include <fstream>
#include <sstream>

namespace nlsql {

namespace {

Result<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<std::string>::error(ErrorCode::INVALID_REQUEST,
            std::format("Cannot open recording '{}'", path));
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Result<std::string>::ok(ss.str());
}

} // anonymous namespace

Result<ReplayAnswerSource> ReplayAnswerSource::from_answer_file(const std::string& path) {
    auto content = read_file(path);
    if (content.is_error()) {
        return Result<ReplayAnswerSource>::error(content.error_code(), content.error_message());
    }
    return Result<ReplayAnswerSource>::ok(ReplayAnswerSource(std::move(content.value()), {}));
}

Result<ReplayAnswerSource> ReplayAnswerSource::from_fragment_file(const std::string& path) {
    auto content = read_file(path);
    if (content.is_error()) {
        return Result<ReplayAnswerSource>::error(content.error_code(), content.error_message());
    }
    auto fragments = parse_fragments(content.value());
    if (fragments.is_error()) {
        return Result<ReplayAnswerSource>::error(fragments.error_code(),
            std::format("{}: {}", path, fragments.error_message()));
    }
    return Result<ReplayAnswerSource>::ok(ReplayAnswerSource({}, std::move(fragments.value())));
}

Result<std::vector<std::string>> ReplayAnswerSource::parse_fragments(std::string_view jsonl) {
    std::vector<std::string> fragments;
    size_t line_no = 0;

    while (!jsonl.empty()) {
        const size_t nl = jsonl.find('\n');
        const std::string_view line = jsonl.substr(0, nl);
        jsonl.remove_prefix(nl == std::string_view::npos ? jsonl.size() : nl + 1);
        ++line_no;

        const std::string trimmed = utils::trim(line);
        if (trimmed.empty()) {
            continue;
        }

        try {
            const auto value = JsonValue::parse(trimmed);
            if (!value.is_string()) {
                return Result<std::vector<std::string>>::error(ErrorCode::INVALID_REQUEST,
                    std::format("line {}: fragment must be a JSON string", line_no));
            }
            fragments.push_back(value.get<std::string>());
        } catch (const JsonValue::parse_error& e) {
            return Result<std::vector<std::string>>::error(ErrorCode::INVALID_REQUEST,
                std::format("line {}: {}", line_no, e.what()));
        }
    }

    return Result<std::vector<std::string>>::ok(std::move(fragments));
}

Result<std::string> ReplayAnswerSource::generate(const AnswerRequest& request) {
    last_request_ = request;
    if (answer_.empty()) {
        return Result<std::string>::error(ErrorCode::GENERATION_FAILED, "No recorded answer");
    }
    return Result<std::string>::ok(answer_);
}

Result<size_t> ReplayAnswerSource::stream(const AnswerRequest& request,
                                          const FragmentCallback& on_fragment) {
    last_request_ = request;
    size_t delivered = 0;
    for (const auto& fragment : fragments_) {
        ++delivered;
        if (!on_fragment(fragment)) {
            break;
        }
    }
    return Result<size_t>::ok(delivered);
}

} // namespace nlsql
