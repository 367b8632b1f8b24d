#pragma once

#include "core/error.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace nlsql {

/**
 * @brief Summary of one finished question, for side effects after the fact
 */
struct RunRecord {
    uint64_t sequence_num = 0;
    std::string tenant_id;
    std::string question;
    std::string sql;
    bool streamed = false;
    bool success = false;
    ErrorCode error_code = ErrorCode::NONE;
    uint64_t row_count = 0;
    std::chrono::milliseconds elapsed{0};
    std::chrono::system_clock::time_point finished_at{};
};

/**
 * @brief Receives RunRecords on the notifier's background thread
 *
 * Only ever called from that one thread, so no internal locking is needed.
 */
class IRunListener {
public:
    virtual ~IRunListener() = default;

    /// Returns false on failure; the notifier counts it and moves on
    [[nodiscard]] virtual bool on_run(const RunRecord& record) = 0;

    /// Human-readable name for logging
    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * @brief Writes one log line per finished run
 */
class LoggingRunListener : public IRunListener {
public:
    [[nodiscard]] bool on_run(const RunRecord& record) override;
    [[nodiscard]] std::string name() const override { return "log"; }
};

} // namespace nlsql
