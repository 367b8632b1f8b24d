#pragma once

#include "notify/run_listener.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace nlsql {

/**
 * @brief Dispatches RunRecords to listeners on a background thread
 *
 * notify() never blocks on listeners: records are queued and a dedicated
 * thread delivers them in order. A full queue drops the record and counts
 * the overflow. Listener failures and exceptions are counted and logged,
 * never reported back to the caller.
 */
class RunNotifier {
public:
    static constexpr size_t kDefaultQueueCapacity = 4096;

    explicit RunNotifier(size_t queue_capacity = kDefaultQueueCapacity);

    ~RunNotifier();

    RunNotifier(const RunNotifier&) = delete;
    RunNotifier& operator=(const RunNotifier&) = delete;

    /// Register before the first notify(); listeners are not locked
    void add_listener(std::unique_ptr<IRunListener> listener);

    void notify(RunRecord record);

    /// Block until every record queued so far has been delivered
    void flush();

    /// Deliver what is queued, then stop the thread. Idempotent.
    void shutdown();

    struct Stats {
        uint64_t total_notified;
        uint64_t total_delivered;
        uint64_t overflow_dropped;
        uint64_t listener_failures;
        size_t active_listeners;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    void dispatch_thread_func();
    void deliver(const RunRecord& record);

    size_t queue_capacity_;
    std::vector<std::unique_ptr<IRunListener>> listeners_;

    std::deque<RunRecord> queue_;
    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    bool in_flight_ = false;

    std::thread dispatch_thread_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> sequence_counter_{0};
    std::atomic<uint64_t> total_notified_{0};
    std::atomic<uint64_t> total_delivered_{0};
    std::atomic<uint64_t> overflow_dropped_{0};
    std::atomic<uint64_t> listener_failures_{0};
};

} // namespace nlsql
