#include "notify/run_notifier.hpp"
#include "core/utils.hpp"

#include <format>

namespace nlsql {

// ============================================================================
// LoggingRunListener
// ============================================================================

bool LoggingRunListener::on_run(const RunRecord& r) {
    if (r.success) {
        utils::log::info(std::format("run #{} tenant='{}' {}: {} row(s) in {} ms",
            r.sequence_num, r.tenant_id, r.streamed ? "stream" : "ask",
            r.row_count, r.elapsed.count()));
    } else {
        utils::log::info(std::format("run #{} tenant='{}' {}: failed [{}] after {} ms",
            r.sequence_num, r.tenant_id, r.streamed ? "stream" : "ask",
            error_code_to_string(r.error_code), r.elapsed.count()));
    }
    return true;
}

// ============================================================================
// Construction / Destruction
// ============================================================================

RunNotifier::RunNotifier(size_t queue_capacity)
    : queue_capacity_(queue_capacity) {
    running_.store(true, std::memory_order_release);
    dispatch_thread_ = std::thread(&RunNotifier::dispatch_thread_func, this);
}

RunNotifier::~RunNotifier() {
    shutdown();
}

void RunNotifier::add_listener(std::unique_ptr<IRunListener> listener) {
    if (listener) {
        listeners_.push_back(std::move(listener));
    }
}

// ============================================================================
// Public Interface
// ============================================================================

void RunNotifier::notify(RunRecord record) {
    if (!running_.load(std::memory_order_acquire)) {
        return;
    }

    record.sequence_num = sequence_counter_.fetch_add(1, std::memory_order_relaxed);
    total_notified_.fetch_add(1, std::memory_order_relaxed);

    {
        std::lock_guard lock(mutex_);
        if (queue_.size() >= queue_capacity_) {
            overflow_dropped_.fetch_add(1, std::memory_order_relaxed);
            return;
        }
        queue_.push_back(std::move(record));
    }
    work_cv_.notify_one();
}

void RunNotifier::flush() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this] {
        return (queue_.empty() && !in_flight_) || !running_.load(std::memory_order_acquire);
    });
}

void RunNotifier::shutdown() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
        return;
    }

    {
        // Order the flag change with the dispatcher's predicate check
        std::lock_guard lock(mutex_);
    }
    work_cv_.notify_one();

    if (dispatch_thread_.joinable()) {
        dispatch_thread_.join();
    }
    idle_cv_.notify_all();
}

RunNotifier::Stats RunNotifier::get_stats() const {
    return Stats{
        .total_notified = total_notified_.load(std::memory_order_relaxed),
        .total_delivered = total_delivered_.load(std::memory_order_relaxed),
        .overflow_dropped = overflow_dropped_.load(std::memory_order_relaxed),
        .listener_failures = listener_failures_.load(std::memory_order_relaxed),
        .active_listeners = listeners_.size()
    };
}

// ============================================================================
// Background Dispatch Thread
// ============================================================================

void RunNotifier::deliver(const RunRecord& record) {
    for (auto& listener : listeners_) {
        try {
            if (!listener->on_run(record)) {
                listener_failures_.fetch_add(1, std::memory_order_relaxed);
                utils::log::warn(std::format("Run listener '{}' failed for run #{}",
                    listener->name(), record.sequence_num));
            }
        } catch (const std::exception& e) {
            listener_failures_.fetch_add(1, std::memory_order_relaxed);
            utils::log::warn(std::format("Run listener '{}' threw for run #{}: {}",
                listener->name(), record.sequence_num, e.what()));
        }
    }
    total_delivered_.fetch_add(1, std::memory_order_relaxed);
}

void RunNotifier::dispatch_thread_func() {
    while (true) {
        RunRecord record;
        {
            std::unique_lock lock(mutex_);
            work_cv_.wait(lock, [this] {
                return !queue_.empty() || !running_.load(std::memory_order_acquire);
            });

            if (queue_.empty()) {
                // Stopped and fully drained
                return;
            }

            record = std::move(queue_.front());
            queue_.pop_front();
            in_flight_ = true;
        }

        deliver(record);

        {
            std::lock_guard lock(mutex_);
            in_flight_ = false;
        }
        idle_cv_.notify_all();
    }
}

} // namespace nlsql
