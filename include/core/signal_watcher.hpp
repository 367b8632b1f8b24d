#pragma once

#include <atomic>
#include <csignal>
#include <functional>
#include <initializer_list>
#include <thread>

namespace nlsql {

/**
 * @brief Handles termination signals on an ordinary thread
 *
 * The constructor blocks the given signals in the calling thread, and every
 * thread started after it inherits that mask. A dedicated thread waits for
 * them with sigtimedwait() and runs the handler there, so the handler may
 * lock mutexes, log and join work like any other code.
 *
 * Construct before any other thread is started.
 */
class SignalWatcher {
public:
    using Handler = std::function<void(int signal)>;

    SignalWatcher(std::initializer_list<int> signals, Handler handler);

    /// Stops the thread and restores the previous mask
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

    /// Stop waiting. Idempotent.
    void stop();

    /// True once any watched signal was delivered
    [[nodiscard]] bool triggered() const { return triggered_.load(std::memory_order_acquire); }

private:
    void wait_loop();

    sigset_t signals_{};
    sigset_t previous_mask_{};
    Handler handler_;
    std::atomic<bool> running_{true};
    std::atomic<bool> triggered_{false};
    std::thread thread_;
};

} // namespace nlsql
