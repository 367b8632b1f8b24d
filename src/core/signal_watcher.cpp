#include "core/signal_watcher.hpp"
#include "core/utils.hpp"

#include <cerrno>
#include <cstring>
#include <format>
#include <pthread.h>
#include <stdexcept>

namespace nlsql {

namespace {

// How often the wait loop checks for stop()
constexpr long kPollNanos = 100'000'000;

} // anonymous namespace

SignalWatcher::SignalWatcher(std::initializer_list<int> signals, Handler handler)
    : handler_(std::move(handler)) {
    sigemptyset(&signals_);
    for (const int sig : signals) {
        sigaddset(&signals_, sig);
    }

    if (const int rc = pthread_sigmask(SIG_BLOCK, &signals_, &previous_mask_); rc != 0) {
        throw std::runtime_error(std::format("pthread_sigmask failed: {}", std::strerror(rc)));
    }

    thread_ = std::thread(&SignalWatcher::wait_loop, this);
}

SignalWatcher::~SignalWatcher() {
    stop();
    pthread_sigmask(SIG_SETMASK, &previous_mask_, nullptr);
}

void SignalWatcher::stop() {
    running_.store(false, std::memory_order_release);
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void SignalWatcher::wait_loop() {
    while (running_.load(std::memory_order_acquire)) {
        const timespec timeout{0, kPollNanos};
        const int sig = sigtimedwait(&signals_, nullptr, &timeout);
        if (sig < 0) {
            if (errno != EAGAIN && errno != EINTR) {
                utils::log::error(std::format("sigtimedwait failed: {}", std::strerror(errno)));
                return;
            }
            continue;
        }

        triggered_.store(true, std::memory_order_release);
        utils::log::info(std::format("Received signal {}, shutting down...", sig));
        if (!handler_) {
            continue;
        }
        try {
            handler_(sig);
        } catch (const std::exception& e) {
            utils::log::error(std::format("Signal handler failed: {}", e.what()));
        }
    }
}

} // namespace nlsql
