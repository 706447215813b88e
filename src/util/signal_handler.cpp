#include "anp/util/signal_handler.hpp"

#include <chrono>
#include <condition_variable>
#include <csignal>
#include <mutex>

namespace anp::util {

std::atomic<bool> SignalHandler::shutdown_requested_{false};

namespace {

std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

void signal_handler(int signal) {
    (void)signal;
    SignalHandler::request_shutdown();
}

}  // namespace

void SignalHandler::install() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

bool SignalHandler::should_shutdown() {
    return shutdown_requested_.load();
}

void SignalHandler::wait_for_shutdown() {
    std::unique_lock lock(shutdown_mutex);
    // a notify from inside a signal handler can be missed, so wake up periodically as well
    while (!shutdown_requested_.load()) {
        shutdown_cv.wait_for(lock, std::chrono::milliseconds(100));
    }
}

void SignalHandler::request_shutdown() {
    shutdown_requested_.store(true);
    shutdown_cv.notify_all();
}

void SignalHandler::reset() {
    shutdown_requested_.store(false);
}

}  // namespace anp::util
