#ifndef ANP_UTIL_SIGNAL_HANDLER_HPP
#define ANP_UTIL_SIGNAL_HANDLER_HPP

#include <atomic>

namespace anp::util {

class SignalHandler {
public:
    // SIGINT/SIGTERM request shutdown
    static void install();
    static bool should_shutdown();
    static void wait_for_shutdown();
    static void request_shutdown();
    static void reset();

private:
    static std::atomic<bool> shutdown_requested_;
};

}  // namespace anp::util

#endif
