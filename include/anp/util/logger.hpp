#ifndef ANP_UTIL_LOGGER_HPP
#define ANP_UTIL_LOGGER_HPP

#include <atomic>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace anp::util {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    None = 4
};

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;

    // route every line to `sink` instead of stdout/stderr. nullptr restores the default
    void set_sink(std::ostream* sink);

    void debug(std::string_view message);
    void info(std::string_view message);
    void warn(std::string_view message);
    void error(std::string_view message);

    void log(LogLevel level, std::string_view message);

private:
    Logger() = default;

    [[nodiscard]] std::string timestamp() const;
    [[nodiscard]] std::string_view level_string(LogLevel level) const;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::ostream* sink_ = nullptr;
    std::mutex mutex_;
};

[[nodiscard]] LogLevel parse_log_level(std::string_view s);

//convenience macros
#define LOG_DEBUG(msg) anp::util::Logger::instance().debug(msg);
#define LOG_INFO(msg) anp::util::Logger::instance().info(msg);
#define LOG_WARN(msg) anp::util::Logger::instance().warn(msg);
#define LOG_ERROR(msg) anp::util::Logger::instance().error(msg);

} //namespace anp::util

#endif
