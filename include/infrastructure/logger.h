#pragma once

#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <chrono>
#include <ostream>
#include <unordered_map>

namespace ulagen::infrastructure {

class Logger {
public:
    enum class LogLevel {
        TRACE,
        DEBUG_LEVEL,
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    using Metadata = std::unordered_map<std::string, std::string>;

    struct LogEntry {
        LogLevel level;
        std::string component;
        std::string message;
        std::chrono::system_clock::time_point timestamp;
        Metadata metadata;
    };

    static Logger& instance();

    void set_log_level(LogLevel level);
    LogLevel get_log_level() const;
    void set_log_file(const std::string& filename);
    void enable_console_output(bool enable);
    void enable_json_format(bool enable);
    void set_max_retained_entries(size_t count);

    // Redirects console output, used by tests to keep the runner output clean.
    void set_console_stream(std::ostream* stream);
    std::ostream* get_console_stream() const;

    void log(LogLevel level, const std::string& component, const std::string& message,
             const Metadata& metadata = {});

    void trace(const std::string& component, const std::string& message, const Metadata& metadata = {});
    void debug(const std::string& component, const std::string& message, const Metadata& metadata = {});
    void info(const std::string& component, const std::string& message, const Metadata& metadata = {});
    void warning(const std::string& component, const std::string& message, const Metadata& metadata = {});
    void error(const std::string& component, const std::string& message, const Metadata& metadata = {});
    void critical(const std::string& component, const std::string& message, const Metadata& metadata = {});

    std::vector<LogEntry> get_recent_logs(size_t count = 100) const;
    std::vector<LogEntry> get_logs_by_component(const std::string& component, size_t count = 100) const;
    void clear_recent_logs();

    static std::string log_level_to_string(LogLevel level);
    static bool parse_log_level(const std::string& text, LogLevel& level);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write_to_file(const LogEntry& entry) const;
    void write_to_console(const LogEntry& entry) const;
    std::string format_log_entry(const LogEntry& entry) const;
    std::string format_json_entry(const LogEntry& entry) const;

    mutable std::mutex log_mutex_;
    LogLevel min_level_{LogLevel::WARNING};
    std::string log_file_;
    bool console_output_{true};
    bool json_format_{false};
    std::ostream* console_stream_{nullptr};
    size_t max_retained_entries_{256};
    std::deque<LogEntry> recent_entries_;
};

#define LOG_TRACE(component, message, ...) \
    ulagen::infrastructure::Logger::instance().trace(component, message, ##__VA_ARGS__)

#define LOG_DEBUG(component, message, ...) \
    ulagen::infrastructure::Logger::instance().debug(component, message, ##__VA_ARGS__)

#define LOG_INFO(component, message, ...) \
    ulagen::infrastructure::Logger::instance().info(component, message, ##__VA_ARGS__)

#define LOG_WARNING(component, message, ...) \
    ulagen::infrastructure::Logger::instance().warning(component, message, ##__VA_ARGS__)

#define LOG_ERROR(component, message, ...) \
    ulagen::infrastructure::Logger::instance().error(component, message, ##__VA_ARGS__)

#define LOG_CRITICAL(component, message, ...) \
    ulagen::infrastructure::Logger::instance().critical(component, message, ##__VA_ARGS__)

}
