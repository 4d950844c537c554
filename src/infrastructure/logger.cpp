#include "infrastructure/logger.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <ctime>

namespace ulagen::infrastructure {

namespace {

std::string escape_json(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"': escaped += "\\\""; break;
            case '\\': escaped += "\\\\"; break;
            case '\n': escaped += "\\n"; break;
            case '\r': escaped += "\\r"; break;
            case '\t': escaped += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char unicode[7];
                    std::snprintf(unicode, sizeof(unicode), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    escaped += unicode;
                } else {
                    escaped += c;
                }
                break;
        }
    }
    return escaped;
}

std::string format_timestamp(std::chrono::system_clock::time_point timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    min_level_ = level;
}

Logger::LogLevel Logger::get_log_level() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return min_level_;
}

void Logger::set_log_file(const std::string& filename) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    log_file_ = filename;
}

void Logger::enable_console_output(bool enable) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    console_output_ = enable;
}

void Logger::enable_json_format(bool enable) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    json_format_ = enable;
}

void Logger::set_max_retained_entries(size_t count) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    max_retained_entries_ = count;
    while (recent_entries_.size() > max_retained_entries_) {
        recent_entries_.pop_front();
    }
}

void Logger::set_console_stream(std::ostream* stream) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    console_stream_ = stream;
}

std::ostream* Logger::get_console_stream() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return console_stream_;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message,
                 const Metadata& metadata) {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (level < min_level_) return;

    LogEntry entry{level, component, message, std::chrono::system_clock::now(), metadata};

    write_to_file(entry);
    if (console_output_) write_to_console(entry);

    if (max_retained_entries_ > 0) {
        recent_entries_.push_back(std::move(entry));
        if (recent_entries_.size() > max_retained_entries_) {
            recent_entries_.pop_front();
        }
    }
}

void Logger::trace(const std::string& component, const std::string& message, const Metadata& metadata) {
    log(LogLevel::TRACE, component, message, metadata);
}
void Logger::debug(const std::string& component, const std::string& message, const Metadata& metadata) {
    log(LogLevel::DEBUG_LEVEL, component, message, metadata);
}
void Logger::info(const std::string& component, const std::string& message, const Metadata& metadata) {
    log(LogLevel::INFO, component, message, metadata);
}
void Logger::warning(const std::string& component, const std::string& message, const Metadata& metadata) {
    log(LogLevel::WARNING, component, message, metadata);
}
void Logger::error(const std::string& component, const std::string& message, const Metadata& metadata) {
    log(LogLevel::ERROR, component, message, metadata);
}
void Logger::critical(const std::string& component, const std::string& message, const Metadata& metadata) {
    log(LogLevel::CRITICAL, component, message, metadata);
}

std::vector<Logger::LogEntry> Logger::get_recent_logs(size_t count) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    size_t start = recent_entries_.size() > count ? recent_entries_.size() - count : 0;
    return std::vector<LogEntry>(recent_entries_.begin() + start, recent_entries_.end());
}

std::vector<Logger::LogEntry> Logger::get_logs_by_component(const std::string& component, size_t count) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::vector<LogEntry> logs;
    for (auto it = recent_entries_.rbegin(); it != recent_entries_.rend() && logs.size() < count; ++it) {
        if (it->component == component) {
            logs.push_back(*it);
        }
    }
    std::reverse(logs.begin(), logs.end());
    return logs;
}

void Logger::clear_recent_logs() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    recent_entries_.clear();
}

void Logger::write_to_file(const LogEntry& entry) const {
    if (log_file_.empty()) return;
    std::ofstream ofs(log_file_, std::ios::app);
    if (!ofs.is_open()) return;
    ofs << "[" << format_timestamp(entry.timestamp) << "] " << format_log_entry(entry) << std::endl;
}

void Logger::write_to_console(const LogEntry& entry) const {
    std::ostream& out = console_stream_ ? *console_stream_ : std::cerr;
    out << format_log_entry(entry) << std::endl;
}

std::string Logger::format_log_entry(const LogEntry& entry) const {
    if (json_format_) {
        return format_json_entry(entry);
    }

    std::string line = log_level_to_string(entry.level) + " [" + entry.component + "] " + entry.message;

    // sorted so that identical entries always render identically
    std::map<std::string, std::string> sorted(entry.metadata.begin(), entry.metadata.end());
    for (const auto& [key, value] : sorted) {
        line += " " + key + "=" + value;
    }
    return line;
}

std::string Logger::format_json_entry(const LogEntry& entry) const {
    std::ostringstream oss;
    oss << "{\"time\":\"" << format_timestamp(entry.timestamp) << "\",";
    oss << "\"level\":\"" << log_level_to_string(entry.level) << "\",";
    oss << "\"component\":\"" << escape_json(entry.component) << "\",";
    oss << "\"message\":\"" << escape_json(entry.message) << "\"";

    std::map<std::string, std::string> sorted(entry.metadata.begin(), entry.metadata.end());
    for (const auto& [key, value] : sorted) {
        oss << ",\"" << escape_json(key) << "\":\"" << escape_json(value) << "\"";
    }
    oss << "}";
    return oss.str();
}

std::string Logger::log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG_LEVEL: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

bool Logger::parse_log_level(const std::string& text, LogLevel& level) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    if (upper == "TRACE") {
        level = LogLevel::TRACE;
    } else if (upper == "DEBUG") {
        level = LogLevel::DEBUG_LEVEL;
    } else if (upper == "INFO") {
        level = LogLevel::INFO;
    } else if (upper == "WARNING" || upper == "WARN") {
        level = LogLevel::WARNING;
    } else if (upper == "ERROR") {
        level = LogLevel::ERROR;
    } else if (upper == "CRITICAL") {
        level = LogLevel::CRITICAL;
    } else {
        return false;
    }
    return true;
}

}
