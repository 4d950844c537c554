#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <atomic>
#include <mutex>
#include <exception>
#include <chrono>
#include <thread>
#include <random>
#include <cmath>
#include <algorithm>

namespace ulagen::infrastructure {

enum class ErrorCategory {
    VALIDATION,
    GROUP_ADDRESS,
    VENDOR,
    PLACEHOLDER,
    ACQUISITION,
    CONFIGURATION,
    INTERNAL,
    UNKNOWN
};

enum class ErrorSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

struct ErrorDetails {
    std::string error_id;
    std::string component;
    std::string message;
    ErrorCategory category;
    ErrorSeverity severity;
    std::chrono::system_clock::time_point timestamp;
    std::unordered_map<std::string, std::string> context;
    bool is_user_error;

    ErrorDetails()
        : category(ErrorCategory::UNKNOWN)
        , severity(ErrorSeverity::LOW)
        , timestamp(std::chrono::system_clock::now())
        , is_user_error(false) {}
};

class ErrorHandlerManager {
public:
    static ErrorHandlerManager& instance();

    void report_error(const ErrorDetails& error);
    void report_error(const std::string& component, const std::string& message,
                      ErrorCategory category = ErrorCategory::UNKNOWN,
                      ErrorSeverity severity = ErrorSeverity::MEDIUM);

    std::vector<ErrorDetails> get_recent_errors(size_t count = 100) const;
    std::vector<ErrorDetails> get_errors_by_category(ErrorCategory category) const;

    void clear_error_history();

    size_t get_error_count() const;
    size_t get_error_count_by_category(ErrorCategory category) const;

    void set_max_error_history(size_t max_size);

    static std::string error_category_to_string(ErrorCategory category);
    static std::string error_severity_to_string(ErrorSeverity severity);

private:
    ErrorHandlerManager() = default;
    ~ErrorHandlerManager() = default;
    ErrorHandlerManager(const ErrorHandlerManager&) = delete;
    ErrorHandlerManager& operator=(const ErrorHandlerManager&) = delete;

    void log_error(const ErrorDetails& error) const;
    std::string generate_error_id(const ErrorDetails& error) const;

    mutable std::mutex error_mutex_;
    std::vector<ErrorDetails> error_history_;
    std::unordered_map<ErrorCategory, size_t> category_counts_;
    size_t max_error_history_{1000};
    std::atomic<size_t> total_error_count_{0};
};

class UlaException : public std::exception {
public:
    UlaException(const std::string& message, ErrorCategory category = ErrorCategory::UNKNOWN,
                 ErrorSeverity severity = ErrorSeverity::MEDIUM,
                 std::unordered_map<std::string, std::string> context = {});

    const char* what() const noexcept override {
        return message_.c_str();
    }

    ErrorCategory get_category() const { return category_; }
    ErrorSeverity get_severity() const { return severity_; }
    const std::unordered_map<std::string, std::string>& get_context() const { return context_; }

    // Input defects are fixed by the operator; everything else is environmental or a bug.
    bool is_user_error() const;

private:
    std::string message_;
    ErrorCategory category_;
    ErrorSeverity severity_;
    std::unordered_map<std::string, std::string> context_;
};

class ValidationException : public UlaException {
public:
    ValidationException(const std::string& message, const std::string& field,
                        const std::string& offending_characters,
                        size_t expected_length, size_t actual_length);

    const std::string& get_field() const { return field_; }
    const std::string& get_offending_characters() const { return offending_characters_; }
    size_t get_expected_length() const { return expected_length_; }
    size_t get_actual_length() const { return actual_length_; }

private:
    std::string field_;
    std::string offending_characters_;
    size_t expected_length_;
    size_t actual_length_;
};

class GroupAddressException : public UlaException {
public:
    explicit GroupAddressException(const std::string& mac)
        : UlaException("MAC address \"" + mac + "\" is a group MAC address",
                       ErrorCategory::GROUP_ADDRESS, ErrorSeverity::MEDIUM, {{"mac", mac}}) {}
};

class VendorNotFoundException : public UlaException {
public:
    VendorNotFoundException(const std::string& mac, const std::string& oui)
        : UlaException("MAC address \"" + mac + "\" is not registered to IEEE. Please use a REAL MAC address.",
                       ErrorCategory::VENDOR, ErrorSeverity::MEDIUM, {{"mac", mac}, {"oui", oui}}) {}
};

class PlaceholderAddressException : public UlaException {
public:
    explicit PlaceholderAddressException(const std::string& mac)
        : UlaException("MAC address \"" + mac + "\" is a typical non-existing MAC address. Please use a REAL MAC address.",
                       ErrorCategory::PLACEHOLDER, ErrorSeverity::MEDIUM, {{"mac", mac}}) {}
};

class AcquisitionException : public UlaException {
public:
    AcquisitionException(const std::string& source, const std::string& message)
        : UlaException(source + ": " + message, ErrorCategory::ACQUISITION,
                       ErrorSeverity::HIGH, {{"source", source}}) {}
};

class ConfigurationException : public UlaException {
public:
    explicit ConfigurationException(const std::string& message)
        : UlaException(message, ErrorCategory::CONFIGURATION, ErrorSeverity::HIGH) {}
};

class InternalInvariantException : public UlaException {
public:
    explicit InternalInvariantException(const std::string& message)
        : UlaException(message, ErrorCategory::INTERNAL, ErrorSeverity::CRITICAL) {}
};

#define THROW_ACQUISITION_ERROR(source, msg) throw AcquisitionException(source, msg)
#define THROW_CONFIG_ERROR(msg) throw ConfigurationException(msg)
#define THROW_INTERNAL_ERROR(msg) throw InternalInvariantException(msg)

class RetryPolicy {
public:
    struct RetryConfig {
        size_t max_attempts{3};
        std::chrono::milliseconds base_delay{250};
        double backoff_multiplier{2.0};
        std::chrono::milliseconds max_delay{4000};
        bool enable_jitter{true};
    };

    using RetryCallback = std::function<void(size_t attempt, const std::exception& error)>;

    RetryPolicy() : config_{} {}
    explicit RetryPolicy(const RetryConfig& config) : config_(config) {}

    void on_retry(RetryCallback callback) { on_retry_ = std::move(callback); }

    const RetryConfig& get_config() const { return config_; }

    // Only AcquisitionException is retried; anything else propagates on first failure.
    template<typename F>
    auto execute(F&& func) -> decltype(func()) {
        size_t attempts = std::max<size_t>(config_.max_attempts, 1);

        for (size_t attempt = 0;; ++attempt) {
            try {
                return func();
            } catch (const AcquisitionException& e) {
                if (attempt + 1 >= attempts) {
                    throw;
                }
                if (on_retry_) {
                    on_retry_(attempt + 1, e);
                }
                std::this_thread::sleep_for(calculate_delay(attempt));
            }
        }
    }

private:
    std::chrono::milliseconds calculate_delay(size_t attempt) const {
        auto delay = static_cast<double>(config_.base_delay.count()) *
                     std::pow(config_.backoff_multiplier, static_cast<double>(attempt));

        delay = std::min(delay, static_cast<double>(config_.max_delay.count()));

        if (config_.enable_jitter) {
            std::random_device rd;
            std::mt19937 gen(rd());
            std::uniform_real_distribution<> dis(0.5, 1.5);
            delay *= dis(gen);
        }

        return std::chrono::milliseconds(static_cast<long long>(delay));
    }

    RetryConfig config_;
    RetryCallback on_retry_;
};

}
