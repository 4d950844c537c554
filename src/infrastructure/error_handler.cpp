#include "infrastructure/error_handler.h"
#include "infrastructure/logger.h"
#include <iomanip>
#include <iterator>
#include <sstream>

namespace ulagen::infrastructure {

ErrorHandlerManager& ErrorHandlerManager::instance() {
    static ErrorHandlerManager instance;
    return instance;
}

void ErrorHandlerManager::report_error(const ErrorDetails& error) {
    ErrorDetails recorded = error;
    if (recorded.error_id.empty()) {
        recorded.error_id = generate_error_id(recorded);
    }

    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        error_history_.push_back(recorded);
        if (error_history_.size() > max_error_history_) {
            error_history_.erase(error_history_.begin(),
                                 error_history_.begin() + static_cast<std::ptrdiff_t>(error_history_.size() - max_error_history_));
        }
        ++category_counts_[recorded.category];
    }

    total_error_count_.fetch_add(1);
    log_error(recorded);
}

void ErrorHandlerManager::report_error(const std::string& component, const std::string& message,
                                       ErrorCategory category, ErrorSeverity severity) {
    ErrorDetails error;
    error.component = component;
    error.message = message;
    error.category = category;
    error.severity = severity;
    report_error(error);
}

std::vector<ErrorDetails> ErrorHandlerManager::get_recent_errors(size_t count) const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    size_t start = error_history_.size() > count ? error_history_.size() - count : 0;
    return std::vector<ErrorDetails>(error_history_.begin() + static_cast<std::ptrdiff_t>(start), error_history_.end());
}

std::vector<ErrorDetails> ErrorHandlerManager::get_errors_by_category(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    std::vector<ErrorDetails> result;
    std::copy_if(error_history_.begin(), error_history_.end(), std::back_inserter(result),
                 [category](const ErrorDetails& error) { return error.category == category; });
    return result;
}

void ErrorHandlerManager::clear_error_history() {
    std::lock_guard<std::mutex> lock(error_mutex_);
    error_history_.clear();
    category_counts_.clear();
    total_error_count_.store(0);
}

size_t ErrorHandlerManager::get_error_count() const {
    return total_error_count_.load();
}

size_t ErrorHandlerManager::get_error_count_by_category(ErrorCategory category) const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    auto it = category_counts_.find(category);
    return it == category_counts_.end() ? 0 : it->second;
}

void ErrorHandlerManager::set_max_error_history(size_t max_size) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    max_error_history_ = max_size;
}

std::string ErrorHandlerManager::error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::VALIDATION: return "VALIDATION";
        case ErrorCategory::GROUP_ADDRESS: return "GROUP_ADDRESS";
        case ErrorCategory::VENDOR: return "VENDOR";
        case ErrorCategory::PLACEHOLDER: return "PLACEHOLDER";
        case ErrorCategory::ACQUISITION: return "ACQUISITION";
        case ErrorCategory::CONFIGURATION: return "CONFIGURATION";
        case ErrorCategory::INTERNAL: return "INTERNAL";
        default: return "UNKNOWN";
    }
}

std::string ErrorHandlerManager::error_severity_to_string(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::LOW: return "LOW";
        case ErrorSeverity::MEDIUM: return "MEDIUM";
        case ErrorSeverity::HIGH: return "HIGH";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

void ErrorHandlerManager::log_error(const ErrorDetails& error) const {
    Logger::Metadata metadata = error.context;
    metadata["error_id"] = error.error_id;
    metadata["category"] = error_category_to_string(error.category);
    metadata["severity"] = error_severity_to_string(error.severity);

    std::string component = error.component.empty() ? "error_handler" : error.component;

    // the presentation layer prints the operator-facing diagnostic itself
    if (error.severity == ErrorSeverity::CRITICAL) {
        LOG_ERROR(component, error.message, metadata);
    } else {
        LOG_DEBUG(component, error.message, metadata);
    }
}

std::string ErrorHandlerManager::generate_error_id(const ErrorDetails& error) const {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        error.timestamp.time_since_epoch()).count();

    std::ostringstream oss;
    oss << error_category_to_string(error.category) << "-" << std::hex << millis
        << "-" << std::dec << (total_error_count_.load() + 1);
    return oss.str();
}

UlaException::UlaException(const std::string& message, ErrorCategory category,
                           ErrorSeverity severity,
                           std::unordered_map<std::string, std::string> context)
    : message_(message), category_(category), severity_(severity), context_(std::move(context)) {

    ErrorDetails error;
    error.message = message_;
    error.category = category_;
    error.severity = severity_;
    error.context = context_;
    error.is_user_error = is_user_error();
    error.timestamp = std::chrono::system_clock::now();

    ErrorHandlerManager::instance().report_error(error);
}

bool UlaException::is_user_error() const {
    switch (category_) {
        case ErrorCategory::VALIDATION:
        case ErrorCategory::GROUP_ADDRESS:
        case ErrorCategory::VENDOR:
        case ErrorCategory::PLACEHOLDER:
            return true;
        default:
            return false;
    }
}

ValidationException::ValidationException(const std::string& message, const std::string& field,
                                         const std::string& offending_characters,
                                         size_t expected_length, size_t actual_length)
    : UlaException(message, ErrorCategory::VALIDATION, ErrorSeverity::LOW,
                   {{"field", field},
                    {"offending", offending_characters},
                    {"expected_length", std::to_string(expected_length)},
                    {"actual_length", std::to_string(actual_length)}})
    , field_(field)
    , offending_characters_(offending_characters)
    , expected_length_(expected_length)
    , actual_length_(actual_length) {}

}
