#include "infrastructure/config_manager.h"
#include "infrastructure/error_handler.h"
#include "infrastructure/logger.h"
#include "domain/types.h"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cctype>
#include <algorithm>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <unistd.h>

extern char** environ;

namespace ulagen::infrastructure {

ConfigManager& ConfigManager::instance() {
    static ConfigManager instance;
    return instance;
}

void ConfigManager::reset() {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    config_ = UlaConfig{};
    config_file_path_.clear();
}

const std::unordered_map<std::string, ConfigManager::Setter>& ConfigManager::setters() {
    static const std::unordered_map<std::string, Setter> table = {
        {"ntp.server", [](UlaConfig& c, const std::string& v) { c.ntp.server = v; }},
        {"ntp.port", [](UlaConfig& c, const std::string& v) { c.ntp.port = parse_int("ntp.port", v); }},
        {"ntp.timeout_ms", [](UlaConfig& c, const std::string& v) { c.ntp.timeout_ms = parse_int("ntp.timeout_ms", v); }},
        {"ntp.attempts", [](UlaConfig& c, const std::string& v) { c.ntp.attempts = parse_int("ntp.attempts", v); }},
        {"registry.cache_path", [](UlaConfig& c, const std::string& v) { c.registry.cache_path = v; }},
        {"registry.url", [](UlaConfig& c, const std::string& v) { c.registry.url = v; }},
        {"registry.download_timeout_s", [](UlaConfig& c, const std::string& v) {
            c.registry.download_timeout_s = parse_int("registry.download_timeout_s", v);
        }},
        {"registry.auto_download", [](UlaConfig& c, const std::string& v) {
            c.registry.auto_download = parse_bool("registry.auto_download", v);
        }},
        {"output.style", [](UlaConfig& c, const std::string& v) { c.output.style = v; }},
        {"output.format", [](UlaConfig& c, const std::string& v) { c.output.format = v; }},
        {"output.verbose", [](UlaConfig& c, const std::string& v) { c.output.verbose = parse_bool("output.verbose", v); }},
        {"logging.level", [](UlaConfig& c, const std::string& v) { c.logging.level = v; }},
        {"logging.file", [](UlaConfig& c, const std::string& v) { c.logging.file = v; }},
        {"logging.json", [](UlaConfig& c, const std::string& v) { c.logging.json = parse_bool("logging.json", v); }},
        {"validation.reject_placeholder_nic", [](UlaConfig& c, const std::string& v) {
            c.validation.reject_placeholder_nic = parse_bool("validation.reject_placeholder_nic", v);
        }},
    };
    return table;
}

std::vector<std::string> ConfigManager::get_config_keys() {
    std::vector<std::string> keys;
    for (const auto& [key, setter] : setters()) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

int ConfigManager::parse_int(const std::string& key, const std::string& value) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed == value.size()) {
            return parsed;
        }
    } catch (const std::logic_error&) {
        // invalid_argument and out_of_range both end up below
    }
    THROW_CONFIG_ERROR(key + ": \"" + value + "\" is not an integer");
}

bool ConfigManager::parse_bool(const std::string& key, const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), ::tolower);

    if (lowered == "true" || lowered == "yes" || lowered == "on" || lowered == "1") return true;
    if (lowered == "false" || lowered == "no" || lowered == "off" || lowered == "0") return false;

    THROW_CONFIG_ERROR(key + ": \"" + value + "\" is not a boolean");
}

bool ConfigManager::apply_value_locked(const std::string& key, const std::string& value) {
    auto it = setters().find(key);
    if (it == setters().end()) {
        return false;
    }
    it->second(config_, value);
    return true;
}

void ConfigManager::apply_override(const std::string& key, const std::string& value) {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    if (!apply_value_locked(key, value)) {
        THROW_CONFIG_ERROR("unknown configuration key \"" + key + "\"");
    }
}

ConfigManager::ConfigFormat ConfigManager::detect_format(const std::string& file_path) {
    std::string extension = std::filesystem::path(file_path).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);

    if (extension == ".json") {
        return ConfigFormat::JSON;
    }
    return ConfigFormat::YAML;
}

void ConfigManager::load_config(const std::string& file_path) {
    load_config(file_path, detect_format(file_path));
}

void ConfigManager::load_config(const std::string& file_path, ConfigFormat format) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        THROW_CONFIG_ERROR("cannot open config file \"" + file_path + "\"");
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());

    load_from_string(content, format);

    {
        std::unique_lock<std::shared_mutex> lock(config_mutex_);
        config_file_path_ = file_path;
    }
    LOG_INFO("config", "config loaded", {{"file", file_path}});
}

void ConfigManager::load_from_string(const std::string& config_data, ConfigFormat format) {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);

    switch (format) {
        case ConfigFormat::YAML:
            parse_yaml_config(config_data);
            break;
        case ConfigFormat::JSON:
            parse_json_config(config_data);
            break;
    }
}

void ConfigManager::parse_yaml_config(const std::string& content) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        THROW_CONFIG_ERROR(std::string("yaml parsing failed: ") + e.what());
    }

    if (root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        THROW_CONFIG_ERROR("configuration root must be a mapping");
    }

    for (const auto& section : root) {
        auto section_name = section.first.as<std::string>();
        if (!section.second.IsMap()) {
            THROW_CONFIG_ERROR("section \"" + section_name + "\" must be a mapping");
        }

        for (const auto& entry : section.second) {
            std::string key = section_name + "." + entry.first.as<std::string>();
            if (!entry.second.IsScalar()) {
                THROW_CONFIG_ERROR(key + " must be a scalar value");
            }
            if (!apply_value_locked(key, entry.second.as<std::string>())) {
                LOG_WARNING("config", "unknown configuration key ignored", {{"key", key}});
            }
        }
    }
}

void ConfigManager::parse_json_config(const std::string& content) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(content);
    } catch (const nlohmann::json::exception& e) {
        THROW_CONFIG_ERROR(std::string("json parsing failed: ") + e.what());
    }

    if (!root.is_object()) {
        THROW_CONFIG_ERROR("configuration root must be an object");
    }

    for (const auto& section_item : root.items()) {
        const std::string& section_name = section_item.key();
        const auto& section = section_item.value();
        if (!section.is_object()) {
            THROW_CONFIG_ERROR("section \"" + section_name + "\" must be an object");
        }

        for (const auto& entry : section.items()) {
            std::string key = section_name + "." + entry.key();
            const auto& value = entry.value();
            if (value.is_structured() || value.is_null()) {
                THROW_CONFIG_ERROR(key + " must be a scalar value");
            }
            std::string text = value.is_string() ? value.get<std::string>() : value.dump();
            if (!apply_value_locked(key, text)) {
                LOG_WARNING("config", "unknown configuration key ignored", {{"key", key}});
            }
        }
    }
}

size_t ConfigManager::load_environment_variables(const std::string& prefix) {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    size_t applied = 0;

    for (char** env = environ; *env != nullptr; ++env) {
        std::string env_var = *env;
        if (!env_var.starts_with(prefix)) {
            continue;
        }

        auto eq_pos = env_var.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string name = env_var.substr(prefix.length(), eq_pos - prefix.length());
        std::string value = env_var.substr(eq_pos + 1);
        std::transform(name.begin(), name.end(), name.begin(), ::tolower);

        // Section names carry no underscore, so the first one separates section and key.
        auto separator = name.find('_');
        if (separator == std::string::npos) {
            continue;
        }
        std::string key = name.substr(0, separator) + "." + name.substr(separator + 1);

        if (apply_value_locked(key, value)) {
            ++applied;
        } else {
            LOG_WARNING("config", "unknown environment override ignored", {{"variable", env_var.substr(0, eq_pos)}});
        }
    }

    if (applied > 0) {
        LOG_INFO("config", "environment variables loaded", {{"prefix", prefix}, {"count", std::to_string(applied)}});
    }
    return applied;
}

std::vector<ConfigManager::ValidationError> ConfigManager::validate_config(const UlaConfig& config) const {
    std::vector<ValidationError> errors;

    auto ntp_error = validate_ntp_config(config.ntp);
    if (ntp_error.result != ValidationResult::VALID) {
        errors.push_back(ntp_error);
    }

    auto registry_error = validate_registry_config(config.registry);
    if (registry_error.result != ValidationResult::VALID) {
        errors.push_back(registry_error);
    }

    auto output_error = validate_output_config(config.output);
    if (output_error.result != ValidationResult::VALID) {
        errors.push_back(output_error);
    }

    auto logging_error = validate_logging_config(config.logging);
    if (logging_error.result != ValidationResult::VALID) {
        errors.push_back(logging_error);
    }

    return errors;
}

bool ConfigManager::is_config_valid() const {
    return validate_config(get_config()).empty();
}

void ConfigManager::require_valid() const {
    auto errors = validate_config(get_config());
    if (errors.empty()) {
        return;
    }

    std::ostringstream message;
    message << "invalid configuration:";
    for (const auto& error : errors) {
        message << "\n  " << error.field << ": " << error.message << " (" << error.suggestion << ")";
    }
    THROW_CONFIG_ERROR(message.str());
}

ConfigManager::UlaConfig ConfigManager::get_config() const {
    std::shared_lock<std::shared_mutex> lock(config_mutex_);
    return config_;
}

void ConfigManager::update_config(const UlaConfig& config) {
    std::unique_lock<std::shared_mutex> lock(config_mutex_);
    config_ = config;
}

std::string ConfigManager::get_config_file_path() const {
    std::shared_lock<std::shared_mutex> lock(config_mutex_);
    return config_file_path_;
}

std::string ConfigManager::export_config_json() const {
    auto config = get_config();
    nlohmann::json root;

    root["ntp"]["server"] = config.ntp.server;
    root["ntp"]["port"] = config.ntp.port;
    root["ntp"]["timeout_ms"] = config.ntp.timeout_ms;
    root["ntp"]["attempts"] = config.ntp.attempts;

    root["registry"]["cache_path"] = config.registry.cache_path;
    root["registry"]["url"] = config.registry.url;
    root["registry"]["download_timeout_s"] = config.registry.download_timeout_s;
    root["registry"]["auto_download"] = config.registry.auto_download;

    root["output"]["style"] = config.output.style;
    root["output"]["format"] = config.output.format;
    root["output"]["verbose"] = config.output.verbose;

    root["logging"]["level"] = config.logging.level;
    root["logging"]["file"] = config.logging.file;
    root["logging"]["json"] = config.logging.json;

    root["validation"]["reject_placeholder_nic"] = config.validation.reject_placeholder_nic;

    return root.dump(2);
}

std::string ConfigManager::export_config_yaml() const {
    auto config = get_config();
    YAML::Node root;

    YAML::Node ntp;
    ntp["server"] = config.ntp.server;
    ntp["port"] = config.ntp.port;
    ntp["timeout_ms"] = config.ntp.timeout_ms;
    ntp["attempts"] = config.ntp.attempts;
    root["ntp"] = ntp;

    YAML::Node registry;
    registry["cache_path"] = config.registry.cache_path;
    registry["url"] = config.registry.url;
    registry["download_timeout_s"] = config.registry.download_timeout_s;
    registry["auto_download"] = config.registry.auto_download;
    root["registry"] = registry;

    YAML::Node output;
    output["style"] = config.output.style;
    output["format"] = config.output.format;
    output["verbose"] = config.output.verbose;
    root["output"] = output;

    YAML::Node logging;
    logging["level"] = config.logging.level;
    logging["file"] = config.logging.file;
    logging["json"] = config.logging.json;
    root["logging"] = logging;

    YAML::Node validation;
    validation["reject_placeholder_nic"] = config.validation.reject_placeholder_nic;
    root["validation"] = validation;

    std::ostringstream out;
    out << root;
    return out.str();
}

ConfigManager::ValidationError ConfigManager::validate_ntp_config(const UlaConfig::Ntp& config) const {
    if (config.server.empty()) {
        return {ValidationResult::INVALID_VALUE_TYPE, "ntp.server",
                "server must not be empty", "use a host name such as 0.pool.ntp.org"};
    }

    if (config.port <= 0 || config.port > 65535) {
        return {ValidationResult::INVALID_VALUE_RANGE, "ntp.port",
                "port must be between 1 and 65535", "use the standard ntp port 123"};
    }

    if (config.timeout_ms <= 0) {
        return {ValidationResult::INVALID_VALUE_RANGE, "ntp.timeout_ms",
                "timeout must be positive", "use a value like 2000"};
    }

    if (config.attempts < 1) {
        return {ValidationResult::INVALID_VALUE_RANGE, "ntp.attempts",
                "at least one attempt is required", "use a value like 3"};
    }

    return {ValidationResult::VALID, "", "", ""};
}

ConfigManager::ValidationError ConfigManager::validate_registry_config(const UlaConfig::Registry& config) const {
    if (config.cache_path.empty()) {
        return {ValidationResult::INVALID_VALUE_TYPE, "registry.cache_path",
                "cache path must not be empty", "use a file name such as oui.txt"};
    }

    if (config.auto_download && config.url.empty()) {
        return {ValidationResult::INVALID_VALUE_TYPE, "registry.url",
                "download url must not be empty", "use https://standards-oui.ieee.org/oui/oui.txt"};
    }

    if (config.download_timeout_s <= 0) {
        return {ValidationResult::INVALID_VALUE_RANGE, "registry.download_timeout_s",
                "timeout must be positive", "use a value like 60"};
    }

    return {ValidationResult::VALID, "", "", ""};
}

ConfigManager::ValidationError ConfigManager::validate_output_config(const UlaConfig::Output& config) const {
    domain::UlaRenderStyle style;
    if (!domain::parse_render_style(config.style, style)) {
        return {ValidationResult::INVALID_VALUE_TYPE, "output.style",
                "unknown output style \"" + config.style + "\"", "use one of: fixed, compressed"};
    }

    if (config.format != "text" && config.format != "json") {
        return {ValidationResult::INVALID_VALUE_TYPE, "output.format",
                "unknown output format \"" + config.format + "\"", "use one of: text, json"};
    }

    return {ValidationResult::VALID, "", "", ""};
}

ConfigManager::ValidationError ConfigManager::validate_logging_config(const UlaConfig::Logging& config) const {
    Logger::LogLevel level;
    if (!Logger::parse_log_level(config.level, level)) {
        return {ValidationResult::INVALID_VALUE_TYPE, "logging.level",
                "invalid log level \"" + config.level + "\"", "use one of: TRACE, DEBUG, INFO, WARNING, ERROR, CRITICAL"};
    }

    return {ValidationResult::VALID, "", "", ""};
}

}
