#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <shared_mutex>
#include <mutex>
#include <filesystem>

namespace ulagen::infrastructure {

class ConfigManager {
public:
    struct UlaConfig {
        struct Ntp {
            std::string server = "0.pool.ntp.org";
            int port = 123;
            int timeout_ms = 2000;
            int attempts = 3;
        } ntp;

        struct Registry {
            std::string cache_path = "oui.txt";
            std::string url = "https://standards-oui.ieee.org/oui/oui.txt";
            int download_timeout_s = 60;
            bool auto_download = true;
        } registry;

        struct Output {
            std::string style = "fixed";
            std::string format = "text";
            bool verbose = false;
        } output;

        struct Logging {
            std::string level = "WARNING";
            std::string file;
            bool json = false;
        } logging;

        struct Validation {
            bool reject_placeholder_nic = false;
        } validation;
    };

    enum class ConfigFormat {
        YAML,
        JSON
    };

    enum class ValidationResult {
        VALID,
        INVALID_VALUE_TYPE,
        INVALID_VALUE_RANGE,
        UNKNOWN_FIELD
    };

    struct ValidationError {
        ValidationResult result;
        std::string field;
        std::string message;
        std::string suggestion;
    };

    static ConfigManager& instance();

    // Back to built-in defaults; forgets the loaded file.
    void reset();

    // Throw ConfigurationException when the file cannot be read or parsed.
    void load_config(const std::string& file_path);
    void load_config(const std::string& file_path, ConfigFormat format);
    void load_from_string(const std::string& config_data, ConfigFormat format = ConfigFormat::YAML);

    // ULAGEN_NTP_SERVER=... sets ntp.server; returns the number of variables applied.
    size_t load_environment_variables(const std::string& prefix = "ULAGEN_");

    // key is "section.name"; value is converted to the field's type.
    void apply_override(const std::string& key, const std::string& value);

    std::vector<ValidationError> validate_config(const UlaConfig& config) const;
    bool is_config_valid() const;

    // Throws ConfigurationException listing every validation error.
    void require_valid() const;

    UlaConfig get_config() const;
    void update_config(const UlaConfig& config);

    std::string export_config_json() const;
    std::string export_config_yaml() const;

    std::string get_config_file_path() const;

    static ConfigFormat detect_format(const std::string& file_path);
    static std::vector<std::string> get_config_keys();

private:
    ConfigManager() = default;
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    using Setter = void (*)(UlaConfig&, const std::string&);
    static const std::unordered_map<std::string, Setter>& setters();

    bool apply_value_locked(const std::string& key, const std::string& value);

    void parse_yaml_config(const std::string& content);
    void parse_json_config(const std::string& content);

    ValidationError validate_ntp_config(const UlaConfig::Ntp& config) const;
    ValidationError validate_registry_config(const UlaConfig::Registry& config) const;
    ValidationError validate_output_config(const UlaConfig::Output& config) const;
    ValidationError validate_logging_config(const UlaConfig::Logging& config) const;

    static int parse_int(const std::string& key, const std::string& value);
    static bool parse_bool(const std::string& key, const std::string& value);

    mutable std::shared_mutex config_mutex_;
    UlaConfig config_;
    std::string config_file_path_;
};

}
