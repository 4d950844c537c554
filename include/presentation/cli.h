#pragma once

#include "../infrastructure/config_manager.h"
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace ulagen::presentation {

constexpr const char* ULAGEN_VERSION = "1.0.0";

struct CommandLineOptions {
    std::optional<std::string> mac;
    std::optional<std::string> interface_name;
    bool auto_interface = false;

    std::optional<std::string> clock;
    std::optional<std::string> ntp_server;
    bool local_clock = false;

    std::optional<std::string> registry_path;
    std::optional<std::string> registry_url;
    bool refresh_registry = false;
    bool no_download = false;

    std::optional<std::string> style;
    bool json = false;
    bool verbose = false;
    bool debug = false;

    bool reject_placeholder = false;
    std::optional<std::string> config_file;
    bool interactive = false;
    bool show_help = false;
    bool show_version = false;

    // No MAC option given, or --interactive.
    bool prompts_for_mac() const;
};

class CommandLineParser {
public:
    // Throws ConfigurationException for unknown flags, missing values and
    // conflicting sources.
    static CommandLineOptions parse(const std::vector<std::string>& args);
    static CommandLineOptions parse(int argc, char* argv[]);

    // Layers the flags that shadow configuration keys over the loaded config.
    static void apply_to_config(const CommandLineOptions& options, infrastructure::ConfigManager& config);

    static void print_usage(std::ostream& out);
    static void print_version(std::ostream& out);
};

}
