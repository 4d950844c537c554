#include "presentation/cli.h"
#include "infrastructure/error_handler.h"

namespace ulagen::presentation {

using infrastructure::ConfigurationException;

bool CommandLineOptions::prompts_for_mac() const {
    return interactive || (!mac && !interface_name && !auto_interface);
}

CommandLineOptions CommandLineParser::parse(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse(args);
}

CommandLineOptions CommandLineParser::parse(const std::vector<std::string>& args) {
    CommandLineOptions options;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        auto value = [&]() -> std::string {
            if (i + 1 >= args.size()) {
                THROW_CONFIG_ERROR("option " + arg + " requires a value");
            }
            return args[++i];
        };

        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--version") {
            options.show_version = true;
        } else if (arg == "--mac") {
            options.mac = value();
        } else if (arg == "--interface") {
            options.interface_name = value();
        } else if (arg == "--auto-interface") {
            options.auto_interface = true;
        } else if (arg == "--clock") {
            options.clock = value();
        } else if (arg == "--ntp-server") {
            options.ntp_server = value();
        } else if (arg == "--local-clock") {
            options.local_clock = true;
        } else if (arg == "--registry") {
            options.registry_path = value();
        } else if (arg == "--registry-url") {
            options.registry_url = value();
        } else if (arg == "--refresh-registry") {
            options.refresh_registry = true;
        } else if (arg == "--no-download") {
            options.no_download = true;
        } else if (arg == "--style") {
            options.style = value();
        } else if (arg == "--json") {
            options.json = true;
        } else if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (arg == "--reject-placeholder") {
            options.reject_placeholder = true;
        } else if (arg == "--config") {
            options.config_file = value();
        } else if (arg == "--interactive" || arg == "-i") {
            options.interactive = true;
        } else {
            THROW_CONFIG_ERROR("unknown option " + arg);
        }
    }

    int mac_sources = (options.mac ? 1 : 0) + (options.interface_name ? 1 : 0) + (options.auto_interface ? 1 : 0);
    if (mac_sources > 1) {
        THROW_CONFIG_ERROR("--mac, --interface and --auto-interface are mutually exclusive");
    }

    int clock_sources = (options.clock ? 1 : 0) + (options.local_clock ? 1 : 0);
    if (clock_sources > 1) {
        THROW_CONFIG_ERROR("--clock and --local-clock are mutually exclusive");
    }

    if (options.refresh_registry && options.no_download) {
        THROW_CONFIG_ERROR("--refresh-registry and --no-download are mutually exclusive");
    }

    return options;
}

void CommandLineParser::apply_to_config(const CommandLineOptions& options, infrastructure::ConfigManager& config) {
    if (options.ntp_server) config.apply_override("ntp.server", *options.ntp_server);
    if (options.registry_path) config.apply_override("registry.cache_path", *options.registry_path);
    if (options.registry_url) config.apply_override("registry.url", *options.registry_url);
    if (options.no_download) config.apply_override("registry.auto_download", "false");
    if (options.style) config.apply_override("output.style", *options.style);
    if (options.json) config.apply_override("output.format", "json");
    if (options.verbose) config.apply_override("output.verbose", "true");
    if (options.reject_placeholder) config.apply_override("validation.reject_placeholder_nic", "true");

    if (options.debug) {
        config.apply_override("logging.level", "DEBUG");
    } else if (options.verbose) {
        config.apply_override("logging.level", "INFO");
    }
}

void CommandLineParser::print_usage(std::ostream& out) {
    out << "ulagen - RFC 4193 unique local IPv6 prefix generator\n";
    out << "Usage: ulagen [options]\n\n";
    out << "Hardware address (default: prompt):\n";
    out << "  --mac <address>         MAC address, e.g. 00:0d:3a:00:00:01\n";
    out << "  --interface <name>      Read the MAC of a network interface\n";
    out << "  --auto-interface        Use the first active non-loopback interface\n\n";
    out << "Timestamp (default: query NTP):\n";
    out << "  --clock <ntp-time>      64-bit NTP time, e.g. dcf4268b.208dd000\n";
    out << "  --ntp-server <host>     NTP server to query (default: 0.pool.ntp.org)\n";
    out << "  --local-clock           Use the local system clock\n\n";
    out << "Vendor registry:\n";
    out << "  --registry <path>       Registry cache file (default: oui.txt)\n";
    out << "  --registry-url <url>    Download location for a missing cache\n";
    out << "  --refresh-registry      Download the registry even if cached\n";
    out << "  --no-download           Fail instead of downloading a missing cache\n\n";
    out << "Output:\n";
    out << "  --style <fixed|compressed>  Group rendering (default: fixed)\n";
    out << "  --json                  Print the result as JSON\n";
    out << "  --verbose, -v           Show inputs and intermediary values\n";
    out << "  --debug                 Debug logging on stderr\n\n";
    out << "Other:\n";
    out << "  --reject-placeholder    Reject typical made-up NIC parts (01:02:03, 12:34:56, ...)\n";
    out << "  --config <file>         YAML or JSON configuration file\n";
    out << "  --interactive, -i       Prompt for the MAC address and clock\n";
    out << "  --help, -h              Show this help\n";
    out << "  --version               Show version\n";
}

void CommandLineParser::print_version(std::ostream& out) {
    out << "ulagen " << ULAGEN_VERSION << "\n";
}

}
