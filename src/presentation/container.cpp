#include "presentation/container.h"
#include "presentation/prompt.h"
#include "infrastructure/error_handler.h"
#include "infrastructure/hardware_address_sources.h"
#include "infrastructure/logger.h"
#include "infrastructure/openssl_hash.h"
#include "infrastructure/oui_registry.h"
#include "infrastructure/time_sources.h"

namespace ulagen::presentation {

using infrastructure::ConfigurationException;
using infrastructure::InternalInvariantException;

DependencyContainer& DependencyContainer::instance() {
    static DependencyContainer instance;
    return instance;
}

void DependencyContainer::initialize(const CommandLineOptions& options, std::istream& in, std::ostream& prompt_out) {
    reset();

    auto& config_manager = infrastructure::ConfigManager::instance();
    config_manager.reset();
    if (options.config_file) {
        config_manager.load_config(*options.config_file);
    }
    config_manager.load_environment_variables();
    CommandLineParser::apply_to_config(options, config_manager);
    config_manager.require_valid();

    options_ = options;
    config_ = config_manager.get_config();
    in_ = &in;
    prompt_out_ = &prompt_out;
    initialized_ = true;

    configure_logging();
    LOG_DEBUG("container", "dependencies configured", {{"config", config_manager.get_config_file_path()}});
}

void DependencyContainer::reset() {
    initialized_ = false;
    options_ = CommandLineOptions{};
    config_ = infrastructure::ConfigManager::UlaConfig{};
    in_ = nullptr;
    prompt_out_ = nullptr;
    hash_function_.reset();
    hardware_address_source_.reset();
    time_source_.reset();
    registry_source_.reset();
    generation_service_.reset();
    generate_use_case_.reset();
}

void DependencyContainer::require_initialized() const {
    if (!initialized_) {
        THROW_INTERNAL_ERROR("dependency container used before initialize()");
    }
}

void DependencyContainer::configure_logging() const {
    auto& logger = infrastructure::Logger::instance();

    infrastructure::Logger::LogLevel level;
    if (!infrastructure::Logger::parse_log_level(config_.logging.level, level)) {
        THROW_CONFIG_ERROR("invalid log level \"" + config_.logging.level + "\"");
    }
    logger.set_log_level(level);
    logger.enable_json_format(config_.logging.json);
    if (!config_.logging.file.empty()) {
        logger.set_log_file(config_.logging.file);
    }
}

std::shared_ptr<const domain::IHashFunction> DependencyContainer::get_hash_function() {
    require_initialized();
    if (!hash_function_) {
        hash_function_ = std::make_shared<infrastructure::OpenSSLSha1>();
    }
    return hash_function_;
}

std::shared_ptr<domain::IHardwareAddressSource> DependencyContainer::get_hardware_address_source() {
    require_initialized();
    if (hardware_address_source_) {
        return hardware_address_source_;
    }

    if (options_.mac && !options_.interactive) {
        hardware_address_source_ = std::make_shared<infrastructure::LiteralHardwareAddressSource>(*options_.mac);
    } else if (options_.interface_name && !options_.interactive) {
        hardware_address_source_ = std::make_shared<infrastructure::InterfaceHardwareAddressSource>(*options_.interface_name);
    } else if (options_.auto_interface && !options_.interactive) {
        hardware_address_source_ = std::make_shared<infrastructure::AutoDetectHardwareAddressSource>();
    } else {
        hardware_address_source_ = std::make_shared<PromptHardwareAddressSource>(*in_, *prompt_out_);
    }
    return hardware_address_source_;
}

std::shared_ptr<domain::ITimeSource> DependencyContainer::create_network_or_local_time_source() const {
    if (options_.local_clock) {
        return std::make_shared<infrastructure::SystemClockTimeSource>();
    }

    infrastructure::SntpTimeSource::Options sntp;
    sntp.server = config_.ntp.server;
    sntp.port = static_cast<uint16_t>(config_.ntp.port);
    sntp.timeout = std::chrono::milliseconds(config_.ntp.timeout_ms);
    sntp.retry.max_attempts = static_cast<size_t>(config_.ntp.attempts);
    return std::make_shared<infrastructure::SntpTimeSource>(sntp);
}

std::shared_ptr<domain::ITimeSource> DependencyContainer::get_time_source() {
    require_initialized();
    if (time_source_) {
        return time_source_;
    }

    if (options_.clock) {
        time_source_ = std::make_shared<infrastructure::LiteralTimeSource>(*options_.clock);
    } else if (options_.prompts_for_mac()) {
        time_source_ = std::make_shared<PromptTimeSource>(*in_, *prompt_out_, create_network_or_local_time_source());
    } else {
        time_source_ = create_network_or_local_time_source();
    }
    return time_source_;
}

std::shared_ptr<domain::IRegistrySource> DependencyContainer::get_registry_source() {
    require_initialized();
    if (!registry_source_) {
        infrastructure::CachingRegistrySource::Options registry;
        registry.cache_path = config_.registry.cache_path;
        registry.url = config_.registry.url;
        registry.auto_download = config_.registry.auto_download;
        registry.force_refresh = options_.refresh_registry;
        registry.download.timeout = std::chrono::seconds(config_.registry.download_timeout_s);
        registry_source_ = std::make_shared<infrastructure::CachingRegistrySource>(registry);
    }
    return registry_source_;
}

std::shared_ptr<const application::UlaGenerationService> DependencyContainer::get_generation_service() {
    require_initialized();
    if (!generation_service_) {
        application::GenerationOptions generation;
        if (!domain::parse_render_style(config_.output.style, generation.style)) {
            THROW_CONFIG_ERROR("unknown output style \"" + config_.output.style + "\"");
        }
        generation.reject_placeholder_nic = config_.validation.reject_placeholder_nic;
        generation_service_ = std::make_shared<application::UlaGenerationService>(get_hash_function(), generation);
    }
    return generation_service_;
}

std::shared_ptr<application::GenerateUlaUseCase> DependencyContainer::get_generate_use_case() {
    require_initialized();
    if (!generate_use_case_) {
        generate_use_case_ = std::make_shared<application::GenerateUlaUseCase>(
            get_hardware_address_source(), get_registry_source(), get_time_source(), get_generation_service());
    }
    return generate_use_case_;
}

ResultRenderer DependencyContainer::get_result_renderer() const {
    require_initialized();

    OutputFormat format;
    if (!parse_output_format(config_.output.format, format)) {
        THROW_CONFIG_ERROR("unknown output format \"" + config_.output.format + "\"");
    }
    return ResultRenderer(format, config_.output.verbose);
}

}
