#pragma once

#include "cli.h"
#include "result_renderer.h"
#include "../domain/interfaces.h"
#include "../application/services.h"
#include "../application/use_cases.h"
#include "../infrastructure/config_manager.h"
#include <istream>
#include <memory>
#include <ostream>

namespace ulagen::presentation {

// Wires collaborators from the effective configuration and the command line.
class DependencyContainer {
public:
    static DependencyContainer& instance();

    // Loads --config, environment overrides and flags into ConfigManager,
    // validates the result and applies the logging settings.
    void initialize(const CommandLineOptions& options, std::istream& in, std::ostream& prompt_out);
    void reset();

    std::shared_ptr<const domain::IHashFunction> get_hash_function();
    std::shared_ptr<domain::IHardwareAddressSource> get_hardware_address_source();
    std::shared_ptr<domain::ITimeSource> get_time_source();
    std::shared_ptr<domain::IRegistrySource> get_registry_source();
    std::shared_ptr<const application::UlaGenerationService> get_generation_service();
    std::shared_ptr<application::GenerateUlaUseCase> get_generate_use_case();
    ResultRenderer get_result_renderer() const;

    const infrastructure::ConfigManager::UlaConfig& get_config() const { return config_; }

private:
    DependencyContainer() = default;
    ~DependencyContainer() = default;
    DependencyContainer(const DependencyContainer&) = delete;
    DependencyContainer& operator=(const DependencyContainer&) = delete;

    void require_initialized() const;
    void configure_logging() const;
    std::shared_ptr<domain::ITimeSource> create_network_or_local_time_source() const;

    bool initialized_ = false;
    CommandLineOptions options_;
    infrastructure::ConfigManager::UlaConfig config_;
    std::istream* in_ = nullptr;
    std::ostream* prompt_out_ = nullptr;

    std::shared_ptr<const domain::IHashFunction> hash_function_;
    std::shared_ptr<domain::IHardwareAddressSource> hardware_address_source_;
    std::shared_ptr<domain::ITimeSource> time_source_;
    std::shared_ptr<domain::IRegistrySource> registry_source_;
    std::shared_ptr<const application::UlaGenerationService> generation_service_;
    std::shared_ptr<application::GenerateUlaUseCase> generate_use_case_;
};

}
