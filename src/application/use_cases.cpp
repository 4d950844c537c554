#include "application/use_cases.h"
#include "domain/vendor_registry.h"
#include "infrastructure/error_handler.h"
#include "infrastructure/logger.h"

namespace ulagen::application {

using infrastructure::InternalInvariantException;

GenerateUlaUseCase::GenerateUlaUseCase(
    std::shared_ptr<domain::IHardwareAddressSource> hardware_address_source,
    std::shared_ptr<domain::IRegistrySource> registry_source,
    std::shared_ptr<domain::ITimeSource> time_source,
    std::shared_ptr<const UlaGenerationService> service
) : hardware_address_source_(std::move(hardware_address_source)),
    registry_source_(std::move(registry_source)),
    time_source_(std::move(time_source)),
    service_(std::move(service)) {
    if (!hardware_address_source_ || !registry_source_ || !time_source_ || !service_) {
        THROW_INTERNAL_ERROR("generate use case is missing a collaborator");
    }
}

domain::GenerationResult GenerateUlaUseCase::execute() {
    LOG_DEBUG("use_case", "acquiring hardware address", {{"source", hardware_address_source_->describe()}});
    auto mac = domain::MacAddress::parse(hardware_address_source_->acquire_address());

    LOG_DEBUG("use_case", "acquiring timestamp", {{"source", time_source_->describe()}});
    auto timestamp = domain::NtpTimestamp::parse(time_source_->acquire_timestamp());

    LOG_DEBUG("use_case", "loading vendor registry", {{"source", registry_source_->describe()}});
    auto registry = registry_source_->load_registry();
    if (!registry) {
        THROW_INTERNAL_ERROR(registry_source_->describe() + " returned no registry");
    }

    return service_->generate(mac, timestamp, *registry);
}

}
