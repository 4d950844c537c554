#pragma once

#include "services.h"
#include "../domain/interfaces.h"
#include <memory>

namespace ulagen::application {

// One full run. The MAC is validated before the timestamp is acquired so a
// typo is reported without waiting on an NTP server. Collaborator failures
// surface as AcquisitionException; input defects as the matching
// UlaException subclass.
class GenerateUlaUseCase {
public:
    GenerateUlaUseCase(
        std::shared_ptr<domain::IHardwareAddressSource> hardware_address_source,
        std::shared_ptr<domain::IRegistrySource> registry_source,
        std::shared_ptr<domain::ITimeSource> time_source,
        std::shared_ptr<const UlaGenerationService> service
    );

    domain::GenerationResult execute();

private:
    std::shared_ptr<domain::IHardwareAddressSource> hardware_address_source_;
    std::shared_ptr<domain::IRegistrySource> registry_source_;
    std::shared_ptr<domain::ITimeSource> time_source_;
    std::shared_ptr<const UlaGenerationService> service_;
};

}
