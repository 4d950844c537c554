#pragma once

#include "../domain/types.h"
#include "../domain/interfaces.h"
#include "../domain/vendor_registry.h"
#include "../domain/eui64_deriver.h"
#include "../domain/global_id_generator.h"
#include "../domain/ula_formatter.h"
#include <memory>
#include <string>

namespace ulagen::application {

struct GenerationOptions {
    domain::UlaRenderStyle style{domain::UlaRenderStyle::FIXED_WIDTH};
    bool reject_placeholder_nic{false};
};

// The deterministic pipeline: validate, look up the vendor, derive the
// EUI-64, hash, format. Holds no state between calls.
class UlaGenerationService {
public:
    explicit UlaGenerationService(std::shared_ptr<const domain::IHashFunction> sha1,
                                  GenerationOptions options = {});

    domain::GenerationResult generate(const std::string& raw_mac, const std::string& raw_timestamp,
                                      const domain::VendorRegistry& registry) const;

    // Inputs already validated, e.g. by a caller that checks the MAC before
    // acquiring a timestamp.
    domain::GenerationResult generate(const domain::MacAddress& mac, const domain::NtpTimestamp& timestamp,
                                      const domain::VendorRegistry& registry) const;

    const GenerationOptions& options() const { return options_; }

private:
    GenerationOptions options_;
    domain::Eui64Deriver eui64_deriver_;
    domain::GlobalIdGenerator global_id_generator_;
    domain::UlaFormatter formatter_;
};

}
