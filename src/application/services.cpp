#include "application/services.h"
#include "infrastructure/error_handler.h"
#include "infrastructure/logger.h"

namespace ulagen::application {

UlaGenerationService::UlaGenerationService(std::shared_ptr<const domain::IHashFunction> sha1,
                                           GenerationOptions options)
    : options_(options),
      global_id_generator_(std::move(sha1)),
      formatter_(options.style) {}

domain::GenerationResult UlaGenerationService::generate(const std::string& raw_mac,
                                                        const std::string& raw_timestamp,
                                                        const domain::VendorRegistry& registry) const {
    auto mac = domain::MacAddress::parse(raw_mac);
    auto timestamp = domain::NtpTimestamp::parse(raw_timestamp);
    return generate(mac, timestamp, registry);
}

domain::GenerationResult UlaGenerationService::generate(const domain::MacAddress& mac,
                                                        const domain::NtpTimestamp& timestamp,
                                                        const domain::VendorRegistry& registry) const {
    std::string vendor = registry.lookup_vendor(mac);
    LOG_INFO("generator", "vendor found", {{"mac", mac.hex()}, {"vendor", vendor}});

    if (options_.reject_placeholder_nic && mac.has_placeholder_nic()) {
        throw infrastructure::PlaceholderAddressException(mac.hex());
    }

    auto eui64 = eui64_deriver_.derive(mac);
    auto global_id = global_id_generator_.derive(timestamp, eui64);
    auto prefix = formatter_.format(global_id);

    LOG_INFO("generator", "ula prefix generated",
             {{"eui64", eui64.hex()}, {"timestamp", timestamp.hex()}, {"prefix", prefix}});

    return domain::GenerationResult{mac, vendor, timestamp, eui64, global_id, prefix, options_.style};
}

}
