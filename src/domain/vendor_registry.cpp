#include "domain/vendor_registry.h"
#include "domain/hex_validator.h"
#include "infrastructure/error_handler.h"
#include "infrastructure/logger.h"

namespace ulagen::domain {

using infrastructure::VendorNotFoundException;

VendorRegistry::VendorRegistry(std::unordered_map<std::string, std::string> entries) {
    for (const auto& [oui, vendor] : entries) {
        add(oui, vendor);
    }
}

std::string VendorRegistry::normalize_key(const std::string& oui) {
    return to_upper_hex(HexValidator().strip_delimiters(oui));
}

bool VendorRegistry::add(const std::string& oui, const std::string& vendor) {
    std::string key = normalize_key(oui);
    if (key.size() != OUI_HEX_LENGTH) {
        return false;
    }
    for (char c : key) {
        if (!is_hex_digit(c)) return false;
    }
    return entries_.emplace(key, vendor).second;
}

std::optional<std::string> VendorRegistry::find(const std::string& oui) const {
    auto it = entries_.find(normalize_key(oui));
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string VendorRegistry::lookup_vendor(const std::string& mac_prefix) const {
    auto vendor = find(mac_prefix);
    if (!vendor) {
        throw VendorNotFoundException(mac_prefix, normalize_key(mac_prefix));
    }

    LOG_DEBUG("oui_lookup", "vendor found", {{"oui", normalize_key(mac_prefix)}, {"vendor", *vendor}});
    return *vendor;
}

std::string VendorRegistry::lookup_vendor(const MacAddress& mac) const {
    auto vendor = find(mac.oui());
    if (!vendor) {
        throw VendorNotFoundException(mac.hex(), mac.oui());
    }

    LOG_DEBUG("oui_lookup", "vendor found", {{"oui", mac.oui()}, {"vendor", *vendor}});
    return *vendor;
}

}
