#pragma once

#include "types.h"
#include <string>
#include <optional>
#include <unordered_map>

namespace ulagen::domain {

// Read-only OUI -> vendor mapping, keyed by 6 uppercase hex digits.
class VendorRegistry {
public:
    VendorRegistry() = default;
    explicit VendorRegistry(std::unordered_map<std::string, std::string> entries);

    // Normalises the key; later entries do not replace earlier ones.
    bool add(const std::string& oui, const std::string& vendor);

    std::optional<std::string> find(const std::string& oui) const;

    // Throws VendorNotFoundException for an unknown prefix.
    std::string lookup_vendor(const std::string& mac_prefix) const;
    std::string lookup_vendor(const MacAddress& mac) const;

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    static std::string normalize_key(const std::string& oui);

    std::unordered_map<std::string, std::string> entries_;
};

}
