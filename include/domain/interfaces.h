#pragma once

#include "types.h"
#include <memory>
#include <string>
#include <vector>
#include <cstdint>

namespace ulagen::domain {

class VendorRegistry;

class IHashFunction {
public:
    virtual ~IHashFunction() = default;
    virtual std::vector<uint8_t> digest(const std::vector<uint8_t>& data) const = 0;
    virtual size_t digest_size() const = 0;
    virtual std::string name() const = 0;
};

// Collaborators return raw text; the core validates it.

class ITimeSource {
public:
    virtual ~ITimeSource() = default;
    virtual std::string acquire_timestamp() = 0;
    virtual std::string describe() const = 0;
};

class IHardwareAddressSource {
public:
    virtual ~IHardwareAddressSource() = default;
    virtual std::string acquire_address() = 0;
    virtual std::string describe() const = 0;
};

class IRegistrySource {
public:
    virtual ~IRegistrySource() = default;
    virtual std::shared_ptr<const VendorRegistry> load_registry() = 0;
    virtual std::string describe() const = 0;
};

}
