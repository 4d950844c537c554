#pragma once

#include "../domain/interfaces.h"
#include <string>
#include <vector>

namespace ulagen::infrastructure {

class LiteralHardwareAddressSource : public domain::IHardwareAddressSource {
public:
    explicit LiteralHardwareAddressSource(std::string value) : value_(std::move(value)) {}

    std::string acquire_address() override { return value_; }
    std::string describe() const override { return "command line"; }

private:
    std::string value_;
};

struct InterfaceInfo {
    std::string name;
    std::string hardware_address;
    bool is_up{false};
    bool is_loopback{false};
};

// Reads the hardware address of a named interface with SIOCGIFHWADDR.
class InterfaceHardwareAddressSource : public domain::IHardwareAddressSource {
public:
    explicit InterfaceHardwareAddressSource(std::string interface_name)
        : interface_name_(std::move(interface_name)) {}

    std::string acquire_address() override;
    std::string describe() const override { return "interface " + interface_name_; }

    static InterfaceInfo query_interface(const std::string& name);
    static std::vector<std::string> list_interfaces();

private:
    std::string interface_name_;
};

// First interface that is up, not loopback and has a non-zero address.
class AutoDetectHardwareAddressSource : public domain::IHardwareAddressSource {
public:
    std::string acquire_address() override;
    std::string describe() const override { return "auto-detected interface"; }

    static bool is_candidate(const InterfaceInfo& info);
};

}
