#include "infrastructure/hardware_address_sources.h"
#include "infrastructure/error_handler.h"
#include "infrastructure/logger.h"
#include "domain/hex_validator.h"
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <net/if.h>
#include <net/if_arp.h>
#include <ifaddrs.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <memory>
#include <set>

namespace ulagen::infrastructure {

namespace {

constexpr const char* SOURCE = "network interface";

class ControlSocket {
public:
    ControlSocket() : fd_(socket(AF_INET, SOCK_DGRAM, 0)) {
        if (fd_ == -1) {
            THROW_ACQUISITION_ERROR(SOURCE, std::string("cannot open control socket: ") + std::strerror(errno));
        }
    }
    ~ControlSocket() { close(fd_); }

    ControlSocket(const ControlSocket&) = delete;
    ControlSocket& operator=(const ControlSocket&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

struct ifaddrs_deleter {
    void operator()(ifaddrs* list) const noexcept {
        if (list) {
            freeifaddrs(list);
        }
    }
};

}

InterfaceInfo InterfaceHardwareAddressSource::query_interface(const std::string& name) {
    if (name.empty() || name.size() >= IFNAMSIZ) {
        THROW_ACQUISITION_ERROR(SOURCE, "invalid interface name \"" + name + "\"");
    }

    ControlSocket control;

    struct ifreq ifr;
    memset(&ifr, 0, sizeof(ifr));
    strncpy(ifr.ifr_name, name.c_str(), IFNAMSIZ - 1);

    if (ioctl(control.get(), SIOCGIFHWADDR, &ifr) < 0) {
        THROW_ACQUISITION_ERROR(SOURCE, name + ": " + std::strerror(errno));
    }

    if (ifr.ifr_hwaddr.sa_family != ARPHRD_ETHER) {
        THROW_ACQUISITION_ERROR(SOURCE, name + " has no 48-bit hardware address");
    }

    InterfaceInfo info;
    info.name = name;
    info.hardware_address = domain::encode_hex(
        reinterpret_cast<const uint8_t*>(ifr.ifr_hwaddr.sa_data), 6);

    memset(&ifr, 0, sizeof(ifr));
    strncpy(ifr.ifr_name, name.c_str(), IFNAMSIZ - 1);
    if (ioctl(control.get(), SIOCGIFFLAGS, &ifr) < 0) {
        THROW_ACQUISITION_ERROR(SOURCE, name + ": " + std::strerror(errno));
    }
    info.is_up = (ifr.ifr_flags & IFF_UP) != 0;
    info.is_loopback = (ifr.ifr_flags & IFF_LOOPBACK) != 0;

    return info;
}

std::vector<std::string> InterfaceHardwareAddressSource::list_interfaces() {
    ifaddrs* raw_list = nullptr;
    if (getifaddrs(&raw_list) != 0) {
        THROW_ACQUISITION_ERROR(SOURCE, std::string("cannot list interfaces: ") + std::strerror(errno));
    }
    std::unique_ptr<ifaddrs, ifaddrs_deleter> list(raw_list);

    // getifaddrs yields one entry per address family; keep first-seen order.
    std::vector<std::string> names;
    std::set<std::string> seen;
    for (ifaddrs* entry = list.get(); entry != nullptr; entry = entry->ifa_next) {
        if (entry->ifa_name != nullptr && seen.insert(entry->ifa_name).second) {
            names.emplace_back(entry->ifa_name);
        }
    }
    return names;
}

std::string InterfaceHardwareAddressSource::acquire_address() {
    auto info = query_interface(interface_name_);
    LOG_INFO("hardware_address", "interface address read",
             {{"interface", info.name}, {"address", info.hardware_address}});
    return info.hardware_address;
}

bool AutoDetectHardwareAddressSource::is_candidate(const InterfaceInfo& info) {
    return info.is_up && !info.is_loopback &&
           info.hardware_address.find_first_not_of('0') != std::string::npos;
}

std::string AutoDetectHardwareAddressSource::acquire_address() {
    for (const auto& name : InterfaceHardwareAddressSource::list_interfaces()) {
        try {
            auto info = InterfaceHardwareAddressSource::query_interface(name);
            if (is_candidate(info)) {
                LOG_INFO("hardware_address", "interface selected",
                         {{"interface", info.name}, {"address", info.hardware_address}});
                return info.hardware_address;
            }
            LOG_DEBUG("hardware_address", "interface skipped", {{"interface", name}});
        } catch (const AcquisitionException& e) {
            LOG_DEBUG("hardware_address", "interface skipped", {{"interface", name}, {"error", e.what()}});
        }
    }

    THROW_ACQUISITION_ERROR(SOURCE, "no active interface with a hardware address found");
}

}
