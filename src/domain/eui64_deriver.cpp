#include "domain/eui64_deriver.h"
#include "infrastructure/error_handler.h"
#include "infrastructure/logger.h"
#include <algorithm>

namespace ulagen::domain {

using infrastructure::GroupAddressException;
using infrastructure::InternalInvariantException;

const std::array<Eui64Deriver::NibbleFlip, 8> Eui64Deriver::FLIP_TABLE = {{
    {'0', '2'}, {'2', '0'},
    {'4', '6'}, {'6', '4'},
    {'8', 'a'}, {'a', '8'},
    {'c', 'e'}, {'e', 'c'},
}};

std::optional<char> Eui64Deriver::flip_universal_local(char nibble) {
    auto it = std::find_if(FLIP_TABLE.begin(), FLIP_TABLE.end(),
                           [nibble](const NibbleFlip& flip) { return flip.from == nibble; });
    if (it == FLIP_TABLE.end()) {
        return std::nullopt;
    }
    return it->to;
}

Eui64 Eui64Deriver::derive(const MacAddress& mac) const {
    const std::string& hex = mac.hex();

    char first = hex[0];
    char second = hex[1];
    std::string upper = hex.substr(2, 4);
    std::string lower = hex.substr(6, 6);

    if (mac.is_group()) {
        throw GroupAddressException(hex);
    }

    auto flipped = flip_universal_local(second);
    if (!flipped) {
        THROW_INTERNAL_ERROR("MAC address \"" + hex + "\" passed the group check, but the first octet (" +
                             hex.substr(0, 2) + ") has no u/l bit mapping");
    }

    Eui64 eui64(std::string(1, first) + *flipped + upper + "fffe" + lower);

    LOG_DEBUG("eui64", "derived modified EUI-64", {{"mac", hex}, {"eui64", eui64.hex()}});
    return eui64;
}

Eui64 derive_eui64(const MacAddress& mac) {
    return Eui64Deriver().derive(mac);
}

}
