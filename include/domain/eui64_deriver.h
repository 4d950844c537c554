#pragma once

#include "types.h"
#include <array>
#include <optional>

namespace ulagen::domain {

// Modified EUI-64 construction from RFC 4291 appendix A: invert the
// universal/local bit and insert 0xfffe between the OUI and the NIC part.
class Eui64Deriver {
public:
    // Throws GroupAddressException when the group bit is set.
    Eui64 derive(const MacAddress& mac) const;

    // Maps an even nibble to its u/l-flipped partner; empty for odd nibbles.
    static std::optional<char> flip_universal_local(char nibble);

private:
    struct NibbleFlip {
        char from;
        char to;
    };

    static const std::array<NibbleFlip, 8> FLIP_TABLE;
};

Eui64 derive_eui64(const MacAddress& mac);

}
