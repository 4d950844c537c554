#pragma once

#include "types.h"
#include "interfaces.h"
#include <memory>
#include <vector>

namespace ulagen::domain {

// Global ID per RFC 4193 section 3.2.2: the least significant 40 bits of
// SHA-1(timestamp || EUI-64), computed over the decoded bytes.
class GlobalIdGenerator {
public:
    explicit GlobalIdGenerator(std::shared_ptr<const IHashFunction> sha1);

    GlobalId derive(const NtpTimestamp& timestamp, const Eui64& eui64) const;

    // The 16 bytes that get hashed.
    static std::vector<uint8_t> hash_input(const NtpTimestamp& timestamp, const Eui64& eui64);

private:
    std::shared_ptr<const IHashFunction> sha1_;
};

}
