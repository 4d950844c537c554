#pragma once

#include <string>
#include <array>
#include <cstdint>
#include <ostream>

namespace ulagen::domain {

constexpr size_t MAC_HEX_LENGTH = 12;
constexpr size_t OUI_HEX_LENGTH = 6;
constexpr size_t NTP_TIMESTAMP_HEX_LENGTH = 16;
constexpr size_t EUI64_HEX_LENGTH = 16;
constexpr size_t GLOBAL_ID_HEX_LENGTH = 10;

// RFC 4193 prefix fc00::/7 with the L bit set.
constexpr const char* ULA_PREFIX_BYTE = "fd";

enum class UlaRenderStyle {
    FIXED_WIDTH,
    COMPRESSED
};

// 48-bit hardware address held as 12 lowercase hex digits.
class MacAddress {
public:
    static MacAddress parse(const std::string& raw);

    const std::string& hex() const { return hex_; }

    // Uppercase, matching the registry's key convention.
    std::string oui() const;
    std::string nic() const;

    bool is_group() const;
    bool is_locally_administered() const;

    // NIC parts people type when they do not know their real address.
    bool has_placeholder_nic() const;

    std::string to_colon_string() const;
    std::array<uint8_t, 6> bytes() const;

    bool operator==(const MacAddress& other) const { return hex_ == other.hex_; }
    bool operator!=(const MacAddress& other) const { return hex_ != other.hex_; }

private:
    explicit MacAddress(std::string canonical_hex) : hex_(std::move(canonical_hex)) {}

    std::string hex_;
};

// 64-bit NTP timestamp: 32-bit seconds since 1900 and a 32-bit fraction.
class NtpTimestamp {
public:
    static NtpTimestamp parse(const std::string& raw);
    static NtpTimestamp from_parts(uint32_t seconds, uint32_t fraction);

    const std::string& hex() const { return hex_; }

    uint32_t seconds() const;
    uint32_t fraction() const;

    // "dcf4268b.208dd000", the form ntpq prints.
    std::string to_dotted_string() const;

    bool operator==(const NtpTimestamp& other) const { return hex_ == other.hex_; }
    bool operator!=(const NtpTimestamp& other) const { return hex_ != other.hex_; }

private:
    explicit NtpTimestamp(std::string canonical_hex) : hex_(std::move(canonical_hex)) {}

    std::string hex_;
};

class Eui64 {
public:
    explicit Eui64(std::string canonical_hex);

    const std::string& hex() const { return hex_; }

    bool operator==(const Eui64& other) const { return hex_ == other.hex_; }
    bool operator!=(const Eui64& other) const { return hex_ != other.hex_; }

private:
    std::string hex_;
};

// Low 40 bits of the SHA-1 digest.
class GlobalId {
public:
    explicit GlobalId(std::string canonical_hex);

    const std::string& hex() const { return hex_; }

    bool operator==(const GlobalId& other) const { return hex_ == other.hex_; }
    bool operator!=(const GlobalId& other) const { return hex_ != other.hex_; }

private:
    std::string hex_;
};

struct GenerationResult {
    MacAddress mac;
    std::string vendor;
    NtpTimestamp timestamp;
    Eui64 eui64;
    GlobalId global_id;
    std::string ula_prefix;
    UlaRenderStyle style;
};

std::string render_style_to_string(UlaRenderStyle style);
bool parse_render_style(const std::string& text, UlaRenderStyle& style);

inline std::ostream& operator<<(std::ostream& os, const MacAddress& mac) {
    return os << mac.hex();
}

inline std::ostream& operator<<(std::ostream& os, const NtpTimestamp& timestamp) {
    return os << timestamp.hex();
}

inline std::ostream& operator<<(std::ostream& os, const Eui64& eui64) {
    return os << eui64.hex();
}

inline std::ostream& operator<<(std::ostream& os, const GlobalId& global_id) {
    return os << global_id.hex();
}

}
