#include "domain/types.h"
#include "domain/hex_validator.h"
#include "infrastructure/error_handler.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace ulagen::domain {

using infrastructure::InternalInvariantException;

namespace {

uint8_t nibble_value(char c) {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    throw InternalInvariantException(std::string("not a hex digit: '") + c + "'");
}

void require_canonical(const std::string& hex, size_t length, const char* what) {
    if (hex.size() != length) {
        throw InternalInvariantException(std::string(what) + " must be " + std::to_string(length) +
                                         " hex digits, got \"" + hex + "\"");
    }
    for (char c : hex) {
        if (!is_hex_digit(c) || (c >= 'A' && c <= 'F')) {
            throw InternalInvariantException(std::string(what) + " is not canonical lowercase hex: \"" + hex + "\"");
        }
    }
}

}

MacAddress MacAddress::parse(const std::string& raw) {
    return MacAddress(validate_hex(raw, MAC_HEX_LENGTH, "MAC address"));
}

std::string MacAddress::oui() const {
    return to_upper_hex(hex_.substr(0, OUI_HEX_LENGTH));
}

std::string MacAddress::nic() const {
    return hex_.substr(OUI_HEX_LENGTH);
}

bool MacAddress::is_group() const {
    return (nibble_value(hex_[1]) & 0x1) != 0;
}

bool MacAddress::is_locally_administered() const {
    return (nibble_value(hex_[1]) & 0x2) != 0;
}

bool MacAddress::has_placeholder_nic() const {
    static const std::array<const char*, 5> placeholders = {"010203", "000000", "000001", "000102", "123456"};
    std::string nic_part = nic();
    return std::any_of(placeholders.begin(), placeholders.end(),
                       [&nic_part](const char* placeholder) { return nic_part == placeholder; });
}

std::string MacAddress::to_colon_string() const {
    std::string text;
    for (size_t i = 0; i < hex_.size(); i += 2) {
        if (i > 0) text += ':';
        text += hex_.substr(i, 2);
    }
    return text;
}

std::array<uint8_t, 6> MacAddress::bytes() const {
    std::array<uint8_t, 6> result{};
    auto decoded = decode_hex(hex_);
    std::copy(decoded.begin(), decoded.end(), result.begin());
    return result;
}

NtpTimestamp NtpTimestamp::parse(const std::string& raw) {
    return NtpTimestamp(validate_hex(raw, NTP_TIMESTAMP_HEX_LENGTH, "NTP timestamp"));
}

NtpTimestamp NtpTimestamp::from_parts(uint32_t seconds, uint32_t fraction) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(8) << seconds << std::setw(8) << fraction;
    return NtpTimestamp(oss.str());
}

uint32_t NtpTimestamp::seconds() const {
    return static_cast<uint32_t>(std::stoul(hex_.substr(0, 8), nullptr, 16));
}

uint32_t NtpTimestamp::fraction() const {
    return static_cast<uint32_t>(std::stoul(hex_.substr(8, 8), nullptr, 16));
}

std::string NtpTimestamp::to_dotted_string() const {
    return hex_.substr(0, 8) + "." + hex_.substr(8, 8);
}

Eui64::Eui64(std::string canonical_hex) : hex_(std::move(canonical_hex)) {
    require_canonical(hex_, EUI64_HEX_LENGTH, "EUI-64");
}

GlobalId::GlobalId(std::string canonical_hex) : hex_(std::move(canonical_hex)) {
    require_canonical(hex_, GLOBAL_ID_HEX_LENGTH, "global ID");
}

std::string render_style_to_string(UlaRenderStyle style) {
    switch (style) {
        case UlaRenderStyle::FIXED_WIDTH: return "fixed";
        case UlaRenderStyle::COMPRESSED: return "compressed";
        default: return "unknown";
    }
}

bool parse_render_style(const std::string& text, UlaRenderStyle& style) {
    if (text == "fixed") {
        style = UlaRenderStyle::FIXED_WIDTH;
    } else if (text == "compressed") {
        style = UlaRenderStyle::COMPRESSED;
    } else {
        return false;
    }
    return true;
}

}
