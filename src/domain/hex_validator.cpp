#include "domain/hex_validator.h"
#include "infrastructure/error_handler.h"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace ulagen::domain {

using infrastructure::ValidationException;
using infrastructure::InternalInvariantException;

bool is_hex_digit(char c) {
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

std::string HexValidator::strip_delimiters(const std::string& input) const {
    std::string stripped;
    stripped.reserve(input.size());
    for (char c : input) {
        if (delimiters_.find(c) == std::string::npos) {
            stripped.push_back(c);
        }
    }
    return stripped;
}

std::string HexValidator::validate(const std::string& input, size_t expected_length,
                                   const std::string& field_name) const {
    std::string stripped = strip_delimiters(input);

    std::string offending;
    for (char c : stripped) {
        if (!is_hex_digit(c) && offending.find(c) == std::string::npos) {
            offending.push_back(c);
        }
    }

    if (!offending.empty()) {
        throw ValidationException(
            field_name + " \"" + input + "\" contains non-hex characters: \"" + offending + "\"",
            field_name, offending, expected_length, stripped.size());
    }

    if (stripped.size() != expected_length) {
        throw ValidationException(
            field_name + " \"" + input + "\" is invalid: expected " + std::to_string(expected_length) +
            " hex digits, got " + std::to_string(stripped.size()),
            field_name, "", expected_length, stripped.size());
    }

    std::transform(stripped.begin(), stripped.end(), stripped.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return stripped;
}

std::string validate_hex(const std::string& input, size_t expected_length,
                         const std::string& field_name) {
    static const HexValidator validator;
    return validator.validate(input, expected_length, field_name);
}

std::vector<uint8_t> decode_hex(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        throw InternalInvariantException("hex string of odd length " + std::to_string(hex.size()) +
                                         " cannot be decoded to bytes");
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);

    for (size_t i = 0; i < hex.size(); i += 2) {
        if (!is_hex_digit(hex[i]) || !is_hex_digit(hex[i + 1])) {
            throw InternalInvariantException("non-hex digit in \"" + hex + "\" at offset " + std::to_string(i));
        }
        bytes.push_back(static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
    }

    return bytes;
}

std::string encode_hex(const uint8_t* data, size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string encode_hex(const std::vector<uint8_t>& bytes) {
    return encode_hex(bytes.data(), bytes.size());
}

std::string to_upper_hex(const std::string& hex) {
    std::string upper = hex;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

}
