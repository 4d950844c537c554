#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace ulagen::domain {

// Characters removed before validation: the separators MAC and NTP values
// are usually written with, plus line endings left over from input.
constexpr const char* DEFAULT_HEX_DELIMITERS = ":-.\n\r";

class HexValidator {
public:
    HexValidator() : delimiters_(DEFAULT_HEX_DELIMITERS) {}
    explicit HexValidator(std::string delimiters) : delimiters_(std::move(delimiters)) {}

    // Returns the lowercase, delimiter-free form of input.
    // Throws ValidationException naming the offending characters or the length mismatch.
    std::string validate(const std::string& input, size_t expected_length,
                         const std::string& field_name) const;

    std::string strip_delimiters(const std::string& input) const;

    const std::string& delimiters() const { return delimiters_; }

private:
    std::string delimiters_;
};

std::string validate_hex(const std::string& input, size_t expected_length,
                         const std::string& field_name);

bool is_hex_digit(char c);

// Two hex digits per byte; the input must have even length and hex digits only.
std::vector<uint8_t> decode_hex(const std::string& hex);
std::string encode_hex(const uint8_t* data, size_t length);
std::string encode_hex(const std::vector<uint8_t>& bytes);

std::string to_upper_hex(const std::string& hex);

}
