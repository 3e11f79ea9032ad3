#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace ble {

using address_bytes = std::array<uint8_t, 6>;

/**
 * @brief parse_address Parses "aa:bb:cc:dd:ee:ff", "AA-BB-..." or "aabbccddeeff"
 * @return nullopt if s is not a 48 bit address
 */
std::optional<address_bytes> parse_address(std::string_view s);

// Uppercase, colon separated
std::string to_string(address_bytes const& a);

/**
 * @brief canonical_address Canonical colon-hex form of s, nullopt if s doesn't parse
 */
std::optional<std::string> canonical_address(std::string_view s);

}  // namespace ble
