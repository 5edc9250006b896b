#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace presence {

std::string trim(std::string_view s);
std::string to_upper(std::string_view s);

/**
 * @brief normalize_mac Converts a MAC address to uppercase colon-delimited form
 * Accepts six hex octets separated by ':' or '-', in any case.
 * @return Canonical "AA:BB:CC:DD:EE:FF" form, or nullopt if s is not a MAC address
 */
std::optional<std::string> normalize_mac(std::string_view s);

/**
 * @brief normalize_identifier Canonical key for a mapping file identifier
 * MAC addresses get their canonical form, anything else (e.g. an advertised
 * device name) is trimmed and uppercased.
 */
std::string normalize_identifier(std::string_view s);

}  // namespace presence
