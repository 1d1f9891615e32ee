#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace formsauth {

// Lowercase, two digits per byte.
std::string to_hex(const std::vector<std::uint8_t> &data);

// Accepts either case. Throws std::invalid_argument on odd length or a
// character outside [0-9a-fA-F].
std::vector<std::uint8_t> from_hex(const std::string &hex);

} // namespace formsauth
