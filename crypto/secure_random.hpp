#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace formsauth {

// CSPRNG output from OpenSSL; safe to call from any thread.
std::vector<std::uint8_t> random_bytes(std::size_t len);

// Compares every byte regardless of where the first difference is.
// Inputs of different length compare unequal.
bool constant_time_equal(const std::vector<std::uint8_t> &a,
                         const std::vector<std::uint8_t> &b);

} // namespace formsauth
