#ifndef DCS_COMMON_TYPES_HPP
#define DCS_COMMON_TYPES_HPP

#include <array>
#include <cstdint>
#include <vector>

namespace dcs {

using Bytes = std::vector<uint8_t>;

// Fixed-width identifiers shared with the chain
using Hash32 = std::array<uint8_t, 32>;
using Address = std::array<uint8_t, 20>;

} // namespace dcs

#endif // DCS_COMMON_TYPES_HPP
