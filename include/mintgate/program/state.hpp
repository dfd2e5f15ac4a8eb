#pragma once

#include <cstdint>

namespace mintgate::program::state {

namespace space {

constexpr std::uint32_t denomination  = 0;
constexpr std::uint32_t ownership     = 1;
constexpr std::uint32_t contract_info = 2;

} // namespace space

} // namespace mintgate::program::state
