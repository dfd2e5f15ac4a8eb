#pragma once

#include <cstddef>
#include <span>
#include <string>

namespace mintgate::encode {

// Renders continuation keys as 0x-prefixed lowercase hex
std::string to_hex( std::span< const std::byte > s ) noexcept;

} // namespace mintgate::encode
