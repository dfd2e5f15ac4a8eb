#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <mintgate/log/formatter.hpp>
#include <mintgate/log/frontend.hpp>

namespace mintgate::log {

void initialize() noexcept;
logger* instance() noexcept;

bool set_level( std::string_view level ) noexcept;

} // namespace mintgate::log
