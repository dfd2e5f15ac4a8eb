#pragma once

#include <string_view>

#include <mintgate/program/error.hpp>
#include <mintgate/program/system_interface.hpp>
#include <mintgate/protocol/contract.hpp>

namespace mintgate::program {

std::error_code set_contract_info( system_interface* system, std::string_view name, std::string_view version );
result< protocol::contract_info > get_contract_info( system_interface* system );

} // namespace mintgate::program
