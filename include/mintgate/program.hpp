#pragma once

#include <mintgate/program/authorization_gate.hpp>
#include <mintgate/program/contract_info.hpp>
#include <mintgate/program/error.hpp>
#include <mintgate/program/identity_store.hpp>
#include <mintgate/program/pagination.hpp>
#include <mintgate/program/program.hpp>
#include <mintgate/program/state.hpp>
#include <mintgate/program/system_interface.hpp>
#include <mintgate/program/token_controller.hpp>
