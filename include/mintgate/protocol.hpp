#pragma once

#include <mintgate/protocol/asset_ft.hpp>
#include <mintgate/protocol/contract.hpp>
#include <mintgate/protocol/pagination.hpp>
#include <mintgate/protocol/types.hpp>
