#pragma once

#include <mintgate/host/asset_ft_ledger.hpp>
#include <mintgate/host/error.hpp>
#include <mintgate/host/memory_host.hpp>
