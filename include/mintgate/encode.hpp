#pragma once

#include <mintgate/encode/archive.hpp>
#include <mintgate/encode/error.hpp>
#include <mintgate/encode/hex.hpp>
