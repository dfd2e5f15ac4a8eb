#pragma once

#include <mintgate/config/options.hpp>
