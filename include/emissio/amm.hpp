#pragma once

#include <emissio/amm/error.hpp>
#include <emissio/amm/pool.hpp>
