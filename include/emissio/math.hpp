#pragma once

#include <emissio/math/error.hpp>
#include <emissio/math/fixed_point.hpp>
