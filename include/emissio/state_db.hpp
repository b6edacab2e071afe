#pragma once

#include <emissio/state_db/state_delta.hpp>
#include <emissio/state_db/types.hpp>
