#pragma once

#include <emissio/protocol/account.hpp>
#include <emissio/protocol/program.hpp>
