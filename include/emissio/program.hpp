#pragma once

#include <emissio/program/bonding_curve.hpp>
#include <emissio/program/error.hpp>
#include <emissio/program/instruction.hpp>
#include <emissio/program/program.hpp>
#include <emissio/program/system_interface.hpp>
