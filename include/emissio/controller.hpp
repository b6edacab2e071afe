#pragma once

#include <emissio/controller/bank.hpp>
#include <emissio/controller/controller.hpp>
#include <emissio/controller/error.hpp>
#include <emissio/controller/execution_context.hpp>
#include <emissio/controller/state.hpp>
