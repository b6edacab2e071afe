#pragma once

#include <emissio/curve/distribution.hpp>
#include <emissio/curve/error.hpp>
#include <emissio/curve/graduation.hpp>
#include <emissio/curve/ledger.hpp>
#include <emissio/curve/lifecycle.hpp>
#include <emissio/curve/pricing.hpp>
#include <emissio/curve/types.hpp>
