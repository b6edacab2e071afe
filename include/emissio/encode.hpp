#pragma once

#include <emissio/encode/binary.hpp>
#include <emissio/encode/error.hpp>
#include <emissio/encode/hex.hpp>
