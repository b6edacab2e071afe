#pragma once

#include <emissio/log/formatter.hpp>
#include <emissio/log/frontend.hpp>
#include <emissio/log/log.hpp>
