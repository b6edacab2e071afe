#pragma once

#include <string_view>

#include <quill/LogMacros.h>

#include <emissio/log/formatter.hpp>
#include <emissio/log/frontend.hpp>

namespace emissio::log {

void initialize() noexcept;
logger* instance() noexcept;

// Accepts quill level names such as "debug" or "warning" and throws on anything else
void set_level( std::string_view level );

} // namespace emissio::log
