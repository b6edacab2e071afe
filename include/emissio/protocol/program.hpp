#pragma once

#include <string>
#include <vector>

namespace emissio::protocol {

struct program_input
{
  std::vector< std::string > arguments;
  std::vector< std::byte > stdin;
};

struct program_output
{
  std::vector< std::byte > stdout;
  std::vector< std::byte > stderr;
};

} // namespace emissio::protocol
