#include <emissio/program/error.hpp>

#include <string>
#include <utility>

namespace emissio::program {

struct _program_category final: std::error_category
{
  const char* name() const noexcept final
  {
    return "program";
  }

  std::string message( int condition ) const final
  {
    using namespace std::string_literals;
    switch( static_cast< program_errc >( condition ) )
    {
      case program_errc::ok:
        return "ok"s;
      case program_errc::invalid_instruction:
        return "invalid instruction"s;
      case program_errc::unexpected_object:
        return "unexpected object"s;
      case program_errc::bad_file_descriptor:
        return "bad file descriptor"s;
      case program_errc::insufficient_funds:
        return "insufficient funds"s;
    }
    std::unreachable();
  }
};

const std::error_category& program_category() noexcept
{
  static _program_category category;
  return category;
}

std::error_code make_error_code( program_errc e )
{
  return std::error_code( static_cast< int >( e ), program_category() );
}

} // namespace emissio::program
