#include <rawcodec/codec_options.hpp>

#include <utility>

#include <fmt/format.h>

#include <rawcodec/codec_error.hpp>

namespace rawcodec
{

codec_options::codec_options(std::uint32_t const width,
                             std::uint32_t const height,
                             bool const little_endian,
                             std::string identifier,
                             identifier_requirement const requirement)
  : width_{ width }
  , height_{ height }
  , little_endian_{ little_endian }
  , identifier_{ std::move(identifier) }
{
  if (width_ == 0u or height_ == 0u)
  {
    throw codec_error{
      errc::invalid_geometry,
      fmt::format("image of {}x{} pixels has no samples", width_, height_),
    };
  }

  if (requirement == identifier_requirement::required and identifier_.empty())
  {
    throw codec_error{
      errc::missing_identifier,
      "codec requires a calibration identifier",
    };
  }
}

} // namespace rawcodec
