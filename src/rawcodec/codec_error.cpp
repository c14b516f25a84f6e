#include <rawcodec/codec_error.hpp>

#include <utility>

#include <fmt/format.h>

namespace rawcodec
{

auto
to_string(errc const code) noexcept -> std::string_view
{
  switch (code)
  {
  case errc::unsupported_platform: return "unsupported platform";
  case errc::missing_resource: return "missing resource";
  case errc::invalid_geometry: return "invalid geometry";
  case errc::missing_identifier: return "missing identifier";
  case errc::invalid_buffer_length: return "invalid buffer length";
  case errc::encoding_failed: return "encoding failed";
  case errc::buffer_too_small: return "buffer too small";
  }

  return "unknown error";
}

codec_error::codec_error(errc const code,
                         std::string const& message,
                         std::exception_ptr cause)
  : std::runtime_error{ fmt::format("{}: {}", to_string(code), message) }
  , code_{ code }
  , cause_{ std::move(cause) }
{
}

} // namespace rawcodec
