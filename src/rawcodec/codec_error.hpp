#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

namespace rawcodec
{

enum class errc
{
  unsupported_platform,
  missing_resource,
  invalid_geometry,
  missing_identifier,
  invalid_buffer_length,
  encoding_failed,
  buffer_too_small,
};

[[nodiscard]] auto to_string(errc code) noexcept -> std::string_view;

class codec_error : public std::runtime_error
{
public:
  codec_error(errc code,
              std::string const& message,
              std::exception_ptr cause = nullptr);

  [[nodiscard]] auto code() const noexcept -> errc { return code_; }

  // Underlying failure for missing_resource, null otherwise
  [[nodiscard]] auto cause() const noexcept -> std::exception_ptr
  {
    return cause_;
  }

private:
  errc code_;
  std::exception_ptr cause_;
};

} // namespace rawcodec
