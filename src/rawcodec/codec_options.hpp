#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace rawcodec
{

enum class identifier_requirement
{
  optional,
  required,
};

// Geometry, byte order and calibration identifier for one codec call.
// Validated on construction and immutable afterwards.
class codec_options
{
public:
  codec_options(std::uint32_t width,
                std::uint32_t height,
                bool little_endian,
                std::string identifier = {},
                identifier_requirement requirement =
                  identifier_requirement::optional);

  [[nodiscard]] auto width() const noexcept -> std::uint32_t { return width_; }

  [[nodiscard]] auto height() const noexcept -> std::uint32_t
  {
    return height_;
  }

  [[nodiscard]] auto little_endian() const noexcept -> bool
  {
    return little_endian_;
  }

  [[nodiscard]] auto byte_order() const noexcept -> std::endian
  {
    return little_endian_ ? std::endian::little : std::endian::big;
  }

  [[nodiscard]] auto identifier() const noexcept -> std::string_view
  {
    return identifier_;
  }

  [[nodiscard]] auto pixel_count() const noexcept -> std::size_t
  {
    return static_cast<std::size_t>(width_) * height_;
  }

  // Size of the uncompressed plane, two bytes per sample
  [[nodiscard]] auto sample_bytes() const noexcept -> std::size_t
  {
    return pixel_count() * 2u;
  }

private:
  std::uint32_t width_;
  std::uint32_t height_;
  bool little_endian_;
  std::string identifier_;
};

} // namespace rawcodec
