#pragma once

#include <cstddef>
#include <istream>
#include <span>
#include <string_view>
#include <vector>

#include <rawcodec/codec_options.hpp>

namespace rawcodec
{

// Block codec over fixed-geometry 16-bit planes.
//
// Inputs are borrowed and never modified; every call returns a newly
// allocated buffer. Identical input bytes and options give identical output.
class codec
{
public:
  virtual ~codec() = default;

  [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;

  // Whether options passed to this codec need a non-empty identifier
  [[nodiscard]] virtual auto requires_identifier() const noexcept -> bool = 0;

  [[nodiscard]] virtual auto compress(std::span<std::byte const> data,
                                      codec_options const& options)
    -> std::vector<std::byte> = 0;

  [[nodiscard]] virtual auto decompress(std::span<std::byte const> data,
                                        codec_options const& options)
    -> std::vector<std::byte> = 0;

  // Reads everything left in the stream, then decompresses it
  [[nodiscard]] auto decompress(std::istream& in, codec_options const& options)
    -> std::vector<std::byte>;

protected:
  codec() = default;
  codec(codec const&) = default;
  codec(codec&&) = default;
  auto operator=(codec const&) -> codec& = default;
  auto operator=(codec&&) -> codec& = default;
};

} // namespace rawcodec
