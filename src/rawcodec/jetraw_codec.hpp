#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <rawcodec/codec.hpp>
#include <rawcodec/codec_options.hpp>
#include <rawcodec/native/native_resource.hpp>
#include <rawcodec/native/resource_config.hpp>

namespace rawcodec
{

// Codec backed by the Jetraw native library.
//
// The library is loaded on the first compress or decompress call made
// through any instance sharing the same native_resource. Compression needs a
// calibration identifier in the options; decompression does not.
class jetraw_codec final : public codec
{
public:
  static constexpr auto library_base_name =
    std::string_view{ "jetraw_bioformats_plugin" };

  static constexpr auto error_bound = 1.0f;

  // Shares the process-wide resource built from default_config()
  jetraw_codec();

  explicit jetraw_codec(native::native_resource& resource);

  // resource_config for the Jetraw library, asset directory taken from the
  // environment
  [[nodiscard]] static auto default_config() -> native::resource_config;

  // Options with the identifier declared required
  [[nodiscard]] static auto make_options(std::uint32_t width,
                                         std::uint32_t height,
                                         bool little_endian,
                                         std::string identifier)
    -> codec_options;

  [[nodiscard]] auto name() const noexcept -> std::string_view override;

  [[nodiscard]] auto requires_identifier() const noexcept -> bool override;

  [[nodiscard]] auto compress(std::span<std::byte const> data,
                              codec_options const& options)
    -> std::vector<std::byte> override;

  using codec::decompress;

  [[nodiscard]] auto decompress(std::span<std::byte const> data,
                                codec_options const& options)
    -> std::vector<std::byte> override;

private:
  native::native_resource* resource_;
};

} // namespace rawcodec
