#include <rawcodec/jetraw_codec.hpp>

#include <utility>

#include <fmt/format.h>

#include <rawcodec/codec_error.hpp>
#include <rawcodec/log.hpp>
#include <rawcodec/sample_buffer.hpp>

namespace rawcodec
{

jetraw_codec::jetraw_codec()
  : jetraw_codec{ native::shared_resource(default_config()) }
{
}

jetraw_codec::jetraw_codec(native::native_resource& resource)
  : resource_{ &resource }
{
}

auto
jetraw_codec::default_config() -> native::resource_config
{
  return native::resource_config::from_environment(
    std::string{ library_base_name });
}

auto
jetraw_codec::make_options(std::uint32_t const width,
                           std::uint32_t const height,
                           bool const little_endian,
                           std::string identifier) -> codec_options
{
  return codec_options{
    width,
    height,
    little_endian,
    std::move(identifier),
    identifier_requirement::required,
  };
}

auto
jetraw_codec::name() const noexcept -> std::string_view
{
  return "jetraw";
}

auto
jetraw_codec::requires_identifier() const noexcept -> bool
{
  return true;
}

auto
jetraw_codec::compress(std::span<std::byte const> const data,
                       codec_options const& options) -> std::vector<std::byte>
{
  if (data.size() != options.sample_bytes())
  {
    throw codec_error{
      errc::invalid_buffer_length,
      fmt::format("{} bytes given for a {}x{} plane of 16-bit samples",
                  data.size(),
                  options.width(),
                  options.height()),
    };
  }

  if (options.identifier().empty())
  {
    throw codec_error{
      errc::missing_identifier,
      "jetraw compression requires a calibration identifier",
    };
  }

  auto& backend = resource_->acquire();

  // Preparation works in place, so it gets its own copy of the samples
  auto samples = bytes_to_samples(data, options.byte_order());

  log::debug("preparation using identifier: {}", options.identifier());
  backend.prepare(samples, options.identifier(), error_bound);

  auto encoded =
    std::vector<std::byte>(backend.encoded_capacity(options.pixel_count()));
  auto const length =
    backend.encode(samples, options.width(), options.height(), encoded);

  encoded.resize(length);

  return encoded;
}

auto
jetraw_codec::decompress(std::span<std::byte const> const data,
                         codec_options const& options)
  -> std::vector<std::byte>
{
  auto& backend = resource_->acquire();

  auto samples = std::vector<std::uint16_t>(options.pixel_count());

  log::debug("performing decoding of {} bytes", data.size());
  backend.decode(data, samples);

  return samples_to_bytes(samples, options.byte_order());
}

} // namespace rawcodec
