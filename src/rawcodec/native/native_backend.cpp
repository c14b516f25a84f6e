#include <rawcodec/native/native_backend.hpp>

#include <limits>
#include <string>
#include <utility>

#include <fmt/format.h>

#include <rawcodec/codec_error.hpp>
#include <rawcodec/log.hpp>

namespace rawcodec::native
{

namespace
{

template<typename Int>
[[nodiscard]] auto
checked_cast(std::size_t const value, std::string_view const what) -> Int
{
  if (value > static_cast<std::size_t>(std::numeric_limits<Int>::max()))
  {
    throw codec_error{
      errc::invalid_buffer_length,
      fmt::format("{} of {} exceeds the native interface limit", what, value),
    };
  }

  return static_cast<Int>(value);
}

[[nodiscard]] auto
resolve(shared_library const& library) -> native_api
{
  return native_api{
    .init = library.symbol<init_fn>(init_symbol),
    .prepare = library.symbol<prepare_fn>(prepare_symbol),
    .encode = library.symbol<encode_fn>(encode_symbol),
    .decode = library.symbol<decode_fn>(decode_symbol),
  };
}

} // namespace

auto
native_backend::half_pixel_capacity(std::size_t const pixel_count) noexcept
  -> std::size_t
{
  return pixel_count / 2u;
}

native_backend::native_backend(native_api const api,
                               bool const serialize_calls,
                               capacity_function const capacity)
  : api_{ api }
  , serialize_calls_{ serialize_calls }
  , capacity_{ capacity }
{
  if (not api_.complete())
  {
    throw codec_error{
      errc::missing_resource,
      "native library does not provide every codec entry point",
    };
  }
}

native_backend::native_backend(shared_library library,
                               bool const serialize_calls,
                               capacity_function const capacity)
  : native_backend{ resolve(library), serialize_calls, capacity }
{
  library_.emplace(std::move(library));
}

void
native_backend::init()
{
  auto const lock = this->lock();
  auto const status = api_.init();

  if (status != 0)
  {
    throw codec_error{
      errc::missing_resource,
      fmt::format("native library initialization returned {}", status),
    };
  }
}

void
native_backend::prepare(std::span<std::uint16_t> const samples,
                        std::string_view const identifier,
                        float const error_bound)
{
  auto const sample_count =
    checked_cast<std::int64_t>(samples.size(), "sample count");
  auto const c_identifier = std::string{ identifier };

  auto const lock = this->lock();
  auto const status = api_.prepare(
    samples.data(), sample_count, c_identifier.c_str(), error_bound);
  log::debug("preparation exited with status {}", status);

  if (status != 0)
  {
    throw codec_error{
      errc::encoding_failed,
      fmt::format("preparation with identifier '{}' returned {}",
                  identifier,
                  status),
    };
  }
}

auto
native_backend::encoded_capacity(std::size_t const pixel_count) const noexcept
  -> std::size_t
{
  return capacity_(pixel_count);
}

auto
native_backend::encode(std::span<std::uint16_t const> const samples,
                       std::uint32_t const width,
                       std::uint32_t const height,
                       std::span<std::byte> const out) -> std::size_t
{
  if (samples.size() != static_cast<std::size_t>(width) * height)
  {
    throw codec_error{
      errc::invalid_buffer_length,
      fmt::format("{} samples given for a {}x{} image",
                  samples.size(),
                  width,
                  height),
    };
  }

  auto const native_width = checked_cast<std::int32_t>(width, "width");
  auto const native_height = checked_cast<std::int32_t>(height, "height");
  auto const capacity = checked_cast<std::int32_t>(out.size(), "capacity");

  auto const lock = this->lock();
  auto const length =
    api_.encode(samples.data(),
                native_width,
                native_height,
                reinterpret_cast<std::uint8_t*>(out.data()),
                capacity);
  log::debug("encoding exited with image length {}", length);

  if (length < 0)
  {
    throw codec_error{
      errc::encoding_failed,
      fmt::format("encoding returned status {}", length),
    };
  }

  if (static_cast<std::size_t>(length) > out.size())
  {
    throw codec_error{
      errc::buffer_too_small,
      fmt::format("encoder reported {} bytes for a {} byte buffer",
                  length,
                  out.size()),
    };
  }

  return static_cast<std::size_t>(length);
}

void
native_backend::decode(std::span<std::byte const> const encoded,
                       std::span<std::uint16_t> const out)
{
  auto const encoded_size =
    checked_cast<std::int32_t>(encoded.size(), "encoded size");
  auto const out_size = checked_cast<std::int32_t>(out.size(), "sample count");

  auto const lock = this->lock();
  api_.decode(reinterpret_cast<std::uint8_t const*>(encoded.data()),
              encoded_size,
              out.data(),
              out_size);
}

auto
native_backend::lock() -> std::unique_lock<std::mutex>
{
  return serialize_calls_ ? std::unique_lock{ call_mutex_ }
                          : std::unique_lock<std::mutex>{};
}

} // namespace rawcodec::native
