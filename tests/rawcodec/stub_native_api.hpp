#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

#include <rawcodec/native/native_api.hpp>
#include <rawcodec/native/native_backend.hpp>

// In-process stand-ins for a native codec library. The identity encoder
// stores samples little endian, so it needs twice the sample count in bytes.
namespace rawcodec::test
{

inline auto init_calls = std::atomic<int>{ 0 };
inline auto init_status = std::atomic<std::int32_t>{ 0 };
inline auto prepare_status = std::atomic<std::int32_t>{ 0 };
inline auto reported_length = std::atomic<std::int32_t>{ -1 };
inline auto last_identifier = std::string{};
inline auto last_error_bound = 0.0f;

inline void
reset_stub()
{
  init_calls = 0;
  init_status = 0;
  prepare_status = 0;
  reported_length = -1;
  last_identifier.clear();
  last_error_bound = 0.0f;
}

inline auto
stub_init() -> std::int32_t
{
  ++init_calls;
  return init_status;
}

inline auto
stub_prepare(std::uint16_t* const,
             std::int64_t const,
             char const* const identifier,
             float const error_bound) -> std::int32_t
{
  last_identifier = identifier;
  last_error_bound = error_bound;
  return prepare_status;
}

inline auto
identity_encode(std::uint16_t const* const samples,
                std::int32_t const width,
                std::int32_t const height,
                std::uint8_t* const out,
                std::int32_t const out_capacity) -> std::int32_t
{
  auto const count = width * height;

  if (count * 2 > out_capacity)
  {
    return -1;
  }

  for (auto i = 0; i < count; ++i)
  {
    out[2 * i] = static_cast<std::uint8_t>(samples[i] & 0xFFu);
    out[2 * i + 1] = static_cast<std::uint8_t>(samples[i] >> 8u);
  }

  return count * 2;
}

// Writes a recognizable pattern and reports whatever reported_length holds
inline auto
fixed_length_encode(std::uint16_t const* const,
                    std::int32_t const,
                    std::int32_t const,
                    std::uint8_t* const out,
                    std::int32_t const out_capacity) -> std::int32_t
{
  for (auto i = 0; i < out_capacity; ++i)
  {
    out[i] = static_cast<std::uint8_t>(i);
  }

  return reported_length;
}

inline void
identity_decode(std::uint8_t const* const encoded,
                std::int32_t const encoded_size,
                std::uint16_t* const out,
                std::int32_t const out_size)
{
  for (auto i = 0; i < out_size and 2 * i + 1 < encoded_size; ++i)
  {
    out[i] = static_cast<std::uint16_t>(encoded[2 * i] |
                                        (encoded[2 * i + 1] << 8u));
  }
}

inline auto
identity_api() -> native::native_api
{
  return native::native_api{
    .init = stub_init,
    .prepare = stub_prepare,
    .encode = identity_encode,
    .decode = identity_decode,
  };
}

inline auto
fixed_length_api() -> native::native_api
{
  auto api = identity_api();
  api.encode = fixed_length_encode;
  return api;
}

inline auto
double_pixel_capacity(std::size_t const pixel_count) -> std::size_t
{
  return pixel_count * 2u;
}

} // namespace rawcodec::test
