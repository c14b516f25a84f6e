#pragma once

#include <cstdint>
#include <string_view>

namespace rawcodec::native
{

// Entry points a native codec library exports with C linkage. The signatures
// are pinned; changing any of them breaks every distributed library.

using init_fn = std::int32_t (*)();

using prepare_fn = std::int32_t (*)(std::uint16_t* samples,
                                    std::int64_t sample_count,
                                    char const* identifier,
                                    float error_bound);

// Returns the encoded length or a negative status
using encode_fn = std::int32_t (*)(std::uint16_t const* samples,
                                   std::int32_t width,
                                   std::int32_t height,
                                   std::uint8_t* out,
                                   std::int32_t out_capacity);

// Fills exactly out_size samples
using decode_fn = void (*)(std::uint8_t const* encoded,
                           std::int32_t encoded_size,
                           std::uint16_t* out,
                           std::int32_t out_size);

inline constexpr auto init_symbol = std::string_view{ "dpcore_init" };
inline constexpr auto prepare_symbol = std::string_view{ "dpcore_prepare" };
inline constexpr auto encode_symbol = std::string_view{ "dpcore_encode" };
inline constexpr auto decode_symbol = std::string_view{ "dpcore_decode" };

struct native_api
{
  init_fn init = nullptr;
  prepare_fn prepare = nullptr;
  encode_fn encode = nullptr;
  decode_fn decode = nullptr;

  [[nodiscard]] auto complete() const noexcept -> bool
  {
    return init and prepare and encode and decode;
  }
};

} // namespace rawcodec::native
