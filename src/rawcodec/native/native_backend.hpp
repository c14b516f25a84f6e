#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>

#include <rawcodec/native/native_api.hpp>
#include <rawcodec/native/shared_library.hpp>

namespace rawcodec::native
{

// The only code that calls into a native codec library.
//
// Checks every buffer against the ABI's integer widths before the call and
// turns native status codes into codec_errors. With serialize_calls set, the
// four operations are mutually exclusive across threads.
class native_backend
{
public:
  // Output buffer size the encoder is given for a plane of pixel_count samples
  using capacity_function = std::size_t (*)(std::size_t pixel_count);

  [[nodiscard]] static auto
  half_pixel_capacity(std::size_t pixel_count) noexcept -> std::size_t;

  // Throws codec_error{errc::missing_resource} for an incomplete api
  explicit native_backend(native_api api,
                          bool serialize_calls = true,
                          capacity_function capacity = half_pixel_capacity);

  // Resolves the entry points from the library and keeps it loaded
  explicit native_backend(shared_library library,
                          bool serialize_calls = true,
                          capacity_function capacity = half_pixel_capacity);

  native_backend(native_backend const&) = delete;
  auto operator=(native_backend const&) -> native_backend& = delete;

  // Non-zero status: codec_error{errc::missing_resource}
  void init();

  // Non-zero status: codec_error{errc::encoding_failed}
  void prepare(std::span<std::uint16_t> samples,
               std::string_view identifier,
               float error_bound);

  [[nodiscard]] auto encoded_capacity(std::size_t pixel_count) const noexcept
    -> std::size_t;

  // Returns the encoded length; negative status is encoding_failed and a
  // length past out.size() is buffer_too_small
  [[nodiscard]] auto encode(std::span<std::uint16_t const> samples,
                            std::uint32_t width,
                            std::uint32_t height,
                            std::span<std::byte> out) -> std::size_t;

  void decode(std::span<std::byte const> encoded,
              std::span<std::uint16_t> out);

private:
  [[nodiscard]] auto lock() -> std::unique_lock<std::mutex>;

  std::optional<shared_library> library_;
  native_api api_;
  bool serialize_calls_;
  capacity_function capacity_;
  std::mutex call_mutex_;
};

} // namespace rawcodec::native
