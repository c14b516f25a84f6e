#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace rawcodec
{

// Reinterprets an even number of bytes as unsigned 16-bit samples.
// Throws codec_error{errc::invalid_buffer_length} for an odd byte count.
[[nodiscard]] auto bytes_to_samples(std::span<std::byte const> bytes,
                                    std::endian order)
  -> std::vector<std::uint16_t>;

[[nodiscard]] auto bytes_to_samples(std::span<std::byte const> bytes,
                                    bool little_endian)
  -> std::vector<std::uint16_t>;

// Inverse of bytes_to_samples, two bytes per sample
[[nodiscard]] auto samples_to_bytes(std::span<std::uint16_t const> samples,
                                    std::endian order)
  -> std::vector<std::byte>;

[[nodiscard]] auto samples_to_bytes(std::span<std::uint16_t const> samples,
                                    bool little_endian)
  -> std::vector<std::byte>;

[[nodiscard]] constexpr auto
to_byte_order(bool const little_endian) noexcept -> std::endian
{
  return little_endian ? std::endian::little : std::endian::big;
}

} // namespace rawcodec
