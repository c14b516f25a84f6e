#include <rawcodec/sample_buffer.hpp>

#include <range/v3/view/chunk.hpp>
#include <range/v3/view/zip.hpp>

#include <fmt/format.h>

#include <rawcodec/codec_error.hpp>

namespace rawcodec
{

auto
bytes_to_samples(std::span<std::byte const> const bytes,
                 std::endian const order) -> std::vector<std::uint16_t>
{
  if (bytes.size() % 2u != 0u)
  {
    throw codec_error{
      errc::invalid_buffer_length,
      fmt::format("{} bytes do not form whole 16-bit samples", bytes.size()),
    };
  }

  auto samples = std::vector<std::uint16_t>(bytes.size() / 2u);

  for (auto const [pair, sample] :
       ranges::views::zip(bytes | ranges::views::chunk(2), samples))
  {
    auto const it = ranges::begin(pair);
    auto const first = std::to_integer<std::uint16_t>(it[0]);
    auto const second = std::to_integer<std::uint16_t>(it[1]);

    sample = order == std::endian::little
               ? static_cast<std::uint16_t>(first | (second << 8u))
               : static_cast<std::uint16_t>((first << 8u) | second);
  }

  return samples;
}

auto
bytes_to_samples(std::span<std::byte const> const bytes,
                 bool const little_endian) -> std::vector<std::uint16_t>
{
  return bytes_to_samples(bytes, to_byte_order(little_endian));
}

auto
samples_to_bytes(std::span<std::uint16_t const> const samples,
                 std::endian const order) -> std::vector<std::byte>
{
  auto bytes = std::vector<std::byte>(samples.size() * 2u);

  for (auto const [sample, pair] :
       ranges::views::zip(samples, bytes | ranges::views::chunk(2)))
  {
    auto const it = ranges::begin(pair);
    auto const low = static_cast<std::byte>(sample & 0x00FFu);
    auto const high = static_cast<std::byte>((sample & 0xFF00u) >> 8u);

    it[0] = order == std::endian::little ? low : high;
    it[1] = order == std::endian::little ? high : low;
  }

  return bytes;
}

auto
samples_to_bytes(std::span<std::uint16_t const> const samples,
                 bool const little_endian) -> std::vector<std::byte>
{
  return samples_to_bytes(samples, to_byte_order(little_endian));
}

} // namespace rawcodec
