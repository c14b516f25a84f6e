#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <random>
#include <vector>

#include <catch2/catch.hpp>

#include <rawcodec/codec_error.hpp>
#include <rawcodec/sample_buffer.hpp>

#include "testing_utilities.hpp"

namespace
{

auto
make_bytes(std::initializer_list<unsigned> const values)
  -> std::vector<std::byte>
{
  auto bytes = std::vector<std::byte>{};

  for (auto const value : values)
  {
    bytes.push_back(static_cast<std::byte>(value));
  }

  return bytes;
}

} // namespace

TEST_CASE("Byte order decides how two bytes form a sample")
{
  auto const bytes = make_bytes({ 0x01, 0x02 });

  SECTION("little endian")
  {
    auto const samples = rawcodec::bytes_to_samples(bytes, true);

    REQUIRE(samples == std::vector<std::uint16_t>{ 0x0201 });
  }

  SECTION("big endian")
  {
    auto const samples = rawcodec::bytes_to_samples(bytes, false);

    REQUIRE(samples == std::vector<std::uint16_t>{ 0x0102 });
  }
}

TEST_CASE("Samples are written low byte first only in little endian")
{
  auto const samples = std::vector<std::uint16_t>{ 0xABCD, 0x0001, 0xFF00 };

  CHECK(rawcodec::samples_to_bytes(samples, std::endian::little) ==
        make_bytes({ 0xCD, 0xAB, 0x01, 0x00, 0x00, 0xFF }));
  CHECK(rawcodec::samples_to_bytes(samples, std::endian::big) ==
        make_bytes({ 0xAB, 0xCD, 0x00, 0x01, 0xFF, 0x00 }));
}

TEST_CASE("Odd byte counts are rejected")
{
  auto const bytes = make_bytes({ 0x01, 0x02, 0x03 });

  REQUIRE_THROWS_MATCHES(
    rawcodec::bytes_to_samples(bytes, true),
    rawcodec::codec_error,
    rawcodec::test::has_code(rawcodec::errc::invalid_buffer_length));
}

TEST_CASE("Empty buffers convert to empty buffers")
{
  CHECK(rawcodec::bytes_to_samples({}, true).empty());
  CHECK(rawcodec::samples_to_bytes({}, false).empty());
}

TEST_CASE("Converting bytes to samples and back restores the bytes")
{
  auto const little_endian = GENERATE(true, false);
  auto const length =
    GENERATE(std::size_t{ 2 }, std::size_t{ 64 }, std::size_t{ 4096 });

  auto engine = std::mt19937{ static_cast<unsigned>(length) };
  auto distribution = std::uniform_int_distribution<unsigned>{ 0u, 255u };

  auto bytes = std::vector<std::byte>(length);
  for (auto& byte : bytes)
  {
    byte = static_cast<std::byte>(distribution(engine));
  }

  auto const samples = rawcodec::bytes_to_samples(bytes, little_endian);

  REQUIRE(samples.size() == length / 2u);
  REQUIRE(rawcodec::samples_to_bytes(samples, little_endian) == bytes);
}
