#include <rawcodec/compressed_plane_io.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <stdexcept>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>

namespace rawcodec
{

namespace
{

struct compressed_plane_header
{
  static constexpr auto magic = std::string_view{ "RAWCODEC_PLANE1" };
  static constexpr auto max_codec_name = std::size_t{ 16 };

  std::array<char, magic.size()> magic_value;
  std::array<char, max_codec_name> codec_name;
  std::uint32_t width;
  std::uint32_t height;
  std::uint8_t little_endian;
  std::array<std::uint8_t, 7> reserved;
  std::uint64_t payload_length;

  void set_magic() noexcept { std::ranges::copy(magic, magic_value.begin()); }

  [[nodiscard]] auto is_valid() const noexcept -> bool
  {
    return std::string_view{ magic_value.data(), magic_value.size() } == magic;
  }
};

static_assert(std::is_trivially_copyable_v<compressed_plane_header>);

} // namespace

auto
header_size() noexcept -> std::size_t
{
  return sizeof(compressed_plane_header);
}

auto
read_plane_header(std::istream& in) -> plane_header
{
  auto header = compressed_plane_header{};

  if (not in.read(
        reinterpret_cast<char*>(&header),
        static_cast<std::streamsize>(sizeof(compressed_plane_header))))
  {
    throw std::runtime_error{ "Failed to read plane header" };
  }

  if (not header.is_valid())
  {
    throw std::runtime_error{ "Invalid plane header" };
  }

  auto const name_end = std::ranges::find(header.codec_name, '\0');

  return plane_header{
    .codec_name = std::string{ header.codec_name.begin(), name_end },
    .width = header.width,
    .height = header.height,
    .little_endian = header.little_endian != 0u,
    .payload_length = header.payload_length,
  };
}

void
write_compressed_plane(std::ostream& out,
                       plane_header const& header,
                       std::span<std::byte const> const payload)
{
  if (header.codec_name.size() > compressed_plane_header::max_codec_name)
  {
    throw std::runtime_error{
      fmt::format("Codec name '{}' does not fit the plane header",
                  header.codec_name),
    };
  }

  auto raw = compressed_plane_header{};
  raw.set_magic();
  std::ranges::copy(header.codec_name, raw.codec_name.begin());
  raw.width = header.width;
  raw.height = header.height;
  raw.little_endian = header.little_endian ? 1u : 0u;
  raw.payload_length = payload.size();

  if (not out.write(
        reinterpret_cast<char const*>(&raw),
        static_cast<std::streamsize>(sizeof(compressed_plane_header))))
  {
    throw std::runtime_error{ "Failed to write plane header" };
  }

  if (not out.write(reinterpret_cast<char const*>(payload.data()),
                    static_cast<std::streamsize>(payload.size())))
  {
    throw std::runtime_error{ "Failed to write plane payload" };
  }
}

auto
read_compressed_plane(std::istream& in, std::vector<std::byte>& payload)
  -> plane_header
{
  auto header = read_plane_header(in);

  auto const payload_start = std::streamoff{ in.tellg() };
  in.seekg(0, std::ios::end);
  auto const stream_end = std::streamoff{ in.tellg() };
  in.seekg(payload_start);

  if (payload_start < 0 or stream_end < payload_start or not in)
  {
    throw std::runtime_error{ "Failed to measure plane payload" };
  }

  auto const available =
    static_cast<std::uint64_t>(stream_end - payload_start);

  if (header.payload_length > available)
  {
    throw std::runtime_error{
      fmt::format("Plane payload of {} bytes exceeds the {} bytes stored",
                  header.payload_length,
                  available),
    };
  }

  payload.resize(static_cast<std::size_t>(header.payload_length));

  if (not in.read(reinterpret_cast<char*>(payload.data()),
                  static_cast<std::streamsize>(payload.size())))
  {
    throw std::runtime_error{ "Failed to read plane payload" };
  }

  return header;
}

auto
read_compressed_plane(std::filesystem::path const& path,
                      std::vector<std::byte>& payload) -> plane_header
{
  auto file = std::ifstream{ path, std::ios::binary };

  if (not file)
  {
    throw std::runtime_error{
      fmt::format("Failed to open {} for reading", path.string()),
    };
  }

  return read_compressed_plane(file, payload);
}

void
write_compressed_plane(std::filesystem::path const& path,
                       plane_header const& header,
                       std::span<std::byte const> const payload)
{
  auto file = std::ofstream{ path, std::ios::binary };

  if (not file)
  {
    throw std::runtime_error{
      fmt::format("Failed to open {} for writing", path.string()),
    };
  }

  write_compressed_plane(file, header, payload);
}

auto
read_raw_plane(std::filesystem::path const& path) -> std::vector<std::byte>
{
  auto file = std::ifstream{ path, std::ios::binary | std::ios::ate };

  if (not file)
  {
    throw std::runtime_error{
      fmt::format("Failed to open {} for reading", path.string()),
    };
  }

  auto data = std::vector<std::byte>(static_cast<std::size_t>(file.tellg()));
  file.seekg(0);

  if (not file.read(reinterpret_cast<char*>(data.data()),
                    static_cast<std::streamsize>(data.size())))
  {
    throw std::runtime_error{ "Failed to read raw plane" };
  }

  return data;
}

void
write_raw_plane(std::filesystem::path const& path,
                std::span<std::byte const> const data)
{
  auto file = std::ofstream{ path, std::ios::binary };

  if (not file.write(reinterpret_cast<char const*>(data.data()),
                     static_cast<std::streamsize>(data.size())))
  {
    throw std::runtime_error{ "Failed to write raw plane" };
  }
}

} // namespace rawcodec
