#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace rawcodec
{

struct plane_header
{
  std::string codec_name;
  std::uint32_t width = 0u;
  std::uint32_t height = 0u;
  bool little_endian = true;
  std::uint64_t payload_length = 0u;
};

[[nodiscard]] auto header_size() noexcept -> std::size_t;

// Reads and validates the header, leaving the stream at the payload
[[nodiscard]] auto read_plane_header(std::istream& in) -> plane_header;

// payload_length is taken from payload, not from header
void write_compressed_plane(std::ostream& out,
                            plane_header const& header,
                            std::span<std::byte const> payload);

// Reads the header and exactly payload_length bytes after it. Throws
// std::runtime_error when the stream holds fewer bytes than the header claims.
[[nodiscard]] auto read_compressed_plane(std::istream& in,
                                         std::vector<std::byte>& payload)
  -> plane_header;

[[nodiscard]] auto read_compressed_plane(std::filesystem::path const& path,
                                         std::vector<std::byte>& payload)
  -> plane_header;

void write_compressed_plane(std::filesystem::path const& path,
                            plane_header const& header,
                            std::span<std::byte const> payload);

// Uncompressed planes are stored as bare sample bytes
[[nodiscard]] auto read_raw_plane(std::filesystem::path const& path)
  -> std::vector<std::byte>;

void write_raw_plane(std::filesystem::path const& path,
                     std::span<std::byte const> data);

} // namespace rawcodec
