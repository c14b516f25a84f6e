#include <rawcodec/codec.hpp>

#include <iterator>

#include <rawcodec/codec_error.hpp>

namespace rawcodec
{

auto
codec::decompress(std::istream& in, codec_options const& options)
  -> std::vector<std::byte>
{
  if (not in)
  {
    throw codec_error{
      errc::invalid_buffer_length,
      "compressed stream is not readable",
    };
  }

  auto const content = std::vector<char>{
    std::istreambuf_iterator<char>{ in },
    std::istreambuf_iterator<char>{},
  };

  return decompress(std::as_bytes(std::span{ content }), options);
}

} // namespace rawcodec
