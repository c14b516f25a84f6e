#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <lyra/lyra.hpp>

#include <rawcodec/compressed_plane_io.hpp>
#include <rawcodec/jetraw_codec.hpp>
#include <rawcodec/log.hpp>
#include <rawcodec/native/native_resource.hpp>

auto
main(int const argc, char const* const* const argv) -> int
{
  try
  {
    // Parse arguments
    auto show_help = false;
    auto show_stats = false;
    auto verbose = false;
    auto big_endian = false;
    auto width = std::uint32_t{};
    auto height = std::uint32_t{};
    auto identifier = std::string{};
    auto asset_dir = std::filesystem::path{};
    auto in_path = std::filesystem::path{};
    auto out_path = std::filesystem::path{};

    auto const parser =
      lyra::cli_parser{}
        .add_argument(lyra::help(show_help))
        .add_argument(lyra::opt(width, "width")
                        .name("-W")
                        .name("--width")
                        .required()
                        .help("Plane width in pixels"))
        .add_argument(lyra::opt(height, "height")
                        .name("-H")
                        .name("--height")
                        .required()
                        .help("Plane height in pixels"))
        .add_argument(lyra::opt(big_endian)
                        .name("-b")
                        .name("--big-endian")
                        .help("Input samples are stored high byte first"))
        .add_argument(lyra::opt(identifier, "id")
                        .name("-i")
                        .name("--identifier")
                        .required()
                        .help("Camera calibration identifier"))
        .add_argument(lyra::opt(asset_dir, "dir")
                        .name("-a")
                        .name("--asset-dir")
                        .help("Directory holding the native codec library"))
        .add_argument(lyra::opt(show_stats)
                        .name("-s")
                        .name("--stats")
                        .help("Display compression stats"))
        .add_argument(
          lyra::opt(verbose).name("-v").name("--verbose").help("Debug output"))
        .add_argument(lyra::arg(in_path, "in").help("Input raw 16-bit plane"))
        .add_argument(
          lyra::arg(out_path, "out").help("Output compressed plane path"));

    if (auto const parse_result = parser.parse(lyra::args(argc, argv));
        not parse_result)
    {
      fmt::print(stderr, "{}\n", parse_result.errorMessage());
      fmt::print(stderr, "See --help for correct usage\n");

      return EXIT_FAILURE;
    }

    if (show_help)
    {
      // Display usage and exit
      fmt::print("{}", fmt::streamed(parser));

      return EXIT_SUCCESS;
    }

    if (verbose)
    {
      rawcodec::log::set_level(rawcodec::log::level_all);
    }

    auto config = rawcodec::jetraw_codec::default_config();

    if (not asset_dir.empty())
    {
      config.asset_dir = asset_dir;
    }

    auto const options = rawcodec::jetraw_codec::make_options(
      width, height, not big_endian, identifier);

    // Read and encode the plane
    auto const plane = rawcodec::read_raw_plane(in_path);

    auto codec =
      rawcodec::jetraw_codec{ rawcodec::native::shared_resource(config) };
    auto const compressed_data = codec.compress(plane, options);

    if (show_stats)
    {
      auto const original_size = plane.size();
      auto const compressed_size = compressed_data.size();
      auto const header_size = rawcodec::header_size();
      auto const compression_ratio =
        static_cast<float>(compressed_size + header_size) /
        static_cast<float>(original_size);

      fmt::print("Original size: {}B\n"
                 "Compressed size: {}B (+ {}B header)\n"
                 "Compression ratio (including header): {}\n",
                 original_size,
                 compressed_size,
                 header_size,
                 compression_ratio);
      std::fflush(stdout);
    }

    // Write the encoded plane
    rawcodec::write_compressed_plane(
      out_path,
      rawcodec::plane_header{
        .codec_name = std::string{ codec.name() },
        .width = options.width(),
        .height = options.height(),
        .little_endian = options.little_endian(),
      },
      compressed_data);
  }
  catch (std::exception const& error)
  {
    fmt::print(stderr, "{}\n", error.what());

    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
