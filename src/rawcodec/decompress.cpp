#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <lyra/lyra.hpp>

#include <rawcodec/codec_options.hpp>
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
    auto verbose = false;
    auto asset_dir = std::filesystem::path{};
    auto in_path = std::filesystem::path{};
    auto out_path = std::filesystem::path{};

    auto const parser =
      lyra::cli_parser{}
        .add_argument(lyra::help(show_help))
        .add_argument(lyra::opt(asset_dir, "dir")
                        .name("-a")
                        .name("--asset-dir")
                        .help("Directory holding the native codec library"))
        .add_argument(
          lyra::opt(verbose).name("-v").name("--verbose").help("Debug output"))
        .add_argument(
          lyra::arg(in_path, "in").help("Input compressed plane path"))
        .add_argument(
          lyra::arg(out_path, "out").help("Output raw 16-bit plane"));

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

    auto codec =
      rawcodec::jetraw_codec{ rawcodec::native::shared_resource(config) };

    // Read the compressed plane
    auto payload = std::vector<std::byte>{};
    auto const header = rawcodec::read_compressed_plane(in_path, payload);

    if (header.codec_name != codec.name())
    {
      fmt::print(stderr,
                 "{} was written by codec '{}', expected '{}'\n",
                 in_path.string(),
                 header.codec_name,
                 codec.name());

      return EXIT_FAILURE;
    }

    auto const options = rawcodec::codec_options{
      header.width,
      header.height,
      header.little_endian,
    };

    auto const decoded_plane = codec.decompress(payload, options);

    // Write the decoded plane
    rawcodec::write_raw_plane(out_path, decoded_plane);
  }
  catch (std::exception const& error)
  {
    fmt::print(stderr, "{}\n", error.what());

    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
