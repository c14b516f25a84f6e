#include <rawcodec/native/asset_extractor.hpp>

#include <cstdint>
#include <exception>
#include <random>
#include <string>
#include <system_error>

#include <fmt/format.h>

#include <rawcodec/codec_error.hpp>
#include <rawcodec/log.hpp>

namespace rawcodec::native
{

namespace
{

auto
unique_prefix() -> std::uint64_t
{
  static thread_local auto engine = std::mt19937_64{ std::random_device{}() };
  return engine();
}

[[noreturn]] void
throw_missing(std::string const& message,
              std::filesystem::path const& path,
              std::error_code const error)
{
  throw codec_error{
    errc::missing_resource,
    message,
    std::make_exception_ptr(std::filesystem::filesystem_error{
      message,
      path,
      error,
    }),
  };
}

} // namespace

auto
extract_asset(std::filesystem::path const& asset_dir,
              std::string_view const file_name,
              std::filesystem::path const& target_dir) -> std::filesystem::path
{
  auto const source = asset_dir / file_name;
  auto error = std::error_code{};

  if (not std::filesystem::is_regular_file(source, error))
  {
    if (not error)
    {
      error = std::make_error_code(std::errc::no_such_file_or_directory);
    }

    throw_missing(fmt::format("native asset {} not found", source.string()),
                  source,
                  error);
  }

  auto directory = target_dir;

  if (directory.empty())
  {
    directory = std::filesystem::temp_directory_path(error);

    if (error)
    {
      throw_missing("no temporary directory for native asset", source, error);
    }
  }

  auto const target =
    directory / fmt::format("{:016x}-{}", unique_prefix(), file_name);

  if (not std::filesystem::copy_file(
        source, target, std::filesystem::copy_options::none, error))
  {
    if (error != std::errc::file_exists)
    {
      auto ignored = std::error_code{};
      std::filesystem::remove(target, ignored);
    }

    throw_missing(fmt::format("cannot extract {} to {}",
                              source.string(),
                              target.string()),
                  target,
                  error);
  }

  log::debug("extracted {} to {}", source.string(), target.string());

  return target;
}

} // namespace rawcodec::native
