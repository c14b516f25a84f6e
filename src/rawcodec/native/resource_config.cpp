#include <rawcodec/native/resource_config.hpp>

#include <cstdlib>
#include <utility>

#ifndef RAWCODEC_DEFAULT_ASSET_DIR
#define RAWCODEC_DEFAULT_ASSET_DIR "share/rawcodec/native"
#endif

namespace rawcodec::native
{

auto
resource_config::from_environment(std::string library_base_name)
  -> resource_config
{
  auto config = resource_config{};
  config.library_base_name = std::move(library_base_name);

  if (auto const* const asset_dir = std::getenv("RAWCODEC_ASSET_DIR");
      asset_dir and *asset_dir != '\0')
  {
    config.asset_dir = asset_dir;
  }
  else
  {
    config.asset_dir = RAWCODEC_DEFAULT_ASSET_DIR;
  }

  return config;
}

} // namespace rawcodec::native
