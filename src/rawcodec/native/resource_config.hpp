#pragma once

#include <filesystem>
#include <string>

namespace rawcodec::native
{

// What a resource does on the call after a failed load
enum class failure_policy
{
  // Stay failed, later calls throw missing_resource without loading again
  cache,
  // Attempt the whole load sequence again on the next call
  retry,
};

struct resource_config
{
  std::filesystem::path asset_dir;
  std::string library_base_name;
  // Empty means the system temporary directory
  std::filesystem::path extraction_dir = {};
  failure_policy on_failure = failure_policy::cache;
  // Hold one lock around every native call; clear only for reentrant
  // libraries
  bool serialize_calls = true;

  // asset_dir from RAWCODEC_ASSET_DIR, falling back to the directory
  // assets are installed to
  [[nodiscard]] static auto from_environment(std::string library_base_name)
    -> resource_config;
};

} // namespace rawcodec::native
