#pragma once

#include <filesystem>
#include <string_view>

namespace rawcodec::native
{

// Copies asset_dir/file_name to a new, uniquely named file in target_dir
// (the system temporary directory when empty) and returns its path.
// Throws codec_error{errc::missing_resource} with the I/O failure as cause.
[[nodiscard]] auto extract_asset(std::filesystem::path const& asset_dir,
                                 std::string_view file_name,
                                 std::filesystem::path const& target_dir)
  -> std::filesystem::path;

} // namespace rawcodec::native
