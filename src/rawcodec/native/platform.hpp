#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace rawcodec::native
{

enum class platform
{
  windows,
  macos,
  posix,
};

// Maps an operating system identifier ("Linux", "Darwin", "Windows_NT",
// "AIX", ...) to a platform; unknown identifiers map to nothing
[[nodiscard]] auto platform_from_os_name(std::string_view os_name)
  -> std::optional<platform>;

// Identifier of the running system, as reported by uname on POSIX
[[nodiscard]] auto current_os_name() -> std::string;

[[nodiscard]] auto current_platform() -> std::optional<platform>;

// Shared library file name for a base name: "<base>.dll", "lib<base>.dylib"
// or "lib<base>.so"
[[nodiscard]] auto library_file_name(platform target, std::string_view base)
  -> std::string;

// library_file_name for the running system. Throws
// codec_error{errc::unsupported_platform} when it cannot be mapped.
[[nodiscard]] auto current_library_file_name(std::string_view base)
  -> std::string;

} // namespace rawcodec::native
