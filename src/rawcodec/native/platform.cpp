#include <rawcodec/native/platform.hpp>

#include <array>
#include <utility>

#if !defined(_WIN32)
#include <sys/utsname.h>
#endif

#include <absl/strings/ascii.h>
#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>
#include <fmt/format.h>

#include <rawcodec/codec_error.hpp>

namespace rawcodec::native
{

namespace
{

// Exact identifiers, compared after lower-casing
constexpr auto known_os_names = std::array{
  std::pair{ std::string_view{ "windows_nt" }, platform::windows },
  std::pair{ std::string_view{ "darwin" }, platform::macos },
  std::pair{ std::string_view{ "mac os x" }, platform::macos },
  std::pair{ std::string_view{ "linux" }, platform::posix },
  std::pair{ std::string_view{ "aix" }, platform::posix },
  std::pair{ std::string_view{ "freebsd" }, platform::posix },
  std::pair{ std::string_view{ "netbsd" }, platform::posix },
  std::pair{ std::string_view{ "openbsd" }, platform::posix },
  std::pair{ std::string_view{ "sunos" }, platform::posix },
};

} // namespace

auto
platform_from_os_name(std::string_view const os_name)
  -> std::optional<platform>
{
  auto const normalized = absl::AsciiStrToLower(
    absl::StripAsciiWhitespace(os_name));

  for (auto const& [name, target] : known_os_names)
  {
    if (normalized == name)
    {
      return target;
    }
  }

  // Versioned names such as "Windows 10" or "MINGW64_NT-10.0"
  if (absl::StartsWith(normalized, "windows") or
      absl::StartsWith(normalized, "mingw") or
      absl::StartsWith(normalized, "cygwin"))
  {
    return platform::windows;
  }

  return std::nullopt;
}

auto
current_os_name() -> std::string
{
#if defined(_WIN32)
  return "Windows_NT";
#else
  auto info = ::utsname{};

  if (::uname(&info) != 0)
  {
    return {};
  }

  return info.sysname;
#endif
}

auto
current_platform() -> std::optional<platform>
{
  return platform_from_os_name(current_os_name());
}

auto
library_file_name(platform const target, std::string_view const base)
  -> std::string
{
  switch (target)
  {
  case platform::windows: return absl::StrCat(base, ".dll");
  case platform::macos: return absl::StrCat("lib", base, ".dylib");
  case platform::posix: return absl::StrCat("lib", base, ".so");
  }

  return {};
}

auto
current_library_file_name(std::string_view const base) -> std::string
{
  auto const os_name = current_os_name();
  auto const target = platform_from_os_name(os_name);

  if (not target)
  {
    throw codec_error{
      errc::unsupported_platform,
      fmt::format("no native library for operating system '{}'", os_name),
    };
  }

  return library_file_name(*target, base);
}

} // namespace rawcodec::native
