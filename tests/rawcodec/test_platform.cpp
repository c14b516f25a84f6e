#include <optional>

#include <catch2/catch.hpp>

#include <rawcodec/native/platform.hpp>

namespace native = rawcodec::native;

TEST_CASE("Operating system identifiers map to platforms")
{
  CHECK(native::platform_from_os_name("Linux") == native::platform::posix);
  CHECK(native::platform_from_os_name("AIX") == native::platform::posix);
  CHECK(native::platform_from_os_name("FreeBSD") == native::platform::posix);
  CHECK(native::platform_from_os_name("Darwin") == native::platform::macos);
  CHECK(native::platform_from_os_name("Mac OS X") == native::platform::macos);
  CHECK(native::platform_from_os_name("Windows_NT") ==
        native::platform::windows);
  CHECK(native::platform_from_os_name("Windows 10") ==
        native::platform::windows);
  CHECK(native::platform_from_os_name(" linux\n") == native::platform::posix);
}

TEST_CASE("Unknown identifiers map to no platform")
{
  CHECK(native::platform_from_os_name("Plan9") == std::nullopt);
  CHECK(native::platform_from_os_name("") == std::nullopt);
  // Substrings of known names are not enough
  CHECK(native::platform_from_os_name("Linuxish") == std::nullopt);
  CHECK(native::platform_from_os_name("Darwinism") == std::nullopt);
}

TEST_CASE("Library file names follow each platform's convention")
{
  constexpr auto base = "jetraw_bioformats_plugin";

  CHECK(native::library_file_name(native::platform::windows, base) ==
        "jetraw_bioformats_plugin.dll");
  CHECK(native::library_file_name(native::platform::macos, base) ==
        "libjetraw_bioformats_plugin.dylib");
  CHECK(native::library_file_name(native::platform::posix, base) ==
        "libjetraw_bioformats_plugin.so");
}

TEST_CASE("The running system has a platform")
{
  REQUIRE(native::current_platform().has_value());

#if defined(__linux__)
  CHECK(native::current_platform() == native::platform::posix);
  CHECK(native::current_library_file_name("codec") == "libcodec.so");
#elif defined(__APPLE__)
  CHECK(native::current_platform() == native::platform::macos);
  CHECK(native::current_library_file_name("codec") == "libcodec.dylib");
#elif defined(_WIN32)
  CHECK(native::current_platform() == native::platform::windows);
  CHECK(native::current_library_file_name("codec") == "codec.dll");
#endif
}
