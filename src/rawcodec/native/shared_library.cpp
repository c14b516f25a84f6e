#include <rawcodec/native/shared_library.hpp>

#include <string>
#include <utility>

#if defined(_WIN32)
#include <windows.h>
#else
#include <dlfcn.h>
#endif

#include <fmt/format.h>

#include <rawcodec/codec_error.hpp>
#include <rawcodec/log.hpp>

namespace rawcodec::native
{

namespace
{

auto
last_error() -> std::string
{
#if defined(_WIN32)
  return fmt::format("error code {}", ::GetLastError());
#else
  auto const* const message = ::dlerror();
  return message ? message : "unknown error";
#endif
}

} // namespace

shared_library::shared_library(std::filesystem::path path)
  : path_{ std::move(path) }
{
#if defined(_WIN32)
  handle_ = ::LoadLibraryW(path_.c_str());
#else
  handle_ = ::dlopen(path_.c_str(), RTLD_NOW | RTLD_LOCAL);
#endif

  if (not handle_)
  {
    throw codec_error{
      errc::missing_resource,
      fmt::format("cannot load {}: {}", path_.string(), last_error()),
    };
  }

  log::debug("loaded native library {}", path_.string());
}

shared_library::~shared_library()
{
  close();
}

shared_library::shared_library(shared_library&& other) noexcept
  : path_{ std::move(other.path_) }
  , handle_{ std::exchange(other.handle_, nullptr) }
{
}

auto
shared_library::operator=(shared_library&& other) noexcept -> shared_library&
{
  if (this != &other)
  {
    close();
    path_ = std::move(other.path_);
    handle_ = std::exchange(other.handle_, nullptr);
  }

  return *this;
}

auto
shared_library::raw_symbol(std::string_view const name) const -> void*
{
  auto const symbol_name = std::string{ name };

#if defined(_WIN32)
  auto* const address = reinterpret_cast<void*>(
    ::GetProcAddress(static_cast<HMODULE>(handle_), symbol_name.c_str()));

  if (not address)
  {
    throw codec_error{
      errc::missing_resource,
      fmt::format("{} has no symbol {}: {}",
                  path_.string(),
                  symbol_name,
                  last_error()),
    };
  }
#else
  // A null symbol value is legal, so clear dlerror and check it afterwards
  ::dlerror();
  auto* const address = ::dlsym(handle_, symbol_name.c_str());

  if (auto const* const error = ::dlerror())
  {
    throw codec_error{
      errc::missing_resource,
      fmt::format(
        "{} has no symbol {}: {}", path_.string(), symbol_name, error),
    };
  }
#endif

  return address;
}

void
shared_library::close() noexcept
{
  if (not handle_)
  {
    return;
  }

#if defined(_WIN32)
  ::FreeLibrary(static_cast<HMODULE>(handle_));
#else
  ::dlclose(handle_);
#endif
  handle_ = nullptr;
}

} // namespace rawcodec::native
