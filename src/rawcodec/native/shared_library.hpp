#pragma once

#include <filesystem>
#include <string_view>

namespace rawcodec::native
{

// Owns a library loaded into the process. Load and lookup failures throw
// codec_error{errc::missing_resource}.
class shared_library
{
public:
  explicit shared_library(std::filesystem::path path);
  ~shared_library();

  shared_library(shared_library const&) = delete;
  auto operator=(shared_library const&) -> shared_library& = delete;

  shared_library(shared_library&& other) noexcept;
  auto operator=(shared_library&& other) noexcept -> shared_library&;

  template<typename Function>
  [[nodiscard]] auto symbol(std::string_view const name) const -> Function
  {
    return reinterpret_cast<Function>(raw_symbol(name));
  }

  [[nodiscard]] auto path() const noexcept -> std::filesystem::path const&
  {
    return path_;
  }

private:
  [[nodiscard]] auto raw_symbol(std::string_view name) const -> void*;

  void close() noexcept;

  std::filesystem::path path_;
  void* handle_ = nullptr;
};

} // namespace rawcodec::native
