#pragma once

#include <string_view>
#include <utility>

#include <fmt/format.h>

namespace rawcodec::log
{

using level_t = unsigned;

enum : level_t
{
  level_info = 1u << 0u,
  level_debug = 1u << 1u,
  level_warn = 1u << 2u,
  level_error = 1u << 3u,

  level_none = 0u,
  level_default = level_warn | level_error,
  level_all = level_info | level_debug | level_warn | level_error,
};

// Initial mask comes from RAWCODEC_LOG_LEVEL, see parse_level
void set_level(level_t mask) noexcept;

[[nodiscard]] auto level() noexcept -> level_t;

// Accepts "none", "error", "warn", "info", "debug" (each enabling itself and
// everything more severe) or a decimal bit mask. Unknown text gives
// level_default.
[[nodiscard]] auto parse_level(std::string_view text) noexcept -> level_t;

void write(level_t level, std::string_view message);

template<typename... Args>
void
info(fmt::format_string<Args...> format, Args&&... args)
{
  if (level() & level_info)
  {
    write(level_info, fmt::format(format, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void
debug(fmt::format_string<Args...> format, Args&&... args)
{
  if (level() & level_debug)
  {
    write(level_debug, fmt::format(format, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void
warn(fmt::format_string<Args...> format, Args&&... args)
{
  if (level() & level_warn)
  {
    write(level_warn, fmt::format(format, std::forward<Args>(args)...));
  }
}

template<typename... Args>
void
error(fmt::format_string<Args...> format, Args&&... args)
{
  if (level() & level_error)
  {
    write(level_error, fmt::format(format, std::forward<Args>(args)...));
  }
}

} // namespace rawcodec::log
