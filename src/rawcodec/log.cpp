#include <rawcodec/log.hpp>

#include <atomic>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <mutex>

namespace rawcodec::log
{

namespace
{

auto
initial_level() noexcept -> level_t
{
  auto const* const env = std::getenv("RAWCODEC_LOG_LEVEL");

  return env ? parse_level(env) : level_default;
}

auto
level_cell() -> std::atomic<level_t>&
{
  static auto cell = std::atomic<level_t>{ initial_level() };
  return cell;
}

auto
tag(level_t const level) noexcept -> std::string_view
{
  switch (level)
  {
  case level_info: return "[info]";
  case level_debug: return "[dbg] ";
  case level_warn: return "[WARN]";
  case level_error: return "[ERR] ";
  default: return "      ";
  }
}

} // namespace

void
set_level(level_t const mask) noexcept
{
  level_cell().store(mask, std::memory_order_relaxed);
}

auto
level() noexcept -> level_t
{
  return level_cell().load(std::memory_order_relaxed);
}

auto
parse_level(std::string_view const text) noexcept -> level_t
{
  if (text == "none")
  {
    return level_none;
  }
  if (text == "error")
  {
    return level_error;
  }
  if (text == "warn")
  {
    return level_warn | level_error;
  }
  if (text == "info")
  {
    return level_info | level_warn | level_error;
  }
  if (text == "debug")
  {
    return level_all;
  }

  auto mask = level_t{};
  auto const [end, ec] =
    std::from_chars(text.data(), text.data() + text.size(), mask);

  if (ec != std::errc{} or end != text.data() + text.size())
  {
    return level_default;
  }

  return mask & level_all;
}

void
write(level_t const level, std::string_view const message)
{
  // Keep lines from concurrent codec calls whole
  static auto mutex = std::mutex{};
  auto const lock = std::scoped_lock{ mutex };

  fmt::print(stderr, "{} rawcodec: {}\n", tag(level), message);
}

} // namespace rawcodec::log
