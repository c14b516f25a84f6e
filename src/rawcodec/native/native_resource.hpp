#pragma once

#include <atomic>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <rawcodec/native/native_backend.hpp>
#include <rawcodec/native/resource_config.hpp>

namespace rawcodec::native
{

enum class resource_state
{
  unloaded,
  loading,
  ready,
  failed,
};

[[nodiscard]] auto to_string(resource_state state) noexcept -> std::string_view;

// Lifecycle of one native library inside the process.
//
// The first acquire() runs the loader and the library's init() under a lock;
// concurrent callers wait for it and see the same outcome. Once ready the
// resource stays ready. After a failure, failure_policy decides whether the
// next acquire() loads again or throws missing_resource straight away.
class native_resource
{
public:
  using loader_type = std::function<std::unique_ptr<native_backend>()>;

  native_resource(std::string name,
                  loader_type loader,
                  failure_policy on_failure = failure_policy::cache);

  native_resource(native_resource const&) = delete;
  auto operator=(native_resource const&) -> native_resource& = delete;

  [[nodiscard]] auto acquire() -> native_backend&;

  [[nodiscard]] auto state() const noexcept -> resource_state
  {
    return state_.load(std::memory_order_acquire);
  }

  // Number of times the load sequence started
  [[nodiscard]] auto load_attempts() const noexcept -> std::size_t
  {
    return load_attempts_.load(std::memory_order_relaxed);
  }

  [[nodiscard]] auto name() const noexcept -> std::string_view
  {
    return name_;
  }

private:
  std::string name_;
  loader_type loader_;
  failure_policy on_failure_;

  std::atomic<resource_state> state_ = resource_state::unloaded;
  std::atomic<std::size_t> load_attempts_ = 0u;
  std::mutex load_mutex_;
  std::unique_ptr<native_backend> backend_;
  std::exception_ptr failure_;
};

// Locates the library for the running platform, extracts it from the asset
// directory, loads it and resolves its entry points
[[nodiscard]] auto make_library_loader(resource_config config)
  -> native_resource::loader_type;

// Process-wide resource for config.library_base_name, created from config on
// first request. Later requests for the same library share that resource and
// its original configuration.
[[nodiscard]] auto shared_resource(resource_config const& config)
  -> native_resource&;

} // namespace rawcodec::native
