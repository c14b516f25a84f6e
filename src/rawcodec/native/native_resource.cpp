#include <rawcodec/native/native_resource.hpp>

#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>

#include <absl/container/flat_hash_map.h>
#include <fmt/format.h>

#include <rawcodec/codec_error.hpp>
#include <rawcodec/log.hpp>
#include <rawcodec/native/asset_extractor.hpp>
#include <rawcodec/native/platform.hpp>
#include <rawcodec/native/shared_library.hpp>

namespace rawcodec::native
{

auto
to_string(resource_state const state) noexcept -> std::string_view
{
  switch (state)
  {
  case resource_state::unloaded: return "unloaded";
  case resource_state::loading: return "loading";
  case resource_state::ready: return "ready";
  case resource_state::failed: return "failed";
  }

  return "unknown";
}

native_resource::native_resource(std::string name,
                                 loader_type loader,
                                 failure_policy const on_failure)
  : name_{ std::move(name) }
  , loader_{ std::move(loader) }
  , on_failure_{ on_failure }
{
}

auto
native_resource::acquire() -> native_backend&
{
  if (state() == resource_state::ready)
  {
    return *backend_;
  }

  auto const lock = std::scoped_lock{ load_mutex_ };

  switch (state())
  {
  case resource_state::ready: return *backend_;
  case resource_state::failed:
    if (on_failure_ == failure_policy::cache)
    {
      throw codec_error{
        errc::missing_resource,
        fmt::format("native library {} failed to load earlier", name_),
        failure_,
      };
    }
    break;
  case resource_state::unloaded:
  case resource_state::loading: break;
  }

  log::debug("loading native library {} ({})", name_, to_string(state()));
  state_.store(resource_state::loading, std::memory_order_release);
  load_attempts_.fetch_add(1u, std::memory_order_relaxed);

  try
  {
    auto backend = loader_();
    backend->init();

    backend_ = std::move(backend);
    failure_ = nullptr;
    state_.store(resource_state::ready, std::memory_order_release);
  }
  catch (std::exception const& error)
  {
    failure_ = std::current_exception();
    state_.store(resource_state::failed, std::memory_order_release);
    log::error("native library {} not available: {}", name_, error.what());
    throw;
  }
  catch (...)
  {
    failure_ = std::current_exception();
    state_.store(resource_state::failed, std::memory_order_release);
    log::error("native library {} not available", name_);
    throw;
  }

  log::info("native library {} ready", name_);

  return *backend_;
}

auto
make_library_loader(resource_config config) -> native_resource::loader_type
{
  return [config = std::move(config)]
  {
    auto const file_name =
      current_library_file_name(config.library_base_name);
    auto const extracted =
      extract_asset(config.asset_dir, file_name, config.extraction_dir);

    auto library = std::optional<shared_library>{};

    try
    {
      library.emplace(extracted);
    }
    catch (codec_error const&)
    {
      auto error = std::error_code{};
      std::filesystem::remove(extracted, error);
      throw;
    }

#if !defined(_WIN32)
    // The mapping outlives the directory entry
    auto error = std::error_code{};
    std::filesystem::remove(extracted, error);
#endif

    return std::make_unique<native_backend>(std::move(*library),
                                            config.serialize_calls);
  };
}

auto
shared_resource(resource_config const& config) -> native_resource&
{
  static auto mutex = std::mutex{};
  static auto resources =
    absl::flat_hash_map<std::string, std::unique_ptr<native_resource>>{};

  auto const lock = std::scoped_lock{ mutex };
  auto& resource = resources[config.library_base_name];

  if (not resource)
  {
    resource = std::make_unique<native_resource>(config.library_base_name,
                                                 make_library_loader(config),
                                                 config.on_failure);
  }

  return *resource;
}

} // namespace rawcodec::native
