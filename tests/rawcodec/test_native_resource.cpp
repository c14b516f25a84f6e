#include <atomic>
#include <chrono>
#include <latch>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include <catch2/catch.hpp>

#include <rawcodec/codec_error.hpp>
#include <rawcodec/native/native_resource.hpp>

#include "stub_native_api.hpp"
#include "testing_utilities.hpp"

namespace native = rawcodec::native;
namespace test = rawcodec::test;

using rawcodec::errc;
using rawcodec::test::has_code;

namespace
{

auto
identity_loader(std::atomic<int>& loads) -> native::native_resource::loader_type
{
  return [&loads]
  {
    ++loads;
    return std::make_unique<native::native_backend>(test::identity_api());
  };
}

auto
failing_loader(std::atomic<int>& loads) -> native::native_resource::loader_type
{
  return [&loads]() -> std::unique_ptr<native::native_backend>
  {
    ++loads;
    throw rawcodec::codec_error{ errc::missing_resource, "asset not found" };
  };
}

} // namespace

TEST_CASE("Resource starts unloaded and becomes ready on first acquire")
{
  test::reset_stub();
  auto loads = std::atomic<int>{ 0 };
  auto resource = native::native_resource{ "identity", identity_loader(loads) };

  CHECK(resource.state() == native::resource_state::unloaded);
  CHECK(resource.load_attempts() == 0u);

  auto& backend = resource.acquire();

  CHECK(resource.state() == native::resource_state::ready);
  CHECK(&resource.acquire() == &backend);
  CHECK(loads == 1);
  CHECK(test::init_calls == 1);
  CHECK(resource.load_attempts() == 1u);
}

TEST_CASE("Concurrent first use loads and initializes once")
{
  constexpr auto thread_count = 8;

  test::reset_stub();
  auto loads = std::atomic<int>{ 0 };
  auto resource = native::native_resource{
    "identity",
    [&loads]
    {
      ++loads;
      // Widen the window in which other threads arrive
      std::this_thread::sleep_for(std::chrono::milliseconds{ 50 });
      return std::make_unique<native::native_backend>(test::identity_api());
    },
  };

  auto start = std::latch{ thread_count };
  auto seen = std::vector<native::native_backend*>(thread_count);
  auto threads = std::vector<std::thread>{};

  for (auto i = 0; i < thread_count; ++i)
  {
    threads.emplace_back(
      [&, i]
      {
        start.arrive_and_wait();
        seen[static_cast<std::size_t>(i)] = &resource.acquire();
      });
  }

  for (auto& thread : threads)
  {
    thread.join();
  }

  CHECK(loads == 1);
  CHECK(test::init_calls == 1);
  CHECK(resource.state() == native::resource_state::ready);

  for (auto const* const backend : seen)
  {
    CHECK(backend == seen.front());
  }
}

TEST_CASE("Concurrent first use observes one failure")
{
  constexpr auto thread_count = 8;

  auto loads = std::atomic<int>{ 0 };
  auto resource = native::native_resource{ "missing", failing_loader(loads) };

  auto start = std::latch{ thread_count };
  auto failures = std::atomic<int>{ 0 };
  auto threads = std::vector<std::thread>{};

  for (auto i = 0; i < thread_count; ++i)
  {
    threads.emplace_back(
      [&]
      {
        start.arrive_and_wait();

        try
        {
          static_cast<void>(resource.acquire());
        }
        catch (rawcodec::codec_error const& error)
        {
          if (error.code() == errc::missing_resource)
          {
            ++failures;
          }
        }
      });
  }

  for (auto& thread : threads)
  {
    thread.join();
  }

  CHECK(loads == 1);
  CHECK(failures == thread_count);
  CHECK(resource.state() == native::resource_state::failed);
}

TEST_CASE("Cached failure fails fast with the original cause")
{
  auto loads = std::atomic<int>{ 0 };
  auto resource = native::native_resource{ "missing", failing_loader(loads) };

  CHECK_THROWS_MATCHES(resource.acquire(),
                       rawcodec::codec_error,
                       has_code(errc::missing_resource));
  CHECK(resource.state() == native::resource_state::failed);

  try
  {
    static_cast<void>(resource.acquire());
    FAIL("acquire after a failed load must throw");
  }
  catch (rawcodec::codec_error const& error)
  {
    CHECK(error.code() == errc::missing_resource);
    REQUIRE(error.cause());
    CHECK_THROWS_WITH(std::rethrow_exception(error.cause()),
                      Catch::Contains("asset not found"));
  }

  CHECK(loads == 1);
  CHECK(resource.load_attempts() == 1u);
}

TEST_CASE("Retry policy loads again after a failure")
{
  test::reset_stub();
  auto loads = std::atomic<int>{ 0 };
  auto fail = true;

  auto resource = native::native_resource{
    "flaky",
    [&]() -> std::unique_ptr<native::native_backend>
    {
      ++loads;

      if (fail)
      {
        throw rawcodec::codec_error{ errc::missing_resource, "not yet" };
      }

      return std::make_unique<native::native_backend>(test::identity_api());
    },
    native::failure_policy::retry,
  };

  CHECK_THROWS_AS(resource.acquire(), rawcodec::codec_error);
  CHECK_THROWS_AS(resource.acquire(), rawcodec::codec_error);
  CHECK(loads == 2);

  fail = false;
  static_cast<void>(resource.acquire());

  CHECK(resource.state() == native::resource_state::ready);
  CHECK(loads == 3);

  static_cast<void>(resource.acquire());
  CHECK(loads == 3);
}

TEST_CASE("Init failure leaves the resource failed")
{
  test::reset_stub();
  test::init_status = 1;

  auto loads = std::atomic<int>{ 0 };
  auto resource = native::native_resource{ "broken", identity_loader(loads) };

  CHECK_THROWS_MATCHES(resource.acquire(),
                       rawcodec::codec_error,
                       has_code(errc::missing_resource));
  CHECK(resource.state() == native::resource_state::failed);
  CHECK(test::init_calls == 1);
}

TEST_CASE("Exceptions outside the codec taxonomy still end loading")
{
  auto resource = native::native_resource{
    "throws",
    []() -> std::unique_ptr<native::native_backend>
    { throw std::logic_error{ "loader bug" }; },
  };

  CHECK_THROWS_AS(resource.acquire(), std::logic_error);
  CHECK(resource.state() == native::resource_state::failed);
  CHECK_THROWS_MATCHES(resource.acquire(),
                       rawcodec::codec_error,
                       has_code(errc::missing_resource));
}

TEST_CASE("Resource states have readable names")
{
  CHECK(native::to_string(native::resource_state::unloaded) == "unloaded");
  CHECK(native::to_string(native::resource_state::loading) == "loading");
  CHECK(native::to_string(native::resource_state::ready) == "ready");
  CHECK(native::to_string(native::resource_state::failed) == "failed");
}
