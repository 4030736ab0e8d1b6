#include <boost/uuid/uuid_io.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cstddef>
#include <latch>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include <codec/uuids.hpp>
#include <core/errors.hpp>
#include <supplier/default_supplier.hpp>

#include "test_doubles/counting_discovery.hpp"

namespace {

const auto fixed_uuid = uuid_kit::codec::from_standard_representation("3f0f2ddb-b2e9-4757-9348-80ed6057abb3");

auto testable_service() -> uuid_kit::supplier::uuid_service
{
  return uuid_kit::supplier::uuid_service{ .name = "testable_uuid_supplier", .generate = []() { return fixed_uuid; } };
}

auto setting(std::optional<std::string> value) -> uuid_kit::supplier::caching_setting_fn
{
  return [value = std::move(value)]() { return value; };
}

}// namespace

TEST_CASE("parse_caching_mode is lenient", "[supplier][default][config]")
{
  using uuid_kit::supplier::caching_mode;
  using uuid_kit::supplier::parse_caching_mode;

  SECTION("unset means cached") { REQUIRE(parse_caching_mode(std::nullopt) == caching_mode::cached); }

  SECTION("true means cached")
  {
    REQUIRE(parse_caching_mode("true") == caching_mode::cached);
    REQUIRE(parse_caching_mode("TRUE") == caching_mode::cached);
  }

  SECTION("false in any case means non-cached")
  {
    REQUIRE(parse_caching_mode("false") == caching_mode::non_cached);
    REQUIRE(parse_caching_mode("False") == caching_mode::non_cached);
    REQUIRE(parse_caching_mode("FALSE") == caching_mode::non_cached);
  }

  SECTION("anything else means cached")
  {
    REQUIRE(parse_caching_mode("") == caching_mode::cached);
    REQUIRE(parse_caching_mode("no") == caching_mode::cached);
    REQUIRE(parse_caching_mode("0") == caching_mode::cached);
    REQUIRE(parse_caching_mode(" false") == caching_mode::cached);
  }
}

TEST_CASE("default_supplier_holder requires its collaborators", "[supplier][default]")
{
  REQUIRE_THROWS_AS(uuid_kit::supplier::default_supplier_holder({}, setting(std::nullopt)),
    uuid_kit::core::null_input_error);
  REQUIRE_THROWS_AS(uuid_kit::supplier::default_supplier_holder(uuid_kit_test::counting_discovery{}, {}),
    uuid_kit::core::null_input_error);
}

SCENARIO("default_supplier_holder in cached mode", "[supplier][default][cached]")
{
  GIVEN("no registered service")
  {
    const uuid_kit_test::counting_discovery discovery;
    uuid_kit::supplier::default_supplier_holder holder(discovery, setting(std::nullopt));

    THEN("nothing is discovered before the first call")
    {
      REQUIRE(discovery.calls() == 0);
      REQUIRE_FALSE(holder.caching().has_value());
    }

    WHEN("the default is requested twice")
    {
      auto first = holder.get();
      auto second = holder.get();

      THEN("the random supplier is used and discovery ran once")
      {
        REQUIRE(first == uuid_kit::supplier::random_uuid_supplier());
        REQUIRE(second == first);
        REQUIRE(first->get() != first->get());
        REQUIRE(discovery.calls() == 1);
        REQUIRE(holder.caching() == uuid_kit::supplier::caching_mode::cached);
      }
    }
  }

  GIVEN("a registered service")
  {
    uuid_kit_test::counting_discovery discovery;
    discovery.set_service(testable_service());
    uuid_kit::supplier::default_supplier_holder holder(discovery, setting("true"));

    WHEN("the default is requested")
    {
      auto supplier = holder.get();

      THEN("it delegates to the service")
      {
        REQUIRE(supplier->holds<uuid_kit::supplier::discovered_strategy>());
        REQUIRE(supplier->get() == fixed_uuid);
        REQUIRE(supplier->describe() == "discovered_uuid_supplier(testable_uuid_supplier)");
      }

      AND_WHEN("the service is unregistered afterwards")
      {
        discovery.clear_service();

        THEN("the cached supplier is unchanged and discovery is not repeated")
        {
          REQUIRE(holder.get() == supplier);
          REQUIRE(holder.get()->get() == fixed_uuid);
          REQUIRE(discovery.calls() == 1);
        }
      }
    }
  }

  GIVEN("many threads racing on the first call")
  {
    uuid_kit_test::counting_discovery discovery;
    discovery.set_service(testable_service());
    uuid_kit::supplier::default_supplier_holder holder(discovery, setting(std::nullopt));

    constexpr int num_threads = 16;
    std::latch start(num_threads);
    std::vector<uuid_kit::supplier::uuid_supplier_ptr> results(num_threads);
    std::vector<std::thread> threads;

    for (int i = 0; i < num_threads; ++i) {
      threads.emplace_back([&, i]() {
        start.arrive_and_wait();
        results[static_cast<std::size_t>(i)] = holder.get();
      });
    }
    for (auto &thread : threads) { thread.join(); }

    THEN("discovery ran exactly once and every thread got the same initialized supplier")
    {
      REQUIRE(discovery.calls() == 1);
      for (const auto &result : results) {
        REQUIRE(result != nullptr);
        REQUIRE(result == results.front());
        REQUIRE(result->get() == fixed_uuid);
      }
    }
  }
}

SCENARIO("default_supplier_holder in non-cached mode", "[supplier][default][non_cached]")
{
  GIVEN("caching disabled")
  {
    uuid_kit_test::counting_discovery discovery;
    uuid_kit::supplier::default_supplier_holder holder(discovery, setting("false"));

    auto supplier = holder.get();

    THEN("initialization itself does not run discovery")
    {
      REQUIRE(discovery.calls() == 0);
      REQUIRE(holder.caching() == uuid_kit::supplier::caching_mode::non_cached);
      REQUIRE(supplier->describe() == "non_caching_uuid_supplier(uninitialized - call get() first)");
    }

    THEN("the handle never changes") { REQUIRE(holder.get() == supplier); }

    WHEN("nothing is registered")
    {
      const auto uuid1 = supplier->get();
      const auto uuid2 = supplier->get();

      THEN("random UUIDs are produced and discovery ran on every call")
      {
        REQUIRE(uuid1 != uuid2);
        REQUIRE(discovery.calls() == 2);
        REQUIRE(supplier->describe() == "non_caching_uuid_supplier(random_uuid_supplier)");
      }
    }

    WHEN("a service is registered later")
    {
      std::ignore = supplier->get();
      discovery.set_service(testable_service());

      THEN("the next call picks it up")
      {
        REQUIRE(supplier->get() == fixed_uuid);
        REQUIRE(supplier->describe() == "non_caching_uuid_supplier(testable_uuid_supplier)");
      }

      AND_WHEN("it is unregistered again")
      {
        discovery.clear_service();

        THEN("random UUIDs come back")
        {
          REQUIRE(supplier->get() != fixed_uuid);
          REQUIRE(supplier->describe() == "non_caching_uuid_supplier(random_uuid_supplier)");
        }
      }
    }
  }
}

SCENARIO("default_supplier_holder surfaces discovery failures", "[supplier][default][errors]")
{
  GIVEN("a discovery function that throws")
  {
    uuid_kit_test::counting_discovery discovery;
    discovery.set_throw_on_lookup(true);

    WHEN("caching is enabled")
    {
      uuid_kit::supplier::default_supplier_holder holder(discovery, setting(std::nullopt));

      THEN("get() rethrows and a later get() retries")
      {
        REQUIRE_THROWS_AS(holder.get(), std::runtime_error);
        REQUIRE_FALSE(holder.caching().has_value());

        discovery.set_throw_on_lookup(false);
        discovery.set_service(testable_service());

        REQUIRE(holder.get()->get() == fixed_uuid);
        REQUIRE(discovery.calls() == 2);
      }
    }

    WHEN("caching is disabled")
    {
      uuid_kit::supplier::default_supplier_holder holder(discovery, setting("false"));
      auto supplier = holder.get();

      THEN("each supplier call rethrows") { REQUIRE_THROWS_AS(supplier->get(), std::runtime_error); }
    }
  }

  GIVEN("a setting reader that throws")
  {
    const uuid_kit_test::counting_discovery discovery;
    uuid_kit::supplier::default_supplier_holder holder(
      discovery, []() -> std::optional<std::string> { throw std::runtime_error("setting unavailable"); });

    THEN("get() rethrows without running discovery")
    {
      REQUIRE_THROWS_AS(holder.get(), std::runtime_error);
      REQUIRE(discovery.calls() == 0);
    }
  }
}
