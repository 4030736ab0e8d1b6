#include <boost/uuid/uuid_io.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

#include <codec/uuids.hpp>
#include <core/errors.hpp>
#include <supplier/service_registry.hpp>

#include "test_doubles/scoped_services.hpp"

namespace {

auto make_service(const std::string &name, std::uint64_t low_bits) -> uuid_kit::supplier::uuid_service
{
  return uuid_kit::supplier::uuid_service{ .name = name,
    .generate = [low_bits]() { return uuid_kit::codec::make_uuid(0, low_bits); } };
}

}// namespace

TEST_CASE("service_registry starts empty", "[supplier][service_registry]")
{
  const uuid_kit::supplier::service_registry registry;

  REQUIRE_FALSE(registry.find_first().has_value());
  REQUIRE(registry.find_all().empty());
}

TEST_CASE("service_registry keeps registration order", "[supplier][service_registry]")
{
  uuid_kit::supplier::service_registry registry;
  registry.register_service(make_service("first", 1));
  registry.register_service(make_service("second", 2));

  SECTION("find_first returns the earliest registration")
  {
    auto service = registry.find_first();
    REQUIRE(service.has_value());
    CHECK(service->name == "first");
    CHECK(service->generate() == uuid_kit::codec::make_uuid(0, 1));
  }

  SECTION("find_all returns every registration in order")
  {
    auto services = registry.find_all();
    REQUIRE(services.size() == 2);
    CHECK(services[0].name == "first");
    CHECK(services[1].name == "second");
  }

  SECTION("clear removes everything")
  {
    registry.clear();
    REQUIRE_FALSE(registry.find_first().has_value());
  }

  SECTION("set_services replaces the registrations")
  {
    registry.set_services({ make_service("replacement", 3) });

    auto services = registry.find_all();
    REQUIRE(services.size() == 1);
    CHECK(services[0].name == "replacement");
  }

  SECTION("set_services with nothing clears the registry")
  {
    registry.set_services({});
    REQUIRE(registry.find_all().empty());
  }
}

TEST_CASE("service_registry rejects services without a generator", "[supplier][service_registry]")
{
  uuid_kit::supplier::service_registry registry;

  SECTION("register_service")
  {
    REQUIRE_THROWS_AS(registry.register_service(uuid_kit::supplier::uuid_service{ .name = "empty", .generate = {} }),
      uuid_kit::core::null_input_error);
    REQUIRE(registry.find_all().empty());
  }

  SECTION("set_services leaves the previous registrations in place")
  {
    registry.register_service(make_service("kept", 1));

    REQUIRE_THROWS_AS(registry.set_services({ make_service("valid", 2), { .name = "empty", .generate = {} } }),
      uuid_kit::core::null_input_error);

    auto services = registry.find_all();
    REQUIRE(services.size() == 1);
    CHECK(services[0].name == "kept");
  }
}

TEST_CASE("service_registry tolerates concurrent registration", "[supplier][service_registry]")
{
  uuid_kit::supplier::service_registry registry;
  constexpr int num_threads = 8;
  constexpr int per_thread = 50;
  std::vector<std::thread> threads;

  for (int i = 0; i < num_threads; ++i) {
    threads.emplace_back([&registry, i]() {
      for (int j = 0; j < per_thread; ++j) {
        registry.register_service(make_service(std::to_string(i), static_cast<std::uint64_t>(j)));
        std::ignore = registry.find_first();
      }
    });
  }
  for (auto &thread : threads) { thread.join(); }

  REQUIRE(registry.find_all().size() == static_cast<std::size_t>(num_threads * per_thread));
}

TEST_CASE("discover_registered_service reads the process-wide registry", "[supplier][service_registry]")
{
  SECTION("nothing registered")
  {
    uuid_kit::supplier::service_registry::instance().clear();
    REQUIRE_FALSE(uuid_kit::supplier::discover_registered_service().has_value());
  }

  SECTION("services installed for a scope")
  {
    {
      const uuid_kit_test::scoped_services services({ make_service("scoped", 7), make_service("ignored", 8) });

      auto service = uuid_kit::supplier::discover_registered_service();
      REQUIRE(service.has_value());
      CHECK(service->name == "scoped");
      CHECK(service->generate() == uuid_kit::codec::make_uuid(0, 7));
    }

    REQUIRE_FALSE(uuid_kit::supplier::discover_registered_service().has_value());
  }
}
