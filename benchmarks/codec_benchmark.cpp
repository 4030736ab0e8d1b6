#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/string_generator.hpp>
#include <catch2/benchmark/catch_benchmark.hpp>
#include <catch2/catch_test_macros.hpp>
#include <string>

#include <codec/uuids.hpp>
#include <supplier/uuid_supplier.hpp>

namespace uuid_kit::codec::test {

TEST_CASE("Codec Performance Benchmarks", "[benchmark][codec]")
{
  const std::string standard{ "85a8b17f-8ca5-4061-aeb6-2f8a1a3bb60b" };
  const std::string shortened{ "85a8b17f8ca54061aeb62f8a1a3bb60b" };
  const auto uuid = from_standard_representation(standard);

  SECTION("Parsing")
  {
    BENCHMARK("from_standard_representation") { return from_standard_representation(standard); };

    BENCHMARK("boost string_generator") { return boost::uuids::string_generator{}(standard); };

    BENCHMARK("from_shortened_representation") { return from_shortened_representation(shortened); };
  }

  SECTION("Formatting")
  {
    BENCHMARK("to_standard_representation") { return to_standard_representation(uuid); };

    BENCHMARK("to_shortened_representation") { return to_shortened_representation(uuid); };
  }
}

TEST_CASE("Supplier Performance Benchmarks", "[benchmark][supplier]")
{
  auto random = supplier::random_uuid_supplier();
  auto fixed = supplier::fixed_uuid_supplier(boost::uuids::random_generator{}());

  BENCHMARK("random_uuid_supplier") { return random->get(); };

  BENCHMARK("fixed_uuid_supplier") { return fixed->get(); };
}

}// namespace uuid_kit::codec::test
