#include <codec/uuids.hpp>
#include <core/errors.hpp>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

// Fuzzer that feeds arbitrary input to both UUID parsers
// cppcheck-suppress unusedFunction symbolName=LLVMFuzzerTestOneInput
// NOLINTNEXTLINE(readability-identifier-naming)
extern "C" auto LLVMFuzzerTestOneInput(const uint8_t *Data, size_t Size) -> int
{
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  const std::string input(reinterpret_cast<const char *>(Data), Size);

  try {
    const auto uuid = uuid_kit::codec::from_standard_representation(input);
    if (uuid_kit::codec::from_standard_representation(uuid_kit::codec::to_standard_representation(uuid)) != uuid) {
      throw std::logic_error("standard representation did not round trip");
    }
  } catch (const uuid_kit::core::invalid_format_error &) {
    // rejected input is expected
  }

  try {
    const auto uuid = uuid_kit::codec::from_shortened_representation(input);
    if (uuid_kit::codec::from_shortened_representation(uuid_kit::codec::to_shortened_representation(uuid)) != uuid) {
      throw std::logic_error("shortened representation did not round trip");
    }
  } catch (const uuid_kit::core::invalid_format_error &) {
    // rejected input is expected
  }

  return 0;
}
