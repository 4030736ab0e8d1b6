#include <codec/uuids.hpp>

#include <algorithm>
#include <array>
#include <boost/uuid/uuid_io.hpp>
#include <charconv>
#include <core/errors.hpp>
#include <fmt/format.h>
#include <tuple>

namespace uuid_kit::codec {

namespace {

  constexpr std::size_t bytes_per_half = 8;
  constexpr std::size_t bits_per_byte = 8;
  constexpr std::array<std::size_t, standard_dash_count> dash_offsets = { 8, 13, 18, 23 };

  constexpr auto is_hex_digit(char chr) -> bool
  {
    return (chr >= '0' and chr <= '9') or (chr >= 'a' and chr <= 'f') or (chr >= 'A' and chr <= 'F');
  }

  [[noreturn]] auto throw_invalid(std::string_view str) -> void
  {
    throw core::invalid_format_error(fmt::format("Invalid UUID string: {}", str));
  }

  // Callers validate the digits first, so from_chars cannot fail here.
  auto parse_hex(std::string_view digits) -> std::uint64_t
  {
    std::uint64_t value = 0;
    std::ignore = std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
    return value;
  }

  auto is_dash_offset(std::size_t offset) -> bool
  {
    return std::find(dash_offsets.begin(), dash_offsets.end(), offset) != dash_offsets.end();
  }

  auto assemble(std::string_view group1,
    std::string_view group2,
    std::string_view group3,
    std::string_view group4,
    std::string_view group5) -> boost::uuids::uuid
  {
    std::uint64_t most_sig_bits = parse_hex(group1);
    most_sig_bits <<= 16U;
    most_sig_bits |= parse_hex(group2);
    most_sig_bits <<= 16U;
    most_sig_bits |= parse_hex(group3);

    std::uint64_t least_sig_bits = parse_hex(group4);
    least_sig_bits <<= 48U;
    least_sig_bits |= parse_hex(group5);

    return make_uuid(most_sig_bits, least_sig_bits);
  }

}// namespace

auto make_uuid(std::uint64_t most_sig_bits, std::uint64_t least_sig_bits) -> boost::uuids::uuid
{
  boost::uuids::uuid uuid{};
  auto *out = uuid.begin();
  for (std::size_t i = 0; i < bytes_per_half; ++i) {
    const auto shift = (bytes_per_half - 1 - i) * bits_per_byte;
    out[i] = static_cast<std::uint8_t>(most_sig_bits >> shift);
    out[i + bytes_per_half] = static_cast<std::uint8_t>(least_sig_bits >> shift);
  }
  return uuid;
}

auto most_significant_bits(const boost::uuids::uuid &uuid) -> std::uint64_t
{
  std::uint64_t bits = 0;
  std::for_each(uuid.begin(), uuid.begin() + bytes_per_half, [&bits](std::uint8_t byte) {
    bits = (bits << bits_per_byte) | byte;
  });
  return bits;
}

auto least_significant_bits(const boost::uuids::uuid &uuid) -> std::uint64_t
{
  std::uint64_t bits = 0;
  std::for_each(uuid.begin() + bytes_per_half, uuid.end(), [&bits](std::uint8_t byte) {
    bits = (bits << bits_per_byte) | byte;
  });
  return bits;
}

auto from_standard_representation(std::string_view str) -> boost::uuids::uuid
{
  if (str.size() != standard_length) { throw_invalid(str); }

  for (std::size_t i = 0; i < str.size(); ++i) {
    if (is_dash_offset(i)) {
      if (str[i] != '-') { throw_invalid(str); }
    } else if (not is_hex_digit(str[i])) {
      throw_invalid(str);
    }
  }

  return assemble(str.substr(0, 8), str.substr(9, 4), str.substr(14, 4), str.substr(19, 4), str.substr(24, 12));
}

auto from_standard_representation(const char *str) -> boost::uuids::uuid
{
  if (str == nullptr) { throw core::null_input_error("str"); }
  return from_standard_representation(std::string_view{ str });
}

auto from_shortened_representation(std::string_view str) -> boost::uuids::uuid
{
  if (str.size() != shortened_length) { throw_invalid(str); }
  if (not std::all_of(str.begin(), str.end(), is_hex_digit)) { throw_invalid(str); }

  return assemble(str.substr(0, 8), str.substr(8, 4), str.substr(12, 4), str.substr(16, 4), str.substr(20, 12));
}

auto from_shortened_representation(const char *str) -> boost::uuids::uuid
{
  if (str == nullptr) { throw core::null_input_error("str"); }
  return from_shortened_representation(std::string_view{ str });
}

auto to_standard_representation(const boost::uuids::uuid &uuid) -> std::string
{
  return boost::uuids::to_string(uuid);
}

auto to_shortened_representation(const boost::uuids::uuid &uuid) -> std::string
{
  return fmt::format("{:016x}{:016x}", most_significant_bits(uuid), least_significant_bits(uuid));
}

}// namespace uuid_kit::codec
