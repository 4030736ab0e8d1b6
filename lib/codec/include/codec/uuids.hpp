#pragma once

#include <boost/uuid/uuid.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace uuid_kit::codec {

/// Length of "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"
constexpr std::size_t standard_length = 36;
/// Number of dashes in the standard representation
constexpr std::size_t standard_dash_count = 4;
/// Length of "xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx"
constexpr std::size_t shortened_length = standard_length - standard_dash_count;

/**
 * @brief Builds a UUID from its most and least significant 64-bit halves.
 *
 * @param most_sig_bits Bytes 0..7 of the UUID, big-endian
 * @param least_sig_bits Bytes 8..15 of the UUID, big-endian
 * @return The UUID
 */
[[nodiscard]] auto make_uuid(std::uint64_t most_sig_bits, std::uint64_t least_sig_bits) -> boost::uuids::uuid;

/**
 * @brief Returns bytes 0..7 of the UUID as a big-endian 64-bit value.
 */
[[nodiscard]] auto most_significant_bits(const boost::uuids::uuid &uuid) -> std::uint64_t;

/**
 * @brief Returns bytes 8..15 of the UUID as a big-endian 64-bit value.
 */
[[nodiscard]] auto least_significant_bits(const boost::uuids::uuid &uuid) -> std::uint64_t;

/**
 * @brief Creates a UUID from the standard string representation.
 *
 * Accepts exactly `time_low "-" time_mid "-" time_high_and_version "-" variant_and_sequence "-" node`
 * with 8-4-4-4-12 hex digits. Hex digits are case-insensitive.
 *
 * @param str String of the form "85a8b17f-8ca5-4061-aeb6-2f8a1a3bb60b"
 * @return The UUID
 * @throws core::invalid_format_error if str does not conform to the standard representation
 */
[[nodiscard]] auto from_standard_representation(std::string_view str) -> boost::uuids::uuid;

/**
 * @brief Creates a UUID from the standard string representation.
 *
 * @throws core::null_input_error if str is null
 * @throws core::invalid_format_error if str does not conform to the standard representation
 */
[[nodiscard]] auto from_standard_representation(const char *str) -> boost::uuids::uuid;

/**
 * @brief Creates a UUID from the shortened (undashed) string representation.
 *
 * @param str String of 32 hex digits, e.g. "85a8b17f8ca54061aeb62f8a1a3bb60b"
 * @return The UUID
 * @throws core::invalid_format_error if str does not conform to the shortened representation
 */
[[nodiscard]] auto from_shortened_representation(std::string_view str) -> boost::uuids::uuid;

/**
 * @brief Creates a UUID from the shortened (undashed) string representation.
 *
 * @throws core::null_input_error if str is null
 * @throws core::invalid_format_error if str does not conform to the shortened representation
 */
[[nodiscard]] auto from_shortened_representation(const char *str) -> boost::uuids::uuid;

/**
 * @brief Returns the standard string representation of the UUID.
 *
 * @return Lowercase dashed form as produced by boost::uuids::to_string
 */
[[nodiscard]] auto to_standard_representation(const boost::uuids::uuid &uuid) -> std::string;

/**
 * @brief Returns the shortened string representation of the UUID.
 *
 * @return 32 lowercase hex digits
 */
[[nodiscard]] auto to_shortened_representation(const boost::uuids::uuid &uuid) -> std::string;

}// namespace uuid_kit::codec
