#pragma once

#include <stdexcept>
#include <string>

namespace uuid_kit::core {

/**
 * @brief Thrown when a required argument is absent (null pointer, empty callable).
 *
 * The message names the missing argument.
 */
class null_input_error : public std::invalid_argument
{
public:
  explicit null_input_error(const std::string &argument_name) : std::invalid_argument(argument_name) {}
};

/**
 * @brief Thrown when a string does not conform to the UUID representation it claims.
 *
 * The message embeds the offending input verbatim: "Invalid UUID string: <input>".
 */
class invalid_format_error : public std::invalid_argument
{
public:
  explicit invalid_format_error(const std::string &message) : std::invalid_argument(message) {}
};

}// namespace uuid_kit::core
