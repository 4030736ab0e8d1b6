#pragma once

#include <optional>
#include <string>

namespace uuid_kit::platform {

/**
 * @brief Reads an environment variable.
 *
 * @param name Variable name
 * @return The value, or std::nullopt if the variable is not set
 */
[[nodiscard]] auto get_environment_variable(const std::string &name) -> std::optional<std::string>;

}// namespace uuid_kit::platform
