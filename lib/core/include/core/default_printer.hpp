#pragma once

#include <fmt/core.h>
#include <utility>

namespace uuid_kit::core {

/**
 * @brief Printer writing to stdout through fmt.
 */
class default_printer
{
public:
  template<typename... Args> auto print(fmt::format_string<Args...> format_string, Args &&...args) const -> void
  {
    fmt::print(format_string, std::forward<Args>(args)...);
  }
};

}// namespace uuid_kit::core
