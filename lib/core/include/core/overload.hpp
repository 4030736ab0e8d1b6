#pragma once

namespace uuid_kit::core {

/**
 * @brief Helper for std::visit with overload pattern.
 *
 * Lets a supplier variant be visited with one lambda per alternative:
 * @code
 * std::visit(overload{
 *   [](const discovered_strategy &strategy) { return strategy.describe(); },
 *   [](const auto &) -> std::string { return "other"; }
 * }, strategy_);
 * @endcode
 */
template<class... Ts> struct overload : Ts...
{
  using Ts::operator()...;
};

template<class... Ts> overload(Ts...) -> overload<Ts...>;

}// namespace uuid_kit::core
