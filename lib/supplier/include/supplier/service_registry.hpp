#pragma once

#include <boost/uuid/uuid.hpp>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace uuid_kit::supplier {

/**
 * @brief An externally registered UUID supplier implementation.
 */
struct uuid_service
{
  std::string name;
  std::function<boost::uuids::uuid()> generate;
};

/**
 * @brief Looks up the registered supplier service to use, if any.
 *
 * Returns at most one service; std::nullopt when nothing is registered.
 */
using discovery_fn = std::function<std::optional<uuid_service>()>;

/**
 * @brief Ordered, thread-safe list of registered UUID supplier services.
 *
 * The process-wide instance is the discovery mechanism behind get_default().
 * Services are visible to discovery in registration order; discovery uses the
 * first one.
 */
class service_registry
{
public:
  service_registry() = default;

  service_registry(const service_registry &) = delete;
  auto operator=(const service_registry &) -> service_registry & = delete;
  service_registry(service_registry &&) = delete;
  auto operator=(service_registry &&) -> service_registry & = delete;
  ~service_registry() = default;

  /**
   * @brief Returns the process-wide registry.
   */
  [[nodiscard]] static auto instance() -> service_registry &;

  /**
   * @brief Appends a service.
   *
   * @throws core::null_input_error if service.generate is empty
   */
  auto register_service(uuid_service service) -> void;

  /**
   * @brief Replaces all registered services.
   *
   * @param services New services, in discovery order; empty clears the registry
   * @throws core::null_input_error if any generate function is empty
   */
  auto set_services(std::vector<uuid_service> services) -> void;

  auto clear() -> void;

  [[nodiscard]] auto find_first() const -> std::optional<uuid_service>;

  [[nodiscard]] auto find_all() const -> std::vector<uuid_service>;

private:
  mutable std::mutex mutex_;
  std::vector<uuid_service> services_;
};

/**
 * @brief Production discovery: the first service of service_registry::instance().
 */
[[nodiscard]] auto discover_registered_service() -> std::optional<uuid_service>;

}// namespace uuid_kit::supplier
