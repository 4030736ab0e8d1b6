#include <supplier/service_registry.hpp>

#include <algorithm>
#include <core/errors.hpp>
#include <spdlog/spdlog.h>
#include <utility>

namespace uuid_kit::supplier {

namespace {

  auto require_generate(const uuid_service &service) -> void
  {
    if (not service.generate) { throw core::null_input_error("generate"); }
  }

}// namespace

auto service_registry::instance() -> service_registry &
{
  static service_registry registry;
  return registry;
}

auto service_registry::register_service(uuid_service service) -> void
{
  require_generate(service);

  const std::scoped_lock lock(mutex_);
  spdlog::debug("[service_registry] Registered service: {}", service.name);
  services_.push_back(std::move(service));
}

auto service_registry::set_services(std::vector<uuid_service> services) -> void
{
  std::for_each(services.begin(), services.end(), require_generate);

  const std::scoped_lock lock(mutex_);
  spdlog::debug("[service_registry] Installed {} service(s)", services.size());
  services_ = std::move(services);
}

auto service_registry::clear() -> void
{
  const std::scoped_lock lock(mutex_);
  services_.clear();
}

auto service_registry::find_first() const -> std::optional<uuid_service>
{
  const std::scoped_lock lock(mutex_);
  if (services_.empty()) { return std::nullopt; }
  return services_.front();
}

auto service_registry::find_all() const -> std::vector<uuid_service>
{
  const std::scoped_lock lock(mutex_);
  return services_;
}

auto discover_registered_service() -> std::optional<uuid_service>
{
  return service_registry::instance().find_first();
}

}// namespace uuid_kit::supplier
