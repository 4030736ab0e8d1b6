#include <supplier/default_supplier.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <core/errors.hpp>
#include <platform/env_utils.hpp>
#include <spdlog/spdlog.h>

namespace uuid_kit::supplier {

auto parse_caching_mode(const std::optional<std::string> &value) -> caching_mode
{
  if (value.has_value() and boost::algorithm::iequals(*value, "false")) { return caching_mode::non_cached; }
  return caching_mode::cached;
}

default_supplier_holder::default_supplier_holder(discovery_fn discover, caching_setting_fn read_caching_setting)
  : discover_(std::move(discover)), read_caching_setting_(std::move(read_caching_setting))
{
  if (not discover_) { throw core::null_input_error("discover"); }
  if (not read_caching_setting_) { throw core::null_input_error("read_caching_setting"); }
}

auto default_supplier_holder::get() -> uuid_supplier_ptr
{
  if (initialized_.load(std::memory_order_acquire)) { return supplier_; }

  const std::scoped_lock lock(init_mutex_);
  if (not initialized_.load(std::memory_order_relaxed)) { initialize(); }
  return supplier_;
}

auto default_supplier_holder::caching() const -> std::optional<caching_mode>
{
  if (not initialized_.load(std::memory_order_acquire)) { return std::nullopt; }
  return mode_;
}

auto default_supplier_holder::initialize() -> void
{
  const auto mode = parse_caching_mode(read_caching_setting_());

  if (mode == caching_mode::non_cached) {
    spdlog::info("[default_supplier] Caching disabled, discovering supplier on every call");
    supplier_ = std::make_shared<uuid_supplier>(std::in_place_type<discovered_strategy>, discover_);
  } else if (auto service = discover_(); service.has_value()) {
    spdlog::info("[default_supplier] Using registered service: {}", service->name);
    supplier_ = std::make_shared<uuid_supplier>(std::in_place_type<discovered_strategy>, std::move(*service));
  } else {
    spdlog::debug("[default_supplier] No service registered, using random_uuid_supplier");
    supplier_ = random_uuid_supplier();
  }

  mode_ = mode;
  initialized_.store(true, std::memory_order_release);
}

auto get_default() -> uuid_supplier_ptr
{
  static default_supplier_holder holder(
    discover_registered_service, []() { return platform::get_environment_variable(cached_setting_name); });
  return holder.get();
}

}// namespace uuid_kit::supplier
