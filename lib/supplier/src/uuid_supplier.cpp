#include <supplier/uuid_supplier.hpp>

#include <boost/uuid/random_generator.hpp>
#include <core/overload.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace uuid_kit::supplier {

namespace {

  constexpr auto random_supplier_name = "random_uuid_supplier";

}// namespace

auto random_strategy::operator()() const -> boost::uuids::uuid
{
  static thread_local boost::uuids::random_generator gen;
  return gen();
}

auto queue_strategy::operator()() const -> boost::uuids::uuid
{
  auto uuid = poll_();
  return uuid.has_value() ? *uuid : empty_queue_value_;
}

discovered_strategy::discovered_strategy(uuid_service service) : service_(std::move(service))
{
  if (not service_->generate) { throw core::null_input_error("generate"); }
}

discovered_strategy::discovered_strategy(discovery_fn discover)
  : discover_(std::move(discover)), last_used_("uninitialized - call get() first")
{
  if (not discover_) { throw core::null_input_error("discover"); }
}

auto discovered_strategy::operator()() const -> boost::uuids::uuid
{
  if (service_.has_value()) { return service_->generate(); }

  auto service = discover_();
  if (service.has_value() and not service->generate) { throw core::null_input_error("generate"); }

  const std::string used = service.has_value() ? service->name : random_supplier_name;
  spdlog::trace("[discovered_supplier] Discovered supplier: {}", used);

  {
    const std::scoped_lock lock(last_used_mutex_);
    last_used_ = used;
  }

  if (service.has_value()) { return service->generate(); }
  return random_strategy{}();
}

auto discovered_strategy::describe() const -> std::string
{
  if (service_.has_value()) { return fmt::format("discovered_uuid_supplier({})", service_->name); }

  const std::scoped_lock lock(last_used_mutex_);
  return fmt::format("non_caching_uuid_supplier({})", last_used_);
}

auto uuid_supplier::get() const -> boost::uuids::uuid
{
  return std::visit([](const auto &strategy) { return strategy(); }, strategy_);
}

auto uuid_supplier::describe() const -> std::string
{
  return std::visit(core::overload{ [](const random_strategy & /*strategy*/) -> std::string { return random_supplier_name; },
                      [](const fixed_strategy & /*strategy*/) -> std::string { return "fixed_uuid_supplier"; },
                      [](const queue_strategy & /*strategy*/) -> std::string { return "queue_based_uuid_supplier"; },
                      [](const discovered_strategy &strategy) -> std::string { return strategy.describe(); } },
    strategy_);
}

auto random_uuid_supplier() -> uuid_supplier_ptr
{
  static const uuid_supplier_ptr instance = std::make_shared<uuid_supplier>(std::in_place_type<random_strategy>);
  return instance;
}

auto fixed_uuid_supplier(const boost::uuids::uuid &uuid) -> uuid_supplier_ptr
{
  return std::make_shared<uuid_supplier>(std::in_place_type<fixed_strategy>, uuid);
}

}// namespace uuid_kit::supplier
