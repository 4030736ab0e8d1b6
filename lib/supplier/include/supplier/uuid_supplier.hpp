#pragma once

#include <boost/uuid/uuid.hpp>
#include <concepts/uuid_queue.hpp>
#include <core/errors.hpp>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <supplier/service_registry.hpp>
#include <utility>
#include <variant>

namespace uuid_kit::supplier {

/**
 * @brief Returns a fresh random UUID on every call.
 */
struct random_strategy
{
  [[nodiscard]] auto operator()() const -> boost::uuids::uuid;
};

/**
 * @brief Returns the same UUID on every call.
 */
class fixed_strategy
{
public:
  explicit fixed_strategy(const boost::uuids::uuid &uuid) : uuid_(uuid) {}

  [[nodiscard]] auto operator()() const -> boost::uuids::uuid { return uuid_; }

private:
  boost::uuids::uuid uuid_;
};

/**
 * @brief Pops UUIDs from a shared queue, falling back to a constant when it is empty.
 */
class queue_strategy
{
public:
  queue_strategy(std::function<std::optional<boost::uuids::uuid>()> poll, const boost::uuids::uuid &empty_queue_value)
    : poll_(std::move(poll)), empty_queue_value_(empty_queue_value)
  {}

  [[nodiscard]] auto operator()() const -> boost::uuids::uuid;

private:
  std::function<std::optional<boost::uuids::uuid>()> poll_;
  boost::uuids::uuid empty_queue_value_;
};

/**
 * @brief Delegates to a registered service.
 *
 * Constructed with a service, it keeps using that service (cached). Constructed
 * with a discovery function, it runs discovery on every call and falls back to
 * random UUIDs whenever nothing is registered (non-caching).
 */
class discovered_strategy
{
public:
  explicit discovered_strategy(uuid_service service);
  explicit discovered_strategy(discovery_fn discover);

  discovered_strategy(const discovered_strategy &) = delete;
  auto operator=(const discovered_strategy &) -> discovered_strategy & = delete;
  discovered_strategy(discovered_strategy &&) = delete;
  auto operator=(discovered_strategy &&) -> discovered_strategy & = delete;
  ~discovered_strategy() = default;

  [[nodiscard]] auto operator()() const -> boost::uuids::uuid;

  [[nodiscard]] auto is_caching() const -> bool { return service_.has_value(); }

  [[nodiscard]] auto describe() const -> std::string;

private:
  std::optional<uuid_service> service_;
  discovery_fn discover_;
  mutable std::mutex last_used_mutex_;
  mutable std::string last_used_;
};

/**
 * @brief A UUID supplier: exactly one of the random, fixed, queue-based or discovered strategies.
 *
 * Handed out as uuid_supplier_ptr; callers compare handles by pointer identity.
 */
class uuid_supplier
{
public:
  using strategy_t = std::variant<random_strategy, fixed_strategy, queue_strategy, discovered_strategy>;

  template<typename Strategy, typename... Args>
  explicit uuid_supplier(std::in_place_type_t<Strategy> type, Args &&...args)
    : strategy_(type, std::forward<Args>(args)...)
  {}

  uuid_supplier(const uuid_supplier &) = delete;
  auto operator=(const uuid_supplier &) -> uuid_supplier & = delete;
  uuid_supplier(uuid_supplier &&) = delete;
  auto operator=(uuid_supplier &&) -> uuid_supplier & = delete;
  ~uuid_supplier() = default;

  /**
   * @brief Supplies the next UUID.
   */
  [[nodiscard]] auto get() const -> boost::uuids::uuid;

  [[nodiscard]] auto operator()() const -> boost::uuids::uuid { return get(); }

  /**
   * @brief Human-readable name of the supplier, e.g. "fixed_uuid_supplier".
   */
  [[nodiscard]] auto describe() const -> std::string;

  template<typename Strategy> [[nodiscard]] auto holds() const -> bool
  {
    return std::holds_alternative<Strategy>(strategy_);
  }

private:
  strategy_t strategy_;
};

using uuid_supplier_ptr = std::shared_ptr<const uuid_supplier>;

/**
 * @brief Returns the process-wide supplier of random UUIDs.
 *
 * Every call returns the same handle.
 */
[[nodiscard]] auto random_uuid_supplier() -> uuid_supplier_ptr;

/**
 * @brief Returns a new supplier that always yields uuid.
 */
[[nodiscard]] auto fixed_uuid_supplier(const boost::uuids::uuid &uuid) -> uuid_supplier_ptr;

/**
 * @brief Returns a new supplier that pops UUIDs from uuid_queue.
 *
 * The queue is shared, not copied: values pushed after construction are seen by
 * the supplier. No locking is added around the queue.
 *
 * @param uuid_queue Queue to pop from
 * @param empty_queue_value UUID returned whenever the queue is empty
 * @throws core::null_input_error if uuid_queue is null
 */
template<concepts::uuid_queue Queue>
[[nodiscard]] auto queue_based_uuid_supplier(std::shared_ptr<Queue> uuid_queue,
  const boost::uuids::uuid &empty_queue_value) -> uuid_supplier_ptr
{
  if (not uuid_queue) { throw core::null_input_error("uuid_queue"); }

  return std::make_shared<uuid_supplier>(
    std::in_place_type<queue_strategy>,
    [queue = std::move(uuid_queue)]() -> std::optional<boost::uuids::uuid> { return queue->try_pop(); },
    empty_queue_value);
}

}// namespace uuid_kit::supplier
