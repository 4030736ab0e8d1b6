#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <supplier/service_registry.hpp>
#include <supplier/uuid_supplier.hpp>

namespace uuid_kit::supplier {

/// Environment variable deciding whether the discovered supplier is cached
constexpr auto cached_setting_name = "UUID_KIT_SUPPLIER_DEFAULT_CACHED";

enum class caching_mode : std::uint8_t {
  cached,
  non_cached,
};

/**
 * @brief Reads the raw caching setting; std::nullopt when unset.
 */
using caching_setting_fn = std::function<std::optional<std::string>()>;

/**
 * @brief Interprets the caching setting.
 *
 * Only a case-insensitive "false" disables caching; an unset or any other value
 * keeps it enabled.
 */
[[nodiscard]] auto parse_caching_mode(const std::optional<std::string> &value) -> caching_mode;

/**
 * @brief Lazily chooses the default UUID supplier, exactly once.
 *
 * On the first get() the caching setting is read. Cached: discovery runs once and
 * the found service (or the random supplier) is kept for the holder's lifetime.
 * Non-cached: the kept supplier re-runs discovery on every call.
 *
 * Concurrent first calls initialize once; every caller gets the same handle. If
 * discovery or the setting reader throws, the exception reaches the caller and the
 * next get() tries again.
 */
class default_supplier_holder
{
public:
  /**
   * @throws core::null_input_error if either function is empty
   */
  default_supplier_holder(discovery_fn discover, caching_setting_fn read_caching_setting);

  default_supplier_holder(const default_supplier_holder &) = delete;
  auto operator=(const default_supplier_holder &) -> default_supplier_holder & = delete;
  default_supplier_holder(default_supplier_holder &&) = delete;
  auto operator=(default_supplier_holder &&) -> default_supplier_holder & = delete;
  ~default_supplier_holder() = default;

  [[nodiscard]] auto get() -> uuid_supplier_ptr;

  /**
   * @brief The mode chosen at initialization, or std::nullopt before the first get().
   */
  [[nodiscard]] auto caching() const -> std::optional<caching_mode>;

private:
  auto initialize() -> void;

  discovery_fn discover_;
  caching_setting_fn read_caching_setting_;
  std::mutex init_mutex_;
  uuid_supplier_ptr supplier_;
  caching_mode mode_{ caching_mode::cached };
  std::atomic<bool> initialized_{ false };
};

/**
 * @brief Returns the process-wide default UUID supplier.
 *
 * The first service of service_registry::instance() is used, otherwise random
 * UUIDs. Set UUID_KIT_SUPPLIER_DEFAULT_CACHED=false before the first call to look
 * the service up again on every call; the setting is read once per process.
 *
 * @code
 * auto id = uuid_kit::supplier::get_default()->get();
 * @endcode
 */
[[nodiscard]] auto get_default() -> uuid_supplier_ptr;

}// namespace uuid_kit::supplier
