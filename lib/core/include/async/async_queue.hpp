#pragma once

#include <atomic>
#include <boost/asio/experimental/concurrent_channel.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>
#include <cstddef>
#include <optional>
#include <tuple>
#include <utility>

namespace uuid_kit::async {

/**
 * @brief Thread-safe queue backed by a Boost.Asio concurrent channel.
 *
 * @tparam T The type of elements stored in the queue
 *
 * Any number of threads may push and try_pop concurrently; neither call blocks.
 * Shared through std::shared_ptr, an async_queue<boost::uuids::uuid> is the
 * queue behind a queue-based UUID supplier: the caller keeps pushing into the
 * same instance the supplier pops from.
 */
template<typename T> class async_queue
{
public:
  /// Maximum number of elements the queue can hold
  static constexpr std::size_t channel_size{ 1024 };

  async_queue() : channel_(io_context_, channel_size), size_(0) {}

  async_queue(const async_queue &) = delete;
  auto operator=(const async_queue &) -> async_queue & = delete;
  async_queue(async_queue &&) = delete;
  auto operator=(async_queue &&) -> async_queue & = delete;
  ~async_queue() = default;

  /**
   * @brief Pushes a value onto the queue (non-blocking).
   *
   * @param value The value to push (moved into the queue)
   * @return false if the queue is full or closed and the value was dropped
   */
  auto push(T value) -> bool
  {
    ++size_;
    if (not channel_.try_send(boost::system::error_code{}, std::move(value))) {
      --size_;
      return false;
    }
    return true;
  }

  /**
   * @brief Removes the head of the queue without blocking.
   *
   * @return The head element, or std::nullopt if the queue is empty or closed
   */
  auto try_pop() -> std::optional<T>
  {
    std::optional<T> value;
    // A closed channel still invokes the handler, with channel_closed and a default T.
    std::ignore = channel_.try_receive([&value](boost::system::error_code err, T rx_value) {
      if (not err) { value.emplace(std::move(rx_value)); }
    });

    if (value.has_value()) { --size_; }
    return value;
  }

  [[nodiscard]] auto empty() const -> bool { return size_.load() == 0; }

  [[nodiscard]] auto size() const -> std::size_t { return size_.load(); }

  /**
   * @brief Closes the queue; later pushes are dropped and try_pop yields nothing.
   */
  auto close() -> void { channel_.close(); }

private:
  // Only the non-blocking try_ operations are used, so this context is never run.
  boost::asio::io_context io_context_;
  boost::asio::experimental::concurrent_channel<void(boost::system::error_code, T)> channel_;
  std::atomic<std::size_t> size_;
};

}// namespace uuid_kit::async
