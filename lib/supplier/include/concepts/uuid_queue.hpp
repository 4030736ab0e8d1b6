#pragma once

#include <boost/uuid/uuid.hpp>
#include <concepts>
#include <optional>

namespace uuid_kit::concepts {

/**
 * @brief Concept for a queue a queue-based UUID supplier can drain.
 *
 * try_pop() removes and returns the head, or std::nullopt when empty. Thread
 * safety is whatever the queue type provides; async::async_queue<boost::uuids::uuid>
 * is safe for concurrent push and try_pop.
 */
template<typename T>
concept uuid_queue = requires(T &queue) {
  { queue.try_pop() } -> std::same_as<std::optional<boost::uuids::uuid>>;
};

}// namespace uuid_kit::concepts
