/**
 * @file config.hpp
 * @brief Library defaults and the option structs of the dispatcher and
 *        the client.
 */

#pragma once

#include <chrono>
#include <cstddef>

namespace mqroute {

namespace defaults {
/// Handler invocations allowed in flight at once.
inline constexpr std::size_t max_concurrency = 8;
/// Longest a blocking receive waits before the run loop re‑checks `stop()`.
inline constexpr std::chrono::milliseconds receive_poll_interval{50};
/// Largest accepted payload body (tag byte excluded), 1 MiB.
inline constexpr std::size_t max_payload_size = 1'048'576;
/// Capacity of the lock‑free ring in front of every message queue.
inline constexpr std::size_t fast_queue_size = 1024;
} // namespace defaults

/// Runtime knobs of the dispatcher.
struct DispatcherOptions {
    std::size_t max_concurrency = defaults::max_concurrency;
    std::chrono::milliseconds receive_poll_interval =
        defaults::receive_poll_interval;
};

/// Runtime knobs of the client facade.
struct ClientOptions {
    DispatcherOptions dispatcher;
    std::size_t max_payload_size = defaults::max_payload_size;
};

} // namespace mqroute
