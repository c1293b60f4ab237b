/**
 * @file dispatcher.hpp
 * @brief Concurrency and failure‑isolation core.
 *
 *   * **HandlerSlots**  – counting gate bounding in‑flight invocations.
 *   * **HandlerPool**   – fixed set of worker threads running invocations.
 *   * **Dispatcher**    – the consume loop: pulls messages in source
 *     order, resolves routes, and hands one invocation per matching
 *     route to the pool.
 *
 * Lifecycle: `Idle` → `Running` → `Draining` → `Stopped`.  The consume
 * loop blocks in exactly three places: waiting for the next message,
 * waiting for a free handler slot, and waiting for in‑flight handlers
 * while draining.
 */

#pragma once

#include "codec.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "message.hpp"
#include "message_queue.hpp"
#include "route_table.hpp"
#include "transport.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace mqroute {

enum class DispatcherState { Idle, Running, Draining, Stopped };

inline constexpr std::string_view to_string(DispatcherState state) {
    switch (state) {
    case DispatcherState::Idle:
        return "idle";
    case DispatcherState::Running:
        return "running";
    case DispatcherState::Draining:
        return "draining";
    case DispatcherState::Stopped:
        return "stopped";
    }
    return "unknown";
}

enum class DeliveryOutcome {
    Delivered,
    DecodeFailed,
    HandlerFailed,
    EncodeFailed,  ///< The handler's reply could not be encoded.
    PublishFailed, ///< The sink rejected the handler's reply.
};

inline constexpr std::string_view to_string(DeliveryOutcome outcome) {
    switch (outcome) {
    case DeliveryOutcome::Delivered:
        return "delivered";
    case DeliveryOutcome::DecodeFailed:
        return "decode-failed";
    case DeliveryOutcome::HandlerFailed:
        return "handler-failed";
    case DeliveryOutcome::EncodeFailed:
        return "encode-failed";
    case DeliveryOutcome::PublishFailed:
        return "publish-failed";
    }
    return "unknown";
}

/// Outcome of one (message, route) handler invocation.
struct DeliveryReport {
    std::string topic;
    std::string filter;
    PayloadTag payload_type = 0;
    DeliveryOutcome outcome = DeliveryOutcome::Delivered;
    std::size_t payload_length = 0;
    std::string error; ///< Empty when delivered.

    bool ok() const { return outcome == DeliveryOutcome::Delivered; }
};

using ReportCallback = std::function<void(const DeliveryReport&)>;

/// Snapshot of the dispatcher counters.
struct DispatcherStats {
    std::size_t received = 0;
    std::size_t unrouted = 0;
    std::size_t delivered = 0;
    std::size_t decode_failures = 0;
    std::size_t handler_failures = 0;
    std::size_t reply_failures = 0;
    std::size_t in_flight = 0;
};

// ==========================================================================
// HandlerSlots – concurrency bound
// ==========================================================================

class HandlerSlots {
  private:
    mutable std::mutex m_mutex;
    std::condition_variable m_changed;
    const std::size_t m_limit;
    std::size_t m_in_flight = 0;

  public:
    explicit HandlerSlots(std::size_t limit) : m_limit(limit) {
        if (m_limit == 0) {
            throw Error("handler concurrency limit must be at least 1");
        }
    }

    /// Block until a slot is free, then take it.
    void acquire() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_changed.wait(lock, [this] { return m_in_flight < m_limit; });
        ++m_in_flight;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            --m_in_flight;
        }
        m_changed.notify_all();
    }

    /// Block until no slot is taken.
    void wait_idle() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_changed.wait(lock, [this] { return m_in_flight == 0; });
    }

    std::size_t in_flight() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_in_flight;
    }
    std::size_t limit() const { return m_limit; }
};

// ==========================================================================
// HandlerPool – worker threads
// ==========================================================================

class HandlerPool {
  public:
    using Task = std::function<void()>;

  private:
    MessageQueue<Task> m_tasks;
    std::vector<std::thread> m_workers;
    std::atomic<bool> m_should_run{false};
    const std::size_t m_size;
    const std::chrono::milliseconds m_poll_interval;

    void work() {
        while (true) {
            if (auto task = m_tasks.pop_for(m_poll_interval)) {
                (*task)();
                continue;
            }
            if (!m_should_run.load(std::memory_order_acquire)) {
                break;
            }
        }
    }

  public:
    HandlerPool(std::size_t size, std::chrono::milliseconds poll_interval)
        : m_size(size), m_poll_interval(poll_interval) {}

    HandlerPool(const HandlerPool&) = delete;
    HandlerPool& operator=(const HandlerPool&) = delete;

    ~HandlerPool() { stop(); }

    void start() {
        m_should_run.store(true, std::memory_order_release);
        m_workers.reserve(m_size);
        for (std::size_t i = 0; i < m_size; ++i) {
            m_workers.emplace_back([this]() { work(); });
        }
    }

    void submit(Task task) {
        m_tasks.push(std::make_unique<Task>(std::move(task)));
    }

    /// Let workers finish queued tasks, then join them.
    void stop() {
        m_should_run.store(false, std::memory_order_release);
        m_tasks.notify_all();
        for (auto& worker : m_workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        m_workers.clear();
    }

    std::size_t size() const { return m_size; }
};

// ==========================================================================
// Dispatcher
// ==========================================================================

/**
 * @brief Pulls messages from a MessageSource and runs matching handlers.
 *
 * Each (message, route) pair is one isolated invocation: a decode
 * failure, a throwing handler or a failed reply only produces a failed
 * DeliveryReport for that pair.  Sibling invocations of the same message
 * run concurrently, as do invocations of different messages, up to
 * `max_concurrency`.
 *
 * The route table and codec registry must not change while the
 * dispatcher runs.  `stop()` must not be called from inside a handler.
 */
class Dispatcher {
  private:
    const RouteTable& m_routes;
    const CodecRegistry& m_codecs;
    MessageSource& m_source;
    MessageSink& m_sink;
    const DispatcherOptions m_options;
    ReportCallback m_on_report;

    HandlerSlots m_slots;
    HandlerPool m_pool;

    std::atomic<DispatcherState> m_state{DispatcherState::Idle};
    std::mutex m_state_mutex; ///< Pairs with m_stopped for wait().
    std::condition_variable m_stopped;
    std::mutex m_lifecycle_mutex; ///< Serialises start()/stop().
    std::thread m_thread;
    std::exception_ptr m_termination;

    std::atomic<std::size_t> m_received{0};
    std::atomic<std::size_t> m_unrouted{0};
    std::atomic<std::size_t> m_delivered{0};
    std::atomic<std::size_t> m_decode_failures{0};
    std::atomic<std::size_t> m_handler_failures{0};
    std::atomic<std::size_t> m_reply_failures{0};

    logging::Logger m_logger;

    /// Returns the slot taken for an invocation, whatever happens.
    class SlotGuard {
        HandlerSlots& m_slots;

      public:
        explicit SlotGuard(HandlerSlots& slots) : m_slots(slots) {}
        ~SlotGuard() { m_slots.release(); }
        SlotGuard(const SlotGuard&) = delete;
        SlotGuard& operator=(const SlotGuard&) = delete;
    };

    void set_stopped() {
        {
            std::lock_guard<std::mutex> lock(m_state_mutex);
            m_state.store(DispatcherState::Stopped, std::memory_order_release);
        }
        m_stopped.notify_all();
        MQROUTE_LOG_INFO(m_logger, "dispatcher stopped");
    }

    void run() {
        MQROUTE_LOG_INFO(m_logger,
                         "dispatcher running with max_concurrency={}",
                         m_slots.limit());
        while (m_state.load(std::memory_order_acquire) ==
               DispatcherState::Running) {
            std::optional<RawMessage> message;
            try {
                message = m_source.receive(m_options.receive_poll_interval);
            } catch (const SourceClosed& error) {
                MQROUTE_LOG_ERROR(m_logger, "message source closed: {}",
                                  error.what());
                m_termination = std::current_exception();
                break;
            } catch (const std::exception& error) {
                MQROUTE_LOG_ERROR(m_logger, "message source failed: {}",
                                  error.what());
                m_termination = std::make_exception_ptr(SourceClosed(
                    std::string("message source failed: ") + error.what()));
                break;
            }
            if (message) {
                dispatch(std::move(*message));
            }
        }
        drain();
    }

    void drain() {
        m_state.store(DispatcherState::Draining, std::memory_order_release);
        MQROUTE_LOG_INFO(m_logger, "draining {} in-flight handler(s)",
                         m_slots.in_flight());
        m_slots.wait_idle();
        m_pool.stop();
        set_stopped();
    }

    void dispatch(RawMessage&& message) {
        m_received.fetch_add(1, std::memory_order_relaxed);

        TopicType topic;
        try {
            topic = TopicType::parse(message.topic);
        } catch (const InvalidTopicError& error) {
            MQROUTE_LOG_WARNING(m_logger, "dropping message: {}",
                                error.what());
            m_unrouted.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        auto routes = m_routes.resolve(topic);
        if (routes.empty()) {
            MQROUTE_LOG_DEBUG(m_logger, "no route for topic \"{}\"",
                              message.topic);
            m_unrouted.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        auto shared = std::make_shared<const RawMessage>(std::move(message));
        for (const Route* route : routes) {
            auto parameters = route->filter.capture(topic);
            m_slots.acquire();
            m_pool.submit([this, shared, route,
                           parameters = std::move(parameters)]() {
                SlotGuard guard(m_slots);
                record(invoke(*route, *shared, parameters));
            });
        }
    }

    DeliveryReport invoke(const Route& route, const RawMessage& message,
                          const PathParameters& parameters) {
        DeliveryReport report{message.topic,
                              route.filter.pattern(),
                              route.payload_type,
                              DeliveryOutcome::Delivered,
                              message.payload.size(),
                              {}};

        std::any payload;
        try {
            payload = m_codecs.decode(route.payload_type, message.payload);
        } catch (const std::exception& error) {
            DecodeError decode_error(message.topic, message.payload.size(),
                                     error.what());
            report.outcome = DeliveryOutcome::DecodeFailed;
            report.error = decode_error.what();
            return report;
        } catch (...) {
            DecodeError decode_error(message.topic, message.payload.size(),
                                     "non-standard exception");
            report.outcome = DeliveryOutcome::DecodeFailed;
            report.error = decode_error.what();
            return report;
        }

        HandlerResult result;
        try {
            result = route.handler(message, parameters, payload);
        } catch (const std::exception& error) {
            report.outcome = DeliveryOutcome::HandlerFailed;
            report.error = HandlerError(error.what()).what();
            return report;
        } catch (...) {
            report.outcome = DeliveryOutcome::HandlerFailed;
            report.error = HandlerError("non-standard exception").what();
            return report;
        }

        if (!result.succeeded()) {
            report.outcome = DeliveryOutcome::HandlerFailed;
            report.error = result.error();
            return report;
        }
        if (result.outbound()) {
            forward(route, *result.outbound(), report);
        }
        return report;
    }

    /// Publish a handler's reply with the codec bound to its tag.
    void forward(const Route& route, const OutboundMessage& outbound,
                 DeliveryReport& report) {
        const auto tag = outbound.payload_type.value_or(route.payload_type);
        Bytes framed;
        try {
            TopicType::parse(outbound.topic);
            const auto* codec = m_codecs.find(tag);
            if (codec == nullptr) {
                throw EncodeError("no codec bound to payload tag " +
                                  std::to_string(tag));
            }
            framed = m_codecs.encode(*codec, outbound.payload);
        } catch (const Error& error) {
            report.outcome = DeliveryOutcome::EncodeFailed;
            report.error = error.what();
            return;
        } catch (...) {
            report.outcome = DeliveryOutcome::EncodeFailed;
            report.error = EncodeError("non-standard exception").what();
            return;
        }

        try {
            if (!m_sink.publish(outbound.topic, framed, outbound.qos,
                                outbound.retain)) {
                report.outcome = DeliveryOutcome::PublishFailed;
                report.error = "sink rejected reply on topic \"" +
                               outbound.topic + "\"";
            }
        } catch (const std::exception& error) {
            report.outcome = DeliveryOutcome::PublishFailed;
            report.error = error.what();
        } catch (...) {
            report.outcome = DeliveryOutcome::PublishFailed;
            report.error = "sink failed on topic \"" + outbound.topic +
                           "\": non-standard exception";
        }
    }

    void record(const DeliveryReport& report) {
        switch (report.outcome) {
        case DeliveryOutcome::Delivered:
            m_delivered.fetch_add(1, std::memory_order_relaxed);
            break;
        case DeliveryOutcome::DecodeFailed:
            m_decode_failures.fetch_add(1, std::memory_order_relaxed);
            MQROUTE_LOG_WARNING(m_logger, "{}", report.error);
            break;
        case DeliveryOutcome::HandlerFailed:
            m_handler_failures.fetch_add(1, std::memory_order_relaxed);
            MQROUTE_LOG_WARNING(m_logger,
                                "handler for \"{}\" failed on topic \"{}\" "
                                "with payload_length={}: {}",
                                report.filter, report.topic,
                                report.payload_length, report.error);
            break;
        case DeliveryOutcome::EncodeFailed:
        case DeliveryOutcome::PublishFailed:
            m_reply_failures.fetch_add(1, std::memory_order_relaxed);
            MQROUTE_LOG_WARNING(m_logger, "reply from \"{}\" failed: {}",
                                report.filter, report.error);
            break;
        }

        if (m_on_report) {
            try {
                m_on_report(report);
            } catch (const std::exception& error) {
                MQROUTE_LOG_ERROR(m_logger, "report callback threw: {}",
                                  error.what());
            } catch (...) {
                MQROUTE_LOG_ERROR(m_logger,
                                  "report callback threw a non-standard "
                                  "exception");
            }
        }
    }

  public:
    Dispatcher(const RouteTable& routes, const CodecRegistry& codecs,
               MessageSource& source, MessageSink& sink,
               DispatcherOptions options = {})
        : m_routes(routes), m_codecs(codecs), m_source(source), m_sink(sink),
          m_options(options), m_slots(options.max_concurrency),
          m_pool(options.max_concurrency, options.receive_poll_interval),
          m_logger(logging::create_logger("dispatcher")) {}

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    ~Dispatcher() { stop(); }

    /// Install the per‑invocation report callback. Only before start().
    void on_report(ReportCallback callback) {
        if (state() != DispatcherState::Idle) {
            throw AlreadyStartedError(
                "report callback must be set before start()");
        }
        m_on_report = std::move(callback);
    }

    /**
     * @brief `Idle` → `Running`; spawns the consume loop.
     * @throws AlreadyStartedError unless the dispatcher is `Idle`.
     */
    void start() {
        std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
        auto expected = DispatcherState::Idle;
        if (!m_state.compare_exchange_strong(expected,
                                             DispatcherState::Running)) {
            throw AlreadyStartedError(
                "dispatcher cannot start from state " +
                std::string(to_string(expected)));
        }
        m_pool.start();
        m_thread = std::thread([this]() { run(); });
    }

    /**
     * @brief Stop intake, wait for every in‑flight handler, then join.
     *
     * Idempotent; an `Idle` dispatcher goes straight to `Stopped`.
     */
    void stop() {
        std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
        auto expected = DispatcherState::Idle;
        if (m_state.compare_exchange_strong(expected,
                                            DispatcherState::Stopped)) {
            set_stopped();
            return;
        }
        expected = DispatcherState::Running;
        m_state.compare_exchange_strong(expected, DispatcherState::Draining);
        if (m_thread.joinable()) {
            m_thread.join();
        }
    }

    /**
     * @brief Block until `Stopped`.
     * @throws SourceClosed if the source ended the run.
     */
    void wait() {
        {
            std::unique_lock<std::mutex> lock(m_state_mutex);
            m_stopped.wait(lock, [this] {
                return m_state.load(std::memory_order_acquire) ==
                       DispatcherState::Stopped;
            });
        }
        if (m_termination) {
            std::rethrow_exception(m_termination);
        }
    }

    DispatcherState state() const {
        return m_state.load(std::memory_order_acquire);
    }

    DispatcherStats stats() const {
        DispatcherStats stats;
        stats.received = m_received.load(std::memory_order_relaxed);
        stats.unrouted = m_unrouted.load(std::memory_order_relaxed);
        stats.delivered = m_delivered.load(std::memory_order_relaxed);
        stats.decode_failures =
            m_decode_failures.load(std::memory_order_relaxed);
        stats.handler_failures =
            m_handler_failures.load(std::memory_order_relaxed);
        stats.reply_failures = m_reply_failures.load(std::memory_order_relaxed);
        stats.in_flight = m_slots.in_flight();
        return stats;
    }

    const DispatcherOptions& options() const { return m_options; }
};

} // namespace mqroute
