/**
 * @file transport.hpp
 * @brief Collaborator interfaces towards the MQTT connection, plus an
 *        in‑process loopback broker implementing both of them.
 *
 * The routing core never speaks MQTT itself.  An adapter around a real
 * client library implements @ref MessageSource (inbound) and
 * @ref MessageSink (outbound); reconnection, TLS and authentication live
 * entirely inside that adapter.
 */

#pragma once

#include "errors.hpp"
#include "logging.hpp"
#include "message.hpp"
#include "message_queue.hpp"
#include "qos.hpp"
#include "topic.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mqroute {

/**
 * @brief Lazy, potentially infinite sequence of inbound messages.
 */
class MessageSource {
  public:
    virtual ~MessageSource() = default;

    /**
     * @brief Register interest in @p filter at the broker.
     * @throws SubscribeError if the subscription is rejected.
     */
    virtual void subscribe(const TopicFilter& filter, QoS qos) = 0;

    /**
     * @brief Wait up to @p timeout for the next message.
     * @return The message, or `std::nullopt` if none arrived in time.
     * @throws SourceClosed once the connection is gone for good.
     */
    virtual std::optional<RawMessage>
    receive(std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief Accepts outbound messages for publication.
 */
class MessageSink {
  public:
    virtual ~MessageSink() = default;

    /// @return `false` if the publish attempt failed.
    virtual bool publish(const std::string& topic, ByteView payload, QoS qos,
                         bool retain) = 0;
};

// ==========================================================================
// LoopbackBroker
// ==========================================================================

/**
 * @brief Minimal in‑process broker: whatever is published to it is
 *        delivered back to its own inbound queue when a subscribed filter
 *        matches.
 *
 * Intended for tests, examples and benchmarks.  Every publish is also
 * recorded so callers can inspect outbound traffic.
 */
class LoopbackBroker : public MessageSource, public MessageSink {
  public:
    struct Subscription {
        TopicFilter filter;
        QoS qos;
    };

  private:
    MessageQueue<RawMessage> m_inbound;
    std::atomic<bool> m_closed{false};
    std::atomic<bool> m_fail_publish{false};
    std::atomic<bool> m_fail_subscribe{false};

    mutable std::mutex m_mutex; ///< Guards subscriptions and the log.
    std::vector<Subscription> m_subscriptions;
    std::vector<RawMessage> m_published;

    logging::Logger m_logger;

    bool is_subscribed(const TopicType& topic) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& subscription : m_subscriptions) {
            if (matches(subscription.filter, topic)) {
                return true;
            }
        }
        return false;
    }

  public:
    LoopbackBroker() : m_logger(logging::create_logger("loopback-broker")) {}

    void subscribe(const TopicFilter& filter, QoS qos) override {
        if (m_fail_subscribe.load(std::memory_order_relaxed)) {
            throw SubscribeError("subscription to \"" + filter.to_string() +
                                 "\" rejected");
        }
        std::lock_guard<std::mutex> lock(m_mutex);
        m_subscriptions.push_back(Subscription{filter, qos});
        MQROUTE_LOG_DEBUG(m_logger, "subscribed to \"{}\" with qos={}",
                          filter.to_string(), static_cast<int>(qos));
    }

    std::optional<RawMessage>
    receive(std::chrono::milliseconds timeout) override {
        auto message = m_inbound.pop_for(timeout);
        if (message) {
            return std::move(*message);
        }
        if (m_closed.load(std::memory_order_acquire) && m_inbound.empty()) {
            throw SourceClosed("loopback broker closed");
        }
        return std::nullopt;
    }

    bool publish(const std::string& topic, ByteView payload, QoS qos,
                 bool retain) override {
        if (m_fail_publish.load(std::memory_order_relaxed)) {
            MQROUTE_LOG_WARNING(m_logger, "rejecting publish to \"{}\"",
                                topic);
            return false;
        }
        RawMessage message{topic, Bytes(payload.begin(), payload.end()),
                           MessageMetadata{qos, retain}};
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_published.push_back(message);
        }
        if (!m_closed.load(std::memory_order_acquire) &&
            is_subscribed(TopicType::parse(topic))) {
            m_inbound.push(std::make_unique<RawMessage>(std::move(message)));
        }
        return true;
    }

    /// Deliver @p message to the inbound queue regardless of subscriptions.
    void inject(RawMessage message) {
        m_inbound.push(std::make_unique<RawMessage>(std::move(message)));
    }

    /// Deliver already framed bytes on @p topic.
    void inject(std::string topic, Bytes payload,
                MessageMetadata metadata = {}) {
        inject(RawMessage{std::move(topic), std::move(payload), metadata});
    }

    /**
     * @brief Simulate connection loss: once the queued messages are
     *        consumed, @ref receive throws SourceClosed.
     */
    void close() {
        m_closed.store(true, std::memory_order_release);
        m_inbound.notify_all();
    }

    void set_publish_failure(bool fail) {
        m_fail_publish.store(fail, std::memory_order_relaxed);
    }
    void set_subscribe_failure(bool fail) {
        m_fail_subscribe.store(fail, std::memory_order_relaxed);
    }

    std::vector<Subscription> subscriptions() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_subscriptions;
    }

    std::vector<RawMessage> published() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_published;
    }

    std::size_t pending() const { return m_inbound.size(); }
};

} // namespace mqroute
