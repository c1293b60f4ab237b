/**
 * @file message.hpp
 * @brief Per‑delivery value types: raw and decoded messages, handler
 *        results and outbound replies.
 */

#pragma once

#include "qos.hpp"
#include "topic.hpp"

#include <any>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace mqroute {

using Bytes = std::vector<std::uint8_t>;        ///< Owned wire bytes.
using ByteView = std::span<const std::uint8_t>; ///< Borrowed wire bytes.
using PayloadTag = std::uint8_t; ///< One‑byte payload type identifier.

namespace detail {
template <typename T> struct payload_value {
    using type = T;
};
template <typename T>
    requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
struct payload_value<T> {
    using type = std::int64_t;
};
template <typename T>
    requires std::is_floating_point_v<T>
struct payload_value<T> {
    using type = double;
};
template <typename T>
    requires std::is_convertible_v<const T&, std::string_view>
struct payload_value<T> {
    using type = std::string;
};

/**
 * Type a published value travels as: string literals and views become
 * `std::string`, other integers `std::int64_t`, floats `double`.
 */
template <typename T>
using payload_value_t = typename payload_value<std::decay_t<T>>::type;
} // namespace detail

/// Delivery metadata attached to an inbound message by the source.
struct MessageMetadata {
    QoS qos = QoS::AtMostOnce;
    bool retain = false;
};

/**
 * @brief Inbound message exactly as produced by the message source.
 *
 * Consumed once by the dispatcher and discarded afterwards.
 */
struct RawMessage {
    std::string topic; ///< Concrete topic, never a filter.
    Bytes payload;
    MessageMetadata metadata;
};

/**
 * @brief A RawMessage together with its decoded payload and the path
 *        parameters captured by the route's filter.
 *
 * Only valid for the duration of one handler invocation.
 */
template <typename T> struct DecodedMessage {
    const RawMessage& raw;
    const T& payload;
    const PathParameters& parameters;

    const std::string& topic() const { return raw.topic; }
    QoS qos() const { return raw.metadata.qos; }
    bool retain() const { return raw.metadata.retain; }

    /// Level captured by `{name}`. @throws Error for an unknown name.
    const std::string& param(std::string_view name) const {
        return parameters.at(name);
    }
    /// Levels matched by the filter's trailing `#`.
    const std::string& wildcard() const { return parameters.wildcard(); }
};

/**
 * @brief Message a handler asks the dispatcher to publish on its behalf.
 *
 * When @ref payload_type is unset the tag of the route that produced the
 * reply is used for encoding.
 */
struct OutboundMessage {
    std::string topic;
    std::any payload;
    std::optional<PayloadTag> payload_type;
    QoS qos = QoS::AtLeastOnce;
    bool retain = false;
};

/// Options accepted by `Client::publish`.
struct PublishOptions {
    QoS qos = QoS::AtLeastOnce;
    bool retain = false;
};

/**
 * @brief Outcome of a single handler invocation.
 *
 * Either success (optionally with one outbound message) or a failure
 * description.  Handlers may also simply throw; the dispatcher converts
 * the exception into a failed result.
 */
class HandlerResult {
  private:
    bool m_ok = true;
    std::string m_error;
    std::optional<OutboundMessage> m_outbound;

  public:
    static HandlerResult ok() { return HandlerResult(); }

    /// Success carrying a reply published with the route's codec.
    template <typename T>
    static HandlerResult reply(std::string topic, T&& payload,
                               PublishOptions options = {}) {
        HandlerResult result;
        result.m_outbound = OutboundMessage{
            std::move(topic),
            std::any(detail::payload_value_t<T>(std::forward<T>(payload))),
            std::nullopt, options.qos, options.retain};
        return result;
    }

    /// Success carrying a fully specified outbound message.
    static HandlerResult reply(OutboundMessage message) {
        HandlerResult result;
        result.m_outbound = std::move(message);
        return result;
    }

    static HandlerResult failure(std::string error) {
        HandlerResult result;
        result.m_ok = false;
        result.m_error = std::move(error);
        return result;
    }

    bool succeeded() const { return m_ok; }
    const std::string& error() const { return m_error; }
    const std::optional<OutboundMessage>& outbound() const {
        return m_outbound;
    }
};

} // namespace mqroute
