/**
 * @file errors.hpp
 * @brief Exception taxonomy of the routing core.
 *
 * Registration and facade misuse errors are thrown synchronously to the
 * caller.  Errors raised inside a single handler invocation
 * (@ref DecodeError, @ref HandlerError) never leave the dispatcher; they
 * are turned into a failed delivery report instead.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace mqroute {

/// Common base of every mqroute exception.
class Error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/// A topic or topic filter string violates MQTT topic syntax.
class InvalidTopicError : public Error {
  public:
    using Error::Error;
};

/// The exact (filter, payload tag) pair is already registered.
class DuplicateRouteError : public Error {
  public:
    using Error::Error;
};

/// Registration or start attempted after the dispatcher left `Idle`.
class AlreadyStartedError : public Error {
  public:
    using Error::Error;
};

/// Codec registration conflict or malformed payload body.
class CodecError : public Error {
  public:
    using Error::Error;
};

/**
 * @brief Inbound payload could not be decoded for a route.
 *
 * Carries the topic and the raw payload length so that reports never
 * have to keep the payload itself alive.
 */
class DecodeError : public Error {
    std::string m_topic;
    std::size_t m_payload_length;

  public:
    DecodeError(std::string topic, std::size_t payload_length,
                const std::string& reason)
        : Error("cannot decode payload on topic \"" + topic + "\" (" +
                std::to_string(payload_length) + " bytes): " + reason),
          m_topic(std::move(topic)), m_payload_length(payload_length) {}

    const std::string& topic() const { return m_topic; }
    std::size_t payload_length() const { return m_payload_length; }
};

/// Typed message could not be encoded for its declared payload type.
class EncodeError : public Error {
  public:
    using Error::Error;
};

/// Wraps whatever a handler threw.
class HandlerError : public Error {
  public:
    using Error::Error;
};

/// The message sink rejected an outbound message.
class PublishError : public Error {
  public:
    using Error::Error;
};

/// The message source rejected a subscription.
class SubscribeError : public Error {
  public:
    using Error::Error;
};

/// The message source lost its connection; fatal to the dispatcher run.
class SourceClosed : public Error {
  public:
    using Error::Error;
    SourceClosed() : Error("message source closed") {}
};

} // namespace mqroute
