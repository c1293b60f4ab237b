/**
 * @file mqroute.hpp
 * @brief Header‑only topic routing and dispatch framework for MQTT.
 *
 * The framework sits above a raw MQTT connection and lets applications
 * register handlers against topic filters, exchange typed binary
 * payloads, and run handlers concurrently with bounded back‑pressure.
 *
 *   * **TopicFilter / matches** – MQTT `+` / `#` filter matching.
 *   * **CodecRegistry**         – tag‑keyed payload codecs; every payload
 *     travels as `[tag][body]`.
 *   * **RouteTable / Router**   – ordered (filter, payload tag, handler)
 *     registrations, optionally grouped under a prefix.
 *   * **Dispatcher**            – single consume loop plus a bounded pool
 *     of handler threads with per‑invocation failure isolation.
 *   * **Client**                – facade owning the message source and
 *     sink; registration, lifecycle and publishing.
 *
 * The MQTT connection itself is abstracted as MessageSource and
 * MessageSink; LoopbackBroker implements both in‑process.
 *
 * The code is header‑only and freestanding except for `Boost.Lockfree`,
 * (optionally) the `quill` logging library and, for ProtobufCodec only,
 * protobuf.
 *
 * @note All public types live inside the `mqroute` namespace.
 */

#pragma once

#include "client.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "message.hpp"
#include "message_queue.hpp"
#include "qos.hpp"
#include "route_table.hpp"
#include "topic.hpp"
#include "transport.hpp"
