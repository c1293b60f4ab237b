/**
 * @file client.hpp
 * @brief Public facade: route registration, lifecycle and publishing.
 */

#pragma once

#include "codec.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "message.hpp"
#include "route_table.hpp"
#include "topic.hpp"
#include "transport.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <typeindex>
#include <typeinfo>
#include <utility>

namespace mqroute {

/**
 * @brief Entry point for applications.
 *
 * The client owns its message source and sink, a codec registry
 * (pre‑loaded with the built‑in codecs), the route table and the
 * dispatcher.  Routes and codecs are registered while the client is
 * `Idle`; `start()` subscribes every route filter on the source and
 * starts consuming.  `publish()` works in every state.
 *
 * @code
 * auto broker = std::make_shared<mqroute::LoopbackBroker>();
 * mqroute::Client client(broker, broker);
 * client.route<std::string>("greet/+", [](const auto& msg) {
 *     return mqroute::HandlerResult::reply("greetings",
 *                                          "hello " + msg.payload);
 * });
 * client.start();
 * @endcode
 */
class Client {
  private:
    std::shared_ptr<MessageSource> m_source;
    std::shared_ptr<MessageSink> m_sink;
    const ClientOptions m_options;
    CodecRegistry m_codecs;
    RouteTable m_routes;
    Dispatcher m_dispatcher;
    logging::Logger m_logger;

    void ensure_idle(std::string_view operation) const {
        if (m_dispatcher.state() != DispatcherState::Idle) {
            throw AlreadyStartedError(
                std::string(operation) + " is only allowed before start()");
        }
    }

    PayloadTag tag_for(std::type_index type, std::string_view filter) const {
        const auto* codec = m_codecs.find(type);
        if (codec == nullptr) {
            throw CodecError("no codec bound for the payload type of route \"" +
                             std::string(filter) + "\"");
        }
        return codec->tag();
    }

    static std::shared_ptr<MessageSource>
    require(std::shared_ptr<MessageSource> source) {
        if (!source) {
            throw Error("client requires a message source");
        }
        return source;
    }

    static std::shared_ptr<MessageSink>
    require(std::shared_ptr<MessageSink> sink) {
        if (!sink) {
            throw Error("client requires a message sink");
        }
        return sink;
    }

  public:
    Client(std::shared_ptr<MessageSource> source,
           std::shared_ptr<MessageSink> sink, ClientOptions options = {})
        : m_source(require(std::move(source))),
          m_sink(require(std::move(sink))), m_options(options),
          m_codecs(CodecRegistry::with_builtins(options.max_payload_size)),
          m_dispatcher(m_routes, m_codecs, *m_source, *m_sink,
                       options.dispatcher),
          m_logger(logging::create_logger("client")) {}

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    ~Client() { stop(); }

    // -------------------------------------------------------------------
    // Registration – Idle only
    // -------------------------------------------------------------------

    /**
     * @brief Bind an additional codec.
     * @throws AlreadyStartedError after start(); CodecError on conflicts.
     */
    void add_codec(std::shared_ptr<const PayloadCodec> codec,
                   bool replace = false) {
        ensure_idle("add_codec()");
        m_codecs.add(std::move(codec), replace);
    }

    /**
     * @brief Register @p handler for payloads of type @p T on @p filter.
     *
     * The handler receives `const DecodedMessage<T>&` and returns `void`
     * or a HandlerResult.  Handlers are invoked concurrently.  A
     * `{name}` level of @p filter is subscribed as `+` and its value is
     * available as `message.param("name")`; the levels matched by a
     * trailing `#` are `message.wildcard()`.
     *
     * @throws AlreadyStartedError after start(), InvalidTopicError for a
     *         malformed filter, CodecError if no codec is bound to @p T,
     *         DuplicateRouteError if (filter, T) is already routed.
     */
    template <typename T, typename Handler>
    void route(std::string_view filter, Handler handler,
               QoS qos = QoS::AtMostOnce) {
        ensure_idle("route()");
        TopicFilter topic_filter(filter);
        const auto tag = tag_for(typeid(T), filter);
        m_routes.add(Route{std::move(topic_filter), tag,
                           detail::make_raw_handler<T>(std::move(handler)),
                           qos});
        MQROUTE_LOG_DEBUG(m_logger, "route \"{}\" registered for tag {}",
                          filter, tag);
    }

    /// Register an untyped handler for payload tag @p payload_type.
    void route(std::string_view filter, PayloadTag payload_type,
               RawHandler handler, QoS qos = QoS::AtMostOnce) {
        ensure_idle("route()");
        TopicFilter topic_filter(filter);
        if (m_codecs.find(payload_type) == nullptr) {
            throw CodecError("no codec bound to payload tag " +
                             std::to_string(payload_type));
        }
        m_routes.add(
            Route{std::move(topic_filter), payload_type, std::move(handler),
                  qos});
    }

    /**
     * @brief Register every declaration of @p router, in order.
     *
     * Stops at the first failing declaration; the ones before it stay
     * registered.
     */
    void include(const Router& router) {
        ensure_idle("include()");
        for (const auto& declaration : router.declarations()) {
            TopicFilter topic_filter(declaration.filter);
            const auto tag =
                tag_for(declaration.payload_type, declaration.filter);
            m_routes.add(Route{std::move(topic_filter), tag,
                               declaration.handler, declaration.qos});
        }
    }

    /// Observe every handler invocation outcome. Only before start().
    void on_report(ReportCallback callback) {
        ensure_idle("on_report()");
        m_dispatcher.on_report(std::move(callback));
    }

    // -------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------

    /**
     * @brief Subscribe all route filters and start dispatching.
     * @throws AlreadyStartedError unless Idle; SubscribeError if the
     *         source rejects a subscription (the client stays Idle).
     */
    void start() {
        ensure_idle("start()");
        for (const auto& subscription : m_routes.subscriptions()) {
            m_source->subscribe(subscription.filter, subscription.qos);
            MQROUTE_LOG_INFO(m_logger,
                             "subscribed to \"{}\" with qos={} ({})",
                             subscription.filter.to_string(),
                             static_cast<int>(subscription.qos),
                             to_string(subscription.qos));
        }
        m_dispatcher.start();
    }

    /// Drain and stop. Idempotent.
    void stop() { m_dispatcher.stop(); }

    /**
     * @brief Block until the dispatcher is Stopped.
     * @throws SourceClosed if the source ended the run.
     */
    void wait() { m_dispatcher.wait(); }

    DispatcherState state() const { return m_dispatcher.state(); }
    DispatcherStats stats() const { return m_dispatcher.stats(); }

    // -------------------------------------------------------------------
    // Publishing – any state
    // -------------------------------------------------------------------

    /**
     * @brief Encode @p value with the codec bound to its type and publish.
     * @throws InvalidTopicError, EncodeError, or PublishError if the sink
     *         rejects the message.
     */
    template <typename T>
    void publish(std::string_view topic, T&& value,
                 PublishOptions options = {}) {
        TopicType::parse(topic);
        auto framed = m_codecs.encode(std::forward<T>(value));
        const std::string topic_string(topic);
        if (!m_sink->publish(topic_string, framed, options.qos,
                             options.retain)) {
            MQROUTE_LOG_ERROR(m_logger,
                              "publish to topic=\"{}\" with qos={}, "
                              "retain={} failed",
                              topic_string, static_cast<int>(options.qos),
                              options.retain);
            throw PublishError("publish to topic \"" + topic_string +
                               "\" failed");
        }
        MQROUTE_LOG_DEBUG(m_logger,
                          "published to topic=\"{}\" with qos={}, retain={}: "
                          "{} bytes",
                          topic_string, static_cast<int>(options.qos),
                          options.retain, framed.size());
    }

    const CodecRegistry& codecs() const { return m_codecs; }
    const RouteTable& routes() const { return m_routes; }
    const ClientOptions& options() const { return m_options; }
};

} // namespace mqroute
