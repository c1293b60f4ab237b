/**
 * @file route_table.hpp
 * @brief Ordered route registrations and prefix‑scoped routers.
 */

#pragma once

#include "errors.hpp"
#include "message.hpp"
#include "qos.hpp"
#include "topic.hpp"

#include <any>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <utility>
#include <vector>

namespace mqroute {

/// Type‑erased handler: the raw message, its path parameters and its
/// decoded payload.
using RawHandler = std::function<HandlerResult(
    const RawMessage&, const PathParameters&, const std::any&)>;

/**
 * @brief One (filter, payload tag, handler) registration.
 *
 * Identity is the (filter, payload_type) pair.
 */
struct Route {
    TopicFilter filter;
    PayloadTag payload_type;
    RawHandler handler;
    QoS qos = QoS::AtMostOnce; ///< Requested subscription QoS.
};

/// A filter the source must be subscribed to, with its strongest QoS.
struct Subscription {
    TopicFilter filter;
    QoS qos;
};

namespace detail {
/**
 * Wrap a typed handler taking `const DecodedMessage<T>&` and returning
 * either `void` or `HandlerResult`.
 */
template <typename T, typename Handler>
RawHandler make_raw_handler(Handler handler) {
    using Result = std::invoke_result_t<const Handler&,
                                        const DecodedMessage<T>&>;
    static_assert(std::is_void_v<Result> ||
                      std::is_same_v<Result, HandlerResult>,
                  "route handlers must return void or HandlerResult");

    return [handler = std::move(handler)](const RawMessage& raw,
                                          const PathParameters& parameters,
                                          const std::any& payload) {
        DecodedMessage<T> message{raw, std::any_cast<const T&>(payload),
                                  parameters};
        if constexpr (std::is_void_v<Result>) {
            handler(message);
            return HandlerResult::ok();
        } else {
            return handler(message);
        }
    };
}
} // namespace detail

// ==========================================================================
// RouteTable
// ==========================================================================

/**
 * @brief Registration‑ordered collection of routes.
 *
 * Routes are only added during start‑up; once the dispatcher runs the
 * table is read concurrently without locking.
 */
class RouteTable {
  private:
    std::vector<Route> m_routes;

  public:
    /**
     * @brief Append @p route.
     * @throws DuplicateRouteError if (filter, payload_type) exists.
     */
    void add(Route route) {
        if (contains(route.filter, route.payload_type)) {
            throw DuplicateRouteError(
                "route for filter \"" + route.filter.to_string() +
                "\" with payload tag " + std::to_string(route.payload_type) +
                " is already registered");
        }
        m_routes.push_back(std::move(route));
    }

    bool contains(const TopicFilter& filter, PayloadTag payload_type) const {
        for (const auto& route : m_routes) {
            if (route.payload_type == payload_type && route.filter == filter) {
                return true;
            }
        }
        return false;
    }

    /// @return All routes matching @p topic, in registration order.
    std::vector<const Route*> resolve(const TopicType& topic) const {
        std::vector<const Route*> matched;
        for (const auto& route : m_routes) {
            if (matches(route.filter, topic)) {
                matched.push_back(&route);
            }
        }
        return matched;
    }

    std::vector<const Route*> resolve(std::string_view topic) const {
        return resolve(TopicType::parse(topic));
    }

    /**
     * @return Distinct filters in first‑registration order, each with the
     *         highest QoS any of its routes asked for.
     */
    std::vector<Subscription> subscriptions() const {
        std::vector<Subscription> result;
        for (const auto& route : m_routes) {
            bool merged = false;
            for (auto& subscription : result) {
                if (subscription.filter == route.filter) {
                    if (route.qos > subscription.qos) {
                        subscription.qos = route.qos;
                    }
                    merged = true;
                    break;
                }
            }
            if (!merged) {
                result.push_back(Subscription{route.filter, route.qos});
            }
        }
        return result;
    }

    std::size_t size() const { return m_routes.size(); }
    bool empty() const { return m_routes.empty(); }

    auto begin() const { return m_routes.begin(); }
    auto end() const { return m_routes.end(); }
};

// ==========================================================================
// Router – prefix‑scoped route declarations
// ==========================================================================

/**
 * @brief Group of route declarations sharing a topic prefix.
 *
 * Declarations are only bound to payload tags (and checked for
 * duplicates) when the router is included into a Client.
 *
 * @code
 * mqroute::Router sensors("sensors");
 * sensors.route<double>("{room}/temperature", [](const auto& msg) {
 *     record(msg.param("room"), msg.payload);
 * });
 * client.include(sensors); // subscribes "sensors/+/temperature"
 * @endcode
 */
class Router {
  public:
    struct Declaration {
        std::string filter;
        std::type_index payload_type;
        RawHandler handler;
        QoS qos;
    };

  private:
    std::string m_prefix;
    std::vector<Declaration> m_declarations;

  public:
    explicit Router(std::string prefix = "") : m_prefix(std::move(prefix)) {
        if (!m_prefix.empty()) {
            TopicFilter validated(m_prefix);
            if (validated.segments().size() > 0 &&
                std::holds_alternative<MultiLevelWildcard>(
                    validated.segments().back())) {
                throw InvalidTopicError("router prefix \"" + m_prefix +
                                        "\" must not end with '#'");
            }
        }
    }

    const std::string& prefix() const { return m_prefix; }

    /// @return @p filter with this router's prefix prepended.
    std::string full_filter(std::string_view filter) const {
        if (m_prefix.empty()) {
            return std::string(filter);
        }
        return m_prefix + topic_separator + std::string(filter);
    }

    /**
     * @brief Declare a typed route below this router's prefix.
     *
     * Parameter names must be unique across prefix and filter.
     * @throws InvalidTopicError if the combined filter is malformed.
     */
    template <typename T, typename Handler>
    Router& route(std::string_view filter, Handler handler,
                  QoS qos = QoS::AtMostOnce) {
        auto full = full_filter(filter);
        TopicFilter validated(full);
        m_declarations.push_back(
            Declaration{std::move(full), std::type_index(typeid(T)),
                        detail::make_raw_handler<T>(std::move(handler)), qos});
        return *this;
    }

    /// Append another router's declarations, prefixed by this router's.
    Router& include(const Router& other) {
        for (const auto& declaration : other.m_declarations) {
            auto full = full_filter(declaration.filter);
            TopicFilter validated(full);
            m_declarations.push_back(Declaration{std::move(full),
                                                 declaration.payload_type,
                                                 declaration.handler,
                                                 declaration.qos});
        }
        return *this;
    }

    const std::vector<Declaration>& declarations() const {
        return m_declarations;
    }
};

} // namespace mqroute
