/**
 * @file qos.hpp
 * @brief MQTT quality‑of‑service levels.
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace mqroute {

/// MQTT delivery guarantee levels.
enum class QoS : std::uint8_t {
    AtMostOnce = 0,
    AtLeastOnce = 1,
    ExactlyOnce = 2,
};

inline constexpr std::string_view to_string(QoS qos) {
    switch (qos) {
    case QoS::AtMostOnce:
        return "AT_MOST_ONCE";
    case QoS::AtLeastOnce:
        return "AT_LEAST_ONCE";
    case QoS::ExactlyOnce:
        return "EXACTLY_ONCE";
    }
    return "UNKNOWN";
}

} // namespace mqroute
