/**
 * @file pingpong_example.cpp
 * @brief Minimal end‑to‑end demonstration of the mqroute client.
 *
 * A single Client is attached to an in‑process LoopbackBroker and
 * registers three routes:
 *
 *   1. **ping** on `game/ping` – replies with the counter + 1 on
 *      `game/pong`.
 *   2. **pong** on `game/pong` – replies with the counter + 1 on
 *      `game/ping` until the value reaches @c n_pings.
 *   3. **listener** on `game/greetings/#` for string payloads – prints
 *      the greetings of both sides.
 *
 * Every route subscribes automatically when the client starts; replies
 * returned by a handler travel back through the broker and are routed
 * again, so the counter bounces until the limit is hit.
 */

#include <mqroute/mqroute.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

namespace {
constexpr std::int64_t n_pings = 10; ///< Stop after this many exchanges.

/**
 * @brief Handler bouncing the counter to @p reply_topic.
 *
 * Returns a reply while the counter is below @ref n_pings and nothing
 * once the game is over.
 */
auto bounce(mqroute::logging::Logger logger, std::string reply_topic) {
    return [logger, reply_topic = std::move(reply_topic)](
               const mqroute::DecodedMessage<std::int64_t>& message) {
        MQROUTE_LOG_INFO(logger, "topic: \"{}\" Data: {}", message.topic(),
                         message.payload);
        if (message.payload >= n_pings) { // Reached limit.
            return mqroute::HandlerResult::ok();
        }
        return mqroute::HandlerResult::reply(reply_topic, message.payload + 1);
    };
}
} // anonymous namespace

int main() {
    // Quill uses a dedicated backend thread. Start it once per process.
    mqroute::logging::start_backend();

    auto logger = mqroute::logging::create_logger("pingpong");
    auto broker = std::make_shared<mqroute::LoopbackBroker>();

    // One in flight at a time keeps the printed rally in order.
    mqroute::ClientOptions options;
    options.dispatcher.max_concurrency = 1;
    mqroute::Client client(broker, broker, options);

    mqroute::Router game("game");
    game.route<std::int64_t>("ping", bounce(logger, "game/pong"))
        .route<std::int64_t>("pong", bounce(logger, "game/ping"))
        .route<std::string>(
            "greetings/#",
            [logger](const mqroute::DecodedMessage<std::string>& message) {
                MQROUTE_LOG_INFO(logger, "listener: \"{}\" says {}",
                                 message.topic(), message.payload);
            });
    client.include(game);

    client.on_report([logger](const mqroute::DeliveryReport& report) {
        if (!report.ok()) {
            MQROUTE_LOG_WARNING(logger, "delivery on \"{}\" failed: {}",
                                report.topic, report.error);
        }
    });

    client.start();

    client.publish("game/greetings/ping", "hello from the ping side");
    client.publish("game/greetings/pong", "hello from the pong side");
    client.publish("game/ping", 0); // Kick things off.

    // Let the game run for a short while.
    std::this_thread::sleep_for(std::chrono::seconds(1));
    client.stop();

    auto stats = client.stats();
    MQROUTE_LOG_INFO(logger, "received {}, delivered {}, decode failures {}",
                     stats.received, stats.delivered, stats.decode_failures);
    return 0;
}
