#include <gtest/gtest.h>

#include <mqroute/dispatcher.hpp>

#include <algorithm>
#include <any>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <cstring>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {
/// Thread‑safe sink for delivery reports.
class ReportLog {
  private:
    mutable std::mutex m_mutex;
    std::condition_variable m_changed;
    std::vector<mqroute::DeliveryReport> m_reports;

  public:
    mqroute::ReportCallback callback() {
        return [this](const mqroute::DeliveryReport& report) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_reports.push_back(report);
            }
            m_changed.notify_all();
        };
    }

    /// Wait until at least @p count reports arrived.
    bool wait_for(std::size_t count, std::chrono::milliseconds timeout = 5s) {
        std::unique_lock<std::mutex> lock(m_mutex);
        return m_changed.wait_for(lock, timeout, [this, count] {
            return m_reports.size() >= count;
        });
    }

    std::vector<mqroute::DeliveryReport> reports() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_reports;
    }

    std::size_t count(mqroute::DeliveryOutcome outcome) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return static_cast<std::size_t>(std::count_if(
            m_reports.begin(), m_reports.end(),
            [outcome](const auto& report) {
                return report.outcome == outcome;
            }));
    }
};

template <typename Predicate>
bool eventually(Predicate predicate, std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(1ms);
    }
    return predicate();
}

template <typename T, typename Handler>
void add_route(mqroute::RouteTable& table,
               const mqroute::CodecRegistry& codecs, std::string_view filter,
               Handler handler) {
    table.add(mqroute::Route{mqroute::TopicFilter(filter),
                             codecs.find<T>()->tag(),
                             mqroute::detail::make_raw_handler<T>(
                                 std::move(handler)),
                             mqroute::QoS::AtMostOnce});
}

mqroute::DispatcherOptions options(std::size_t max_concurrency) {
    mqroute::DispatcherOptions options;
    options.max_concurrency = max_concurrency;
    options.receive_poll_interval = 10ms;
    return options;
}

/// `float` codec raising values that are not std::exceptions.
class NonStandardFloatCodec final : public mqroute::TypedCodec<float> {
  public:
    NonStandardFloatCodec() : TypedCodec(0x30, "non-standard-float") {}

    mqroute::Bytes encode(const float&) const override { throw 7; }

    float decode(mqroute::ByteView body) const override {
        if (body.size() != sizeof(float)) {
            throw 42;
        }
        float value = 0.0f;
        std::memcpy(&value, body.data(), sizeof(float));
        return value;
    }
};

/// Tracks how many handlers run at the same time.
struct ConcurrencyTracker {
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::atomic<int> finished{0};

    void run(std::chrono::milliseconds duration) {
        int now = ++active;
        int previous = peak.load();
        while (now > previous && !peak.compare_exchange_weak(previous, now)) {
        }
        std::this_thread::sleep_for(duration);
        --active;
        finished++;
    }
};
} // anonymous namespace

TEST(mqroute_dispatcher_tests, decode_failure_is_isolated) {
    auto codecs = mqroute::CodecRegistry::with_builtins();
    mqroute::RouteTable table;
    mqroute::LoopbackBroker broker;
    ReportLog log;

    std::atomic<int> handled{0};
    add_route<std::string>(table, codecs, "greetings/+",
                           [&](const mqroute::DecodedMessage<std::string>&) {
                               handled++;
                           });

    mqroute::Dispatcher dispatcher(table, codecs, broker, broker, options(4));
    dispatcher.on_report(log.callback());
    dispatcher.start();

    broker.inject("greetings/en", codecs.encode(std::int64_t{5}));
    broker.inject("greetings/en", mqroute::Bytes{0x02, 0xFF});
    broker.inject("greetings/en", codecs.encode("hello"));
    ASSERT_TRUE(log.wait_for(3));
    dispatcher.stop();

    EXPECT_EQ(handled.load(), 1);
    EXPECT_EQ(log.count(mqroute::DeliveryOutcome::DecodeFailed), 2);
    EXPECT_EQ(log.count(mqroute::DeliveryOutcome::Delivered), 1);

    for (const auto& report : log.reports()) {
        EXPECT_EQ(report.topic, "greetings/en");
        EXPECT_EQ(report.filter, "greetings/+");
        if (!report.ok()) {
            EXPECT_NE(report.error.find("greetings/en"), std::string::npos);
            EXPECT_EQ(report.payload_length, 2);
        }
    }

    auto stats = dispatcher.stats();
    EXPECT_EQ(stats.received, 3);
    EXPECT_EQ(stats.delivered, 1);
    EXPECT_EQ(stats.decode_failures, 2);
    EXPECT_EQ(stats.in_flight, 0);
}

TEST(mqroute_dispatcher_tests, non_standard_codec_exceptions_are_isolated) {
    auto codecs = mqroute::CodecRegistry::with_builtins();
    codecs.add(std::make_shared<NonStandardFloatCodec>());
    mqroute::RouteTable table;
    mqroute::LoopbackBroker broker;
    ReportLog log;

    std::atomic<int> handled{0};
    add_route<float>(table, codecs, "t",
                     [&](const mqroute::DecodedMessage<float>& message) {
                         handled++;
                         return mqroute::HandlerResult::reply(
                             mqroute::OutboundMessage{
                                 "t/echo", std::any(message.payload),
                                 std::nullopt});
                     });

    mqroute::Dispatcher dispatcher(table, codecs, broker, broker, options(2));
    dispatcher.on_report(log.callback());
    dispatcher.start();

    mqroute::Bytes valid{0x30, 0, 0, 0, 0};
    const float value = 1.5f;
    std::memcpy(valid.data() + 1, &value, sizeof(float));
    broker.inject("t", mqroute::Bytes{0x30, 0x01});
    broker.inject("t", valid);
    ASSERT_TRUE(log.wait_for(2));
    dispatcher.stop();

    EXPECT_EQ(handled.load(), 1);
    EXPECT_EQ(log.count(mqroute::DeliveryOutcome::DecodeFailed), 1);
    EXPECT_EQ(log.count(mqroute::DeliveryOutcome::EncodeFailed), 1);
    for (const auto& report : log.reports()) {
        EXPECT_NE(report.error.find("non-standard exception"),
                  std::string::npos);
        if (report.outcome == mqroute::DeliveryOutcome::DecodeFailed) {
            EXPECT_NE(report.error.find("\"t\""), std::string::npos);
            EXPECT_EQ(report.payload_length, 2);
        }
    }
    EXPECT_TRUE(broker.published().empty());
    EXPECT_EQ(dispatcher.stats().decode_failures, 1);
    EXPECT_EQ(dispatcher.stats().reply_failures, 1);
}

TEST(mqroute_dispatcher_tests, single_slot_runs_sequentially) {
    auto codecs = mqroute::CodecRegistry::with_builtins();
    mqroute::RouteTable table;
    mqroute::LoopbackBroker broker;
    ReportLog log;
    ConcurrencyTracker tracker;

    std::mutex order_mutex;
    std::vector<std::int64_t> order;
    add_route<std::int64_t>(
        table, codecs, "jobs",
        [&](const mqroute::DecodedMessage<std::int64_t>& message) {
            tracker.run(5ms);
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(message.payload);
        });

    mqroute::Dispatcher dispatcher(table, codecs, broker, broker, options(1));
    dispatcher.on_report(log.callback());
    for (std::int64_t i = 0; i < 6; i++) {
        broker.inject("jobs", codecs.encode(i));
    }
    dispatcher.start();
    ASSERT_TRUE(log.wait_for(6));
    dispatcher.stop();

    EXPECT_EQ(tracker.peak.load(), 1);
    EXPECT_EQ(order, (std::vector<std::int64_t>{0, 1, 2, 3, 4, 5}));
}

TEST(mqroute_dispatcher_tests, slots_allow_overlap) {
    auto codecs = mqroute::CodecRegistry::with_builtins();
    mqroute::RouteTable table;
    mqroute::LoopbackBroker broker;
    ReportLog log;
    ConcurrencyTracker tracker;

    add_route<std::int64_t>(
        table, codecs, "jobs",
        [&](const mqroute::DecodedMessage<std::int64_t>&) {
            tracker.run(100ms);
        });

    mqroute::Dispatcher dispatcher(table, codecs, broker, broker, options(4));
    dispatcher.on_report(log.callback());
    for (std::int64_t i = 0; i < 8; i++) {
        broker.inject("jobs", codecs.encode(i));
    }
    dispatcher.start();
    ASSERT_TRUE(log.wait_for(8));
    dispatcher.stop();

    EXPECT_GE(tracker.peak.load(), 2);
    EXPECT_LE(tracker.peak.load(), 4);
}

TEST(mqroute_dispatcher_tests, sibling_routes_share_the_bound) {
    auto codecs = mqroute::CodecRegistry::with_builtins();
    mqroute::RouteTable table;
    mqroute::LoopbackBroker broker;
    ReportLog log;
    ConcurrencyTracker tracker;

    // Three routes match every message; each counts as one invocation.
    for (const char* filter : {"fan/out", "fan/+", "#"}) {
        add_route<std::int64_t>(
            table, codecs, filter,
            [&](const mqroute::DecodedMessage<std::int64_t>&) {
                tracker.run(20ms);
            });
    }

    mqroute::Dispatcher dispatcher(table, codecs, broker, broker, options(2));
    dispatcher.on_report(log.callback());
    dispatcher.start();
    for (std::int64_t i = 0; i < 3; i++) {
        broker.inject("fan/out", codecs.encode(i));
    }
    ASSERT_TRUE(log.wait_for(9));
    dispatcher.stop();

    EXPECT_EQ(tracker.finished.load(), 9);
    EXPECT_LE(tracker.peak.load(), 2);
    EXPECT_EQ(dispatcher.stats().delivered, 9);
    EXPECT_EQ(dispatcher.stats().received, 3);
}

TEST(mqroute_dispatcher_tests, stop_waits_for_in_flight_handlers) {
    auto codecs = mqroute::CodecRegistry::with_builtins();
    mqroute::RouteTable table;
    mqroute::LoopbackBroker broker;

    std::mutex gate_mutex;
    std::condition_variable gate;
    bool released = false;
    std::atomic<int> started{0};
    std::atomic<int> finished{0};
    add_route<std::int64_t>(
        table, codecs, "slow",
        [&](const mqroute::DecodedMessage<std::int64_t>&) {
            started++;
            std::unique_lock<std::mutex> lock(gate_mutex);
            gate.wait(lock, [&] { return released; });
            finished++;
        });

    mqroute::Dispatcher dispatcher(table, codecs, broker, broker, options(4));
    dispatcher.start();
    for (std::int64_t i = 0; i < 3; i++) {
        broker.inject("slow", codecs.encode(i));
    }
    EXPECT_TRUE(eventually([&] { return started.load() == 3; }));

    std::thread stopper([&] { dispatcher.stop(); });
    EXPECT_TRUE(eventually([&] {
        return dispatcher.state() == mqroute::DispatcherState::Draining;
    }));
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(dispatcher.state(), mqroute::DispatcherState::Draining);
    EXPECT_EQ(finished.load(), 0);
    EXPECT_EQ(dispatcher.stats().in_flight, 3);

    {
        std::lock_guard<std::mutex> lock(gate_mutex);
        released = true;
    }
    gate.notify_all();
    stopper.join();

    EXPECT_EQ(finished.load(), 3);
    EXPECT_EQ(dispatcher.state(), mqroute::DispatcherState::Stopped);
    EXPECT_EQ(dispatcher.stats().in_flight, 0);
    EXPECT_NO_THROW(dispatcher.wait());
}

TEST(mqroute_dispatcher_tests, stop_leaves_unconsumed_messages) {
    auto codecs = mqroute::CodecRegistry::with_builtins();
    mqroute::RouteTable table;
    mqroute::LoopbackBroker broker;
    std::atomic<int> handled{0};

    add_route<std::int64_t>(table, codecs, "idle",
                            [&](const mqroute::DecodedMessage<std::int64_t>&) {
                                handled++;
                            });

    mqroute::Dispatcher dispatcher(table, codecs, broker, broker, options(2));
    dispatcher.start();
    dispatcher.stop();
    broker.inject("idle", codecs.encode(1));
    std::this_thread::sleep_for(30ms);

    EXPECT_EQ(handled.load(), 0);
    EXPECT_EQ(broker.pending(), 1);
}

TEST(mqroute_dispatcher_tests, handler_failures_are_isolated) {
    auto codecs = mqroute::CodecRegistry::with_builtins();
    mqroute::RouteTable table;
    mqroute::LoopbackBroker broker;
    ReportLog log;
    std::atomic<int> healthy{0};

    add_route<std::string>(table, codecs, "orders/+",
                           [](const mqroute::DecodedMessage<std::string>&) {
                               throw std::runtime_error("out of stock");
                           });
    add_route<std::string>(table, codecs, "orders/#",
                           [&](const mqroute::DecodedMessage<std::string>&) {
                               healthy++;
                           });
    add_route<std::string>(table, codecs, "+/42",
                           [](const mqroute::DecodedMessage<std::string>&) {
                               throw 42;
                           });
    add_route<std::string>(
        table, codecs, "orders/42",
        [](const mqroute::DecodedMessage<std::string>&) {
            return mqroute::HandlerResult::failure("rejected");
        });

    mqroute::Dispatcher dispatcher(table, codecs, broker, broker, options(4));
    dispatcher.on_report(log.callback());
    dispatcher.start();
    broker.inject("orders/42", codecs.encode("widget"));
    broker.inject("orders/43", codecs.encode("gadget"));
    // 4 routes for orders/42, 2 for orders/43.
    ASSERT_TRUE(log.wait_for(6));
    dispatcher.stop();

    EXPECT_EQ(healthy.load(), 2);
    EXPECT_EQ(log.count(mqroute::DeliveryOutcome::HandlerFailed), 4);
    EXPECT_EQ(log.count(mqroute::DeliveryOutcome::Delivered), 2);

    std::vector<std::string> errors;
    for (const auto& report : log.reports()) {
        if (!report.ok()) {
            errors.push_back(report.error);
        }
    }
    EXPECT_EQ(std::count(errors.begin(), errors.end(), "out of stock"), 2);
    EXPECT_EQ(std::count(errors.begin(), errors.end(), "rejected"), 1);
    EXPECT_EQ(std::count(errors.begin(), errors.end(),
                         "non-standard exception"),
              1);
    EXPECT_EQ(dispatcher.stats().handler_failures, 4);
}

TEST(mqroute_dispatcher_tests, replies_are_published) {
    auto codecs = mqroute::CodecRegistry::with_builtins();
    mqroute::RouteTable table;
    mqroute::LoopbackBroker broker;
    ReportLog log;

    add_route<std::int64_t>(
        table, codecs, "ping",
        [](const mqroute::DecodedMessage<std::int64_t>& message) {
            return mqroute::HandlerResult::reply("pong", message.payload + 1);
        });

    mqroute::Dispatcher dispatcher(table, codecs, broker, broker, options(2));
    dispatcher.on_report(log.callback());
    dispatcher.start();
    broker.inject("ping", codecs.encode(41));
    ASSERT_TRUE(log.wait_for(1));
    dispatcher.stop();

    ASSERT_TRUE(log.reports()[0].ok());
    auto published = broker.published();
    ASSERT_EQ(published.size(), 1);
    EXPECT_EQ(published[0].topic, "pong");
    EXPECT_EQ(published[0].payload, codecs.encode(42));
    EXPECT_EQ(published[0].metadata.qos, mqroute::QoS::AtLeastOnce);
    EXPECT_FALSE(published[0].metadata.retain);
}

TEST(mqroute_dispatcher_tests, reply_with_explicit_payload_type) {
    auto codecs = mqroute::CodecRegistry::with_builtins();
    mqroute::RouteTable table;
    mqroute::LoopbackBroker broker;
    ReportLog log;

    add_route<std::int64_t>(
        table, codecs, "count",
        [](const mqroute::DecodedMessage<std::int64_t>& message) {
            return mqroute::HandlerResult::reply(mqroute::OutboundMessage{
                "count/text", std::to_string(message.payload),
                mqroute::tags::string, mqroute::QoS::ExactlyOnce, true});
        });

    mqroute::Dispatcher dispatcher(table, codecs, broker, broker, options(2));
    dispatcher.on_report(log.callback());
    dispatcher.start();
    broker.inject("count", codecs.encode(7));
    ASSERT_TRUE(log.wait_for(1));
    dispatcher.stop();

    auto published = broker.published();
    ASSERT_EQ(published.size(), 1);
    EXPECT_EQ(published[0].payload, codecs.encode("7"));
    EXPECT_EQ(published[0].metadata.qos, mqroute::QoS::ExactlyOnce);
    EXPECT_TRUE(published[0].metadata.retain);
}

TEST(mqroute_dispatcher_tests, reply_failures_are_reported) {
    auto codecs = mqroute::CodecRegistry::with_builtins();
    mqroute::RouteTable table;
    mqroute::LoopbackBroker broker;
    ReportLog log;

    // The reply is a string but the route's codec is the integer one.
    add_route<std::int64_t>(
        table, codecs, "mismatch",
        [](const mqroute::DecodedMessage<std::int64_t>&) {
            return mqroute::HandlerResult::reply("out", "text");
        });
    add_route<std::int64_t>(
        table, codecs, "rejected",
        [](const mqroute::DecodedMessage<std::int64_t>& message) {
            return mqroute::HandlerResult::reply("out", message.payload);
        });

    broker.set_publish_failure(true);
    mqroute::Dispatcher dispatcher(table, codecs, broker, broker, options(2));
    dispatcher.on_report(log.callback());
    dispatcher.start();
    broker.inject("mismatch", codecs.encode(1));
    broker.inject("rejected", codecs.encode(2));
    ASSERT_TRUE(log.wait_for(2));
    dispatcher.stop();

    EXPECT_EQ(log.count(mqroute::DeliveryOutcome::EncodeFailed), 1);
    EXPECT_EQ(log.count(mqroute::DeliveryOutcome::PublishFailed), 1);
    EXPECT_EQ(dispatcher.stats().reply_failures, 2);
    EXPECT_TRUE(broker.published().empty());
}

TEST(mqroute_dispatcher_tests, unrouted_messages_are_counted) {
    auto codecs = mqroute::CodecRegistry::with_builtins();
    mqroute::RouteTable table;
    mqroute::LoopbackBroker broker;
    ReportLog log;

    add_route<bool>(table, codecs, "known",
                    [](const mqroute::DecodedMessage<bool>&) {});

    mqroute::Dispatcher dispatcher(table, codecs, broker, broker, options(2));
    dispatcher.on_report(log.callback());
    dispatcher.start();
    broker.inject("unknown", codecs.encode(true));
    broker.inject("bad/+/topic", codecs.encode(true));
    broker.inject("known", codecs.encode(true));
    ASSERT_TRUE(log.wait_for(1));
    ASSERT_TRUE(eventually([&] { return dispatcher.stats().received == 3; }));
    dispatcher.stop();

    auto stats = dispatcher.stats();
    EXPECT_EQ(stats.unrouted, 2);
    EXPECT_EQ(stats.delivered, 1);
    EXPECT_EQ(log.reports().size(), 1);
}

TEST(mqroute_dispatcher_tests, source_closed_ends_the_run) {
    auto codecs = mqroute::CodecRegistry::with_builtins();
    mqroute::RouteTable table;
    mqroute::LoopbackBroker broker;
    std::atomic<int> handled{0};

    add_route<std::int64_t>(table, codecs, "last",
                            [&](const mqroute::DecodedMessage<std::int64_t>&) {
                                handled++;
                            });

    mqroute::Dispatcher dispatcher(table, codecs, broker, broker, options(2));
    dispatcher.start();
    broker.inject("last", codecs.encode(1));
    broker.close();

    EXPECT_THROW(dispatcher.wait(), mqroute::SourceClosed);
    EXPECT_EQ(dispatcher.state(), mqroute::DispatcherState::Stopped);
    EXPECT_EQ(handled.load(), 1);
    EXPECT_NO_THROW(dispatcher.stop());
}

TEST(mqroute_dispatcher_tests, report_callback_failures_are_contained) {
    auto codecs = mqroute::CodecRegistry::with_builtins();
    mqroute::RouteTable table;
    mqroute::LoopbackBroker broker;
    std::atomic<int> handled{0};

    add_route<std::int64_t>(table, codecs, "x",
                            [&](const mqroute::DecodedMessage<std::int64_t>&) {
                                handled++;
                            });

    std::atomic<int> reports{0};
    mqroute::Dispatcher dispatcher(table, codecs, broker, broker, options(1));
    dispatcher.on_report([&reports](const mqroute::DeliveryReport&) {
        if (reports++ == 0) {
            throw std::runtime_error("observer broke");
        }
        throw 42;
    });
    dispatcher.start();
    broker.inject("x", codecs.encode(1));
    broker.inject("x", codecs.encode(2));
    ASSERT_TRUE(eventually([&] { return reports.load() == 2; }));
    dispatcher.stop();
    EXPECT_EQ(handled.load(), 2);
    EXPECT_EQ(dispatcher.stats().delivered, 2);
}

TEST(mqroute_dispatcher_tests, lifecycle) {
    auto codecs = mqroute::CodecRegistry::with_builtins();
    mqroute::RouteTable table;
    mqroute::LoopbackBroker broker;

    mqroute::Dispatcher dispatcher(table, codecs, broker, broker, options(1));
    EXPECT_EQ(dispatcher.state(), mqroute::DispatcherState::Idle);
    dispatcher.start();
    EXPECT_EQ(dispatcher.state(), mqroute::DispatcherState::Running);
    EXPECT_THROW(dispatcher.start(), mqroute::AlreadyStartedError);
    EXPECT_THROW(dispatcher.on_report(nullptr), mqroute::AlreadyStartedError);

    dispatcher.stop();
    EXPECT_EQ(dispatcher.state(), mqroute::DispatcherState::Stopped);
    dispatcher.stop();
    EXPECT_EQ(dispatcher.state(), mqroute::DispatcherState::Stopped);
    EXPECT_THROW(dispatcher.start(), mqroute::AlreadyStartedError);

    mqroute::Dispatcher never_started(table, codecs, broker, broker);
    never_started.stop();
    EXPECT_EQ(never_started.state(), mqroute::DispatcherState::Stopped);
    EXPECT_NO_THROW(never_started.wait());
}

TEST(mqroute_dispatcher_tests, handler_slots) {
    EXPECT_THROW(mqroute::HandlerSlots(0), mqroute::Error);

    mqroute::HandlerSlots slots(2);
    slots.acquire();
    slots.acquire();
    EXPECT_EQ(slots.in_flight(), 2);

    std::atomic<bool> acquired{false};
    std::thread waiter([&]() {
        slots.acquire();
        acquired = true;
    });
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(acquired.load());

    slots.release();
    waiter.join();
    EXPECT_TRUE(acquired.load());

    slots.release();
    slots.release();
    slots.wait_idle();
    EXPECT_EQ(slots.in_flight(), 0);
}
