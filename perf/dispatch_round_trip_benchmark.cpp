#include <benchmark/benchmark.h>

#include <mqroute/mqroute.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

class RoundTripClient {
  private:
    std::shared_ptr<mqroute::LoopbackBroker> m_broker;
    mqroute::Client m_client;
    std::atomic<std::int64_t> m_last_received{-1};

    static mqroute::ClientOptions options(std::size_t max_concurrency) {
        mqroute::ClientOptions options;
        options.dispatcher.max_concurrency = max_concurrency;
        options.dispatcher.receive_poll_interval =
            std::chrono::milliseconds(1);
        return options;
    }

  public:
    explicit RoundTripClient(std::size_t max_concurrency)
        : m_broker(std::make_shared<mqroute::LoopbackBroker>()),
          m_client(m_broker, m_broker, options(max_concurrency)) {
        // Echo side.
        m_client.route<std::int64_t>(
            "in", [](const mqroute::DecodedMessage<std::int64_t>& message) {
                return mqroute::HandlerResult::reply("out", message.payload);
            });
        // Round-trip side.
        m_client.route<std::int64_t>(
            "out",
            [this](const mqroute::DecodedMessage<std::int64_t>& message) {
                m_last_received.store(message.payload,
                                      std::memory_order_release);
            });
        m_client.start();
    }

    ~RoundTripClient() { m_client.stop(); }

    void run_round_trip(std::int64_t message) {
        m_client.publish("in", message);
        while (m_last_received.load(std::memory_order_acquire) != message) {
            std::this_thread::yield();
        }
    }
};

static void roundtrip(benchmark::State& st) {
    RoundTripClient client(static_cast<std::size_t>(st.range(0)));

    std::int64_t iteration = 0;
    for (auto _ : st) {
        client.run_round_trip(iteration);
        iteration++;
    }

    st.SetItemsProcessed(st.iterations());
}

static void fanout(benchmark::State& st) {
    auto broker = std::make_shared<mqroute::LoopbackBroker>();
    mqroute::ClientOptions options;
    options.dispatcher.max_concurrency = static_cast<std::size_t>(st.range(0));
    options.dispatcher.receive_poll_interval = std::chrono::milliseconds(1);
    mqroute::Client client(broker, broker, options);

    std::atomic<std::int64_t> handled{0};
    for (const char* filter : {"fan/+/out", "fan/#", "+/a/out", "fan/a/out"}) {
        client.route<std::int64_t>(
            filter, [&handled](const mqroute::DecodedMessage<std::int64_t>&) {
                handled.fetch_add(1, std::memory_order_relaxed);
            });
    }
    client.start();

    std::int64_t expected = 0;
    for (auto _ : st) {
        client.publish("fan/a/out", expected);
        expected += 4;
        while (handled.load(std::memory_order_relaxed) != expected) {
            std::this_thread::yield();
        }
    }
    client.stop();

    st.SetItemsProcessed(st.iterations() * 4);
}

static void match_filter(benchmark::State& st) {
    const mqroute::TopicFilter filter("sensors/+/temperature/#");
    const auto topic =
        mqroute::TopicType::parse("sensors/17/temperature/celsius/raw");
    for (auto _ : st) {
        benchmark::DoNotOptimize(mqroute::matches(filter, topic));
    }
}

static void codec_round_trip(benchmark::State& st) {
    auto registry = mqroute::CodecRegistry::with_builtins();
    const std::string payload(static_cast<std::size_t>(st.range(0)), 'x');
    for (auto _ : st) {
        auto framed = registry.encode(payload);
        benchmark::DoNotOptimize(
            registry.decode(mqroute::tags::string, framed));
    }
    st.SetBytesProcessed(st.iterations() * st.range(0));
}

BENCHMARK(roundtrip)->Arg(1)->Arg(8);
BENCHMARK(fanout)->Arg(1)->Arg(4);
BENCHMARK(match_filter);
BENCHMARK(codec_round_trip)->Arg(16)->Arg(4096);

BENCHMARK_MAIN();
