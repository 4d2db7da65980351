// =============================================================================
// zmq_transport_test.cpp
// =============================================================================
// Integration tests for the two ZeroMQ edges of the broker:
//   - ZmqDataProvider (REQ) against an in-test REP provider
//   - IpcServer: REP command socket and PUB stream socket
//
// Validates:
//   - A provider reply is decoded into a Stock and completed through the
//     dispatcher, never on the caller's stack
//   - {"error": ...} replies, silence past the timeout and fetches while
//     stopped all surface as ProviderFailure
//   - IpcServer answers commands through its handler and publishes
//     [connection_id, frame] two-part messages
//
// Design:
//   Loopback TCP on fixed high ports. Every wait is bounded; helper threads
//   are joined before assertions.
// =============================================================================

#include "relay/cache/mock_data_provider.hpp"
#include "relay/cache/zmq_data_provider.hpp"
#include "relay/concurrent/thread_safe_queue.hpp"
#include "relay/network/ipc_server.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <thread>

namespace {

constexpr const char* kProviderEndpoint = "tcp://127.0.0.1:47311";
constexpr const char* kSilentEndpoint = "tcp://127.0.0.1:47312";
constexpr const char* kCommandEndpoint = "tcp://127.0.0.1:47313";
constexpr const char* kStreamEndpoint = "tcp://127.0.0.1:47314";

// Collects completions handed to the dispatcher, standing in for the
// request loop.
class CompletionSink {
 public:
  relay::ZmqDataProvider::Dispatcher dispatcher() {
    return [this](std::function<void()> task) { tasks_.push(std::move(task)); };
  }

  // Runs the next completion, waiting up to `timeout`.
  bool runNext(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (auto task = tasks_.try_pop()) {
        (*task)();
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return false;
  }

 private:
  relay::ThreadSafeQueue<std::function<void()>> tasks_;
};

// REP provider answering `count` requests: known symbols get a mock stock,
// "BAD" gets an error document.
void serveRequests(zmq::context_t& context, int count,
                   std::atomic<bool>& ready) {
  zmq::socket_t rep(context, zmq::socket_type::rep);
  rep.set(zmq::sockopt::linger, 0);
  rep.set(zmq::sockopt::rcvtimeo, 3000);
  rep.bind(kProviderEndpoint);
  ready.store(true);

  for (int i = 0; i < count; ++i) {
    zmq::message_t request;
    if (!rep.recv(request, zmq::recv_flags::none)) {
      return;
    }
    auto body = nlohmann::json::parse(request.to_string());
    const std::string symbol = body.at("symbol").get<std::string>();

    nlohmann::json reply;
    if (symbol == "BAD") {
      reply["error"] = "unknown symbol";
    } else {
      reply = relay::generateMockStock(symbol, 1'700'000'000'000);
    }
    const std::string text = reply.dump();
    rep.send(zmq::buffer(text), zmq::send_flags::none);
  }
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Successful and error replies from a live provider.
// -----------------------------------------------------------------------------
TEST(ZmqDataProviderTest, DecodesRepliesAndErrors) {
  zmq::context_t server_context(1);
  std::atomic<bool> ready{false};
  std::thread server(
      [&] { serveRequests(server_context, 2, ready); });
  while (!ready.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  CompletionSink sink;
  relay::ZmqDataProvider provider(kProviderEndpoint, 2000, sink.dispatcher());
  provider.start();

  std::optional<relay::Result<relay::domain::Stock>> good;
  std::optional<relay::Result<relay::domain::Stock>> bad;
  provider.fetch("TCS", [&good](relay::Result<relay::domain::Stock> r) {
    good = std::move(r);
  });
  provider.fetch("BAD", [&bad](relay::Result<relay::domain::Stock> r) {
    bad = std::move(r);
  });

  EXPECT_FALSE(good.has_value()) << "completion must go through dispatcher";
  ASSERT_TRUE(sink.runNext(std::chrono::seconds(3)));
  ASSERT_TRUE(sink.runNext(std::chrono::seconds(3)));

  provider.stop();
  server.join();

  ASSERT_TRUE(good.has_value());
  ASSERT_TRUE(good->ok());
  EXPECT_EQ(good->value().symbol, "TCS");
  EXPECT_EQ(good->value().price_history.size(), 7u);

  ASSERT_TRUE(bad.has_value());
  EXPECT_EQ(bad->code(), relay::ErrorCode::ProviderFailure);
}

// -----------------------------------------------------------------------------
// 2. No provider listening: the round trip times out as ProviderFailure.
// -----------------------------------------------------------------------------
TEST(ZmqDataProviderTest, SilentProviderTimesOut) {
  CompletionSink sink;
  relay::ZmqDataProvider provider(kSilentEndpoint, 200, sink.dispatcher());
  provider.start();

  std::optional<relay::Result<relay::domain::Stock>> result;
  provider.fetch("TCS", [&result](relay::Result<relay::domain::Stock> r) {
    result = std::move(r);
  });

  ASSERT_TRUE(sink.runNext(std::chrono::seconds(3)));
  provider.stop();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->code(), relay::ErrorCode::ProviderFailure);
}

// -----------------------------------------------------------------------------
// 3. Fetch before start(): immediate ProviderFailure via the dispatcher.
// -----------------------------------------------------------------------------
TEST(ZmqDataProviderTest, FetchWhileStoppedFails) {
  CompletionSink sink;
  relay::ZmqDataProvider provider(kSilentEndpoint, 200, sink.dispatcher());

  std::optional<relay::Result<relay::domain::Stock>> result;
  provider.fetch("TCS", [&result](relay::Result<relay::domain::Stock> r) {
    result = std::move(r);
  });

  ASSERT_TRUE(sink.runNext(std::chrono::milliseconds(500)));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->code(), relay::ErrorCode::ProviderFailure);
}

// -----------------------------------------------------------------------------
// 4. IpcServer: command round trip and stream fan-out.
// Why: This is the whole process boundary. The handler must see the raw
//      command text, and stream frames must be addressable by connection id
//      so an edge process can route them to the right client.
// -----------------------------------------------------------------------------
TEST(IpcServerTest, CommandsAndStreamFrames) {
  relay::IpcServer server(
      [](const std::string& cmd) { return "echo:" + cmd; }, kCommandEndpoint,
      kStreamEndpoint);
  server.start();

  zmq::context_t context(1);

  zmq::socket_t req(context, zmq::socket_type::req);
  req.set(zmq::sockopt::rcvtimeo, 2000);
  req.set(zmq::sockopt::linger, 0);
  req.connect(kCommandEndpoint);

  const std::string cmd = R"({"cmd":"ping"})";
  ASSERT_TRUE(req.send(zmq::buffer(cmd), zmq::send_flags::none).has_value());
  zmq::message_t reply;
  ASSERT_TRUE(req.recv(reply, zmq::recv_flags::none).has_value());
  EXPECT_EQ(reply.to_string(), "echo:" + cmd);

  zmq::socket_t sub(context, zmq::socket_type::sub);
  sub.set(zmq::sockopt::rcvtimeo, 100);
  sub.set(zmq::sockopt::linger, 0);
  sub.set(zmq::sockopt::subscribe, "c1");
  sub.connect(kStreamEndpoint);

  // PUB drops messages until the subscription has propagated; keep pushing
  // until one arrives.
  const std::string frame = "id: 1\nevent: offer\ndata: {}\n\n";
  std::string topic;
  std::string body;
  const auto deadline =
      std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (body.empty() && std::chrono::steady_clock::now() < deadline) {
    server.pushFrame(relay::OutboundFrame{"c2", "not for c1"});
    server.pushFrame(relay::OutboundFrame{"c1", frame});

    zmq::message_t first;
    if (!sub.recv(first, zmq::recv_flags::none)) {
      continue;
    }
    topic = first.to_string();
    zmq::message_t second;
    ASSERT_TRUE(sub.recv(second, zmq::recv_flags::none).has_value());
    body = second.to_string();
  }

  EXPECT_EQ(topic, "c1");
  EXPECT_EQ(body, frame);
  EXPECT_GE(server.framesSent(), 2u);

  server.stop();
}
