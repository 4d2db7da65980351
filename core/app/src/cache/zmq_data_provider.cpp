#include "relay/cache/zmq_data_provider.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <utility>

namespace relay {

namespace {

constexpr int kHistoryDays = 7;
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

Error providerFailure(const std::string& key, const std::string& what) {
  return makeError(ErrorCode::ProviderFailure, key + ": " + what);
}

}  // namespace

ZmqDataProvider::ZmqDataProvider(std::string endpoint, std::int64_t timeout_ms,
                                 Dispatcher dispatcher)
    : endpoint_(std::move(endpoint)),
      timeout_ms_(timeout_ms),
      dispatcher_(std::move(dispatcher)) {}

ZmqDataProvider::~ZmqDataProvider() { stop(); }

// -----------------------------------------------------------------------------
// start(): context now, socket lazily on the worker
// -----------------------------------------------------------------------------
void ZmqDataProvider::start() {
  if (thread_.joinable()) {
    return;
  }
  context_ = std::make_unique<zmq::context_t>(1);
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[ZmqDataProvider] started. endpoint=" << endpoint_
            << std::endl;
}

// -----------------------------------------------------------------------------
// stop(): join the worker, then fail what it never got to
// -----------------------------------------------------------------------------
void ZmqDataProvider::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  wake_cv_.notify_all();
  thread_.join();

  while (auto request = requests_.try_pop()) {
    Error error = providerFailure(request->key, "provider stopped");
    complete(std::move(*request), std::move(error));
  }

  socket_.reset();
  context_.reset();
  std::cout << "[ZmqDataProvider] stopped." << std::endl;
}

// -----------------------------------------------------------------------------
// fetch(): enqueue for the worker
// -----------------------------------------------------------------------------
void ZmqDataProvider::fetch(const std::string& key,
                            FetchCallback on_complete) {
  if (!running_.load()) {
    Error error = providerFailure(key, "provider not running");
    complete(Request{key, std::move(on_complete)}, std::move(error));
    return;
  }
  requests_.push(Request{key, std::move(on_complete)});
  wake_cv_.notify_all();
}

// -----------------------------------------------------------------------------
// run(): worker loop
// -----------------------------------------------------------------------------
void ZmqDataProvider::run() {
  while (running_.load()) {
    std::optional<Request> request = requests_.try_pop();
    if (!request) {
      std::unique_lock lock(wake_mutex_);
      wake_cv_.wait_for(lock, kIdleWaitTimeout, [this] {
        return !running_.load() || !requests_.empty();
      });
      continue;
    }

    Result<domain::Stock> result = roundTrip(request->key);
    complete(std::move(*request), std::move(result));
  }
}

// -----------------------------------------------------------------------------
// roundTrip(): one request/reply on the REQ socket
// -----------------------------------------------------------------------------
Result<domain::Stock> ZmqDataProvider::roundTrip(const std::string& key) {
  nlohmann::json request;
  request["symbol"] = key;
  request["days"] = kHistoryDays;
  const std::string body = request.dump();

  zmq::message_t reply;
  try {
    if (!socket_) {
      resetSocket();
    }
    zmq::message_t msg(body.data(), body.size());
    auto sent = socket_->send(msg, zmq::send_flags::none);
    if (!sent.has_value()) {
      socket_.reset();
      return providerFailure(key, "send timed out");
    }

    auto received = socket_->recv(reply, zmq::recv_flags::none);
    if (!received.has_value()) {
      std::cerr << "[ZmqDataProvider] timeout waiting for " << key
                << std::endl;
      socket_.reset();
      return providerFailure(key, "timed out");
    }
  } catch (const zmq::error_t& e) {
    std::cerr << "[ZmqDataProvider] zmq error for " << key << ": " << e.what()
              << std::endl;
    socket_.reset();
    return providerFailure(key, e.what());
  }

  try {
    auto json = nlohmann::json::parse(reply.to_string());
    if (json.contains("error")) {
      return providerFailure(key, json.at("error").get<std::string>());
    }
    return json.get<domain::Stock>();
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ZmqDataProvider] malformed reply for " << key << ": "
              << e.what() << std::endl;
    return providerFailure(key, std::string("malformed reply: ") + e.what());
  }
}

// -----------------------------------------------------------------------------
// resetSocket(): fresh REQ socket with timeouts and no linger
// -----------------------------------------------------------------------------
void ZmqDataProvider::resetSocket() {
  socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::req);
  socket_->set(zmq::sockopt::rcvtimeo, static_cast<int>(timeout_ms_));
  socket_->set(zmq::sockopt::sndtimeo, static_cast<int>(timeout_ms_));
  socket_->set(zmq::sockopt::linger, 0);
  socket_->connect(endpoint_);
}

// -----------------------------------------------------------------------------
// complete(): hand the result to the loop
// -----------------------------------------------------------------------------
void ZmqDataProvider::complete(Request request, Result<domain::Stock> result) {
  dispatcher_([callback = std::move(request.on_complete),
               result = std::move(result)]() mutable {
    callback(std::move(result));
  });
}

}  // namespace relay
