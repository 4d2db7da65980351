#pragma once

#include "relay/cache/i_data_provider.hpp"
#include "relay/concurrent/thread_safe_queue.hpp"

#include <zmq.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace relay {

// -----------------------------------------------------------------------------
// ZmqDataProvider: out-of-process market-data client
// -----------------------------------------------------------------------------
//
// @brief  IDataProvider that forwards each fetch over a ZeroMQ REQ socket to
//         an external provider process.
//
// @details
// Wire protocol (one JSON document per frame):
//   request   {"symbol": "AAPL", "days": 7}
//   reply     a Stock document (see domain/stock.hpp), or
//             {"error": "<message>"}
//
// Requests are queued and served one at a time by a dedicated worker thread
// (REQ sockets are strictly send/recv alternating). The result is handed to
// the Dispatcher, which in the broker posts it onto the request loop, so
// on_complete never runs on the worker.
//
// Failure mapping, all reported as ProviderFailure:
//   - no reply within the receive timeout
//   - ZeroMQ errors on send/recv
//   - reply that is not valid JSON or does not match the Stock layout
//   - explicit {"error": ...} reply
//
// A REQ socket that timed out is stuck waiting for its reply, so the worker
// closes it (linger 0) and opens a fresh one for the next request.
//
// Thread model:
//   fetch() is safe from any thread. The socket is touched only by the
//   worker. stop() fails every request still queued.
//
// Ownership:
//   Owned by BrokerEngine via std::unique_ptr; stopped before the loop and
//   the cache are torn down.
// -----------------------------------------------------------------------------
class ZmqDataProvider final : public IDataProvider {
 public:
  using Dispatcher = std::function<void(std::function<void()>)>;

  ZmqDataProvider(std::string endpoint, std::int64_t timeout_ms,
                  Dispatcher dispatcher);
  ~ZmqDataProvider() override;

  ZmqDataProvider(const ZmqDataProvider&) = delete;
  ZmqDataProvider& operator=(const ZmqDataProvider&) = delete;

  void start();
  void stop();

  void fetch(const std::string& key, FetchCallback on_complete) override;

 private:
  struct Request {
    std::string key;
    FetchCallback on_complete;
  };

  void run();
  Result<domain::Stock> roundTrip(const std::string& key);
  void resetSocket();
  void complete(Request request, Result<domain::Stock> result);

  std::string endpoint_;
  std::int64_t timeout_ms_;
  Dispatcher dispatcher_;

  ThreadSafeQueue<Request> requests_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> socket_;

  std::atomic<bool> running_{false};
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
  std::thread thread_;
};

}  // namespace relay
