#pragma once

#include "relay/concurrent/thread_safe_queue.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace relay {

// One framed event addressed to one connection.
struct OutboundFrame {
  std::string connection_id;
  std::string frame;
};

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ command and stream gateway
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that accepts JSON commands on a REP socket
//         and pushes framed stream events on a PUB socket.
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. REP socket (command endpoint, default tcp://127.0.0.1:5556):
//      Each request is one JSON command document. It is passed to the
//      CommandHandler (bound to BrokerEngine::executeCommand(), which posts
//      the command onto the request loop and waits for its reply) and the
//      JSON reply is sent back. ZMQ_RCVTIMEO keeps the thread responsive.
//
//   2. PUB socket (stream endpoint, default tcp://127.0.0.1:5557):
//      Emits two-part messages [connection_id, event-stream text]. The HTTP
//      front end subscribes with connection-id prefixes and writes the text
//      part to the matching client response unchanged.
//
// Frames arrive through pushFrame() from the request loop (the engine's
// EventBroadcast subscriber) and are buffered in a ThreadSafeQueue, so
// ZeroMQ I/O never runs on the loop.
//
// Thread model:
//   start() and stop() from the owning thread. pushFrame() from any thread.
//   Sockets are only touched by the worker thread.
//
// Ownership:
//   Owned by BrokerEngine via std::unique_ptr. Owns the context, both
//   sockets, the frame queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  // RAII: stop() if still running.
  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // Creates the context, binds both sockets and spawns the worker.
  // Idempotent. Throws zmq::error_t if an endpoint cannot be bound.
  // -------------------------------------------------------------------------
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // Joins the worker after it has flushed queued frames, then closes the
  // sockets. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // Thread-safe enqueue of one outbound frame.
  void pushFrame(OutboundFrame frame);

  std::uint64_t framesSent() const { return frames_sent_.load(); }

 private:
  void run();
  void processFrames();
  void processCommands();

  static constexpr int kPollTimeoutMs = 10;

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  ThreadSafeQueue<OutboundFrame> frame_queue_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> frames_sent_{0};
};

}  // namespace relay
