#include "relay/network/ipc_server.hpp"

#include <cerrno>
#include <iostream>
#include <utility>

namespace relay {

// -----------------------------------------------------------------------------
// Constructor: store parameters for deferred socket creation
// -----------------------------------------------------------------------------
IpcServer::IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->set(zmq::sockopt::linger, 0);
  pub_socket_->set(zmq::sockopt::linger, 0);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " STREAM=" << pub_endpoint_ << std::endl;
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped. frames_sent=" << frames_sent_.load()
            << std::endl;
}

void IpcServer::pushFrame(OutboundFrame frame) {
  frame_queue_.push(std::move(frame));
}

// -----------------------------------------------------------------------------
// run(): alternate between the stream queue and the command socket
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processFrames();
    processCommands();
  }

  // Final drain so frames queued before stop() still go out.
  processFrames();
}

// -----------------------------------------------------------------------------
// processFrames(): [connection_id, frame] on the PUB socket
// -----------------------------------------------------------------------------
void IpcServer::processFrames() {
  while (auto frame = frame_queue_.try_pop()) {
    zmq::message_t topic(frame->connection_id.data(),
                         frame->connection_id.size());
    zmq::message_t body(frame->frame.data(), frame->frame.size());

    // PUB never blocks on slow subscribers; dontwait only guards against a
    // full high-water mark, where ZeroMQ drops the message.
    auto first = pub_socket_->send(topic, zmq::send_flags::sndmore |
                                              zmq::send_flags::dontwait);
    if (!first.has_value()) {
      std::cerr << "[IpcServer] dropped frame for "
                << frame->connection_id << std::endl;
      continue;
    }
    auto second = pub_socket_->send(body, zmq::send_flags::none);
    if (second.has_value()) {
      frames_sent_.fetch_add(1);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string response = command_handler_(request.to_string());

  zmq::message_t reply(response.data(), response.size());
  auto sent = cmd_socket_->send(reply, zmq::send_flags::none);
  if (!sent.has_value()) {
    std::cerr << "[IpcServer] failed to send command reply" << std::endl;
  }
}

}  // namespace relay
