#include "swaprouter/network/ipc_server.hpp"
#include "swaprouter/codec/json_codec.hpp"

#include <cerrno>
#include <iostream>
#include <utility>

namespace swaprouter {

namespace {

// Status channel backed by the server's outbound queue. The order id is
// carried by every event, so the channel itself only needs the queue.
class TopicChannel final : public ISubscriberChannel {
 public:
  explicit TopicChannel(
      std::shared_ptr<ThreadSafeQueue<OrderStatusEvent>> queue)
      : queue_(std::move(queue)) {}

  bool isOpen() const override { return !queue_->closed(); }

  void send(const OrderStatusEvent& event) override { queue_->push(event); }

 private:
  std::shared_ptr<ThreadSafeQueue<OrderStatusEvent>> queue_;
};

}  // namespace

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)),
      status_queue_(std::make_shared<StatusQueue>()) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  {
    std::lock_guard lock(queue_mutex_);
    if (status_queue_->closed()) {
      status_queue_ = std::make_shared<StatusQueue>();
    }
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
            << " PUB=" << pub_endpoint_ << "\n";
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

  // Close before the loop's final drain: everything accepted by a channel
  // is then published, and later sends are refused.
  statusQueue()->close();
  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  pub_socket_->set(zmq::sockopt::linger, kShutdownLingerMs);
  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

std::shared_ptr<ISubscriberChannel> IpcServer::makeChannel() {
  return std::make_shared<TopicChannel>(statusQueue());
}

std::shared_ptr<IpcServer::StatusQueue> IpcServer::statusQueue() const {
  std::lock_guard lock(queue_mutex_);
  return status_queue_;
}

std::string IpcServer::formatStatusMessage(const OrderStatusEvent& event) {
  return event.order_id + " " + toJson(event).dump();
}

// -----------------------------------------------------------------------------
// run(): combined poll/drain loop
// -----------------------------------------------------------------------------
void IpcServer::run() {
  while (running_.load()) {
    processStatus();
    processCommands();
  }

  // Final drain so the last transitions before shutdown still go out.
  processStatus();
}

// -----------------------------------------------------------------------------
// processStatus(): drain queue and publish on PUB socket
// -----------------------------------------------------------------------------
void IpcServer::processStatus() {
  auto queue = statusQueue();
  while (auto event = queue->try_pop()) {
    std::string message = formatStatusMessage(*event);
    zmq::message_t msg(message.data(), message.size());
    auto sent = pub_socket_->send(msg, zmq::send_flags::dontwait);
    if (!sent.has_value()) {
      std::cerr << "[IpcServer] status for " << event->order_id
                << " dropped, PUB socket would block\n";
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

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

}  // namespace swaprouter
