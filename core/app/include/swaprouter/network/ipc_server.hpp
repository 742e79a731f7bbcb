#pragma once

#include "swaprouter/broadcast/i_subscriber_channel.hpp"
#include "swaprouter/concurrent/thread_safe_queue.hpp"
#include "swaprouter/events/event_types.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace swaprouter {

// -----------------------------------------------------------------------------
// IpcServer: ZeroMQ transport for commands and order status streams
// -----------------------------------------------------------------------------
//
// @brief  One thread, two sockets: a REP socket that answers JSON command
//         requests, and a PUB socket that streams order status events.
//
// @details
//   1. REP socket (command endpoint, default port 5556):
//      Each request string goes to command_handler_ (bound to
//      RouterEngine::executeCommand()) and the returned JSON string is the
//      reply. ZMQ_RCVTIMEO keeps the recv short so the thread keeps
//      draining status events between requests.
//
//   2. PUB socket (status endpoint, default port 5557):
//      Every message is "<order_id> <json>", so a SUB client filters one
//      order by subscribing to its id as the topic prefix. Events reach the
//      socket through status_queue_: scheduler workers call
//      channel->send(), which only enqueues, and the IPC thread does the
//      socket I/O.
//
// Channels:
//   makeChannel() hands out ISubscriberChannel objects for the
//   StatusBroadcaster. They share status_queue_; once the server stops the
//   queue is closed, every channel reports isOpen() == false, and the
//   broadcaster drops them on their next event.
//
// Thread model:
//   start()/stop() from the owning thread. makeChannel() and the channels
//   themselves are safe from any thread. command_handler_ runs on the IPC
//   thread.
//
// Ownership:
//   Owned by RouterEngine via std::unique_ptr. Owns the ZMQ context, both
//   sockets and the worker thread; shares the status queue with the
//   channels it created.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the IPC thread. Idempotent.
  // @throws zmq::error_t if an endpoint cannot be bound.
  void start();

  // Closes the status queue, publishes everything queued before that and
  // joins. Channels refuse events from then on. Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  // A status channel publishing on the PUB socket. Each event goes out
  // under its own order id as the topic.
  std::shared_ptr<ISubscriberChannel> makeChannel();

  // "<order_id> <json>"
  static std::string formatStatusMessage(const OrderStatusEvent& event);

 private:
  using StatusQueue = ThreadSafeQueue<OrderStatusEvent>;

  static constexpr int kPollTimeoutMs = 50;
  // Time the final drain gets to reach subscribers when the PUB socket closes.
  static constexpr int kShutdownLingerMs = 200;

  void run();
  void processStatus();
  void processCommands();

  std::shared_ptr<StatusQueue> statusQueue() const;

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  mutable std::mutex queue_mutex_;
  std::shared_ptr<StatusQueue> status_queue_;

  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace swaprouter
