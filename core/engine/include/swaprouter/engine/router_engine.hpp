#pragma once

#include "swaprouter/broadcast/status_broadcaster.hpp"
#include "swaprouter/concurrent/order_id_generator.hpp"
#include "swaprouter/domain/router_config.hpp"
#include "swaprouter/eventbus/event_bus.hpp"
#include "swaprouter/execution/execution_state_machine.hpp"
#include "swaprouter/execution/i_settlement.hpp"
#include "swaprouter/network/ipc_server.hpp"
#include "swaprouter/scheduler/order_scheduler.hpp"
#include "swaprouter/service/order_service.hpp"
#include "swaprouter/store/in_memory_order_store.hpp"
#include "swaprouter/time/i_time_provider.hpp"
#include "swaprouter/venue/i_quote_source.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <memory>
#include <string>

namespace swaprouter {

// -----------------------------------------------------------------------------
// RouterEngine: top-level orchestrator of the swap router
// -----------------------------------------------------------------------------
//
// @brief  Builds the execution pipeline from a RouterConfig, owns every
//         component, and manages startup and shutdown order.
//
// @details
// Component graph (all share one EventBus):
//
//   OrderService ──► InMemoryOrderStore
//        │
//        ├──► OrderScheduler ──(workers)──► ExecutionStateMachine
//        │                                   │  ├─ IQuoteSource (Raydium)
//        │                                   │  ├─ IQuoteSource (Meteora)
//        │                                   │  └─ ISettlement
//        │                                   ▼
//        │                              EventBus ──► StatusBroadcaster
//        │                                                  │
//        └──► IpcServer ◄──── topic channels ◄──────────────┘
//
// Lifecycle:
//   Construction wires everything but starts no thread. start() spawns the
//   scheduler workers, then the IPC thread if both endpoints are set.
//   stop() reverses that: IPC first (its command handler reaches into the
//   service), then the workers. Members are declared so that destruction
//   order matches: nothing is destroyed while something that borrows it is
//   still alive.
//
// Thread model:
//   start()/stop() from the owning thread. orders(), eventBus() and
//   executeCommand() are safe from any thread.
// -----------------------------------------------------------------------------
class RouterEngine {
 public:
  // Mock venues and settlement built from config.
  // @throws ValidationError if config is invalid.
  RouterEngine(domain::RouterConfig config, const ITimeProvider& clock);

  // Caller-supplied venues and settlement (tests, or real adapters).
  RouterEngine(domain::RouterConfig config, const ITimeProvider& clock,
               std::unique_ptr<IQuoteSource> raydium,
               std::unique_ptr<IQuoteSource> meteora,
               std::unique_ptr<ISettlement> settlement);

  ~RouterEngine();

  RouterEngine(const RouterEngine&) = delete;
  RouterEngine& operator=(const RouterEngine&) = delete;
  RouterEngine(RouterEngine&&) = delete;
  RouterEngine& operator=(RouterEngine&&) = delete;

  void start();
  void stop();
  bool running() const { return running_; }

  OrderService& orders() { return *service_; }
  EventBus& eventBus() { return bus_; }
  const domain::RouterConfig& config() const { return config_; }

  // True once no job is waiting, delayed or running.
  bool waitForIdle(std::chrono::milliseconds timeout) const;

  // -------------------------------------------------------------------------
  // executeCommand(request)
  // -------------------------------------------------------------------------
  // Handles one JSON request from the IPC command socket and returns the
  // JSON reply. Never throws for client mistakes: validation, lookup and
  // parse errors become {"status":"error","error":<kind>,"message":...}.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

 private:
  void wire();
  nlohmann::json dispatch(const nlohmann::json& request);

  std::shared_ptr<ISubscriberChannel> transportChannel();

  domain::RouterConfig config_;
  const ITimeProvider& clock_;

  EventBus bus_;
  std::unique_ptr<OrderIdGenerator> ids_;
  InMemoryOrderStore store_;

  std::unique_ptr<IQuoteSource> raydium_;
  std::unique_ptr<IQuoteSource> meteora_;
  std::unique_ptr<ISettlement> settlement_;

  std::unique_ptr<ExecutionStateMachine> state_machine_;
  std::unique_ptr<StatusBroadcaster> broadcaster_;
  std::unique_ptr<OrderScheduler> scheduler_;
  std::unique_ptr<OrderService> service_;
  std::unique_ptr<IpcServer> ipc_server_;

  bool running_{false};
};

}  // namespace swaprouter
