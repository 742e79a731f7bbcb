#include "swaprouter/engine/router_engine.hpp"
#include "swaprouter/codec/json_codec.hpp"
#include "swaprouter/config/config_loader.hpp"
#include "swaprouter/errors/router_error.hpp"
#include "swaprouter/execution/mock_settlement.hpp"
#include "swaprouter/venue/mock_quote_source.hpp"

#include <iostream>
#include <utility>

namespace swaprouter {

namespace {

// Derived seeds keep the venues and settlement on independent sequences
// while a single configured seed still reproduces a whole run.
std::uint64_t derivedSeed(std::uint64_t seed, std::uint64_t offset) {
  return seed == 0 ? 0 : seed + offset;
}

nlohmann::json errorReply(const std::string& kind, const std::string& message) {
  nlohmann::json j;
  j["status"] = "error";
  j["error"] = kind;
  j["message"] = message;
  return j;
}

std::string requireOrderId(const nlohmann::json& request) {
  auto it = request.find("order_id");
  if (it == request.end() || !it->is_string() ||
      it->get<std::string>().empty()) {
    throw ValidationError("order_id is required");
  }
  return it->get<std::string>();
}

std::size_t readCount(const nlohmann::json& request, const char* key,
                      std::size_t fallback) {
  auto it = request.find(key);
  if (it == request.end() || it->is_null()) {
    return fallback;
  }
  if (!it->is_number_integer() || it->get<std::int64_t>() < 0) {
    throw ValidationError(std::string(key) + " must be a non-negative integer");
  }
  return it->get<std::size_t>();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructors
// -----------------------------------------------------------------------------
RouterEngine::RouterEngine(domain::RouterConfig config,
                           const ITimeProvider& clock)
    : RouterEngine(
          config, clock,
          std::make_unique<MockQuoteSource>(config.raydium,
                                            config.reference_price,
                                            derivedSeed(config.seed, 1)),
          std::make_unique<MockQuoteSource>(config.meteora,
                                            config.reference_price,
                                            derivedSeed(config.seed, 2)),
          std::make_unique<MockSettlement>(config.settlement,
                                           derivedSeed(config.seed, 3))) {}

RouterEngine::RouterEngine(domain::RouterConfig config,
                           const ITimeProvider& clock,
                           std::unique_ptr<IQuoteSource> raydium,
                           std::unique_ptr<IQuoteSource> meteora,
                           std::unique_ptr<ISettlement> settlement)
    : config_(std::move(config)),
      clock_(clock),
      store_(clock),
      raydium_(std::move(raydium)),
      meteora_(std::move(meteora)),
      settlement_(std::move(settlement)) {
  validateRouterConfig(config_);
  if (!raydium_ || !meteora_ || !settlement_) {
    throw ValidationError("router engine needs both venues and a settlement");
  }
  wire();
}

RouterEngine::~RouterEngine() { stop(); }

// -----------------------------------------------------------------------------
// wire(): build components in dependency order
// -----------------------------------------------------------------------------
void RouterEngine::wire() {
  ids_ = config_.seed == 0
             ? std::make_unique<OrderIdGenerator>()
             : std::make_unique<OrderIdGenerator>(derivedSeed(config_.seed, 4));

  state_machine_ = std::make_unique<ExecutionStateMachine>(
      store_, *raydium_, *meteora_, *settlement_, bus_, config_.execution,
      config_.scheduler.max_retries);

  broadcaster_ = std::make_unique<StatusBroadcaster>(bus_);

  scheduler_ = std::make_unique<OrderScheduler>(
      config_.scheduler,
      [this](const domain::OrderId& id) {
        return state_machine_->runAttempt(id);
      },
      bus_, clock_);

  service_ = std::make_unique<OrderService>(store_, *scheduler_, *broadcaster_,
                                            *ids_, clock_, config_.execution);

  if (!config_.ipc.command_endpoint.empty() &&
      !config_.ipc.status_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& request) { return executeCommand(request); },
        config_.ipc.command_endpoint, config_.ipc.status_endpoint);
  }
}

// -----------------------------------------------------------------------------
// start() / stop()
// -----------------------------------------------------------------------------
void RouterEngine::start() {
  if (running_) {
    return;
  }

  scheduler_->start();
  if (ipc_server_) {
    ipc_server_->start();
  }
  running_ = true;

  std::cout << "[RouterEngine] started. venues=raydium,meteora workers="
            << config_.scheduler.concurrency
            << (ipc_server_ ? " ipc=on" : " ipc=off") << "\n";
}

void RouterEngine::stop() {
  if (!running_) {
    return;
  }

  if (ipc_server_) {
    ipc_server_->stop();
  }
  scheduler_->stop();
  running_ = false;

  std::cout << "[RouterEngine] stopped. " << store_.count()
            << " order(s) in store.\n";
}

bool RouterEngine::waitForIdle(std::chrono::milliseconds timeout) const {
  return scheduler_->waitForIdle(timeout);
}

std::shared_ptr<ISubscriberChannel> RouterEngine::transportChannel() {
  if (ipc_server_ && ipc_server_->running()) {
    return ipc_server_->makeChannel();
  }
  return nullptr;
}

// -----------------------------------------------------------------------------
// executeCommand(): JSON in, JSON out, errors as replies
// -----------------------------------------------------------------------------
std::string RouterEngine::executeCommand(const std::string& request) {
  nlohmann::json response;
  try {
    response = dispatch(nlohmann::json::parse(request));
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[RouterEngine] malformed request: " << e.what() << "\n";
    response = errorReply("validation",
                          std::string("malformed request: ") + e.what());
  } catch (const RouterError& e) {
    response = errorReply(e.kind(), e.what());
  } catch (const std::exception& e) {
    std::cerr << "[RouterEngine] request failed: " << e.what() << "\n";
    response = errorReply("internal", e.what());
  }
  return response.dump();
}

nlohmann::json RouterEngine::dispatch(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw ValidationError("request must be a JSON object");
  }
  auto type_it = request.find("type");
  if (type_it == request.end() || !type_it->is_string()) {
    throw ValidationError("request type is required");
  }
  const std::string type = type_it->get<std::string>();

  nlohmann::json response;
  response["status"] = "ok";

  if (type == "ping") {
    response["response"] = "pong";
  } else if (type == "submit_order") {
    auto order_it = request.find("order");
    if (order_it == request.end()) {
      throw ValidationError("order is required");
    }
    SubmitReceipt receipt =
        service_->submit(parseSubmitRequest(*order_it), transportChannel());
    response.update(toJson(receipt));
  } else if (type == "subscribe") {
    std::string order_id = requireOrderId(request);
    SubscribeResult result = service_->subscribe(order_id, transportChannel());
    response["order_id"] = order_id;
    response["status_topic"] = order_id;
    response["subscription_id"] = result.subscription;
    response["snapshot"] = toJson(result.snapshot);
  } else if (type == "unsubscribe") {
    std::string order_id = requireOrderId(request);
    response["order_id"] = order_id;
    response["detached"] = service_->unsubscribe(order_id);
  } else if (type == "get_order") {
    response["order"] = toJson(service_->getOrder(requireOrderId(request)));
  } else if (type == "list_orders") {
    std::size_t limit =
        readCount(request, "limit", OrderService::kDefaultListLimit);
    std::size_t offset = readCount(request, "offset", 0);
    nlohmann::json orders = nlohmann::json::array();
    for (const auto& order : service_->listOrders(limit, offset)) {
      orders.push_back(toJson(order));
    }
    response["orders"] = std::move(orders);
    response["limit"] = limit;
    response["offset"] = offset;
  } else if (type == "routing_history") {
    std::string order_id = requireOrderId(request);
    nlohmann::json decisions = nlohmann::json::array();
    for (const auto& decision : service_->routingHistory(order_id)) {
      decisions.push_back(toJson(decision));
    }
    response["order_id"] = order_id;
    response["decisions"] = std::move(decisions);
  } else if (type == "metrics") {
    response["metrics"] = toJson(service_->metrics());
  } else if (type == "health") {
    return toJson(service_->health());
  } else {
    throw ValidationError("unknown request type: " + type);
  }

  return response;
}

}  // namespace swaprouter
