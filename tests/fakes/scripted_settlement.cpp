#include "fakes/scripted_settlement.hpp"
#include "swaprouter/errors/router_error.hpp"

#include <stdexcept>

namespace swaprouter {
namespace fakes {

SettlementResult ScriptedSettlement::settle(const SettlementRequest& request) {
  ++calls_;

  std::lock_guard lock(mutex_);
  requests_.push_back(request);

  if (!script_.empty()) {
    auto [kind, message] = script_.front();
    script_.pop_front();
    if (kind == Script::Fail) {
      throw SettlementFailure(message);
    }
    throw std::runtime_error(message);
  }

  SettlementResult result;
  result.settlement_ref = "REF-" + std::to_string(++confirmed_);
  result.executed_price = request.quoted_price;
  result.actual_output =
      request.amount * request.quoted_price * (1.0 - request.fee);
  return result;
}

void ScriptedSettlement::failNext(const std::string& message, int times) {
  std::lock_guard lock(mutex_);
  for (int i = 0; i < times; ++i) {
    script_.emplace_back(Script::Fail, message);
  }
}

void ScriptedSettlement::faultNext(const std::string& message) {
  std::lock_guard lock(mutex_);
  script_.emplace_back(Script::Fault, message);
}

std::vector<SettlementRequest> ScriptedSettlement::requests() const {
  std::lock_guard lock(mutex_);
  return requests_;
}

}  // namespace fakes
}  // namespace swaprouter
