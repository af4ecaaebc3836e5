#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>

#include "internal/model/event.hpp"
#include "internal/util/errors.hpp"

namespace ledger::aggregate {

/*
  Aggregate contract.

  Apply must be pure: same state + same event -> same state, no I/O,
  no clock. Encode/Decode round-trip the state for snapshots.
*/
template <typename State>
class AggregateDefinition {
 public:
  virtual ~AggregateDefinition() = default;

  virtual State       Initial() const                                     = 0;
  virtual State       Apply(State state, const model::Event& event) const = 0;
  virtual std::string Encode(const State& state) const                    = 0;
  virtual State       Decode(const std::string& bytes) const              = 0;
};

/*
  Explicit type -> handler table. Unknown types throw
  util::UnknownEventType instead of being skipped.
*/
template <typename State>
class EventHandlerTable {
 public:
  using Handler = std::function<void(State&, const model::Event&)>;

  EventHandlerTable& On(std::string type, Handler handler) {
    handlers_[std::move(type)] = std::move(handler);
    return *this;
  }

  bool Handles(const std::string& type) const {
    return handlers_.contains(type);
  }

  State Apply(State state, const model::Event& event) const {
    auto it = handlers_.find(event.type);
    if (it == handlers_.end()) {
      throw util::UnknownEventType(event.type);
    }
    it->second(state, event);
    return state;
  }

 private:
  std::unordered_map<std::string, Handler> handlers_;
};

} // namespace ledger::aggregate
