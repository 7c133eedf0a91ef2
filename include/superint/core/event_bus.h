#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "superint/util/json.h"
#include "superint/util/log.h"

namespace superint {

struct GameState;

// Payload delivered to bus handlers.
struct BusEvent {
  std::string topic;
  json::Value data;
  // Only set for "stateChanged".
  std::shared_ptr<const GameState> prev_state;
  std::shared_ptr<const GameState> next_state;
};

// Removes exactly the subscription it was returned for. Safe to call more than
// once and after the bus is gone.
using Unsubscribe = std::function<void()>;

struct EmissionRecord {
  std::string topic;
  std::string source;
  // Number of emissions already in flight when this one started.
  int depth{0};
  std::string parent_topic;
};

// Synchronous topic-keyed publish/subscribe.
//
// emit() invokes the topic's handlers in subscription order before returning.
// Handlers subscribed during an emission are not called by it; handlers
// unsubscribed during an emission are skipped. A handler that throws is
// logged and the remaining handlers still run.
class EventBus {
 public:
  using Handler = std::function<void(const BusEvent&)>;

  explicit EventBus(Logger& log, std::size_t history_limit = 1000, std::size_t max_listeners = 10);
  ~EventBus();

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  Unsubscribe subscribe(const std::string& topic, Handler handler, std::string source = "");

  void emit(const std::string& topic, json::Value data = json::Object{}, const std::string& source = "");
  void emit(BusEvent event, const std::string& source = "");

  std::size_t listener_count(const std::string& topic) const;

  // Most recent emissions, oldest first. limit == 0 returns all retained.
  std::vector<EmissionRecord> history(std::size_t limit = 0) const;
  void clear_history() { history_.clear(); }

  // Topics of the emissions currently in flight, outermost first.
  const std::vector<std::string>& current_chain() const { return chain_; }

  // When enabled every emission is logged at debug level.
  void set_debug(bool enabled) { debug_ = enabled; }
  bool debug() const { return debug_; }

 private:
  struct Subscription {
    std::uint64_t id{0};
    Handler handler;
    std::string source;
    bool active{true};
  };

  void remove(const std::string& topic, std::uint64_t id);
  std::string chain_string() const;

  Logger& log_;
  std::size_t history_limit_;
  std::size_t max_listeners_;
  std::uint64_t next_id_{1};
  bool debug_{false};

  std::unordered_map<std::string, std::vector<std::shared_ptr<Subscription>>> subs_;
  std::deque<EmissionRecord> history_;
  std::vector<std::string> chain_;

  // Expires with the bus; outstanding Unsubscribe callables check it.
  std::shared_ptr<EventBus*> self_;
};

} // namespace superint
