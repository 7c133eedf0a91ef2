#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "superint/core/actions.h"
#include "superint/core/config.h"
#include "superint/core/event_bus.h"
#include "superint/core/game_state.h"
#include "superint/core/reducers.h"
#include "superint/core/save_store.h"
#include "superint/util/log.h"

namespace superint {

// Summary of one readable save record.
struct SaveSummary {
  std::string name;
  std::string version;
  Timestamp timestamp{0};
  int turn{0};
  int year{0};
  int quarter{0};
};

// Owns the current GameState and is the only place it is replaced.
//
// dispatch() runs the reducer; when the root pointer changes, state listeners
// are notified (each isolated: a throwing listener is logged) and
// "stateChanged" is emitted on the bus. Everything happens synchronously on
// the caller's stack, including any dispatches made by listeners.
class StateManager {
 public:
  using Listener = std::function<void(const GameStatePtr& prev, const GameStatePtr& next, const Action& action)>;
  using Reducer = std::function<GameStatePtr(const GameStatePtr&, const Action&)>;
  // Epoch milliseconds.
  using Clock = std::function<Timestamp()>;

  StateManager(GameStatePtr initial, EventBus& bus, Logger& log, SaveStore& store, Clock clock,
               const EngineConfig& cfg = EngineConfig{}, Reducer reducer = &reduce_game);

  StateManager(const StateManager&) = delete;
  StateManager& operator=(const StateManager&) = delete;

  const GameStatePtr& state() const { return state_; }
  Timestamp now() const { return clock_(); }

  void dispatch(const Action& action);

  Unsubscribe subscribe(Listener listener);

  // Calls `listener(prev_slice, next_slice, action)` only when the slice picked
  // by `select` (a GameState -> shared_ptr<const Slice> callable) changed.
  template <typename Selector, typename SliceListener>
  Unsubscribe subscribe_to_slice(Selector select, SliceListener listener) {
    return subscribe([select, listener](const GameStatePtr& prev, const GameStatePtr& next, const Action& action) {
      auto before = select(*prev);
      auto after = select(*next);
      if (before != after) listener(before, after, action);
    });
  }

  // Never throws; failures are logged and reported as false.
  bool save_state(const std::string& name);
  // Leaves the current state untouched on failure.
  bool load_state(const std::string& name);

  // Newest first.
  std::vector<SaveSummary> list_saves() const;
  bool delete_save(const std::string& name);

  std::string save_key(const std::string& name) const { return cfg_.save_key_prefix + name; }

 private:
  struct Entry {
    std::uint64_t id{0};
    Listener fn;
    bool active{true};
  };

  void notify(const GameStatePtr& prev, const GameStatePtr& next, const Action& action);
  void remove_listener(std::uint64_t id);

  GameStatePtr state_;
  EventBus& bus_;
  Logger& log_;
  SaveStore& store_;
  Clock clock_;
  EngineConfig cfg_;
  Reducer reducer_;

  std::uint64_t next_listener_id_{1};
  std::vector<std::shared_ptr<Entry>> listeners_;
  std::shared_ptr<StateManager*> self_;
};

} // namespace superint
