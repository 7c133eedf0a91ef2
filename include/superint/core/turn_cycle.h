#pragma once

#include <vector>

#include "superint/core/config.h"
#include "superint/core/event_bus.h"
#include "superint/core/state_manager.h"
#include "superint/util/log.h"

namespace superint {

// Drives the turn phases: Start -> Action -> End -> Resolution -> next Start.
//
// Systems hook into the cycle through the bus:
//   turn:start   {turn}  resources generate, research is idle
//   turn:ending  {turn}  research progresses, effects are recomputed
//   turn:ended   {turn, year, quarter, month, day}
//
// Completed research compresses time: each completion adds 0.05 to the
// compression factor and each breakthrough another 0.1, so later turns cover
// fewer days.
class TurnCycle {
 public:
  TurnCycle(StateManager& state, EventBus& bus, Logger& log, const EngineConfig& cfg = EngineConfig{});
  ~TurnCycle();

  TurnCycle(const TurnCycle&) = delete;
  TurnCycle& operator=(const TurnCycle&) = delete;

  // Subscribes the time-compression hooks.
  void initialize();

  // Enters Start, emits turn:start, autosaves if enabled, then moves to Action.
  void start_turn();
  // Resolves the current turn, advances the clock and starts the next turn.
  void end_turn();

  // Returns false when the factor is already at its bound.
  bool adjust_time_compression(double amount);

  int turn() const;

 private:
  void set_phase(Phase phase);

  StateManager& state_;
  EventBus& bus_;
  Logger& log_;
  EngineConfig cfg_;
  std::vector<Unsubscribe> subscriptions_;
};

} // namespace superint
