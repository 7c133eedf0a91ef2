#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "superint/core/config.h"
#include "superint/core/event_bus.h"
#include "superint/core/random_source.h"
#include "superint/core/research_content.h"
#include "superint/core/state_manager.h"
#include "superint/util/log.h"

namespace superint {

struct ResearchMetrics {
  int total_nodes{0};
  int locked{0};
  int unlocked{0};
  int in_progress{0};
  int completed{0};
  // Whole percent, rounded.
  int completed_percent{0};
  std::map<std::string, int> category_completion;
  std::map<std::string, int> active_progress;
  // Turns until an active node completes at the current rate, saturating at
  // INT_MAX; nullopt when it is not progressing.
  std::map<std::string, std::optional<int>> turns_to_completion;
  std::unordered_map<std::string, double> category_boosts;
};

// Drives the research tree: node status transitions, per-turn progress,
// unlock propagation and completion effects.
//
// Node state lives in the research slice; the engine only reads it through
// the StateManager and changes it by dispatching actions. Compute claims are
// requested from the resource economy over the bus ("resource:allocate" /
// "resource:deallocate") using the consumer id "research:<node id>".
class ResearchEngine {
 public:
  ResearchEngine(StateManager& state, EventBus& bus, Logger& log, RandomSource& rng,
                 const EngineConfig& cfg = EngineConfig{});
  ~ResearchEngine();

  ResearchEngine(const ResearchEngine&) = delete;
  ResearchEngine& operator=(const ResearchEngine&) = delete;

  // Validates the content (throws std::runtime_error listing every problem),
  // subscribes to the bus and seeds the research slice if it is empty.
  void initialize(ResearchDB db);
  bool initialized() const { return initialized_; }
  const ResearchDB& content() const { return db_; }

  bool start_research(const std::string& node_id, double compute);
  bool cancel_research(const std::string& node_id);
  bool allocate_compute(const std::string& node_id, double amount);

  bool can_afford_research(const std::string& node_id) const;
  bool are_prerequisites_met(const std::string& node_id) const;

  // One turn of progress for every InProgress node; completes nodes that
  // reach 1.0.
  void progress_active_research(int turn);

  // Locked <-> Unlocked propagation for every node that is neither active
  // nor completed.
  void update_node_statuses();

  void update_research_boosts();

  // Progress a node would gain this turn with the current state.
  double progress_per_turn(const std::string& node_id) const;

  ResearchMetrics calculate_research_metrics() const;

  static std::string consumer_id(const std::string& node_id) { return "research:" + node_id; }

 private:
  void seed_or_refresh();
  void complete_research(const std::string& node_id, int turn);
  void emit_effects(const ResearchNode& node, int turn);
  double progress_increment(const ResearchNode& node, const GameState& s) const;
  double effective_compute(const ResearchNode& node, const GameState& s) const;
  bool request_compute(const std::string& node_id, double amount);
  int current_turn() const;

  StateManager& state_;
  EventBus& bus_;
  Logger& log_;
  RandomSource& rng_;
  EngineConfig cfg_;

  ResearchDB db_;
  bool initialized_{false};
  std::vector<Unsubscribe> subscriptions_;
};

} // namespace superint
