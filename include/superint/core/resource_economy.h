#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "superint/core/actions.h"
#include "superint/core/event_bus.h"
#include "superint/core/state_manager.h"
#include "superint/util/json.h"
#include "superint/util/log.h"

namespace superint {

struct DataRequirement {
  double min_amount{0.0};
  double min_quality{0.0};
};

// Data assets are persistent: a data cost is a requirement, never consumed.
struct DataCost {
  std::map<DataType, DataRequirement> requirements;
  std::map<std::string, bool> tiers;
  std::map<std::string, bool> specialized_sets;
};

// Absent parts are vacuously affordable.
struct ResourceCost {
  std::optional<double> computing;
  std::optional<double> funding;
  std::optional<InfluenceLevels> influence;
  std::optional<DataCost> data;
  // Recurring funding costs also raise per-turn expenses.
  bool recurring{false};
};

json::Value resource_cost_to_json(const ResourceCost& cost);
// Throws std::runtime_error on unknown channel / data type names.
ResourceCost resource_cost_from_json(const json::Value& v);

// Derived multipliers, recomputed from scratch from active deployments and
// completed research.
struct ResourceEffects {
  double computing_efficiency{1.0};
  double funding_multiplier{1.0};
  InfluenceLevels influence_multiplier{{1.0, 1.0, 1.0, 1.0, 1.0}};
  double data_quality_bonus{0.0};
  double computing_generation_bonus{0.0};
  double funding_generation_bonus{0.0};
};

json::Value resource_effects_to_json(const ResourceEffects& fx);

struct ResourceMetrics {
  double computing_total{0.0};
  double computing_available{0.0};
  double computing_allocated{0.0};
  int computing_utilization_percent{0};
  int computing_cap_percent{0};
  double computing_efficiency{1.0};

  double funding_current{0.0};
  double funding_net_flow{0.0};
  // Turns of expenses covered by current funds; nullopt without expenses.
  std::optional<double> funding_sustainability;

  InfluenceLevels influence;
  double influence_total{0.0};
  InfluenceChannel dominant_channel{InfluenceChannel::Academic};

  int data_tier_count{0};
  int data_specialized_set_count{0};
  double data_quality{0.0};
  double data_effective_quality{0.0};
  double data_total_amount{0.0};
};

// Affordability, spending, compute allocation, per-turn generation and the
// derived effect bundle. All changes go through StateManager::dispatch.
class ResourceEconomy {
 public:
  ResourceEconomy(StateManager& state, EventBus& bus, Logger& log);
  ~ResourceEconomy();

  ResourceEconomy(const ResourceEconomy&) = delete;
  ResourceEconomy& operator=(const ResourceEconomy&) = delete;

  // Subscribes to the bus and computes the initial effect bundle.
  void initialize();

  bool can_afford(const ResourceCost& cost) const;
  bool spend_resources(const ResourceCost& cost, const std::string& reason);

  bool allocate_computing(const std::string& target, double amount);
  bool deallocate_computing(const std::string& target, double amount);

  void generate_resources(int turn);
  void recompute_effects();
  const ResourceEffects& effects() const { return effects_; }

  bool adjust_influence(const InfluenceLevels& changes, const std::string& reason);

  // Returns false if access was already granted.
  bool add_data_access(DataAccessKind kind, const std::string& key);
  // `quality` defaults to the type's current quality.
  bool add_data(DataType type, double amount, const std::string& source, std::optional<double> quality = std::nullopt);
  bool check_data_access(DataType type, const DataRequirement& requirement) const;

  ResourceMetrics calculate_resource_metrics() const;

 private:
  InfluenceLevels influence_growth(OrganizationType org) const;

  StateManager& state_;
  EventBus& bus_;
  Logger& log_;
  ResourceEffects effects_;
  std::vector<Unsubscribe> subscriptions_;
};

} // namespace superint
