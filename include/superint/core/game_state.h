#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "superint/core/game_time.h"
#include "superint/util/json.h"

namespace superint {

// Wall-clock time in epoch milliseconds. Supplied by callers; reducers never
// read a clock.
using Timestamp = std::int64_t;

enum class Phase { Start, Action, Resolution, End };

enum class OrganizationType { Academic, Startup, BigTech, Government, OpenSource };

enum class Difficulty { Easy, Normal, Hard };

enum class InfluenceChannel { Academic, Industry, Government, Public, OpenSource };

enum class DataType { Text, Image, Video, Synthetic, Behavioral, Scientific };

enum class ResearchStatus { Locked, Unlocked, InProgress, Completed };

enum class ResearchNodeType { Standard, Breakthrough, Tiered, Risk, Divergent };

inline constexpr std::array<InfluenceChannel, 5> kInfluenceChannels{
    InfluenceChannel::Academic, InfluenceChannel::Industry, InfluenceChannel::Government,
    InfluenceChannel::Public, InfluenceChannel::OpenSource};

inline constexpr std::array<DataType, 6> kDataTypes{DataType::Text,      DataType::Image,      DataType::Video,
                                                    DataType::Synthetic, DataType::Behavioral, DataType::Scientific};

// Length of every per-slice history ring.
inline constexpr std::size_t kHistoryLimit = 10;

inline constexpr double kInfluenceMin = 0.0;
inline constexpr double kInfluenceMax = 100.0;

// One value per influence channel.
struct InfluenceLevels {
  std::array<double, kInfluenceChannels.size()> values{};

  double& operator[](InfluenceChannel c) { return values[static_cast<std::size_t>(c)]; }
  double operator[](InfluenceChannel c) const { return values[static_cast<std::size_t>(c)]; }

  bool any_nonzero() const;
  bool operator==(const InfluenceLevels& o) const { return values == o.values; }
  bool operator!=(const InfluenceLevels& o) const { return !(*this == o); }
};

// --- meta -----------------------------------------------------------------

struct TurnHistoryEntry {
  int turn{0};
  int year{0};
  int quarter{0};
  Timestamp timestamp{0};
};

struct MetaSlice {
  int turn{1};
  Phase phase{Phase::Start};
  GameTime time;
  OrganizationType organization{OrganizationType::Academic};
  Timestamp start_date{0};
  std::optional<Timestamp> last_saved;
  // Bounded to the most recent entries.
  std::vector<TurnHistoryEntry> turn_history;
};

// --- resources ------------------------------------------------------------

// Signed change of a consumer's compute claim.
struct AllocationRecord {
  int turn{0};
  std::string target;
  double amount{0.0};
  Timestamp timestamp{0};
};

struct AmountRecord {
  int turn{0};
  double amount{0.0};
  Timestamp timestamp{0};
};

struct ComputingResources {
  double total{50.0};
  // consumer id -> claimed compute
  std::unordered_map<std::string, double> allocated;
  double cap{100.0};
  double generation{5.0};
  double efficiency{1.0};
  std::vector<AllocationRecord> allocation_history;
  std::vector<AmountRecord> generation_history;

  double allocated_total() const;
  double available() const { return total - allocated_total(); }
  double claim(const std::string& target) const;
};

struct SpendingRecord {
  int turn{0};
  double amount{0.0};
  std::string reason;
  bool recurring{false};
  Timestamp timestamp{0};
};

struct FundingResources {
  double current{1000.0};
  double income{100.0};
  double expenses{80.0};
  double reserves{0.0};
  double max_reserves{5000.0};
  std::vector<AmountRecord> history;
  std::vector<SpendingRecord> spending_history;
};

struct InfluenceHistoryEntry {
  int turn{0};
  InfluenceLevels previous;
  InfluenceLevels delta;
  std::string reason;
  Timestamp timestamp{0};
};

struct InfluenceResources {
  InfluenceLevels levels;
  std::vector<InfluenceHistoryEntry> history;
};

struct DataTypeInfo {
  double amount{0.0};
  double quality{0.5};
  double decay_rate{0.02};
  std::vector<std::string> sources;
  double generation_rate{0.0};
  int last_updated{0};
};

struct DataAcquisition {
  int turn{0};
  DataType type{DataType::Text};
  double amount{0.0};
  std::string source;
  double quality{0.0};
  Timestamp timestamp{0};
};

struct DataResources {
  std::map<DataType, DataTypeInfo> types;
  // Access flags keyed by tier / dataset name.
  std::map<std::string, bool> tiers;
  std::map<std::string, bool> specialized_sets;
  double quality{1.0};
  std::vector<DataAcquisition> acquisition_history;

  const DataTypeInfo* find(DataType t) const;
};

struct ResourcesSlice {
  ComputingResources computing;
  FundingResources funding;
  InfluenceResources influence;
  DataResources data;
};

// --- research -------------------------------------------------------------

struct ResearchEffects {
  // Declared multipliers; absent means "no effect".
  std::optional<double> compute_efficiency;
  std::optional<double> influence_multiplier;
  std::vector<std::string> unlock_deployments;
  int deployment_slots{0};
  // Informational list of content this node opens up.
  std::vector<std::string> unlocks;
};

struct ResearchRisk {
  double probability{0.0};
  double severity{0.0};
};

struct NodePosition {
  double x{0.0};
  double y{0.0};
};

// Static definition of a research node, loaded from content.
struct ResearchDef {
  std::string id;
  std::string name;
  std::string description;
  std::string category;
  std::string subcategory;
  ResearchNodeType type{ResearchNodeType::Standard};
  std::vector<std::string> prerequisites;
  std::vector<std::string> exclusions;
  double compute_cost{0.0};
  InfluenceLevels influence_cost;
  std::vector<std::string> data_cost;
  ResearchEffects effects;
  std::optional<ResearchRisk> risk;
  NodePosition position;
  std::vector<std::string> deployment_requirements;
};

struct ResearchNode {
  ResearchDef def;
  ResearchStatus status{ResearchStatus::Locked};
  double progress{0.0};
  double compute_allocated{0.0};
  std::optional<int> start_turn;
  std::optional<int> completion_turn;
  double effective_compute_rate{0.0};
  // deployment id -> boost fraction
  std::unordered_map<std::string, double> deployment_boosts;

  const std::string& id() const { return def.id; }
};

struct ResearchSlice {
  std::unordered_map<std::string, ResearchNode> nodes;
  // InProgress node ids in the order they were started.
  std::vector<std::string> active;
  // Completed node ids in completion order.
  std::vector<std::string> completed;
  // category -> additive boost fraction
  std::unordered_map<std::string, double> category_boosts;
  std::map<DataType, double> data_requirements;
  double budget{0.0};

  const ResearchNode* find(const std::string& id) const;
  bool is_completed(const std::string& id) const;
  bool is_active(const std::string& id) const;
};

// --- deployments ----------------------------------------------------------

struct DeploymentEffects {
  double computing_efficiency{0.0};
  double funding_multiplier{0.0};
  InfluenceLevels influence_growth;
  double data_quality_bonus{0.0};
  double computing_generation{0.0};
  double funding_generation{0.0};
  // research category -> boost fraction
  std::unordered_map<std::string, double> research_boosts;
  // research node id -> boost fraction
  std::unordered_map<std::string, double> node_boosts;
};

struct Deployment {
  std::string id;
  std::string type;
  double compute_allocated{0.0};
  int turn_deployed{0};
  DeploymentEffects effects;
};

struct DeploymentHistoryEntry {
  std::string id;
  std::string type;
  int turn_deployed{0};
  int turn_removed{0};
  DeploymentEffects effects;
};

struct DeploymentsSlice {
  int slots{1};
  std::unordered_map<std::string, Deployment> active;
  std::vector<DeploymentHistoryEntry> history;
  std::vector<std::string> unlocked_types;

  bool has_type_active(const std::string& type) const;
};

// --- competitors / world / settings ---------------------------------------

struct Competitor {
  std::string id;
  std::string name;
  double capability{0.0};
  double safety{0.0};
  double funding{0.0};
  double influence{0.0};
};

struct CompetitorsSlice {
  std::unordered_map<std::string, Competitor> organizations;
  int player_ranking{1};
};

struct Region {
  std::string id;
  std::string name;
  double awareness{0.0};
  double regulation{0.0};
  double adoption{0.0};
};

struct WorldSlice {
  std::unordered_map<std::string, Region> regions;
  double global_awareness{0.0};
  double global_alignment{0.0};
  double global_regulation{0.0};
};

struct SettingsSlice {
  Difficulty difficulty{Difficulty::Normal};
  bool tutorial_enabled{true};
  bool auto_save{true};
  double music_volume{0.7};
  double sound_volume{0.7};
};

// --- events ---------------------------------------------------------------

struct EventChoice {
  std::string id;
  std::string text;
  json::Object effects;
  json::Object requirements;
};

// A narrative event awaiting the player's choice.
struct GameEvent {
  std::string id;
  std::string type;
  std::string title;
  std::string description;
  std::vector<EventChoice> choices;
  double urgency{0.0};
  int turn_triggered{0};
};

struct ResolvedEvent {
  std::string event_id;
  std::string choice_id;
  int turn_triggered{0};
  int turn_resolved{0};
  json::Object effects;
};

struct EventsSlice {
  std::vector<GameEvent> current;
  std::vector<ResolvedEvent> history;
  // Event ids that have been resolved at least once.
  std::map<std::string, bool> triggered;

  const GameEvent* find(const std::string& id) const;
};

// --- aggregate ------------------------------------------------------------

// Aggregate root. Every transition produces a new GameState; untouched slices
// are shared with the previous state, so pointer equality of a slice means
// "unchanged".
struct GameState {
  std::shared_ptr<const MetaSlice> meta;
  std::shared_ptr<const ResourcesSlice> resources;
  std::shared_ptr<const ResearchSlice> research;
  std::shared_ptr<const DeploymentsSlice> deployments;
  std::shared_ptr<const CompetitorsSlice> competitors;
  std::shared_ptr<const WorldSlice> world;
  std::shared_ptr<const SettingsSlice> settings;
  std::shared_ptr<const EventsSlice> events;
};

using GameStatePtr = std::shared_ptr<const GameState>;

// Starting position for a new game (turn 1, 2025-Q1, academic organization).
GameStatePtr make_initial_game_state(Timestamp start_date = 0);

// Append to a history vector, dropping the oldest entries beyond `limit`.
template <typename T>
void push_bounded(std::vector<T>& v, T entry, std::size_t limit) {
  v.push_back(std::move(entry));
  if (v.size() > limit) v.erase(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(v.size() - limit));
}

// Small helper for safe lookups.
template <typename Map>
auto* find_ptr(Map& m, const typename Map::key_type& k) {
  auto it = m.find(k);
  if (it == m.end()) return static_cast<decltype(&it->second)>(nullptr);
  return &it->second;
}

double clamp_influence(double v);

} // namespace superint
