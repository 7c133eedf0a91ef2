#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "superint/core/game_state.h"

namespace superint {

// --- meta -----------------------------------------------------------------

// Advance the turn counter by one. The phase is left to the turn cycle.
struct AdvanceTurn {};

struct SetPhase {
  Phase phase{Phase::Start};
};

// Field merge into the meta slice. Unset fields are left alone.
struct MetaUpdate {
  std::optional<Timestamp> last_saved;
  std::optional<OrganizationType> organization;
};

struct UpdateGameTime {
  GameTime time;
};

struct AddTurnHistory {
  TurnHistoryEntry entry;
};

struct UpdateTimeCompression {
  double compression_factor{1.0};
  int time_scale{kBaseTimeScale};
};

// --- resources ------------------------------------------------------------

// Claim `amount` compute for `target`. Ignored if the pool cannot cover it.
struct AllocateComputing {
  std::string target;
  double amount{0.0};
  int turn{0};
  Timestamp timestamp{0};
};

// Release up to `amount` of `target`'s claim.
struct DeallocateComputing {
  std::string target;
  double amount{0.0};
  int turn{0};
  Timestamp timestamp{0};
};

// Start-of-turn growth:
// - computing total grows by computing_gain, capped
// - funding changes by funding_net
// - influence channels change by influence_gain, clamped
// - data types decay in quality (floor 0.1) and grow by their generation rate
struct GenerateResources {
  int turn{0};
  Timestamp timestamp{0};
  double computing_gain{0.0};
  double funding_net{0.0};
  InfluenceLevels influence_gain;
};

struct SetComputingEfficiency {
  double efficiency{1.0};
};

// Deducts every part of an already validated cost in one step.
struct SpendResources {
  std::string reason;
  int turn{0};
  Timestamp timestamp{0};
  std::optional<double> computing;
  std::optional<double> funding;
  bool recurring{false};
  InfluenceLevels influence;
};

struct AdjustInfluence {
  InfluenceLevels changes;
  std::string reason;
  int turn{0};
  Timestamp timestamp{0};
};

struct UpdateDataType {
  DataType type{DataType::Text};
  DataTypeInfo info;
  std::optional<DataAcquisition> acquisition;
};

enum class DataAccessKind { Tier, SpecializedSet };

struct GrantDataAccess {
  DataAccessKind kind{DataAccessKind::Tier};
  std::string key;
  bool granted{true};
};

struct UpdateResourceCaps {
  std::optional<double> computing_cap;
  std::optional<double> computing_generation;
  std::optional<double> funding_income;
  std::optional<double> funding_expenses;
  std::optional<double> max_reserves;
};

// --- research -------------------------------------------------------------

// Seeds nodes that are not yet present.
struct InitializeResearch {
  std::vector<ResearchNode> nodes;
};

// Unlocked -> InProgress with an initial compute claim.
struct StartResearch {
  std::string node_id;
  double compute{0.0};
  int turn{0};
};

// InProgress -> Unlocked. Progress is kept, the claim is zeroed.
struct CancelResearch {
  std::string node_id;
};

struct AllocateResearchCompute {
  std::string node_id;
  double amount{0.0};
};

struct ResearchProgressUpdate {
  std::string node_id;
  double progress{0.0};
  double effective_compute_rate{0.0};
};

// Batched per-turn progress. Progress never decreases.
struct UpdateResearchProgress {
  std::vector<ResearchProgressUpdate> updates;
};

struct CompleteResearch {
  std::string node_id;
  int turn{0};
};

struct ResearchStatusChange {
  std::string node_id;
  ResearchStatus status{ResearchStatus::Locked};
};

// Locked <-> Unlocked flips from one unlock-propagation pass.
struct UpdateResearchStatuses {
  std::vector<ResearchStatusChange> changes;
};

struct SetResearchBoosts {
  std::unordered_map<std::string, double> category_boosts;
  // node id -> (deployment id -> boost)
  std::unordered_map<std::string, std::unordered_map<std::string, double>> node_boosts;
};

// --- deployments ----------------------------------------------------------

struct DeploySystem {
  Deployment deployment;
};

struct RemoveDeployment {
  std::string deployment_id;
  int turn{0};
};

struct UpdateDeploymentSlots {
  int slots{1};
};

struct UnlockDeploymentType {
  std::string type;
};

// --- competitors / world / settings ---------------------------------------

struct UpdateCompetitor {
  std::string id;
  std::optional<std::string> name;
  std::optional<double> capability;
  std::optional<double> safety;
  std::optional<double> funding;
  std::optional<double> influence;
};

struct UpdatePlayerRanking {
  int ranking{1};
};

struct UpdateGlobalValues {
  std::optional<double> awareness;
  std::optional<double> alignment;
  std::optional<double> regulation;
};

struct UpdateRegion {
  std::string id;
  std::optional<std::string> name;
  std::optional<double> awareness;
  std::optional<double> regulation;
  std::optional<double> adoption;
};

struct UpdateSettings {
  std::optional<Difficulty> difficulty;
  std::optional<bool> tutorial_enabled;
  std::optional<bool> auto_save;
  std::optional<double> music_volume;
  std::optional<double> sound_volume;
};

// --- events ---------------------------------------------------------------

// Ignored if the id is empty or already pending.
struct AddEvent {
  GameEvent event;
};

// Moves a pending event into the history. Ignored for unknown ids.
struct ResolveEvent {
  std::string event_id;
  std::string choice_id;
  json::Object effects;
  int turn{0};
};

// Marker passed to state listeners after a wholesale load. No reducer handles it.
struct StateLoaded {
  std::string name;
};

using Action = std::variant<
    // meta
    AdvanceTurn, SetPhase, MetaUpdate, UpdateGameTime, AddTurnHistory, UpdateTimeCompression,
    // resources
    AllocateComputing, DeallocateComputing, GenerateResources, SetComputingEfficiency, SpendResources,
    AdjustInfluence, UpdateDataType, GrantDataAccess, UpdateResourceCaps,
    // research
    InitializeResearch, StartResearch, CancelResearch, AllocateResearchCompute, UpdateResearchProgress,
    CompleteResearch, UpdateResearchStatuses, SetResearchBoosts,
    // deployments
    DeploySystem, RemoveDeployment, UpdateDeploymentSlots, UnlockDeploymentType,
    // competitors / world / settings
    UpdateCompetitor, UpdatePlayerRanking, UpdateGlobalValues, UpdateRegion, UpdateSettings,
    // events
    AddEvent, ResolveEvent,
    StateLoaded>;

// Stable upper-case name, e.g. "START_RESEARCH".
std::string action_type_name(const Action& a);

} // namespace superint
