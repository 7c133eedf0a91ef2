#include "superint/core/research_engine.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "superint/core/enum_strings.h"
#include "superint/util/sorted_keys.h"

namespace superint {
namespace {

constexpr double kEpsilon = 1e-9;
constexpr const char* kSource = "ResearchEngine";

json::Array to_array(const std::vector<std::string>& v) {
  json::Array a;
  for (const auto& s : v) a.push_back(s);
  return a;
}

std::string fmt(double v) {
  std::ostringstream ss;
  ss << v;
  return ss.str();
}

} // namespace

ResearchEngine::ResearchEngine(StateManager& state, EventBus& bus, Logger& log, RandomSource& rng,
                               const EngineConfig& cfg)
    : state_(state), bus_(bus), log_(log), rng_(rng), cfg_(cfg) {}

ResearchEngine::~ResearchEngine() {
  for (auto& unsub : subscriptions_) unsub();
}

void ResearchEngine::initialize(ResearchDB db) {
  if (initialized_) {
    log_.warn("ResearchEngine: already initialized");
    return;
  }

  const auto errors = validate_research_db(db);
  if (!errors.empty()) {
    std::string msg = "Invalid research content (" + std::to_string(errors.size()) + " errors):";
    for (const auto& e : errors) msg += "\n  - " + e;
    throw std::runtime_error(msg);
  }
  db_ = std::move(db);

  subscriptions_.push_back(bus_.subscribe(
      "turn:start",
      [this](const BusEvent& ev) {
        if (log_.enabled(log::Level::Debug)) {
          log_.debug("ResearchEngine: turn " + std::to_string(ev.data.at("turn").int_value()) + " started");
        }
      },
      kSource));

  subscriptions_.push_back(bus_.subscribe(
      "turn:ending",
      [this](const BusEvent& ev) {
        const json::Value* t = ev.data.find("turn");
        progress_active_research(t ? static_cast<int>(t->int_value()) : current_turn());
        update_research_boosts();
      },
      kSource));

  subscriptions_.push_back(bus_.subscribe(
      "action:start_research",
      [this](const BusEvent& ev) {
        start_research(ev.data.at("node_id").string_value(), ev.data.at("compute").number_value());
      },
      kSource));

  subscriptions_.push_back(bus_.subscribe(
      "action:cancel_research",
      [this](const BusEvent& ev) { cancel_research(ev.data.at("node_id").string_value()); }, kSource));

  subscriptions_.push_back(bus_.subscribe(
      "action:allocate_research_compute",
      [this](const BusEvent& ev) {
        allocate_compute(ev.data.at("node_id").string_value(), ev.data.at("amount").number_value());
      },
      kSource));

  subscriptions_.push_back(
      bus_.subscribe("deployment:active", [this](const BusEvent&) { update_research_boosts(); }, kSource));

  subscriptions_.push_back(bus_.subscribe("stateLoaded", [this](const BusEvent&) { seed_or_refresh(); }, kSource));

  initialized_ = true;
  seed_or_refresh();
  log_.info("ResearchEngine: initialized with " + std::to_string(db_.nodes.size()) + " research nodes");
}

void ResearchEngine::seed_or_refresh() {
  if (!state_.state()->research->nodes.empty()) {
    update_node_statuses();
    return;
  }

  state_.dispatch(InitializeResearch{make_research_nodes(db_)});
  update_node_statuses();

  std::vector<std::string> available;
  const auto s = state_.state();
  for (const auto& id : util::sorted_keys(s->research->nodes)) {
    if (s->research->nodes.at(id).status == ResearchStatus::Unlocked) available.push_back(id);
  }

  json::Object data;
  data["available_nodes"] = to_array(available);
  data["total_nodes"] = static_cast<double>(db_.nodes.size());
  bus_.emit("research:initialized", std::move(data), kSource);
}

int ResearchEngine::current_turn() const { return state_.state()->meta->turn; }

double ResearchEngine::progress_increment(const ResearchNode& node, const GameState& s) const {
  const double cost = node.def.compute_cost > 0.0 ? node.def.compute_cost : cfg_.default_compute_cost;
  double rate = node.compute_allocated / cost;

  auto cat = s.research->category_boosts.find(node.def.category);
  if (cat != s.research->category_boosts.end()) rate *= (1.0 + cat->second);

  for (const auto& dep : util::sorted_keys(node.deployment_boosts)) rate *= (1.0 + node.deployment_boosts.at(dep));

  rate *= s.resources->computing.efficiency;
  return rate;
}

double ResearchEngine::effective_compute(const ResearchNode& node, const GameState& s) const {
  const double cost = node.def.compute_cost > 0.0 ? node.def.compute_cost : cfg_.default_compute_cost;
  return progress_increment(node, s) * cost;
}

double ResearchEngine::progress_per_turn(const std::string& node_id) const {
  const auto s = state_.state();
  const ResearchNode* node = s->research->find(node_id);
  return node ? progress_increment(*node, *s) : 0.0;
}

void ResearchEngine::progress_active_research(int turn) {
  const auto s = state_.state();
  const ResearchSlice& research = *s->research;
  if (research.active.empty()) return;

  struct Pending {
    std::string id;
    double previous{0.0};
    double next{0.0};
    double increment{0.0};
    double compute{0.0};
  };
  std::vector<Pending> pending;
  UpdateResearchProgress batch;

  for (const auto& id : research.active) {
    const ResearchNode* node = research.find(id);
    if (!node || node->status != ResearchStatus::InProgress) {
      log_.warn("ResearchEngine: node '" + id + "' is listed as active but not in progress");
      continue;
    }
    const double inc = progress_increment(*node, *s);
    const double next = std::clamp(node->progress + inc, 0.0, 1.0);
    batch.updates.push_back(ResearchProgressUpdate{id, next, effective_compute(*node, *s)});
    pending.push_back(Pending{id, node->progress, next, inc, node->compute_allocated});
  }
  if (batch.updates.empty()) return;

  state_.dispatch(batch);

  for (const auto& p : pending) {
    json::Object data;
    data["node_id"] = p.id;
    data["previous_progress"] = p.previous;
    data["new_progress"] = p.next;
    data["increment"] = p.increment;
    data["compute_allocated"] = p.compute;
    data["turn"] = turn;
    bus_.emit("research:progress", std::move(data), kSource);
  }

  for (const auto& p : pending) {
    if (p.next >= 1.0 - kEpsilon) complete_research(p.id, turn);
  }
}

void ResearchEngine::complete_research(const std::string& node_id, int turn) {
  const auto s = state_.state();
  const ResearchNode* found = s->research->find(node_id);
  if (!found || found->status == ResearchStatus::Completed) return;
  const ResearchNode node = *found;
  const double claim = s->resources->computing.claim(consumer_id(node_id));

  state_.dispatch(CompleteResearch{node_id, turn});

  if (claim > 0.0) {
    json::Object data;
    data["resource"] = "computing";
    data["target"] = consumer_id(node_id);
    data["amount"] = claim;
    bus_.emit("resource:deallocate", std::move(data), kSource);
  }

  update_node_statuses();
  emit_effects(node, turn);

  log_.info("ResearchEngine: completed '" + node.def.name + "' on turn " + std::to_string(turn));
  {
    json::Object data;
    data["node_id"] = node_id;
    data["category"] = node.def.category;
    data["turn"] = turn;
    data["total_completed"] = static_cast<double>(state_.state()->research->completed.size());
    bus_.emit("research:completed", std::move(data), kSource);
  }

  if (node.def.type == ResearchNodeType::Breakthrough) {
    GameEvent ev;
    ev.id = "research_breakthrough:" + node_id;
    ev.type = "research_breakthrough";
    ev.title = "Breakthrough: " + node.def.name;
    ev.description = node.def.description;
    ev.choices.push_back(EventChoice{"acknowledge", "Continue", {}, {}});
    ev.turn_triggered = turn;
    state_.dispatch(AddEvent{std::move(ev)});

    json::Object data;
    data["type"] = "research_breakthrough";
    data["node_id"] = node_id;
    data["category"] = node.def.category;
    data["turn"] = turn;
    bus_.emit("game:event", std::move(data), kSource);
  }

  if (node.def.risk) {
    const double draw = rng_.next_u01();
    if (draw < node.def.risk->probability) {
      log_.warn("ResearchEngine: risk event triggered by '" + node_id + "'");
      GameEvent ev;
      ev.id = "research_risk:" + node_id;
      ev.type = "research_risk";
      ev.title = "Research risk: " + node.def.name;
      ev.description = node.def.description;
      ev.choices.push_back(EventChoice{"acknowledge", "Accept the consequences", {}, {}});
      ev.urgency = node.def.risk->severity;
      ev.turn_triggered = turn;
      state_.dispatch(AddEvent{std::move(ev)});

      json::Object data;
      data["type"] = "research_risk";
      data["node_id"] = node_id;
      data["severity"] = node.def.risk->severity;
      data["turn"] = turn;
      bus_.emit("game:event", std::move(data), kSource);
    }
  }
}

void ResearchEngine::emit_effects(const ResearchNode& node, int turn) {
  const ResearchEffects& fx = node.def.effects;
  const std::string source = consumer_id(node.id());

  if (fx.compute_efficiency) {
    json::Object data;
    data["type"] = "compute_efficiency";
    data["multiplier"] = *fx.compute_efficiency;
    data["source"] = source;
    bus_.emit("resource:effect", std::move(data), kSource);
  }
  if (fx.influence_multiplier) {
    json::Object data;
    data["type"] = "influence_multiplier";
    data["multiplier"] = *fx.influence_multiplier;
    data["source"] = source;
    bus_.emit("resource:effect", std::move(data), kSource);
  }
  for (const auto& type : fx.unlock_deployments) {
    state_.dispatch(UnlockDeploymentType{type});
    json::Object data;
    data["type"] = type;
    data["source"] = source;
    data["turn"] = turn;
    bus_.emit("deployment:unlock", std::move(data), kSource);
  }
  if (fx.deployment_slots > 0) {
    json::Object data;
    data["slots"] = fx.deployment_slots;
    data["source"] = source;
    bus_.emit("deployment:capacity", std::move(data), kSource);
  }
}

void ResearchEngine::update_node_statuses() {
  const auto s = state_.state();
  const ResearchSlice& research = *s->research;

  UpdateResearchStatuses batch;
  json::Array updates;
  for (const auto& id : util::sorted_keys(research.nodes)) {
    const ResearchNode& node = research.nodes.at(id);
    if (node.status == ResearchStatus::InProgress || node.status == ResearchStatus::Completed) continue;

    const bool prereqs_done = std::all_of(node.def.prerequisites.begin(), node.def.prerequisites.end(),
                                          [&](const std::string& p) { return research.is_completed(p); });
    const bool excluded = std::any_of(node.def.exclusions.begin(), node.def.exclusions.end(),
                                      [&](const std::string& x) { return research.is_completed(x); });
    const ResearchStatus target = (prereqs_done && !excluded) ? ResearchStatus::Unlocked : ResearchStatus::Locked;
    if (node.status == target) continue;

    batch.changes.push_back(ResearchStatusChange{id, target});
    json::Object u;
    u["node_id"] = id;
    u["status"] = research_status_to_string(target);
    updates.push_back(std::move(u));
  }
  if (batch.changes.empty()) return;

  state_.dispatch(batch);
  json::Object data;
  data["updates"] = std::move(updates);
  bus_.emit("research:statuses_updated", std::move(data), kSource);
}

void ResearchEngine::update_research_boosts() {
  const auto s = state_.state();

  SetResearchBoosts boosts;
  for (const auto& dep_id : util::sorted_keys(s->deployments->active)) {
    const Deployment& dep = s->deployments->active.at(dep_id);
    for (const auto& kv : dep.effects.research_boosts) boosts.category_boosts[kv.first] += kv.second;
    for (const auto& kv : dep.effects.node_boosts) {
      if (s->research->find(kv.first)) boosts.node_boosts[kv.first][dep.id] = kv.second;
    }
  }

  json::Object cats;
  for (const auto& kv : boosts.category_boosts) cats[kv.first] = kv.second;

  state_.dispatch(boosts);
  json::Object data;
  data["category_boosts"] = std::move(cats);
  bus_.emit("research:boosts:updated", std::move(data), kSource);
}

bool ResearchEngine::request_compute(const std::string& node_id, double amount) {
  const std::string target = consumer_id(node_id);
  const auto before_state = state_.state();
  const double available = before_state->resources->computing.available();
  if (amount > available + kEpsilon) {
    log_.warn("ResearchEngine: not enough compute for '" + node_id + "' (requested " + fmt(amount) +
              ", available " + fmt(available) + ")");
    return false;
  }
  const double before = before_state->resources->computing.claim(target);

  json::Object data;
  data["resource"] = "computing";
  data["target"] = target;
  data["amount"] = amount;
  bus_.emit("resource:allocate", std::move(data), kSource);

  const double after = state_.state()->resources->computing.claim(target);
  if (after + kEpsilon < before + amount) {
    log_.warn("ResearchEngine: compute allocation for '" + node_id + "' was not applied");
    if (after > before) {
      json::Object undo;
      undo["resource"] = "computing";
      undo["target"] = target;
      undo["amount"] = after - before;
      bus_.emit("resource:deallocate", std::move(undo), kSource);
    }
    return false;
  }
  return true;
}

bool ResearchEngine::start_research(const std::string& node_id, double compute) {
  const auto s = state_.state();
  const ResearchNode* node = s->research->find(node_id);
  if (!node) {
    log_.warn("ResearchEngine: cannot start unknown node '" + node_id + "'");
    return false;
  }
  if (node->status != ResearchStatus::Unlocked) {
    log_.warn("ResearchEngine: cannot start '" + node_id + "' with status " + research_status_to_string(node->status));
    return false;
  }
  if (!(compute > 0.0)) {
    log_.warn("ResearchEngine: cannot start '" + node_id + "' without compute");
    return false;
  }
  if (!request_compute(node_id, compute)) return false;

  const int turn = current_turn();
  state_.dispatch(StartResearch{node_id, compute, turn});

  const ResearchNode* started = state_.state()->research->find(node_id);
  if (!started || started->status != ResearchStatus::InProgress) {
    log_.warn("ResearchEngine: '" + node_id + "' did not enter research; releasing its compute");
    json::Object undo;
    undo["resource"] = "computing";
    undo["target"] = consumer_id(node_id);
    undo["amount"] = compute;
    bus_.emit("resource:deallocate", std::move(undo), kSource);
    return false;
  }

  log_.info("ResearchEngine: started '" + node_id + "' with " + fmt(compute) + " compute");
  json::Object data;
  data["node_id"] = node_id;
  data["compute"] = compute;
  data["turn"] = turn;
  bus_.emit("research:started", std::move(data), kSource);
  return true;
}

bool ResearchEngine::cancel_research(const std::string& node_id) {
  const auto s = state_.state();
  const ResearchNode* node = s->research->find(node_id);
  if (!node || node->status != ResearchStatus::InProgress) {
    log_.warn("ResearchEngine: cannot cancel '" + node_id + "', it is not in progress");
    return false;
  }
  const double progress = node->progress;
  const double claim = s->resources->computing.claim(consumer_id(node_id));

  if (claim > 0.0) {
    json::Object data;
    data["resource"] = "computing";
    data["target"] = consumer_id(node_id);
    data["amount"] = claim;
    bus_.emit("resource:deallocate", std::move(data), kSource);
  }
  state_.dispatch(CancelResearch{node_id});

  log_.info("ResearchEngine: cancelled '" + node_id + "' at " + fmt(progress * 100.0) + "%");
  json::Object data;
  data["node_id"] = node_id;
  data["saved_progress"] = progress;
  data["turn"] = current_turn();
  bus_.emit("research:cancelled", std::move(data), kSource);
  return true;
}

bool ResearchEngine::allocate_compute(const std::string& node_id, double amount) {
  const ResearchNode* node = state_.state()->research->find(node_id);
  if (!node || node->status != ResearchStatus::InProgress) {
    log_.warn("ResearchEngine: cannot allocate compute to '" + node_id + "', it is not in progress");
    return false;
  }
  if (!(amount > 0.0)) {
    log_.warn("ResearchEngine: compute allocation for '" + node_id + "' must be positive");
    return false;
  }
  if (!request_compute(node_id, amount)) return false;

  state_.dispatch(AllocateResearchCompute{node_id, amount});

  json::Object data;
  data["node_id"] = node_id;
  data["amount"] = amount;
  data["new_total"] = state_.state()->research->find(node_id)->compute_allocated;
  data["turn"] = current_turn();
  bus_.emit("research:compute_allocated", std::move(data), kSource);
  return true;
}

bool ResearchEngine::are_prerequisites_met(const std::string& node_id) const {
  const auto s = state_.state();
  const ResearchNode* node = s->research->find(node_id);
  if (!node) return false;
  return std::all_of(node->def.prerequisites.begin(), node->def.prerequisites.end(),
                     [&](const std::string& p) { return s->research->is_completed(p); });
}

bool ResearchEngine::can_afford_research(const std::string& node_id) const {
  const auto s = state_.state();
  const ResearchNode* node = s->research->find(node_id);
  if (!node) return false;

  for (const auto& req : node->def.deployment_requirements) {
    if (!s->deployments->has_type_active(req)) return false;
  }
  if (node->def.compute_cost > s->resources->computing.available()) return false;

  const InfluenceLevels& have = s->resources->influence.levels;
  for (InfluenceChannel c : kInfluenceChannels) {
    if (have[c] < node->def.influence_cost[c]) return false;
  }
  return true;
}

ResearchMetrics ResearchEngine::calculate_research_metrics() const {
  const auto s = state_.state();
  const ResearchSlice& research = *s->research;

  ResearchMetrics m;
  std::map<std::string, std::pair<int, int>> per_category; // completed, total
  for (const auto& [id, node] : research.nodes) {
    ++m.total_nodes;
    auto& cat = per_category[node.def.category];
    ++cat.second;
    switch (node.status) {
      case ResearchStatus::Locked: ++m.locked; break;
      case ResearchStatus::Unlocked: ++m.unlocked; break;
      case ResearchStatus::InProgress: ++m.in_progress; break;
      case ResearchStatus::Completed:
        ++m.completed;
        ++cat.first;
        break;
    }
  }

  const auto percent = [](int part, int whole) {
    return whole > 0 ? static_cast<int>(std::lround(100.0 * part / whole)) : 0;
  };
  m.completed_percent = percent(m.completed, m.total_nodes);
  for (const auto& [cat, counts] : per_category) m.category_completion[cat] = percent(counts.first, counts.second);

  for (const auto& id : research.active) {
    const ResearchNode* node = research.find(id);
    if (!node) continue;
    m.active_progress[id] = static_cast<int>(std::lround(node->progress * 100.0));
    const double per_turn = progress_increment(*node, *s);
    if (per_turn > 0.0) {
      const double turns = std::ceil((1.0 - node->progress) / per_turn - kEpsilon);
      // Slow enough rates saturate instead of overflowing the cast.
      constexpr double kMaxTurns = static_cast<double>(std::numeric_limits<int>::max());
      m.turns_to_completion[id] = static_cast<int>(std::min(turns, kMaxTurns));
    } else {
      m.turns_to_completion[id] = std::nullopt;
    }
  }
  m.category_boosts = research.category_boosts;
  return m;
}

} // namespace superint
