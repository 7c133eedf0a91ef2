#include "superint/core/game_state.h"

#include <algorithm>

namespace superint {
namespace {

double default_decay_rate(DataType t) {
  switch (t) {
    case DataType::Text: return 0.01;
    case DataType::Image: return 0.02;
    case DataType::Video: return 0.03;
    case DataType::Synthetic: return 0.02;
    case DataType::Behavioral: return 0.04;
    case DataType::Scientific: return 0.015;
  }
  return 0.02;
}

ResourcesSlice initial_resources() {
  ResourcesSlice r;

  r.influence.levels[InfluenceChannel::Academic] = 20.0;
  r.influence.levels[InfluenceChannel::Industry] = 5.0;
  r.influence.levels[InfluenceChannel::Government] = 5.0;
  r.influence.levels[InfluenceChannel::Public] = 10.0;
  r.influence.levels[InfluenceChannel::OpenSource] = 15.0;

  for (DataType t : kDataTypes) {
    DataTypeInfo info;
    info.decay_rate = default_decay_rate(t);
    r.data.types[t] = info;
  }

  // Every organization starts with public text and image corpora.
  DataTypeInfo& text = r.data.types[DataType::Text];
  text.amount = 100.0;
  text.quality = 0.7;
  text.sources = {"academic_library", "public_web"};
  text.generation_rate = 10.0;

  DataTypeInfo& image = r.data.types[DataType::Image];
  image.amount = 50.0;
  image.quality = 0.5;
  image.sources = {"public_web"};
  image.generation_rate = 5.0;

  r.data.tiers["public"] = true;
  return r;
}

} // namespace

bool InfluenceLevels::any_nonzero() const {
  return std::any_of(values.begin(), values.end(), [](double v) { return v != 0.0; });
}

double ComputingResources::allocated_total() const {
  double sum = 0.0;
  for (const auto& kv : allocated) sum += kv.second;
  return sum;
}

double ComputingResources::claim(const std::string& target) const {
  auto it = allocated.find(target);
  return it == allocated.end() ? 0.0 : it->second;
}

const DataTypeInfo* DataResources::find(DataType t) const {
  auto it = types.find(t);
  return it == types.end() ? nullptr : &it->second;
}

const ResearchNode* ResearchSlice::find(const std::string& id) const {
  auto it = nodes.find(id);
  return it == nodes.end() ? nullptr : &it->second;
}

bool ResearchSlice::is_completed(const std::string& id) const {
  const ResearchNode* n = find(id);
  return n && n->status == ResearchStatus::Completed;
}

bool ResearchSlice::is_active(const std::string& id) const {
  return std::find(active.begin(), active.end(), id) != active.end();
}

bool DeploymentsSlice::has_type_active(const std::string& type) const {
  for (const auto& kv : active) {
    if (kv.second.type == type || kv.first == type) return true;
  }
  return false;
}

const GameEvent* EventsSlice::find(const std::string& id) const {
  for (const auto& e : current) {
    if (e.id == id) return &e;
  }
  return nullptr;
}

double clamp_influence(double v) { return std::clamp(v, kInfluenceMin, kInfluenceMax); }

GameStatePtr make_initial_game_state(Timestamp start_date) {
  auto meta = std::make_shared<MetaSlice>();
  meta->start_date = start_date;

  auto s = std::make_shared<GameState>();
  s->meta = std::move(meta);
  s->resources = std::make_shared<const ResourcesSlice>(initial_resources());
  s->research = std::make_shared<const ResearchSlice>();
  s->deployments = std::make_shared<const DeploymentsSlice>();
  s->competitors = std::make_shared<const CompetitorsSlice>();
  s->world = std::make_shared<const WorldSlice>();
  s->settings = std::make_shared<const SettingsSlice>();
  s->events = std::make_shared<const EventsSlice>();
  return s;
}

} // namespace superint
