#include "superint/core/serialization.h"

#include <stdexcept>

#include "superint/core/enum_strings.h"
#include "superint/core/research_content.h"

namespace superint {
namespace {

using json::Array;
using json::Object;
using json::Value;

// --- read helpers ---------------------------------------------------------

const Value* find_key(const Object& o, const std::string& k) {
  auto it = o.find(k);
  return it == o.end() ? nullptr : &it->second;
}

double get_num(const Object& o, const std::string& k, double def = 0.0) {
  const Value* v = find_key(o, k);
  return v ? v->number_value(def) : def;
}

int get_int(const Object& o, const std::string& k, int def = 0) {
  const Value* v = find_key(o, k);
  return v ? static_cast<int>(v->int_value(def)) : def;
}

Timestamp get_ts(const Object& o, const std::string& k) {
  const Value* v = find_key(o, k);
  return v ? v->int_value(0) : 0;
}

std::string get_str(const Object& o, const std::string& k, const std::string& def = "") {
  const Value* v = find_key(o, k);
  return v ? v->string_value(def) : def;
}

bool get_bool(const Object& o, const std::string& k, bool def = false) {
  const Value* v = find_key(o, k);
  return v ? v->bool_value(def) : def;
}

std::optional<int> get_opt_int(const Object& o, const std::string& k) {
  const Value* v = find_key(o, k);
  if (!v || !v->is_number()) return std::nullopt;
  return static_cast<int>(v->int_value());
}

const Object& get_obj(const Object& o, const std::string& k) {
  static const Object kEmpty;
  const Value* v = find_key(o, k);
  return (v && v->is_object()) ? *v->as_object() : kEmpty;
}

const Array& get_arr(const Object& o, const std::string& k) {
  static const Array kEmpty;
  const Value* v = find_key(o, k);
  return (v && v->is_array()) ? *v->as_array() : kEmpty;
}

std::vector<std::string> get_strings(const Object& o, const std::string& k) {
  std::vector<std::string> out;
  for (const auto& e : get_arr(o, k)) out.push_back(e.string_value());
  return out;
}

// --- shared encoders ------------------------------------------------------

Array strings_to_json(const std::vector<std::string>& v) {
  Array a;
  a.reserve(v.size());
  for (const auto& s : v) a.push_back(s);
  return a;
}

template <typename Map>
Object number_map_to_json(const Map& m) {
  Object o;
  for (const auto& kv : m) o[kv.first] = kv.second;
  return o;
}

std::unordered_map<std::string, double> number_map_from_json(const Object& o) {
  std::unordered_map<std::string, double> out;
  for (const auto& kv : o) out[kv.first] = kv.second.number_value();
  return out;
}

std::map<std::string, bool> flag_map_from_json(const Object& o) {
  std::map<std::string, bool> out;
  for (const auto& kv : o) out[kv.first] = kv.second.bool_value();
  return out;
}

Object influence_to_json(const InfluenceLevels& l) {
  Object o;
  for (InfluenceChannel c : kInfluenceChannels) o[influence_channel_to_string(c)] = l[c];
  return o;
}

InfluenceLevels influence_from_json(const Object& o) {
  InfluenceLevels l;
  for (InfluenceChannel c : kInfluenceChannels) l[c] = get_num(o, influence_channel_to_string(c));
  return l;
}

Object amount_record_to_json(const AmountRecord& r) {
  Object o;
  o["turn"] = r.turn;
  o["amount"] = r.amount;
  o["timestamp"] = r.timestamp;
  return o;
}

AmountRecord amount_record_from_json(const Object& o) {
  return AmountRecord{get_int(o, "turn"), get_num(o, "amount"), get_ts(o, "timestamp")};
}

Value opt_int_to_json(const std::optional<int>& v) { return v ? Value(*v) : Value(nullptr); }

// --- meta -----------------------------------------------------------------

Value meta_to_json(const MetaSlice& m) {
  Object o;
  o["turn"] = m.turn;
  o["phase"] = phase_to_string(m.phase);

  Object t;
  t["year"] = m.time.year;
  t["quarter"] = m.time.quarter;
  t["month"] = m.time.month;
  t["day"] = m.time.day;
  t["time_scale"] = m.time.time_scale;
  t["compression_factor"] = m.time.compression_factor;
  t["days_passed"] = m.time.days_passed;
  o["time"] = std::move(t);

  o["organization"] = organization_type_to_string(m.organization);
  o["start_date"] = m.start_date;
  o["last_saved"] = m.last_saved ? Value(*m.last_saved) : Value(nullptr);

  Array hist;
  for (const auto& h : m.turn_history) {
    Object e;
    e["turn"] = h.turn;
    e["year"] = h.year;
    e["quarter"] = h.quarter;
    e["timestamp"] = h.timestamp;
    hist.push_back(std::move(e));
  }
  o["turn_history"] = std::move(hist);
  return o;
}

MetaSlice meta_from_json(const Object& o) {
  MetaSlice m;
  m.turn = get_int(o, "turn", 1);
  m.phase = phase_from_string(get_str(o, "phase")).value_or(Phase::Start);

  const Object& t = get_obj(o, "time");
  m.time.year = get_int(t, "year", m.time.year);
  m.time.quarter = get_int(t, "quarter", m.time.quarter);
  m.time.month = get_int(t, "month", m.time.month);
  m.time.day = get_int(t, "day", m.time.day);
  m.time.time_scale = get_int(t, "time_scale", m.time.time_scale);
  m.time.compression_factor = get_num(t, "compression_factor", m.time.compression_factor);
  m.time.days_passed = get_ts(t, "days_passed");

  m.organization = organization_type_from_string(get_str(o, "organization")).value_or(OrganizationType::Academic);
  m.start_date = get_ts(o, "start_date");
  if (const Value* v = find_key(o, "last_saved"); v && v->is_number()) m.last_saved = v->int_value();

  for (const auto& e : get_arr(o, "turn_history")) {
    const Object& h = e.object();
    m.turn_history.push_back(
        TurnHistoryEntry{get_int(h, "turn"), get_int(h, "year"), get_int(h, "quarter"), get_ts(h, "timestamp")});
  }
  return m;
}

// --- resources ------------------------------------------------------------

Value computing_to_json(const ComputingResources& c) {
  Object o;
  o["total"] = c.total;
  o["allocated"] = number_map_to_json(c.allocated);
  o["cap"] = c.cap;
  o["generation"] = c.generation;
  o["efficiency"] = c.efficiency;

  Array alloc;
  for (const auto& r : c.allocation_history) {
    Object e;
    e["turn"] = r.turn;
    e["target"] = r.target;
    e["amount"] = r.amount;
    e["timestamp"] = r.timestamp;
    alloc.push_back(std::move(e));
  }
  o["allocation_history"] = std::move(alloc);

  Array gen;
  for (const auto& r : c.generation_history) gen.push_back(amount_record_to_json(r));
  o["generation_history"] = std::move(gen);
  return o;
}

ComputingResources computing_from_json(const Object& o) {
  ComputingResources c;
  c.total = get_num(o, "total", c.total);
  c.allocated = number_map_from_json(get_obj(o, "allocated"));
  c.cap = get_num(o, "cap", c.cap);
  c.generation = get_num(o, "generation", c.generation);
  c.efficiency = get_num(o, "efficiency", c.efficiency);
  for (const auto& e : get_arr(o, "allocation_history")) {
    const Object& r = e.object();
    c.allocation_history.push_back(
        AllocationRecord{get_int(r, "turn"), get_str(r, "target"), get_num(r, "amount"), get_ts(r, "timestamp")});
  }
  for (const auto& e : get_arr(o, "generation_history")) c.generation_history.push_back(amount_record_from_json(e.object()));
  return c;
}

Value funding_to_json(const FundingResources& f) {
  Object o;
  o["current"] = f.current;
  o["income"] = f.income;
  o["expenses"] = f.expenses;
  o["reserves"] = f.reserves;
  o["max_reserves"] = f.max_reserves;

  Array hist;
  for (const auto& r : f.history) hist.push_back(amount_record_to_json(r));
  o["history"] = std::move(hist);

  Array spend;
  for (const auto& r : f.spending_history) {
    Object e;
    e["turn"] = r.turn;
    e["amount"] = r.amount;
    e["reason"] = r.reason;
    e["recurring"] = r.recurring;
    e["timestamp"] = r.timestamp;
    spend.push_back(std::move(e));
  }
  o["spending_history"] = std::move(spend);
  return o;
}

FundingResources funding_from_json(const Object& o) {
  FundingResources f;
  f.current = get_num(o, "current", f.current);
  f.income = get_num(o, "income", f.income);
  f.expenses = get_num(o, "expenses", f.expenses);
  f.reserves = get_num(o, "reserves", f.reserves);
  f.max_reserves = get_num(o, "max_reserves", f.max_reserves);
  for (const auto& e : get_arr(o, "history")) f.history.push_back(amount_record_from_json(e.object()));
  for (const auto& e : get_arr(o, "spending_history")) {
    const Object& r = e.object();
    f.spending_history.push_back(SpendingRecord{get_int(r, "turn"), get_num(r, "amount"), get_str(r, "reason"),
                                                get_bool(r, "recurring"), get_ts(r, "timestamp")});
  }
  return f;
}

Value influence_resources_to_json(const InfluenceResources& inf) {
  Object o;
  o["levels"] = influence_to_json(inf.levels);
  Array hist;
  for (const auto& h : inf.history) {
    Object e;
    e["turn"] = h.turn;
    e["previous"] = influence_to_json(h.previous);
    e["delta"] = influence_to_json(h.delta);
    e["reason"] = h.reason;
    e["timestamp"] = h.timestamp;
    hist.push_back(std::move(e));
  }
  o["history"] = std::move(hist);
  return o;
}

InfluenceResources influence_resources_from_json(const Object& o) {
  InfluenceResources inf;
  inf.levels = influence_from_json(get_obj(o, "levels"));
  for (const auto& e : get_arr(o, "history")) {
    const Object& h = e.object();
    InfluenceHistoryEntry entry;
    entry.turn = get_int(h, "turn");
    entry.previous = influence_from_json(get_obj(h, "previous"));
    entry.delta = influence_from_json(get_obj(h, "delta"));
    entry.reason = get_str(h, "reason");
    entry.timestamp = get_ts(h, "timestamp");
    inf.history.push_back(std::move(entry));
  }
  return inf;
}

Value data_to_json(const DataResources& d) {
  Object o;
  Object types;
  for (const auto& [type, info] : d.types) {
    Object t;
    t["amount"] = info.amount;
    t["quality"] = info.quality;
    t["decay_rate"] = info.decay_rate;
    t["sources"] = strings_to_json(info.sources);
    t["generation_rate"] = info.generation_rate;
    t["last_updated"] = info.last_updated;
    types[data_type_to_string(type)] = std::move(t);
  }
  o["types"] = std::move(types);

  Object tiers;
  for (const auto& [k, v] : d.tiers) tiers[k] = v;
  o["tiers"] = std::move(tiers);
  Object sets;
  for (const auto& [k, v] : d.specialized_sets) sets[k] = v;
  o["specialized_sets"] = std::move(sets);
  o["quality"] = d.quality;

  Array acq;
  for (const auto& a : d.acquisition_history) {
    Object e;
    e["turn"] = a.turn;
    e["type"] = data_type_to_string(a.type);
    e["amount"] = a.amount;
    e["source"] = a.source;
    e["quality"] = a.quality;
    e["timestamp"] = a.timestamp;
    acq.push_back(std::move(e));
  }
  o["acquisition_history"] = std::move(acq);
  return o;
}

DataType data_type_or_throw(const std::string& s) {
  const auto t = data_type_from_string(s);
  if (!t) throw std::runtime_error("Unknown data type in save: '" + s + "'");
  return *t;
}

DataResources data_from_json(const Object& o) {
  DataResources d;
  for (const auto& [name, v] : get_obj(o, "types")) {
    const Object& t = v.object();
    DataTypeInfo info;
    info.amount = get_num(t, "amount");
    info.quality = get_num(t, "quality", info.quality);
    info.decay_rate = get_num(t, "decay_rate", info.decay_rate);
    info.sources = get_strings(t, "sources");
    info.generation_rate = get_num(t, "generation_rate");
    info.last_updated = get_int(t, "last_updated");
    d.types[data_type_or_throw(name)] = std::move(info);
  }
  d.tiers = flag_map_from_json(get_obj(o, "tiers"));
  d.specialized_sets = flag_map_from_json(get_obj(o, "specialized_sets"));
  d.quality = get_num(o, "quality", d.quality);
  for (const auto& e : get_arr(o, "acquisition_history")) {
    const Object& a = e.object();
    DataAcquisition acq;
    acq.turn = get_int(a, "turn");
    acq.type = data_type_or_throw(get_str(a, "type", "text"));
    acq.amount = get_num(a, "amount");
    acq.source = get_str(a, "source");
    acq.quality = get_num(a, "quality");
    acq.timestamp = get_ts(a, "timestamp");
    d.acquisition_history.push_back(std::move(acq));
  }
  return d;
}

Value resources_to_json(const ResourcesSlice& r) {
  Object o;
  o["computing"] = computing_to_json(r.computing);
  o["funding"] = funding_to_json(r.funding);
  o["influence"] = influence_resources_to_json(r.influence);
  o["data"] = data_to_json(r.data);
  return o;
}

ResourcesSlice resources_from_json(const Object& o) {
  ResourcesSlice r;
  r.computing = computing_from_json(get_obj(o, "computing"));
  r.funding = funding_from_json(get_obj(o, "funding"));
  r.influence = influence_resources_from_json(get_obj(o, "influence"));
  r.data = data_from_json(get_obj(o, "data"));
  return r;
}

// --- research -------------------------------------------------------------

Value research_to_json(const ResearchSlice& r) {
  Object o;
  Object nodes;
  for (const auto& [id, n] : r.nodes) {
    Object e;
    e["definition"] = research_def_to_json(n.def);
    e["status"] = research_status_to_string(n.status);
    e["progress"] = n.progress;
    e["compute_allocated"] = n.compute_allocated;
    e["start_turn"] = opt_int_to_json(n.start_turn);
    e["completion_turn"] = opt_int_to_json(n.completion_turn);
    e["effective_compute_rate"] = n.effective_compute_rate;
    e["deployment_boosts"] = number_map_to_json(n.deployment_boosts);
    nodes[id] = std::move(e);
  }
  o["nodes"] = std::move(nodes);
  o["active"] = strings_to_json(r.active);
  o["completed"] = strings_to_json(r.completed);
  o["category_boosts"] = number_map_to_json(r.category_boosts);

  Object req;
  for (const auto& [type, amount] : r.data_requirements) req[data_type_to_string(type)] = amount;
  o["data_requirements"] = std::move(req);
  o["budget"] = r.budget;
  return o;
}

ResearchSlice research_from_json(const Object& o) {
  ResearchSlice r;
  for (const auto& [id, v] : get_obj(o, "nodes")) {
    const Object& e = v.object();
    ResearchNode n;
    n.def = research_def_from_json(e.at("definition"));
    if (n.def.id != id) throw std::runtime_error("Research node key '" + id + "' does not match its definition");
    const std::string status = get_str(e, "status", "locked");
    const auto st = research_status_from_string(status);
    if (!st) throw std::runtime_error("Unknown research status in save: '" + status + "'");
    n.status = *st;
    n.progress = get_num(e, "progress");
    n.compute_allocated = get_num(e, "compute_allocated");
    n.start_turn = get_opt_int(e, "start_turn");
    n.completion_turn = get_opt_int(e, "completion_turn");
    n.effective_compute_rate = get_num(e, "effective_compute_rate");
    n.deployment_boosts = number_map_from_json(get_obj(e, "deployment_boosts"));
    r.nodes.emplace(id, std::move(n));
  }
  r.active = get_strings(o, "active");
  r.completed = get_strings(o, "completed");
  r.category_boosts = number_map_from_json(get_obj(o, "category_boosts"));
  for (const auto& [name, v] : get_obj(o, "data_requirements")) {
    r.data_requirements[data_type_or_throw(name)] = v.number_value();
  }
  r.budget = get_num(o, "budget");
  return r;
}

// --- deployments ----------------------------------------------------------

Value deployment_effects_to_json(const DeploymentEffects& e) {
  Object o;
  o["computing_efficiency"] = e.computing_efficiency;
  o["funding_multiplier"] = e.funding_multiplier;
  o["influence_growth"] = influence_to_json(e.influence_growth);
  o["data_quality_bonus"] = e.data_quality_bonus;
  o["computing_generation"] = e.computing_generation;
  o["funding_generation"] = e.funding_generation;
  o["research_boosts"] = number_map_to_json(e.research_boosts);
  o["node_boosts"] = number_map_to_json(e.node_boosts);
  return o;
}

DeploymentEffects deployment_effects_from_json(const Object& o) {
  DeploymentEffects e;
  e.computing_efficiency = get_num(o, "computing_efficiency");
  e.funding_multiplier = get_num(o, "funding_multiplier");
  e.influence_growth = influence_from_json(get_obj(o, "influence_growth"));
  e.data_quality_bonus = get_num(o, "data_quality_bonus");
  e.computing_generation = get_num(o, "computing_generation");
  e.funding_generation = get_num(o, "funding_generation");
  e.research_boosts = number_map_from_json(get_obj(o, "research_boosts"));
  e.node_boosts = number_map_from_json(get_obj(o, "node_boosts"));
  return e;
}

Value deployments_to_json(const DeploymentsSlice& d) {
  Object o;
  o["slots"] = d.slots;

  Object active;
  for (const auto& [id, dep] : d.active) {
    Object e;
    e["id"] = dep.id;
    e["type"] = dep.type;
    e["compute_allocated"] = dep.compute_allocated;
    e["turn_deployed"] = dep.turn_deployed;
    e["effects"] = deployment_effects_to_json(dep.effects);
    active[id] = std::move(e);
  }
  o["active"] = std::move(active);

  Array hist;
  for (const auto& h : d.history) {
    Object e;
    e["id"] = h.id;
    e["type"] = h.type;
    e["turn_deployed"] = h.turn_deployed;
    e["turn_removed"] = h.turn_removed;
    e["effects"] = deployment_effects_to_json(h.effects);
    hist.push_back(std::move(e));
  }
  o["history"] = std::move(hist);
  o["unlocked_types"] = strings_to_json(d.unlocked_types);
  return o;
}

DeploymentsSlice deployments_from_json(const Object& o) {
  DeploymentsSlice d;
  d.slots = get_int(o, "slots", d.slots);
  for (const auto& [id, v] : get_obj(o, "active")) {
    const Object& e = v.object();
    Deployment dep;
    dep.id = get_str(e, "id", id);
    dep.type = get_str(e, "type");
    dep.compute_allocated = get_num(e, "compute_allocated");
    dep.turn_deployed = get_int(e, "turn_deployed");
    dep.effects = deployment_effects_from_json(get_obj(e, "effects"));
    d.active.emplace(id, std::move(dep));
  }
  for (const auto& v : get_arr(o, "history")) {
    const Object& e = v.object();
    DeploymentHistoryEntry h;
    h.id = get_str(e, "id");
    h.type = get_str(e, "type");
    h.turn_deployed = get_int(e, "turn_deployed");
    h.turn_removed = get_int(e, "turn_removed");
    h.effects = deployment_effects_from_json(get_obj(e, "effects"));
    d.history.push_back(std::move(h));
  }
  d.unlocked_types = get_strings(o, "unlocked_types");
  return d;
}

// --- competitors / world / settings ---------------------------------------

Value competitors_to_json(const CompetitorsSlice& c) {
  Object o;
  Object orgs;
  for (const auto& [id, org] : c.organizations) {
    Object e;
    e["id"] = org.id;
    e["name"] = org.name;
    e["capability"] = org.capability;
    e["safety"] = org.safety;
    e["funding"] = org.funding;
    e["influence"] = org.influence;
    orgs[id] = std::move(e);
  }
  o["organizations"] = std::move(orgs);
  o["player_ranking"] = c.player_ranking;
  return o;
}

CompetitorsSlice competitors_from_json(const Object& o) {
  CompetitorsSlice c;
  for (const auto& [id, v] : get_obj(o, "organizations")) {
    const Object& e = v.object();
    c.organizations.emplace(id, Competitor{get_str(e, "id", id), get_str(e, "name"), get_num(e, "capability"),
                                           get_num(e, "safety"), get_num(e, "funding"), get_num(e, "influence")});
  }
  c.player_ranking = get_int(o, "player_ranking", c.player_ranking);
  return c;
}

Value world_to_json(const WorldSlice& w) {
  Object o;
  Object regions;
  for (const auto& [id, r] : w.regions) {
    Object e;
    e["id"] = r.id;
    e["name"] = r.name;
    e["awareness"] = r.awareness;
    e["regulation"] = r.regulation;
    e["adoption"] = r.adoption;
    regions[id] = std::move(e);
  }
  o["regions"] = std::move(regions);
  o["global_awareness"] = w.global_awareness;
  o["global_alignment"] = w.global_alignment;
  o["global_regulation"] = w.global_regulation;
  return o;
}

WorldSlice world_from_json(const Object& o) {
  WorldSlice w;
  for (const auto& [id, v] : get_obj(o, "regions")) {
    const Object& e = v.object();
    w.regions.emplace(id, Region{get_str(e, "id", id), get_str(e, "name"), get_num(e, "awareness"),
                                 get_num(e, "regulation"), get_num(e, "adoption")});
  }
  w.global_awareness = get_num(o, "global_awareness");
  w.global_alignment = get_num(o, "global_alignment");
  w.global_regulation = get_num(o, "global_regulation");
  return w;
}

Value settings_to_json(const SettingsSlice& s) {
  Object o;
  o["difficulty"] = difficulty_to_string(s.difficulty);
  o["tutorial_enabled"] = s.tutorial_enabled;
  o["auto_save"] = s.auto_save;
  o["music_volume"] = s.music_volume;
  o["sound_volume"] = s.sound_volume;
  return o;
}

SettingsSlice settings_from_json(const Object& o) {
  SettingsSlice s;
  s.difficulty = difficulty_from_string(get_str(o, "difficulty")).value_or(Difficulty::Normal);
  s.tutorial_enabled = get_bool(o, "tutorial_enabled", s.tutorial_enabled);
  s.auto_save = get_bool(o, "auto_save", s.auto_save);
  s.music_volume = get_num(o, "music_volume", s.music_volume);
  s.sound_volume = get_num(o, "sound_volume", s.sound_volume);
  return s;
}

// --- events ---------------------------------------------------------------

Value events_to_json(const EventsSlice& ev) {
  Object o;
  Array current;
  for (const GameEvent& e : ev.current) {
    Object j;
    j["id"] = e.id;
    j["type"] = e.type;
    j["title"] = e.title;
    j["description"] = e.description;
    Array choices;
    for (const EventChoice& c : e.choices) {
      Object cj;
      cj["id"] = c.id;
      cj["text"] = c.text;
      cj["effects"] = c.effects;
      cj["requirements"] = c.requirements;
      choices.push_back(std::move(cj));
    }
    j["choices"] = std::move(choices);
    j["urgency"] = e.urgency;
    j["turn_triggered"] = e.turn_triggered;
    current.push_back(std::move(j));
  }
  o["current"] = std::move(current);

  Array history;
  for (const ResolvedEvent& r : ev.history) {
    Object j;
    j["event_id"] = r.event_id;
    j["choice_id"] = r.choice_id;
    j["turn_triggered"] = r.turn_triggered;
    j["turn_resolved"] = r.turn_resolved;
    j["effects"] = r.effects;
    history.push_back(std::move(j));
  }
  o["history"] = std::move(history);

  Object triggered;
  for (const auto& [id, flag] : ev.triggered) triggered[id] = flag;
  o["triggered"] = std::move(triggered);
  return o;
}

EventsSlice events_from_json(const Object& o) {
  EventsSlice ev;
  for (const auto& v : get_arr(o, "current")) {
    const Object& j = v.object();
    GameEvent e;
    e.id = get_str(j, "id");
    e.type = get_str(j, "type");
    e.title = get_str(j, "title");
    e.description = get_str(j, "description");
    for (const auto& cv : get_arr(j, "choices")) {
      const Object& cj = cv.object();
      e.choices.push_back(EventChoice{get_str(cj, "id"), get_str(cj, "text"), get_obj(cj, "effects"),
                                      get_obj(cj, "requirements")});
    }
    e.urgency = get_num(j, "urgency");
    e.turn_triggered = get_int(j, "turn_triggered");
    ev.current.push_back(std::move(e));
  }
  for (const auto& v : get_arr(o, "history")) {
    const Object& j = v.object();
    ev.history.push_back(ResolvedEvent{get_str(j, "event_id"), get_str(j, "choice_id"), get_int(j, "turn_triggered"),
                                       get_int(j, "turn_resolved"), get_obj(j, "effects")});
  }
  ev.triggered = flag_map_from_json(get_obj(o, "triggered"));
  return ev;
}

// A missing or non-object slice means the document is not a game state.
const Object& required_slice(const Object& root, const char* key) {
  const Value* v = find_key(root, key);
  if (!v || !v->is_object()) throw std::runtime_error(std::string("Game state is missing slice '") + key + "'");
  return *v->as_object();
}

} // namespace

json::Value game_state_to_json(const GameState& state) {
  Object o;
  o["meta"] = meta_to_json(*state.meta);
  o["resources"] = resources_to_json(*state.resources);
  o["research"] = research_to_json(*state.research);
  o["deployments"] = deployments_to_json(*state.deployments);
  o["competitors"] = competitors_to_json(*state.competitors);
  o["world"] = world_to_json(*state.world);
  o["settings"] = settings_to_json(*state.settings);
  o["events"] = events_to_json(*state.events);
  return o;
}

GameStatePtr game_state_from_json(const json::Value& v) {
  if (!v.is_object()) throw std::runtime_error("Game state must be a JSON object");
  const Object& root = v.object();

  auto s = std::make_shared<GameState>();
  s->meta = std::make_shared<const MetaSlice>(meta_from_json(required_slice(root, "meta")));
  s->resources = std::make_shared<const ResourcesSlice>(resources_from_json(required_slice(root, "resources")));
  s->research = std::make_shared<const ResearchSlice>(research_from_json(required_slice(root, "research")));
  s->deployments =
      std::make_shared<const DeploymentsSlice>(deployments_from_json(required_slice(root, "deployments")));
  s->competitors =
      std::make_shared<const CompetitorsSlice>(competitors_from_json(required_slice(root, "competitors")));
  s->world = std::make_shared<const WorldSlice>(world_from_json(required_slice(root, "world")));
  s->settings = std::make_shared<const SettingsSlice>(settings_from_json(required_slice(root, "settings")));
  // Records written before the events slice existed load with no events.
  s->events = std::make_shared<const EventsSlice>(events_from_json(get_obj(root, "events")));
  return s;
}

std::string serialize_game_state(const GameState& state) { return json::stringify(game_state_to_json(state), 2); }

GameStatePtr deserialize_game_state(const std::string& json_text) {
  return game_state_from_json(json::parse(json_text));
}

} // namespace superint
