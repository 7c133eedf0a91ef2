#include "superint/core/resource_economy.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "superint/core/enum_strings.h"
#include "superint/util/sorted_keys.h"

namespace superint {
namespace {

constexpr double kEpsilon = 1e-9;
constexpr const char* kSource = "ResourceEconomy";

json::Object influence_json(const InfluenceLevels& l) {
  json::Object o;
  for (InfluenceChannel c : kInfluenceChannels) o[influence_channel_to_string(c)] = l[c];
  return o;
}

bool targets_computing(const json::Value& data) {
  const json::Value* r = data.find("resource");
  return !r || r->string_value("computing") == "computing";
}

json::Object flags_json(const std::map<std::string, bool>& m) {
  json::Object o;
  for (const auto& [k, v] : m) o[k] = v;
  return o;
}

std::map<std::string, bool> flags_from_json(const json::Value* v) {
  std::map<std::string, bool> out;
  if (!v || v->is_null()) return out;
  for (const auto& [k, flag] : v->object()) out[k] = flag.bool_value();
  return out;
}

} // namespace

json::Value resource_cost_to_json(const ResourceCost& cost) {
  json::Object o;
  if (cost.computing) o["computing"] = *cost.computing;
  if (cost.funding) o["funding"] = *cost.funding;
  if (cost.influence) o["influence"] = influence_json(*cost.influence);
  if (cost.data) {
    json::Object d;
    json::Object reqs;
    for (const auto& [type, req] : cost.data->requirements) {
      json::Object r;
      r["min_amount"] = req.min_amount;
      r["min_quality"] = req.min_quality;
      reqs[data_type_to_string(type)] = std::move(r);
    }
    d["requirements"] = std::move(reqs);
    d["tiers"] = flags_json(cost.data->tiers);
    d["specialized_sets"] = flags_json(cost.data->specialized_sets);
    o["data"] = std::move(d);
  }
  o["recurring"] = cost.recurring;
  return o;
}

ResourceCost resource_cost_from_json(const json::Value& v) {
  ResourceCost cost;
  if (const auto* c = v.find("computing")) cost.computing = c->number_value();
  if (const auto* f = v.find("funding")) cost.funding = f->number_value();
  if (const auto* inf = v.find("influence")) {
    InfluenceLevels levels;
    for (const auto& [name, amount] : inf->object()) {
      const auto ch = influence_channel_from_string(name);
      if (!ch) throw std::runtime_error("Unknown influence channel in cost: '" + name + "'");
      levels[*ch] = amount.number_value();
    }
    cost.influence = levels;
  }
  if (const auto* d = v.find("data")) {
    DataCost data;
    if (const auto* reqs = d->find("requirements")) {
      for (const auto& [name, r] : reqs->object()) {
        const auto type = data_type_from_string(name);
        if (!type) throw std::runtime_error("Unknown data type in cost: '" + name + "'");
        DataRequirement req;
        if (const auto* a = r.find("min_amount")) req.min_amount = a->number_value();
        if (const auto* q = r.find("min_quality")) req.min_quality = q->number_value();
        data.requirements[*type] = req;
      }
    }
    data.tiers = flags_from_json(d->find("tiers"));
    data.specialized_sets = flags_from_json(d->find("specialized_sets"));
    cost.data = std::move(data);
  }
  if (const auto* r = v.find("recurring")) cost.recurring = r->bool_value();
  return cost;
}

json::Value resource_effects_to_json(const ResourceEffects& fx) {
  json::Object o;
  o["computing_efficiency"] = fx.computing_efficiency;
  o["funding_multiplier"] = fx.funding_multiplier;
  o["influence_multiplier"] = influence_json(fx.influence_multiplier);
  o["data_quality_bonus"] = fx.data_quality_bonus;
  o["computing_generation_bonus"] = fx.computing_generation_bonus;
  o["funding_generation_bonus"] = fx.funding_generation_bonus;
  return o;
}

ResourceEconomy::ResourceEconomy(StateManager& state, EventBus& bus, Logger& log)
    : state_(state), bus_(bus), log_(log) {}

ResourceEconomy::~ResourceEconomy() {
  for (auto& unsub : subscriptions_) unsub();
}

void ResourceEconomy::initialize() {
  if (!subscriptions_.empty()) {
    log_.warn("ResourceEconomy: already initialized");
    return;
  }

  subscriptions_.push_back(bus_.subscribe(
      "turn:start",
      [this](const BusEvent& ev) {
        const json::Value* t = ev.data.find("turn");
        generate_resources(t ? static_cast<int>(t->int_value()) : state_.state()->meta->turn);
      },
      kSource));

  const auto recompute = [this](const BusEvent&) { recompute_effects(); };
  subscriptions_.push_back(bus_.subscribe("turn:ending", recompute, kSource));
  subscriptions_.push_back(bus_.subscribe("deployment:active", recompute, kSource));
  subscriptions_.push_back(bus_.subscribe("research:completed", recompute, kSource));
  subscriptions_.push_back(bus_.subscribe("stateLoaded", recompute, kSource));

  subscriptions_.push_back(bus_.subscribe(
      "resource:allocate",
      [this](const BusEvent& ev) {
        if (!targets_computing(ev.data)) return;
        allocate_computing(ev.data.at("target").string_value(), ev.data.at("amount").number_value());
      },
      kSource));

  subscriptions_.push_back(bus_.subscribe(
      "resource:deallocate",
      [this](const BusEvent& ev) {
        if (!targets_computing(ev.data)) return;
        deallocate_computing(ev.data.at("target").string_value(), ev.data.at("amount").number_value());
      },
      kSource));

  subscriptions_.push_back(bus_.subscribe(
      "resource:spend",
      [this](const BusEvent& ev) {
        spend_resources(resource_cost_from_json(ev.data.at("cost")), ev.data.at("reason").string_value());
      },
      kSource));

  recompute_effects();
  log_.info("ResourceEconomy: initialized");
}

bool ResourceEconomy::can_afford(const ResourceCost& cost) const {
  const ResourcesSlice& r = *state_.state()->resources;

  if (cost.computing && *cost.computing > r.computing.available() + kEpsilon) return false;
  if (cost.funding && *cost.funding > r.funding.current) return false;

  if (cost.influence) {
    for (InfluenceChannel c : kInfluenceChannels) {
      if ((*cost.influence)[c] > r.influence.levels[c]) return false;
    }
  }

  if (cost.data) {
    const auto granted = [](const std::map<std::string, bool>& have, const std::string& key) {
      auto it = have.find(key);
      return it != have.end() && it->second;
    };
    for (const auto& [key, needed] : cost.data->tiers) {
      if (needed && !granted(r.data.tiers, key)) return false;
    }
    for (const auto& [key, needed] : cost.data->specialized_sets) {
      if (needed && !granted(r.data.specialized_sets, key)) return false;
    }
    for (const auto& [type, req] : cost.data->requirements) {
      const DataTypeInfo* info = r.data.find(type);
      if (!info || info->amount < req.min_amount || info->quality < req.min_quality) return false;
    }
  }
  return true;
}

bool ResourceEconomy::spend_resources(const ResourceCost& cost, const std::string& reason) {
  if (!can_afford(cost)) {
    log_.warn("ResourceEconomy: cannot afford '" + reason + "'");
    json::Object data;
    data["reason"] = reason;
    data["cost"] = resource_cost_to_json(cost);
    bus_.emit("resource:spend:failed", std::move(data), kSource);
    return false;
  }

  SpendResources spend;
  spend.reason = reason;
  spend.turn = state_.state()->meta->turn;
  spend.timestamp = state_.now();
  spend.computing = cost.computing;
  spend.funding = cost.funding;
  spend.recurring = cost.recurring;
  if (cost.influence) spend.influence = *cost.influence;
  state_.dispatch(spend);

  json::Object data;
  data["reason"] = reason;
  data["cost"] = resource_cost_to_json(cost);
  data["turn"] = spend.turn;
  bus_.emit("resources:spent", std::move(data), kSource);
  return true;
}

bool ResourceEconomy::allocate_computing(const std::string& target, double amount) {
  const ComputingResources& c = state_.state()->resources->computing;
  const double available = c.available();
  if (target.empty() || !(amount > 0.0) || amount > available + kEpsilon) {
    log_.warn("ResourceEconomy: cannot allocate " + std::to_string(amount) + " compute to '" + target + "'");
    json::Object data;
    data["target"] = target;
    data["amount"] = amount;
    data["available"] = available;
    bus_.emit("resource:allocation:failed", std::move(data), kSource);
    return false;
  }

  state_.dispatch(AllocateComputing{target, amount, state_.state()->meta->turn, state_.now()});
  return true;
}

bool ResourceEconomy::deallocate_computing(const std::string& target, double amount) {
  const double claim = state_.state()->resources->computing.claim(target);
  if (!(amount > 0.0) || !(claim > 0.0)) {
    log_.warn("ResourceEconomy: nothing to release for '" + target + "'");
    json::Object data;
    data["target"] = target;
    data["amount"] = amount;
    data["claimed"] = claim;
    bus_.emit("resource:deallocation:failed", std::move(data), kSource);
    return false;
  }

  state_.dispatch(DeallocateComputing{target, std::min(amount, claim), state_.state()->meta->turn, state_.now()});
  return true;
}

InfluenceLevels ResourceEconomy::influence_growth(OrganizationType org) const {
  InfluenceLevels g;
  switch (org) {
    case OrganizationType::Academic: g[InfluenceChannel::Academic] = 1.0; break;
    case OrganizationType::Startup: g[InfluenceChannel::Industry] = 1.0; break;
    case OrganizationType::Government: g[InfluenceChannel::Government] = 1.0; break;
    case OrganizationType::OpenSource: g[InfluenceChannel::OpenSource] = 1.0; break;
    case OrganizationType::BigTech:
      g[InfluenceChannel::Industry] = 0.5;
      g[InfluenceChannel::Public] = 0.5;
      break;
  }
  for (InfluenceChannel c : kInfluenceChannels) g[c] *= effects_.influence_multiplier[c];
  return g;
}

void ResourceEconomy::generate_resources(int turn) {
  const auto s = state_.state();
  const ResourcesSlice& r = *s->resources;

  GenerateResources gen;
  gen.turn = turn;
  gen.timestamp = state_.now();
  gen.computing_gain = r.computing.generation + effects_.computing_generation_bonus;
  gen.funding_net =
      r.funding.income * effects_.funding_multiplier + effects_.funding_generation_bonus - r.funding.expenses;
  gen.influence_gain = influence_growth(s->meta->organization);
  state_.dispatch(gen);

  const ResourcesSlice& after = *state_.state()->resources;
  json::Object data;
  data["turn"] = turn;
  data["computing_total"] = after.computing.total;
  data["funding_current"] = after.funding.current;
  data["influence"] = influence_json(after.influence.levels);
  bus_.emit("resources:updated", std::move(data), kSource);
}

void ResourceEconomy::recompute_effects() {
  const auto s = state_.state();
  ResourceEffects fx;

  for (const auto& id : util::sorted_keys(s->deployments->active)) {
    const DeploymentEffects& d = s->deployments->active.at(id).effects;
    fx.computing_efficiency *= (1.0 + d.computing_efficiency);
    fx.funding_multiplier *= (1.0 + d.funding_multiplier);
    for (InfluenceChannel c : kInfluenceChannels) fx.influence_multiplier[c] *= (1.0 + d.influence_growth[c]);
    fx.data_quality_bonus += d.data_quality_bonus;
    fx.computing_generation_bonus += d.computing_generation;
    fx.funding_generation_bonus += d.funding_generation;
  }

  for (const auto& id : s->research->completed) {
    const ResearchNode* node = s->research->find(id);
    if (!node) continue;
    const ResearchEffects& e = node->def.effects;
    if (e.compute_efficiency) fx.computing_efficiency *= *e.compute_efficiency;
    if (e.influence_multiplier) {
      for (InfluenceChannel c : kInfluenceChannels) fx.influence_multiplier[c] *= *e.influence_multiplier;
    }
  }

  effects_ = fx;
  if (s->resources->computing.efficiency != fx.computing_efficiency) {
    state_.dispatch(SetComputingEfficiency{fx.computing_efficiency});
  }

  json::Object data;
  data["effects"] = resource_effects_to_json(fx);
  bus_.emit("resource:effects:updated", std::move(data), kSource);
}

bool ResourceEconomy::adjust_influence(const InfluenceLevels& changes, const std::string& reason) {
  if (!changes.any_nonzero()) return false;
  const auto before = state_.state();
  state_.dispatch(AdjustInfluence{changes, reason, before->meta->turn, state_.now()});
  return state_.state()->resources != before->resources;
}

bool ResourceEconomy::add_data_access(DataAccessKind kind, const std::string& key) {
  const DataResources& d = state_.state()->resources->data;
  const auto& table = kind == DataAccessKind::Tier ? d.tiers : d.specialized_sets;
  auto it = table.find(key);
  if (key.empty() || (it != table.end() && it->second)) return false;

  state_.dispatch(GrantDataAccess{kind, key, true});

  json::Object data;
  data["kind"] = kind == DataAccessKind::Tier ? "tier" : "specialized_set";
  data["key"] = key;
  data["turn"] = state_.state()->meta->turn;
  bus_.emit("data:accessed", std::move(data), kSource);
  return true;
}

bool ResourceEconomy::add_data(DataType type, double amount, const std::string& source, std::optional<double> quality) {
  if (!(amount > 0.0)) {
    log_.warn("ResourceEconomy: ignoring non-positive data amount for " + data_type_to_string(type));
    return false;
  }
  const auto s = state_.state();
  const DataTypeInfo* current = s->resources->data.find(type);
  DataTypeInfo info = current ? *current : DataTypeInfo{};

  double q = info.quality;
  if (quality) {
    if (info.amount > 0.0) {
      q = (info.amount * info.quality + amount * *quality) / (info.amount + amount);
      // Better data refreshes the pool faster than a plain average.
      if (*quality > info.quality) q = std::min(1.0, q + (*quality - info.quality) * 0.5);
    } else {
      q = *quality;
    }
  }

  info.amount += amount;
  info.quality = q;
  if (std::find(info.sources.begin(), info.sources.end(), source) == info.sources.end()) {
    info.sources.push_back(source);
  }
  info.last_updated = s->meta->turn;

  DataAcquisition acq;
  acq.turn = s->meta->turn;
  acq.type = type;
  acq.amount = amount;
  acq.source = source;
  acq.quality = quality.value_or(q);
  acq.timestamp = state_.now();

  state_.dispatch(UpdateDataType{type, info, acq});

  json::Object data;
  data["type"] = data_type_to_string(type);
  data["amount"] = amount;
  data["source"] = source;
  data["quality"] = q;
  data["turn"] = s->meta->turn;
  bus_.emit("data:added", std::move(data), kSource);
  return true;
}

bool ResourceEconomy::check_data_access(DataType type, const DataRequirement& requirement) const {
  const DataTypeInfo* info = state_.state()->resources->data.find(type);
  return info && info->amount >= requirement.min_amount && info->quality >= requirement.min_quality;
}

ResourceMetrics ResourceEconomy::calculate_resource_metrics() const {
  const ResourcesSlice& r = *state_.state()->resources;
  ResourceMetrics m;

  m.computing_total = r.computing.total;
  m.computing_allocated = r.computing.allocated_total();
  m.computing_available = r.computing.available();
  if (r.computing.total > 0.0) {
    m.computing_utilization_percent = static_cast<int>(std::lround(100.0 * m.computing_allocated / r.computing.total));
  }
  if (r.computing.cap > 0.0) {
    m.computing_cap_percent = static_cast<int>(std::lround(100.0 * r.computing.total / r.computing.cap));
  }
  m.computing_efficiency = r.computing.efficiency;

  m.funding_current = r.funding.current;
  m.funding_net_flow = r.funding.income - r.funding.expenses;
  if (r.funding.expenses > 0.0) {
    m.funding_sustainability = std::round(r.funding.current / r.funding.expenses * 10.0) / 10.0;
  }

  m.influence = r.influence.levels;
  for (InfluenceChannel c : kInfluenceChannels) {
    m.influence_total += r.influence.levels[c];
    if (r.influence.levels[c] > r.influence.levels[m.dominant_channel]) m.dominant_channel = c;
  }

  for (const auto& [k, v] : r.data.tiers) m.data_tier_count += v ? 1 : 0;
  for (const auto& [k, v] : r.data.specialized_sets) m.data_specialized_set_count += v ? 1 : 0;
  m.data_quality = r.data.quality;
  m.data_effective_quality = r.data.quality + effects_.data_quality_bonus;
  for (const auto& [type, info] : r.data.types) m.data_total_amount += info.amount;
  return m;
}

} // namespace superint
