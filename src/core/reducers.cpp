#include "superint/core/reducers.h"

#include <algorithm>
#include <type_traits>

namespace superint {
namespace {

// Tolerance for comparing compute amounts that went through arithmetic.
constexpr double kComputeEpsilon = 1e-9;

// Copies the slice and applies `mutate` to the copy.
template <typename S, typename F>
std::shared_ptr<const S> mutated(const std::shared_ptr<const S>& s, F&& mutate) {
  auto next = std::make_shared<S>(*s);
  mutate(*next);
  return next;
}

template <typename T>
void assign_if(const std::optional<T>& v, T& dst) {
  if (v) dst = *v;
}

void erase_id(std::vector<std::string>& v, const std::string& id) {
  v.erase(std::remove(v.begin(), v.end(), id), v.end());
}

// Applies signed per-channel changes with clamping and records a history entry.
// Returns false if no channel actually moved.
bool apply_influence(InfluenceResources& inf, const InfluenceLevels& changes, const std::string& reason, int turn,
                     Timestamp ts) {
  InfluenceHistoryEntry entry;
  entry.turn = turn;
  entry.previous = inf.levels;
  entry.reason = reason;
  entry.timestamp = ts;

  for (InfluenceChannel c : kInfluenceChannels) {
    const double before = inf.levels[c];
    const double after = clamp_influence(before + changes[c]);
    inf.levels[c] = after;
    entry.delta[c] = after - before;
  }
  if (!entry.delta.any_nonzero()) return false;
  push_bounded(inf.history, std::move(entry), kHistoryLimit);
  return true;
}

} // namespace

std::shared_ptr<const MetaSlice> reduce_meta(const std::shared_ptr<const MetaSlice>& s, const Action& action) {
  using Ptr = std::shared_ptr<const MetaSlice>;
  return std::visit(
      [&](const auto& a) -> Ptr {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, AdvanceTurn>) {
          return mutated(s, [](MetaSlice& m) { ++m.turn; });
        } else if constexpr (std::is_same_v<T, SetPhase>) {
          if (s->phase == a.phase) return s;
          return mutated(s, [&](MetaSlice& m) { m.phase = a.phase; });
        } else if constexpr (std::is_same_v<T, MetaUpdate>) {
          if (!a.last_saved && !a.organization) return s;
          return mutated(s, [&](MetaSlice& m) {
            if (a.last_saved) m.last_saved = a.last_saved;
            assign_if(a.organization, m.organization);
          });
        } else if constexpr (std::is_same_v<T, UpdateGameTime>) {
          return mutated(s, [&](MetaSlice& m) { m.time = a.time; });
        } else if constexpr (std::is_same_v<T, AddTurnHistory>) {
          return mutated(s, [&](MetaSlice& m) { push_bounded(m.turn_history, a.entry, kHistoryLimit); });
        } else if constexpr (std::is_same_v<T, UpdateTimeCompression>) {
          if (s->time.compression_factor == a.compression_factor && s->time.time_scale == a.time_scale) return s;
          return mutated(s, [&](MetaSlice& m) {
            m.time.compression_factor = a.compression_factor;
            m.time.time_scale = a.time_scale;
          });
        } else {
          return s;
        }
      },
      action);
}

std::shared_ptr<const ResourcesSlice> reduce_resources(const std::shared_ptr<const ResourcesSlice>& s,
                                                       const Action& action) {
  using Ptr = std::shared_ptr<const ResourcesSlice>;
  return std::visit(
      [&](const auto& a) -> Ptr {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, AllocateComputing>) {
          if (a.target.empty() || !(a.amount > 0.0)) return s;
          if (a.amount > s->computing.available() + kComputeEpsilon) return s;
          return mutated(s, [&](ResourcesSlice& r) {
            r.computing.allocated[a.target] += a.amount;
            push_bounded(r.computing.allocation_history, AllocationRecord{a.turn, a.target, a.amount, a.timestamp},
                         kHistoryLimit);
          });
        } else if constexpr (std::is_same_v<T, DeallocateComputing>) {
          const double claim = s->computing.claim(a.target);
          if (!(claim > 0.0) || !(a.amount > 0.0)) return s;
          const double release = std::min(a.amount, claim);
          return mutated(s, [&](ResourcesSlice& r) {
            const double remaining = claim - release;
            if (remaining <= kComputeEpsilon) {
              r.computing.allocated.erase(a.target);
            } else {
              r.computing.allocated[a.target] = remaining;
            }
            push_bounded(r.computing.allocation_history, AllocationRecord{a.turn, a.target, -release, a.timestamp},
                         kHistoryLimit);
          });
        } else if constexpr (std::is_same_v<T, GenerateResources>) {
          return mutated(s, [&](ResourcesSlice& r) {
            ComputingResources& c = r.computing;
            const double before = c.total;
            c.total = std::max(before, std::min(before + a.computing_gain, c.cap));
            push_bounded(c.generation_history, AmountRecord{a.turn, c.total - before, a.timestamp}, kHistoryLimit);

            r.funding.current += a.funding_net;
            push_bounded(r.funding.history, AmountRecord{a.turn, a.funding_net, a.timestamp}, kHistoryLimit);

            apply_influence(r.influence, a.influence_gain, "turn_generation", a.turn, a.timestamp);

            for (auto& kv : r.data.types) {
              DataTypeInfo& d = kv.second;
              d.quality = std::max(0.1, d.quality * (1.0 - d.decay_rate));
              if (d.generation_rate > 0.0) d.amount += d.generation_rate;
              d.last_updated = a.turn;
            }
          });
        } else if constexpr (std::is_same_v<T, SetComputingEfficiency>) {
          if (s->computing.efficiency == a.efficiency) return s;
          return mutated(s, [&](ResourcesSlice& r) { r.computing.efficiency = a.efficiency; });
        } else if constexpr (std::is_same_v<T, SpendResources>) {
          const bool spends_compute = a.computing && *a.computing > 0.0;
          const bool spends_funding = a.funding && *a.funding > 0.0;
          if (!spends_compute && !spends_funding && !a.influence.any_nonzero()) return s;
          // All-or-nothing: a compute part the pool cannot cover refuses the whole spend.
          if (spends_compute && *a.computing > s->computing.available() + kComputeEpsilon) return s;
          return mutated(s, [&](ResourcesSlice& r) {
            if (spends_compute) {
              r.computing.allocated[a.reason] += *a.computing;
              push_bounded(r.computing.allocation_history,
                           AllocationRecord{a.turn, a.reason, *a.computing, a.timestamp}, kHistoryLimit);
            }
            if (spends_funding) {
              r.funding.current -= *a.funding;
              if (a.recurring) r.funding.expenses += *a.funding;
              push_bounded(r.funding.spending_history,
                           SpendingRecord{a.turn, *a.funding, a.reason, a.recurring, a.timestamp}, kHistoryLimit);
            }
            if (a.influence.any_nonzero()) {
              InfluenceLevels neg;
              for (InfluenceChannel c : kInfluenceChannels) neg[c] = -std::max(0.0, a.influence[c]);
              apply_influence(r.influence, neg, a.reason, a.turn, a.timestamp);
            }
          });
        } else if constexpr (std::is_same_v<T, AdjustInfluence>) {
          auto next = std::make_shared<ResourcesSlice>(*s);
          if (!apply_influence(next->influence, a.changes, a.reason, a.turn, a.timestamp)) return s;
          return next;
        } else if constexpr (std::is_same_v<T, UpdateDataType>) {
          return mutated(s, [&](ResourcesSlice& r) {
            r.data.types[a.type] = a.info;
            if (a.acquisition) push_bounded(r.data.acquisition_history, *a.acquisition, kHistoryLimit);
          });
        } else if constexpr (std::is_same_v<T, GrantDataAccess>) {
          const auto& table = a.kind == DataAccessKind::Tier ? s->data.tiers : s->data.specialized_sets;
          auto it = table.find(a.key);
          if (a.key.empty() || (it != table.end() && it->second == a.granted)) return s;
          return mutated(s, [&](ResourcesSlice& r) {
            auto& dst = a.kind == DataAccessKind::Tier ? r.data.tiers : r.data.specialized_sets;
            dst[a.key] = a.granted;
          });
        } else if constexpr (std::is_same_v<T, UpdateResourceCaps>) {
          if (!a.computing_cap && !a.computing_generation && !a.funding_income && !a.funding_expenses &&
              !a.max_reserves) {
            return s;
          }
          return mutated(s, [&](ResourcesSlice& r) {
            assign_if(a.computing_cap, r.computing.cap);
            assign_if(a.computing_generation, r.computing.generation);
            assign_if(a.funding_income, r.funding.income);
            assign_if(a.funding_expenses, r.funding.expenses);
            assign_if(a.max_reserves, r.funding.max_reserves);
          });
        } else {
          return s;
        }
      },
      action);
}

std::shared_ptr<const ResearchSlice> reduce_research(const std::shared_ptr<const ResearchSlice>& s,
                                                     const Action& action) {
  using Ptr = std::shared_ptr<const ResearchSlice>;
  return std::visit(
      [&](const auto& a) -> Ptr {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, InitializeResearch>) {
          const bool any_new = std::any_of(a.nodes.begin(), a.nodes.end(),
                                           [&](const ResearchNode& n) { return !s->find(n.id()); });
          if (!any_new) return s;
          return mutated(s, [&](ResearchSlice& r) {
            for (const ResearchNode& n : a.nodes) r.nodes.emplace(n.id(), n);
          });
        } else if constexpr (std::is_same_v<T, StartResearch>) {
          const ResearchNode* n = s->find(a.node_id);
          if (!n || n->status != ResearchStatus::Unlocked || !(a.compute > 0.0)) return s;
          return mutated(s, [&](ResearchSlice& r) {
            ResearchNode& node = r.nodes.at(a.node_id);
            node.status = ResearchStatus::InProgress;
            node.compute_allocated = a.compute;
            node.start_turn = a.turn;
            if (!r.is_active(a.node_id)) r.active.push_back(a.node_id);
          });
        } else if constexpr (std::is_same_v<T, CancelResearch>) {
          const ResearchNode* n = s->find(a.node_id);
          if (!n || n->status != ResearchStatus::InProgress) return s;
          return mutated(s, [&](ResearchSlice& r) {
            ResearchNode& node = r.nodes.at(a.node_id);
            node.status = ResearchStatus::Unlocked;
            node.compute_allocated = 0.0;
            node.effective_compute_rate = 0.0;
            erase_id(r.active, a.node_id);
          });
        } else if constexpr (std::is_same_v<T, AllocateResearchCompute>) {
          const ResearchNode* n = s->find(a.node_id);
          if (!n || n->status != ResearchStatus::InProgress || !(a.amount > 0.0)) return s;
          return mutated(s, [&](ResearchSlice& r) { r.nodes.at(a.node_id).compute_allocated += a.amount; });
        } else if constexpr (std::is_same_v<T, UpdateResearchProgress>) {
          const bool applies = std::any_of(a.updates.begin(), a.updates.end(), [&](const ResearchProgressUpdate& u) {
            const ResearchNode* n = s->find(u.node_id);
            return n && n->status == ResearchStatus::InProgress;
          });
          if (!applies) return s;
          return mutated(s, [&](ResearchSlice& r) {
            for (const ResearchProgressUpdate& u : a.updates) {
              ResearchNode* node = find_ptr(r.nodes, u.node_id);
              if (!node || node->status != ResearchStatus::InProgress) continue;
              node->progress = std::max(node->progress, std::clamp(u.progress, 0.0, 1.0));
              node->effective_compute_rate = u.effective_compute_rate;
            }
          });
        } else if constexpr (std::is_same_v<T, CompleteResearch>) {
          const ResearchNode* n = s->find(a.node_id);
          if (!n || n->status == ResearchStatus::Completed) return s;
          return mutated(s, [&](ResearchSlice& r) {
            ResearchNode& node = r.nodes.at(a.node_id);
            node.status = ResearchStatus::Completed;
            node.progress = 1.0;
            node.compute_allocated = 0.0;
            node.effective_compute_rate = 0.0;
            node.completion_turn = a.turn;
            erase_id(r.active, a.node_id);
            r.completed.push_back(a.node_id);
          });
        } else if constexpr (std::is_same_v<T, UpdateResearchStatuses>) {
          const auto applicable = [&](const ResearchStatusChange& c) {
            const ResearchNode* n = s->find(c.node_id);
            if (!n || n->status == c.status) return false;
            if (n->status == ResearchStatus::InProgress || n->status == ResearchStatus::Completed) return false;
            return c.status == ResearchStatus::Locked || c.status == ResearchStatus::Unlocked;
          };
          if (std::none_of(a.changes.begin(), a.changes.end(), applicable)) return s;
          return mutated(s, [&](ResearchSlice& r) {
            for (const ResearchStatusChange& c : a.changes) {
              if (applicable(c)) r.nodes.at(c.node_id).status = c.status;
            }
          });
        } else if constexpr (std::is_same_v<T, SetResearchBoosts>) {
          static const std::unordered_map<std::string, double> kNoBoosts;
          const auto boosts_for = [&](const std::string& id) -> const std::unordered_map<std::string, double>& {
            auto it = a.node_boosts.find(id);
            return it == a.node_boosts.end() ? kNoBoosts : it->second;
          };
          bool changed = s->category_boosts != a.category_boosts;
          for (const auto& kv : s->nodes) {
            if (changed) break;
            changed = kv.second.deployment_boosts != boosts_for(kv.first);
          }
          if (!changed) return s;
          return mutated(s, [&](ResearchSlice& r) {
            r.category_boosts = a.category_boosts;
            for (auto& kv : r.nodes) kv.second.deployment_boosts = boosts_for(kv.first);
          });
        } else {
          return s;
        }
      },
      action);
}

std::shared_ptr<const DeploymentsSlice> reduce_deployments(const std::shared_ptr<const DeploymentsSlice>& s,
                                                           const Action& action) {
  using Ptr = std::shared_ptr<const DeploymentsSlice>;
  return std::visit(
      [&](const auto& a) -> Ptr {
        using T = std::decay_t<decltype(a)>;
        if constexpr (std::is_same_v<T, DeploySystem>) {
          if (a.deployment.id.empty()) return s;
          return mutated(s, [&](DeploymentsSlice& d) { d.active[a.deployment.id] = a.deployment; });
        } else if constexpr (std::is_same_v<T, RemoveDeployment>) {
          auto it = s->active.find(a.deployment_id);
          if (it == s->active.end()) return s;
          return mutated(s, [&](DeploymentsSlice& d) {
            const Deployment& dep = d.active.at(a.deployment_id);
            d.history.push_back(DeploymentHistoryEntry{dep.id, dep.type, dep.turn_deployed, a.turn, dep.effects});
            d.active.erase(a.deployment_id);
          });
        } else if constexpr (std::is_same_v<T, UpdateDeploymentSlots>) {
          if (a.slots < 0 || a.slots == s->slots) return s;
          return mutated(s, [&](DeploymentsSlice& d) { d.slots = a.slots; });
        } else if constexpr (std::is_same_v<T, UnlockDeploymentType>) {
          const auto& u = s->unlocked_types;
          if (a.type.empty() || std::find(u.begin(), u.end(), a.type) != u.end()) return s;
          return mutated(s, [&](DeploymentsSlice& d) { d.unlocked_types.push_back(a.type); });
        } else {
          return s;
        }
      },
      action);
}

std::shared_ptr<const CompetitorsSlice> reduce_competitors(const std::shared_ptr<const CompetitorsSlice>& s,
                                                           const Action& action) {
  if (const auto* a = std::get_if<UpdateCompetitor>(&action)) {
    if (a->id.empty()) return s;
    return mutated(s, [&](CompetitorsSlice& c) {
      Competitor& org = c.organizations[a->id];
      org.id = a->id;
      assign_if(a->name, org.name);
      assign_if(a->capability, org.capability);
      assign_if(a->safety, org.safety);
      assign_if(a->funding, org.funding);
      assign_if(a->influence, org.influence);
    });
  }
  if (const auto* a = std::get_if<UpdatePlayerRanking>(&action)) {
    if (a->ranking == s->player_ranking) return s;
    return mutated(s, [&](CompetitorsSlice& c) { c.player_ranking = a->ranking; });
  }
  return s;
}

std::shared_ptr<const WorldSlice> reduce_world(const std::shared_ptr<const WorldSlice>& s, const Action& action) {
  if (const auto* a = std::get_if<UpdateGlobalValues>(&action)) {
    if (!a->awareness && !a->alignment && !a->regulation) return s;
    return mutated(s, [&](WorldSlice& w) {
      assign_if(a->awareness, w.global_awareness);
      assign_if(a->alignment, w.global_alignment);
      assign_if(a->regulation, w.global_regulation);
    });
  }
  if (const auto* a = std::get_if<UpdateRegion>(&action)) {
    if (a->id.empty()) return s;
    return mutated(s, [&](WorldSlice& w) {
      Region& r = w.regions[a->id];
      r.id = a->id;
      assign_if(a->name, r.name);
      assign_if(a->awareness, r.awareness);
      assign_if(a->regulation, r.regulation);
      assign_if(a->adoption, r.adoption);
    });
  }
  return s;
}

std::shared_ptr<const SettingsSlice> reduce_settings(const std::shared_ptr<const SettingsSlice>& s,
                                                     const Action& action) {
  const auto* a = std::get_if<UpdateSettings>(&action);
  if (!a) return s;
  if (!a->difficulty && !a->tutorial_enabled && !a->auto_save && !a->music_volume && !a->sound_volume) return s;
  return mutated(s, [&](SettingsSlice& st) {
    assign_if(a->difficulty, st.difficulty);
    assign_if(a->tutorial_enabled, st.tutorial_enabled);
    assign_if(a->auto_save, st.auto_save);
    assign_if(a->music_volume, st.music_volume);
    assign_if(a->sound_volume, st.sound_volume);
  });
}

std::shared_ptr<const EventsSlice> reduce_events(const std::shared_ptr<const EventsSlice>& s, const Action& action) {
  if (const auto* a = std::get_if<AddEvent>(&action)) {
    if (a->event.id.empty() || s->find(a->event.id)) return s;
    return mutated(s, [&](EventsSlice& e) { e.current.push_back(a->event); });
  }
  if (const auto* a = std::get_if<ResolveEvent>(&action)) {
    const GameEvent* pending = s->find(a->event_id);
    if (!pending) return s;
    const int triggered_on = pending->turn_triggered;
    return mutated(s, [&](EventsSlice& e) {
      e.current.erase(std::remove_if(e.current.begin(), e.current.end(),
                                     [&](const GameEvent& ev) { return ev.id == a->event_id; }),
                      e.current.end());
      e.history.push_back(ResolvedEvent{a->event_id, a->choice_id, triggered_on, a->turn, a->effects});
      e.triggered[a->event_id] = true;
    });
  }
  return s;
}

GameStatePtr reduce_game(const GameStatePtr& state, const Action& a) {
  GameState next;
  next.meta = reduce_meta(state->meta, a);
  next.resources = reduce_resources(state->resources, a);
  next.research = reduce_research(state->research, a);
  next.deployments = reduce_deployments(state->deployments, a);
  next.competitors = reduce_competitors(state->competitors, a);
  next.world = reduce_world(state->world, a);
  next.settings = reduce_settings(state->settings, a);
  next.events = reduce_events(state->events, a);

  if (next.meta == state->meta && next.resources == state->resources && next.research == state->research &&
      next.deployments == state->deployments && next.competitors == state->competitors &&
      next.world == state->world && next.settings == state->settings && next.events == state->events) {
    return state;
  }
  return std::make_shared<const GameState>(std::move(next));
}

} // namespace superint
