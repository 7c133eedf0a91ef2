#include <iostream>
#include <string>
#include <vector>

#include "superint/core/reducers.h"

#define SI_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

using namespace superint;

ResearchNode node(const std::string& id, std::vector<std::string> prereqs = {}) {
  ResearchNode n;
  n.def.id = id;
  n.def.name = id;
  n.def.category = "foundations";
  n.def.compute_cost = 100.0;
  n.def.prerequisites = std::move(prereqs);
  return n;
}

GameStatePtr with_research(GameStatePtr s) {
  s = reduce_game(s, InitializeResearch{{node("a"), node("b", {"a"})}});
  return reduce_game(s, UpdateResearchStatuses{{ResearchStatusChange{"a", ResearchStatus::Unlocked}}});
}

} // namespace

int test_reducers() {
  const GameStatePtr s0 = make_initial_game_state(0);

  // Actions that change nothing return the very same pointers.
  {
    SI_ASSERT(reduce_game(s0, UpdateSettings{}) == s0);
    SI_ASSERT(reduce_game(s0, StateLoaded{"x"}) == s0);
    SI_ASSERT(reduce_game(s0, SetPhase{Phase::Start}) == s0);
    SI_ASSERT(reduce_game(s0, CancelResearch{"missing"}) == s0);
    SI_ASSERT(reduce_game(s0, UpdateResourceCaps{}) == s0);
    SI_ASSERT(reduce_game(s0, AdjustInfluence{InfluenceLevels{}, "noop", 1, 0}) == s0);
    SI_ASSERT(reduce_game(s0, SetComputingEfficiency{1.0}) == s0);
    SI_ASSERT(reduce_game(s0, RemoveDeployment{"nope", 1}) == s0);

    SI_ASSERT(reduce_meta(s0->meta, CompleteResearch{"a", 1}) == s0->meta);
    SI_ASSERT(reduce_resources(s0->resources, AdvanceTurn{}) == s0->resources);
    SI_ASSERT(reduce_research(s0->research, AllocateComputing{"x", 1.0, 1, 0}) == s0->research);
    SI_ASSERT(reduce_deployments(s0->deployments, AdvanceTurn{}) == s0->deployments);
    SI_ASSERT(reduce_competitors(s0->competitors, AdvanceTurn{}) == s0->competitors);
    SI_ASSERT(reduce_world(s0->world, AdvanceTurn{}) == s0->world);
    SI_ASSERT(reduce_settings(s0->settings, AdvanceTurn{}) == s0->settings);
    SI_ASSERT(reduce_events(s0->events, AdvanceTurn{}) == s0->events);
    SI_ASSERT(reduce_game(s0, UpdateTimeCompression{1.0, kBaseTimeScale}) == s0);
    SI_ASSERT(reduce_game(s0, ResolveEvent{"missing", "x", {}, 1}) == s0);
    SI_ASSERT(reduce_game(s0, AddEvent{GameEvent{}}) == s0);
  }

  // Advancing the turn leaves the phase to the turn cycle.
  {
    GameStatePtr s = reduce_game(s0, SetPhase{Phase::Resolution});
    s = reduce_game(s, AdvanceTurn{});
    SI_ASSERT(s->meta->turn == 2);
    SI_ASSERT(s->meta->phase == Phase::Resolution);
  }

  // Time compression only touches the meta slice.
  {
    const GameStatePtr s = reduce_game(s0, UpdateTimeCompression{1.15, 78});
    SI_ASSERT(s != s0);
    SI_ASSERT(s->meta->time.compression_factor == 1.15);
    SI_ASSERT(s->meta->time.time_scale == 78);
    SI_ASSERT(s->meta->time.month == s0->meta->time.month);
    SI_ASSERT(s->resources == s0->resources);
    SI_ASSERT(reduce_game(s, UpdateTimeCompression{1.15, 78}) == s);
  }

  // Events wait in the queue until resolved, then move to history.
  {
    GameEvent ev;
    ev.id = "audit";
    ev.type = "regulation";
    ev.turn_triggered = 3;
    ev.choices.push_back(EventChoice{"comply", "Comply", {}, {}});
    GameStatePtr s = reduce_game(s0, AddEvent{ev});
    SI_ASSERT(s->events->current.size() == 1);
    SI_ASSERT(s->meta == s0->meta);
    // Duplicate ids are ignored while pending.
    SI_ASSERT(reduce_game(s, AddEvent{ev}) == s);

    json::Object effects;
    effects["funding"] = -50;
    const GameStatePtr r = reduce_game(s, ResolveEvent{"audit", "comply", effects, 5});
    SI_ASSERT(r->events->current.empty());
    SI_ASSERT(r->events->history.size() == 1);
    SI_ASSERT(r->events->history[0].turn_triggered == 3);
    SI_ASSERT(r->events->history[0].turn_resolved == 5);
    SI_ASSERT(r->events->history[0].effects.at("funding").number_value() == -50.0);
    SI_ASSERT(r->events->triggered.at("audit"));
    // Resolving twice changes nothing.
    SI_ASSERT(reduce_game(r, ResolveEvent{"audit", "comply", effects, 6}) == r);
    // The input state is untouched.
    SI_ASSERT(s->events->current.size() == 1);
  }

  // A change rebuilds only the slice that owns it.
  {
    const GameStatePtr s1 = reduce_game(s0, AdvanceTurn{});
    SI_ASSERT(s1 != s0);
    SI_ASSERT(s1->meta->turn == s0->meta->turn + 1);
    SI_ASSERT(s1->meta->phase == Phase::Start);
    SI_ASSERT(s1->resources == s0->resources);
    SI_ASSERT(s1->research == s0->research);
    SI_ASSERT(s1->settings == s0->settings);
    // Input is untouched.
    SI_ASSERT(s0->meta->turn == 1);
  }

  // Compute claims never exceed the pool.
  {
    const double total = s0->resources->computing.total;
    GameStatePtr s = reduce_game(s0, AllocateComputing{"x", total + 1.0, 1, 0});
    SI_ASSERT(s == s0);

    s = reduce_game(s0, AllocateComputing{"x", 30.0, 1, 0});
    s = reduce_game(s, AllocateComputing{"y", 20.0, 1, 0});
    SI_ASSERT(s->resources->computing.allocated_total() == 50.0);
    SI_ASSERT(s->resources->computing.available() == total - 50.0);
    SI_ASSERT(reduce_game(s, AllocateComputing{"z", 1.0, 1, 0}) == s);

    // Releasing more than the claim releases the claim.
    s = reduce_game(s, DeallocateComputing{"x", 100.0, 1, 0});
    SI_ASSERT(s->resources->computing.claim("x") == 0.0);
    SI_ASSERT(s->resources->computing.allocated.count("x") == 0);
    SI_ASSERT(s->resources->computing.claim("y") == 20.0);
    SI_ASSERT(reduce_game(s, DeallocateComputing{"x", 1.0, 1, 0}) == s);
  }

  // Generation respects the cap and never shrinks the pool.
  {
    GameStatePtr s = s0;
    for (int i = 0; i < 30; ++i) s = reduce_game(s, GenerateResources{i, 0, 5.0, 10.0, InfluenceLevels{}});
    SI_ASSERT(s->resources->computing.total == s->resources->computing.cap);
    SI_ASSERT(s->resources->computing.generation_history.size() == kHistoryLimit);
    SI_ASSERT(s->resources->funding.current == s0->resources->funding.current + 300.0);
    for (const auto& kv : s->resources->data.types) SI_ASSERT(kv.second.quality >= 0.1);
  }

  // Influence stays within bounds and records what actually moved.
  {
    InfluenceLevels up;
    for (InfluenceChannel c : kInfluenceChannels) up[c] = 500.0;
    GameStatePtr s = reduce_game(s0, AdjustInfluence{up, "windfall", 1, 0});
    for (InfluenceChannel c : kInfluenceChannels) SI_ASSERT(s->resources->influence.levels[c] == kInfluenceMax);
    SI_ASSERT(reduce_game(s, AdjustInfluence{up, "more", 1, 0}) == s);

    InfluenceLevels down;
    for (InfluenceChannel c : kInfluenceChannels) down[c] = -1000.0;
    s = reduce_game(s, AdjustInfluence{down, "scandal", 2, 0});
    for (InfluenceChannel c : kInfluenceChannels) SI_ASSERT(s->resources->influence.levels[c] == kInfluenceMin);
    const auto& last = s->resources->influence.history.back();
    SI_ASSERT(last.reason == "scandal");
    SI_ASSERT(last.delta[InfluenceChannel::Academic] == -kInfluenceMax);
  }

  // Spending is all-or-nothing.
  {
    SpendResources too_much;
    too_much.reason = "cluster";
    too_much.computing = s0->resources->computing.available() + 10.0;
    too_much.funding = 10.0;
    SI_ASSERT(reduce_game(s0, too_much) == s0);

    SpendResources ok;
    ok.reason = "lab";
    ok.computing = 10.0;
    ok.funding = 50.0;
    ok.recurring = true;
    ok.influence[InfluenceChannel::Academic] = 5.0;
    const GameStatePtr s = reduce_game(s0, ok);
    SI_ASSERT(s->resources->computing.claim("lab") == 10.0);
    SI_ASSERT(s->resources->funding.current == s0->resources->funding.current - 50.0);
    SI_ASSERT(s->resources->funding.expenses == s0->resources->funding.expenses + 50.0);
    SI_ASSERT(s->resources->funding.spending_history.back().recurring);
    SI_ASSERT(s->resources->influence.levels[InfluenceChannel::Academic] ==
              s0->resources->influence.levels[InfluenceChannel::Academic] - 5.0);
  }

  // Research status transitions.
  {
    GameStatePtr s = with_research(s0);
    SI_ASSERT(s->research->find("a")->status == ResearchStatus::Unlocked);
    SI_ASSERT(s->research->find("b")->status == ResearchStatus::Locked);

    // Seeding again with known ids changes nothing.
    SI_ASSERT(reduce_game(s, InitializeResearch{{node("a")}}) == s);

    // Locked nodes cannot start.
    SI_ASSERT(reduce_game(s, StartResearch{"b", 10.0, 1}) == s);

    s = reduce_game(s, StartResearch{"a", 50.0, 1});
    const ResearchNode* a = s->research->find("a");
    SI_ASSERT(a->status == ResearchStatus::InProgress);
    SI_ASSERT(a->compute_allocated == 50.0);
    SI_ASSERT(a->start_turn && *a->start_turn == 1);
    SI_ASSERT(s->research->active.size() == 1);

    // Status flips never touch active nodes.
    SI_ASSERT(reduce_game(s, UpdateResearchStatuses{{ResearchStatusChange{"a", ResearchStatus::Locked}}}) == s);

    // Progress never goes backwards and is clamped.
    s = reduce_game(s, UpdateResearchProgress{{ResearchProgressUpdate{"a", 0.6, 60.0}}});
    s = reduce_game(s, UpdateResearchProgress{{ResearchProgressUpdate{"a", 0.2, 20.0}}});
    SI_ASSERT(s->research->find("a")->progress == 0.6);
    s = reduce_game(s, UpdateResearchProgress{{ResearchProgressUpdate{"a", 3.0, 0.0}}});
    SI_ASSERT(s->research->find("a")->progress == 1.0);

    s = reduce_game(s, CompleteResearch{"a", 2});
    a = s->research->find("a");
    SI_ASSERT(a->status == ResearchStatus::Completed);
    SI_ASSERT(a->compute_allocated == 0.0);
    SI_ASSERT(a->completion_turn && *a->completion_turn == 2);
    SI_ASSERT(s->research->active.empty());
    SI_ASSERT(s->research->completed.size() == 1);

    // Completed is terminal.
    SI_ASSERT(reduce_game(s, CompleteResearch{"a", 3}) == s);
    SI_ASSERT(reduce_game(s, CancelResearch{"a"}) == s);
    SI_ASSERT(reduce_game(s, StartResearch{"a", 5.0, 3}) == s);
    SI_ASSERT(reduce_game(s, UpdateResearchStatuses{{ResearchStatusChange{"a", ResearchStatus::Unlocked}}}) == s);
    SI_ASSERT(reduce_game(s, UpdateResearchProgress{{ResearchProgressUpdate{"a", 0.0, 0.0}}}) == s);
  }

  // Cancel keeps progress and returns the node to Unlocked.
  {
    GameStatePtr s = with_research(s0);
    s = reduce_game(s, StartResearch{"a", 40.0, 1});
    s = reduce_game(s, UpdateResearchProgress{{ResearchProgressUpdate{"a", 0.4, 40.0}}});
    s = reduce_game(s, CancelResearch{"a"});
    const ResearchNode* a = s->research->find("a");
    SI_ASSERT(a->status == ResearchStatus::Unlocked);
    SI_ASSERT(a->progress == 0.4);
    SI_ASSERT(a->compute_allocated == 0.0);
    SI_ASSERT(s->research->active.empty());
  }

  // Boosts only rebuild the slice when they change.
  {
    GameStatePtr s = with_research(s0);
    SI_ASSERT(reduce_game(s, SetResearchBoosts{}) == s);
    SetResearchBoosts boosts;
    boosts.category_boosts["foundations"] = 0.2;
    boosts.node_boosts["a"]["dep1"] = 0.1;
    const GameStatePtr s2 = reduce_game(s, boosts);
    SI_ASSERT(s2 != s);
    SI_ASSERT(s2->research->find("a")->deployment_boosts.at("dep1") == 0.1);
    SI_ASSERT(reduce_game(s2, boosts) == s2);
  }

  // Deployments.
  {
    Deployment dep;
    dep.id = "dep1";
    dep.type = "chatbot";
    dep.turn_deployed = 1;
    GameStatePtr s = reduce_game(s0, DeploySystem{dep});
    SI_ASSERT(s->deployments->has_type_active("chatbot"));
    SI_ASSERT(s->deployments->has_type_active("dep1"));
    s = reduce_game(s, RemoveDeployment{"dep1", 3});
    SI_ASSERT(s->deployments->active.empty());
    SI_ASSERT(s->deployments->history.size() == 1);
    SI_ASSERT(s->deployments->history[0].turn_removed == 3);

    s = reduce_game(s, UnlockDeploymentType{"chatbot"});
    SI_ASSERT(reduce_game(s, UnlockDeploymentType{"chatbot"}) == s);
  }

  // Turn history is bounded.
  {
    GameStatePtr s = s0;
    for (int i = 0; i < 15; ++i) s = reduce_game(s, AddTurnHistory{TurnHistoryEntry{i, 2025, 1, 0}});
    SI_ASSERT(s->meta->turn_history.size() == kHistoryLimit);
    SI_ASSERT(s->meta->turn_history.front().turn == 5);
  }

  return 0;
}
