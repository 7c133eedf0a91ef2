#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "superint/core/serialization.h"
#include "superint/core/state_manager.h"
#include "superint/util/json.h"
#include "test.h"

#define SI_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

class UnwritableStore : public superint::SaveStore {
 public:
  std::optional<std::string> get(const std::string&) const override { return std::nullopt; }
  void put(const std::string& key, const std::string&) override {
    throw std::runtime_error("disk full writing '" + key + "'");
  }
  bool remove(const std::string&) override { return false; }
  std::vector<std::string> keys() const override { return {}; }
};

} // namespace

int test_state_manager() {
  using namespace superint;
  using testing::Harness;

  // Construction needs a state and a clock.
  {
    Logger log(log::Level::Off);
    EventBus bus(log);
    MemorySaveStore store;
    bool threw = false;
    try {
      StateManager sm(nullptr, bus, log, store, [] { return Timestamp{0}; });
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    SI_ASSERT(threw);
  }

  // Dispatch replaces the state, notifies listeners and emits stateChanged.
  {
    Harness h;
    auto& changed = h.record("stateChanged");
    int calls = 0;
    int turn_step = 0;
    std::string seen_action;
    auto unsub = h.state.subscribe([&](const GameStatePtr& prev, const GameStatePtr& next, const Action& a) {
      ++calls;
      turn_step = next->meta->turn - prev->meta->turn;
      seen_action = action_type_name(a);
    });

    const GameStatePtr before = h.state.state();
    h.state.dispatch(AdvanceTurn{});
    SI_ASSERT(h.state.state() != before);
    SI_ASSERT(h.state.state()->meta->turn == 2);
    SI_ASSERT(calls == 1);
    SI_ASSERT(turn_step == 1);
    SI_ASSERT(seen_action == "ADVANCE_TURN");
    SI_ASSERT(changed.size() == 1);
    SI_ASSERT(changed[0].at("action").string_value() == "ADVANCE_TURN");

    // A no-op dispatch notifies nobody.
    const GameStatePtr same = h.state.state();
    h.state.dispatch(UpdateSettings{});
    SI_ASSERT(h.state.state() == same);
    SI_ASSERT(calls == 1);
    SI_ASSERT(changed.size() == 1);

    unsub();
    h.state.dispatch(AdvanceTurn{});
    SI_ASSERT(calls == 1);
  }

  // A throwing listener does not stop the others.
  {
    Harness h;
    int good = 0;
    auto u1 = h.state.subscribe(
        [](const GameStatePtr&, const GameStatePtr&, const Action&) { throw std::runtime_error("listener broke"); });
    auto u2 = h.state.subscribe([&](const GameStatePtr&, const GameStatePtr&, const Action&) { ++good; });
    h.state.dispatch(AdvanceTurn{});
    SI_ASSERT(good == 1);
    SI_ASSERT(!h.errors.empty());
    SI_ASSERT(h.errors.back().find("listener broke") != std::string::npos);
    u1();
    u2();
  }

  // Slice subscriptions fire only when their slice changes.
  {
    Harness h;
    int resource_calls = 0;
    double claim_before = -1.0;
    double claim_after = -1.0;
    auto unsub = h.state.subscribe_to_slice([](const GameState& s) { return s.resources; },
                                            [&](const std::shared_ptr<const ResourcesSlice>& before,
                                                const std::shared_ptr<const ResourcesSlice>& after, const Action&) {
                                              ++resource_calls;
                                              claim_before = before->computing.claim("x");
                                              claim_after = after->computing.claim("x");
                                            });
    h.state.dispatch(AdvanceTurn{});
    SI_ASSERT(resource_calls == 0);
    h.state.dispatch(AllocateComputing{"x", 5.0, 1, 0});
    SI_ASSERT(resource_calls == 1);
    SI_ASSERT(claim_before == 0.0);
    SI_ASSERT(claim_after == 5.0);
    unsub();
  }

  // Save then load reproduces the saved state exactly.
  {
    Harness h;
    auto& saved_events = h.record("game:saved");
    auto& loaded_events = h.record("stateLoaded");

    h.state.dispatch(AdvanceTurn{});
    h.state.dispatch(AllocateComputing{"research:a", 12.5, 2, 100});
    InfluenceLevels delta;
    delta[InfluenceChannel::Public] = 7.25;
    h.state.dispatch(AdjustInfluence{delta, "press", 2, 100});
    h.state.dispatch(UpdateTimeCompression{1.15, 78});

    GameEvent leak;
    leak.id = "leak";
    leak.type = "scandal";
    leak.title = "Model weights leaked";
    leak.urgency = 0.8;
    leak.turn_triggered = 2;
    json::Object hit;
    hit["public"] = -5;
    leak.choices.push_back(EventChoice{"deny", "Deny everything", hit, {}});
    h.state.dispatch(AddEvent{leak});
    GameEvent grant = leak;
    grant.id = "grant";
    grant.type = "funding";
    h.state.dispatch(AddEvent{grant});
    h.state.dispatch(ResolveEvent{"grant", "deny", hit, 2});

    const std::string snapshot = serialize_game_state(*h.state.state());
    h.clock_ms = 1735689700000;
    SI_ASSERT(h.state.save_state("slot1"));
    SI_ASSERT(h.store.get("save_slot1").has_value());
    SI_ASSERT(h.state.state()->meta->last_saved.value() == 1735689700000);
    SI_ASSERT(saved_events.size() == 1);
    SI_ASSERT(saved_events[0].at("name").string_value() == "slot1");

    // The record carries its envelope.
    const json::Value record = json::parse(h.store.get("save_slot1").value());
    SI_ASSERT(record.at("version").string_value() == "1.0.0");
    SI_ASSERT(record.at("timestamp").int_value() == 1735689700000);
    SI_ASSERT(record.at("meta").at("turn").int_value() == 2);
    SI_ASSERT(record.at("meta").at("year").int_value() == 2025);

    h.state.dispatch(AdvanceTurn{});
    h.state.dispatch(DeallocateComputing{"research:a", 12.5, 3, 200});

    std::vector<std::string> load_actions;
    auto unsub = h.state.subscribe(
        [&](const GameStatePtr&, const GameStatePtr&, const Action& a) { load_actions.push_back(action_type_name(a)); });
    SI_ASSERT(h.state.load_state("slot1"));
    unsub();

    SI_ASSERT(serialize_game_state(*h.state.state()) == snapshot);
    SI_ASSERT(h.state.state()->meta->turn == 2);
    SI_ASSERT(h.state.state()->resources->computing.claim("research:a") == 12.5);
    SI_ASSERT(h.state.state()->meta->time.time_scale == 78);
    const EventsSlice& events = *h.state.state()->events;
    SI_ASSERT(events.current.size() == 1);
    SI_ASSERT(events.current[0].choices[0].effects.at("public").number_value() == -5.0);
    SI_ASSERT(events.history.size() == 1);
    SI_ASSERT(events.history[0].choice_id == "deny");
    SI_ASSERT(events.triggered.at("grant"));
    SI_ASSERT(load_actions.size() == 1);
    SI_ASSERT(load_actions[0] == "STATE_LOADED");
    SI_ASSERT(loaded_events.size() == 1);
    SI_ASSERT(loaded_events[0].at("name").string_value() == "slot1");
  }

  // A store that cannot be written makes save_state report false.
  {
    Logger log(log::Level::Warn);
    std::vector<std::string> errors;
    log.set_sink([&errors](log::Level l, const std::string& msg) {
      if (l == log::Level::Error) errors.push_back(msg);
    });
    EventBus bus(log);
    UnwritableStore store;
    StateManager sm(make_initial_game_state(0), bus, log, store, [] { return Timestamp{42}; });
    int saved = 0;
    auto unsub = bus.subscribe("game:saved", [&saved](const BusEvent&) { ++saved; });

    const GameStatePtr before = sm.state();
    bool ok = true;
    bool threw = false;
    try {
      ok = sm.save_state("slot");
    } catch (const std::exception&) {
      threw = true;
    }
    unsub();
    SI_ASSERT(!threw);
    SI_ASSERT(!ok);
    SI_ASSERT(saved == 0);
    SI_ASSERT(sm.state() == before);
    SI_ASSERT(!sm.state()->meta->last_saved);
    SI_ASSERT(errors.size() == 1);
  }

  // Failed loads leave the current state alone.
  {
    Harness h;
    h.state.dispatch(AdvanceTurn{});
    const GameStatePtr current = h.state.state();

    SI_ASSERT(!h.state.load_state("missing"));
    SI_ASSERT(h.state.state() == current);
    SI_ASSERT(!h.warnings.empty());

    h.store.put("save_corrupt", "{\"version\": \"1.0.0\", \"gameState\": ");
    SI_ASSERT(!h.state.load_state("corrupt"));
    SI_ASSERT(h.state.state() == current);

    h.store.put("save_partial", "{\"version\": \"1.0.0\", \"gameState\": {\"meta\": {}}, \"timestamp\": 1}");
    SI_ASSERT(!h.state.load_state("partial"));
    SI_ASSERT(h.state.state() == current);
    SI_ASSERT(!h.errors.empty());
  }

  // A version mismatch warns but still loads.
  {
    Harness h;
    SI_ASSERT(h.state.save_state("old"));
    json::Value record = json::parse(h.store.get("save_old").value());
    (*record.as_object())["version"] = "0.9.0";
    h.store.put("save_old", json::stringify(record, 0));
    h.warnings.clear();
    SI_ASSERT(h.state.load_state("old"));
    SI_ASSERT(!h.warnings.empty());
  }

  // Listing is newest first and skips foreign or unreadable keys.
  {
    Harness h;
    h.clock_ms = 1000;
    SI_ASSERT(h.state.save_state("first"));
    h.clock_ms = 3000;
    h.state.dispatch(AdvanceTurn{});
    SI_ASSERT(h.state.save_state("second"));
    h.store.put("settings", "{}");
    h.store.put("save_broken", "not json");

    const auto saves = h.state.list_saves();
    SI_ASSERT(saves.size() == 2);
    SI_ASSERT(saves[0].name == "second");
    SI_ASSERT(saves[0].turn == 2);
    SI_ASSERT(saves[0].timestamp == 3000);
    SI_ASSERT(saves[1].name == "first");

    SI_ASSERT(h.state.delete_save("first"));
    SI_ASSERT(!h.state.delete_save("first"));
    SI_ASSERT(h.state.list_saves().size() == 1);
  }

  return 0;
}
