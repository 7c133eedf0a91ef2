#include "superint/core/state_manager.h"

#include <algorithm>
#include <exception>
#include <stdexcept>

#include "superint/core/serialization.h"

namespace superint {

StateManager::StateManager(GameStatePtr initial, EventBus& bus, Logger& log, SaveStore& store, Clock clock,
                           const EngineConfig& cfg, Reducer reducer)
    : state_(std::move(initial)),
      bus_(bus),
      log_(log),
      store_(store),
      clock_(std::move(clock)),
      cfg_(cfg),
      reducer_(std::move(reducer)),
      self_(std::make_shared<StateManager*>(this)) {
  if (!state_) throw std::invalid_argument("StateManager requires an initial state");
  if (!clock_) throw std::invalid_argument("StateManager requires a clock");
}

void StateManager::dispatch(const Action& action) {
  const GameStatePtr prev = state_;
  GameStatePtr next = reducer_(prev, action);
  if (next == prev) {
    if (log_.enabled(log::Level::Debug)) {
      log_.debug("StateManager: " + action_type_name(action) + " left the state unchanged");
    }
    return;
  }

  state_ = next;
  notify(prev, next, action);

  BusEvent ev;
  ev.topic = "stateChanged";
  json::Object data;
  data["action"] = action_type_name(action);
  ev.data = std::move(data);
  ev.prev_state = prev;
  ev.next_state = next;
  bus_.emit(std::move(ev), "StateManager");
}

Unsubscribe StateManager::subscribe(Listener listener) {
  auto e = std::make_shared<Entry>();
  e->id = next_listener_id_++;
  e->fn = std::move(listener);
  listeners_.push_back(e);

  std::weak_ptr<StateManager*> weak = self_;
  const std::uint64_t id = e->id;
  return [weak, id]() {
    if (auto self = weak.lock()) (*self)->remove_listener(id);
  };
}

void StateManager::remove_listener(std::uint64_t id) {
  for (auto it = listeners_.begin(); it != listeners_.end(); ++it) {
    if ((*it)->id != id) continue;
    (*it)->active = false;
    listeners_.erase(it);
    return;
  }
}

void StateManager::notify(const GameStatePtr& prev, const GameStatePtr& next, const Action& action) {
  const auto snapshot = listeners_;
  for (const auto& e : snapshot) {
    if (!e->active) continue;
    try {
      e->fn(prev, next, action);
    } catch (const std::exception& ex) {
      log_.error("StateManager: state listener failed during " + action_type_name(action) + ": " + ex.what());
    }
  }
}

bool StateManager::save_state(const std::string& name) {
  const Timestamp ts = clock_();
  try {
    const GameState& s = *state_;
    json::Object meta;
    meta["turn"] = s.meta->turn;
    meta["year"] = s.meta->time.year;
    meta["quarter"] = s.meta->time.quarter;
    meta["month"] = s.meta->time.month;
    meta["day"] = s.meta->time.day;

    json::Object record;
    record["version"] = cfg_.save_version;
    record["gameState"] = game_state_to_json(s);
    record["timestamp"] = ts;
    record["meta"] = std::move(meta);

    const std::string text = json::stringify(json::Value(std::move(record)), 0);
    store_.put(save_key(name), text);
    log_.debug("StateManager: wrote " + std::to_string(text.size()) + " bytes to '" + save_key(name) + "'");
  } catch (const std::exception& e) {
    log_.error("StateManager: failed to save game '" + name + "': " + e.what());
    return false;
  }

  MetaUpdate update;
  update.last_saved = ts;
  dispatch(update);

  log_.info("StateManager: game saved as '" + name + "'");
  json::Object data;
  data["name"] = name;
  data["timestamp"] = ts;
  bus_.emit("game:saved", std::move(data), "StateManager");
  return true;
}

bool StateManager::load_state(const std::string& name) {
  GameStatePtr loaded;
  try {
    const auto text = store_.get(save_key(name));
    if (!text) {
      log_.warn("StateManager: no save found with name '" + name + "'");
      return false;
    }
    const json::Value record = json::parse(*text);
    loaded = game_state_from_json(record.at("gameState"));

    const std::string version = record.find("version") ? record.at("version").string_value() : std::string();
    if (version != cfg_.save_version) {
      log_.warn("StateManager: save '" + name + "' has version '" + version + "', expected '" + cfg_.save_version +
                "'");
    }
  } catch (const std::exception& e) {
    log_.error("StateManager: failed to load game '" + name + "': " + e.what());
    return false;
  }

  const GameStatePtr prev = state_;
  state_ = loaded;
  notify(prev, loaded, StateLoaded{name});

  log_.info("StateManager: game loaded from '" + name + "'");
  json::Object data;
  data["name"] = name;
  bus_.emit("stateLoaded", std::move(data), "StateManager");
  return true;
}

std::vector<SaveSummary> StateManager::list_saves() const {
  std::vector<SaveSummary> out;
  std::vector<std::string> keys;
  try {
    keys = store_.keys();
  } catch (const std::exception& e) {
    log_.error(std::string("StateManager: failed to list saves: ") + e.what());
    return out;
  }

  const std::string& prefix = cfg_.save_key_prefix;
  for (const auto& key : keys) {
    if (key.compare(0, prefix.size(), prefix) != 0) continue;
    try {
      const auto text = store_.get(key);
      if (!text) continue;
      const json::Value record = json::parse(*text);
      SaveSummary s;
      s.name = key.substr(prefix.size());
      s.version = record.at("version").string_value();
      s.timestamp = record.at("timestamp").int_value();
      if (const json::Value* meta = record.find("meta")) {
        if (const auto* v = meta->find("turn")) s.turn = static_cast<int>(v->int_value());
        if (const auto* v = meta->find("year")) s.year = static_cast<int>(v->int_value());
        if (const auto* v = meta->find("quarter")) s.quarter = static_cast<int>(v->int_value());
      }
      out.push_back(std::move(s));
    } catch (const std::exception& e) {
      log_.warn("StateManager: skipping unreadable save '" + key + "': " + e.what());
    }
  }

  std::stable_sort(out.begin(), out.end(),
                   [](const SaveSummary& a, const SaveSummary& b) { return a.timestamp > b.timestamp; });
  return out;
}

bool StateManager::delete_save(const std::string& name) {
  try {
    if (!store_.remove(save_key(name))) return false;
  } catch (const std::exception& e) {
    log_.error("StateManager: failed to delete save '" + name + "': " + e.what());
    return false;
  }
  log_.info("StateManager: deleted save '" + name + "'");
  return true;
}

} // namespace superint
