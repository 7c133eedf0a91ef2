#pragma once

#include <string>

#include "superint/core/game_state.h"
#include "superint/util/json.h"

namespace superint {

// Full snapshot of a game state as a JSON document.
json::Value game_state_to_json(const GameState& state);

// Rebuilds a state from game_state_to_json output. Throws std::runtime_error
// if a slice is missing or has the wrong shape.
GameStatePtr game_state_from_json(const json::Value& v);

// Pretty-printed text forms of the above. Equal states serialize to identical
// text.
std::string serialize_game_state(const GameState& state);
GameStatePtr deserialize_game_state(const std::string& json_text);

} // namespace superint
