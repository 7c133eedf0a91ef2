#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "superint/core/game_state.h"
#include "superint/util/json.h"

namespace superint {

// Static research tree content, keyed by node id.
struct ResearchDB {
  std::unordered_map<std::string, ResearchDef> nodes;
};

// Content-file encoding of a single definition (also embedded in saves).
json::Value research_def_to_json(const ResearchDef& def);
// Throws std::runtime_error on a missing id or unknown enum strings.
ResearchDef research_def_from_json(const json::Value& v);

// Loads {"nodes": [ ... ]}. Throws std::runtime_error on malformed documents
// and duplicate ids. Does not validate the graph; see validate_research_db.
ResearchDB load_research_db_from_json(const std::string& text);
ResearchDB load_research_db_from_file(const std::string& path);

// Returns human-readable errors; empty means the content is usable.
//
// Checks: unknown or self-referencing prerequisites/exclusions, ids listed as
// both prerequisite and exclusion, negative costs, risk probability outside
// [0,1] and prerequisite cycles.
std::vector<std::string> validate_research_db(const ResearchDB& db);

// Fresh Locked nodes for every definition, ordered by id.
std::vector<ResearchNode> make_research_nodes(const ResearchDB& db);

} // namespace superint
