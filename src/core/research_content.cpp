#include "superint/core/research_content.h"

#include <algorithm>
#include <functional>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "superint/core/enum_strings.h"
#include "superint/util/file_io.h"
#include "superint/util/sorted_keys.h"

namespace superint {
namespace {

using json::Array;
using json::Object;
using json::Value;

const Value* find_key(const Object& o, const std::string& k) {
  auto it = o.find(k);
  return it == o.end() ? nullptr : &it->second;
}

std::vector<std::string> string_list(const Object& o, const std::string& k) {
  std::vector<std::string> out;
  const Value* v = find_key(o, k);
  if (!v || v->is_null()) return out;
  for (const auto& e : v->array()) {
    if (!e.is_string()) throw std::runtime_error("Expected string entries in '" + k + "'");
    out.push_back(e.string_value());
  }
  return out;
}

Array to_array(const std::vector<std::string>& v) {
  Array a;
  a.reserve(v.size());
  for (const auto& s : v) a.push_back(s);
  return a;
}

template <typename... Args>
std::string join(Args&&... parts) {
  std::ostringstream ss;
  (ss << ... << parts);
  return ss.str();
}

} // namespace

json::Value research_def_to_json(const ResearchDef& def) {
  Object o;
  o["id"] = def.id;
  o["name"] = def.name;
  o["description"] = def.description;
  o["category"] = def.category;
  o["subcategory"] = def.subcategory;
  o["type"] = research_node_type_to_string(def.type);
  o["prerequisites"] = to_array(def.prerequisites);
  o["exclusions"] = to_array(def.exclusions);
  o["compute_cost"] = def.compute_cost;

  Object influence;
  for (InfluenceChannel c : kInfluenceChannels) {
    if (def.influence_cost[c] != 0.0) influence[influence_channel_to_string(c)] = def.influence_cost[c];
  }
  o["influence_cost"] = std::move(influence);
  o["data_cost"] = to_array(def.data_cost);

  Object effects;
  if (def.effects.compute_efficiency) effects["compute_efficiency"] = *def.effects.compute_efficiency;
  if (def.effects.influence_multiplier) effects["influence_multiplier"] = *def.effects.influence_multiplier;
  effects["unlock_deployments"] = to_array(def.effects.unlock_deployments);
  effects["deployment_slots"] = def.effects.deployment_slots;
  effects["unlocks"] = to_array(def.effects.unlocks);
  o["effects"] = std::move(effects);

  if (def.risk) {
    Object risk;
    risk["probability"] = def.risk->probability;
    risk["severity"] = def.risk->severity;
    o["risk"] = std::move(risk);
  }

  Object pos;
  pos["x"] = def.position.x;
  pos["y"] = def.position.y;
  o["position"] = std::move(pos);
  o["deployment_requirements"] = to_array(def.deployment_requirements);
  return o;
}

ResearchDef research_def_from_json(const json::Value& v) {
  const Object& o = v.object();
  ResearchDef def;
  if (const Value* id = find_key(o, "id")) def.id = id->string_value();
  if (def.id.empty()) throw std::runtime_error("Research node is missing an id");

  const auto str = [&](const char* k, const std::string& fallback) {
    const Value* p = find_key(o, k);
    return p ? p->string_value(fallback) : fallback;
  };
  def.name = str("name", def.id);
  def.description = str("description", "");
  def.category = str("category", "");
  def.subcategory = str("subcategory", "");

  const std::string type = str("type", "standard");
  const auto parsed_type = research_node_type_from_string(type);
  if (!parsed_type) throw std::runtime_error(join("Research node '", def.id, "' has unknown type '", type, "'"));
  def.type = *parsed_type;

  def.prerequisites = string_list(o, "prerequisites");
  def.exclusions = string_list(o, "exclusions");
  if (const Value* p = find_key(o, "compute_cost")) def.compute_cost = p->number_value(0.0);

  if (const Value* p = find_key(o, "influence_cost"); p && !p->is_null()) {
    for (const auto& [channel, amount] : p->object()) {
      const auto c = influence_channel_from_string(channel);
      if (!c) throw std::runtime_error(join("Research node '", def.id, "' has unknown influence channel '", channel, "'"));
      def.influence_cost[*c] = amount.number_value(0.0);
    }
  }
  def.data_cost = string_list(o, "data_cost");

  if (const Value* p = find_key(o, "effects"); p && !p->is_null()) {
    const Object& e = p->object();
    if (const Value* x = find_key(e, "compute_efficiency"); x && x->is_number()) {
      def.effects.compute_efficiency = x->number_value();
    }
    if (const Value* x = find_key(e, "influence_multiplier"); x && x->is_number()) {
      def.effects.influence_multiplier = x->number_value();
    }
    def.effects.unlock_deployments = string_list(e, "unlock_deployments");
    if (const Value* x = find_key(e, "deployment_slots")) {
      def.effects.deployment_slots = static_cast<int>(x->int_value(0));
    }
    def.effects.unlocks = string_list(e, "unlocks");
  }

  if (const Value* p = find_key(o, "risk"); p && !p->is_null()) {
    ResearchRisk r;
    r.probability = p->at("probability").number_value(0.0);
    if (const Value* s = p->find("severity")) r.severity = s->number_value(0.0);
    def.risk = r;
  }

  if (const Value* p = find_key(o, "position"); p && !p->is_null()) {
    if (const Value* x = p->find("x")) def.position.x = x->number_value(0.0);
    if (const Value* y = p->find("y")) def.position.y = y->number_value(0.0);
  }
  def.deployment_requirements = string_list(o, "deployment_requirements");
  return def;
}

ResearchDB load_research_db_from_json(const std::string& text) {
  const Value root = json::parse(text);
  ResearchDB db;
  for (const auto& nv : root.at("nodes").array()) {
    ResearchDef def = research_def_from_json(nv);
    const std::string id = def.id;
    if (!db.nodes.emplace(id, std::move(def)).second) {
      throw std::runtime_error("Duplicate research node id: " + id);
    }
  }
  return db;
}

ResearchDB load_research_db_from_file(const std::string& path) {
  try {
    return load_research_db_from_json(read_text_file(path));
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load research content '" + path + "': " + e.what());
  }
}

std::vector<std::string> validate_research_db(const ResearchDB& db) {
  std::vector<std::string> errors;
  const auto ids = util::sorted_keys(db.nodes);

  for (const auto& id : ids) {
    const ResearchDef& d = db.nodes.at(id);

    const auto check_refs = [&](const std::vector<std::string>& refs, const char* what) {
      for (const auto& ref : refs) {
        if (ref == id) {
          errors.push_back(join("Research node '", id, "' lists itself as ", what));
        } else if (db.nodes.find(ref) == db.nodes.end()) {
          errors.push_back(join("Research node '", id, "' has unknown ", what, " '", ref, "'"));
        }
      }
    };
    check_refs(d.prerequisites, "prerequisite");
    check_refs(d.exclusions, "exclusion");

    for (const auto& p : d.prerequisites) {
      if (std::find(d.exclusions.begin(), d.exclusions.end(), p) != d.exclusions.end()) {
        errors.push_back(join("Research node '", id, "' lists '", p, "' as both prerequisite and exclusion"));
      }
    }

    if (d.compute_cost < 0.0) errors.push_back(join("Research node '", id, "' has negative compute_cost"));
    for (InfluenceChannel c : kInfluenceChannels) {
      if (d.influence_cost[c] < 0.0) {
        errors.push_back(join("Research node '", id, "' has negative influence cost for '",
                              influence_channel_to_string(c), "'"));
      }
    }
    if (d.risk && (d.risk->probability < 0.0 || d.risk->probability > 1.0)) {
      errors.push_back(join("Research node '", id, "' has risk probability outside [0,1]"));
    }
  }

  // Prerequisite cycles make every node on the cycle permanently Locked.
  // 0 = unvisited, 1 = visiting, 2 = done.
  std::unordered_map<std::string, int> visit;
  std::vector<std::string> stack;
  std::unordered_map<std::string, std::size_t> stack_pos;
  std::unordered_set<std::string> reported;

  std::function<void(const std::string&)> dfs = [&](const std::string& id) {
    visit[id] = 1;
    stack_pos[id] = stack.size();
    stack.push_back(id);

    std::vector<std::string> prereqs = db.nodes.at(id).prerequisites;
    std::sort(prereqs.begin(), prereqs.end());
    prereqs.erase(std::unique(prereqs.begin(), prereqs.end()), prereqs.end());

    for (const auto& pre : prereqs) {
      if (pre == id || db.nodes.find(pre) == db.nodes.end()) continue;
      const int st = visit.count(pre) ? visit[pre] : 0;
      if (st == 0) {
        dfs(pre);
      } else if (st == 1) {
        std::vector<std::string> canon(stack.begin() + static_cast<std::ptrdiff_t>(stack_pos[pre]), stack.end());
        std::sort(canon.begin(), canon.end());
        std::string key;
        for (const auto& c : canon) key += (key.empty() ? "" : "|") + c;
        if (reported.insert(key).second) errors.push_back("Research prerequisite cycle detected: " + key);
      }
    }

    stack.pop_back();
    stack_pos.erase(id);
    visit[id] = 2;
  };

  for (const auto& id : ids) {
    if (!visit.count(id)) dfs(id);
  }
  return errors;
}

std::vector<ResearchNode> make_research_nodes(const ResearchDB& db) {
  std::vector<ResearchNode> out;
  out.reserve(db.nodes.size());
  for (const auto& id : util::sorted_keys(db.nodes)) {
    ResearchNode n;
    n.def = db.nodes.at(id);
    out.push_back(std::move(n));
  }
  return out;
}

} // namespace superint
