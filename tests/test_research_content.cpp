#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "superint/core/research_content.h"
#include "superint/util/json.h"

#define SI_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace {

bool has_error(const std::vector<std::string>& errors, const std::string& needle) {
  return std::any_of(errors.begin(), errors.end(),
                     [&](const std::string& e) { return e.find(needle) != std::string::npos; });
}

std::string load_error(const std::string& text) {
  try {
    (void)superint::load_research_db_from_json(text);
  } catch (const std::runtime_error& e) {
    return e.what();
  }
  return {};
}

} // namespace

int test_research_content() {
  using namespace superint;

  // The shipped tree loads and validates.
  {
    const ResearchDB db = load_research_db_from_file("data/research/research_tree.json");
    SI_ASSERT(db.nodes.size() >= 10);
    const auto errors = validate_research_db(db);
    for (const auto& e : errors) std::cerr << "  " << e << "\n";
    SI_ASSERT(errors.empty());

    const ResearchDef& t = db.nodes.at("transformer_architecture");
    SI_ASSERT(t.compute_cost == 10.0);
    SI_ASSERT(t.influence_cost[InfluenceChannel::Academic] == 5.0);
    SI_ASSERT(t.prerequisites.empty());
    SI_ASSERT(t.data_cost.size() == 1);
    SI_ASSERT(t.data_cost[0] == "public_text");
    SI_ASSERT(t.effects.compute_efficiency && *t.effects.compute_efficiency == 1.0);
    SI_ASSERT(t.risk && t.risk->probability == 0.05);

    // Nodes are seeded Locked and in id order.
    const auto nodes = make_research_nodes(db);
    SI_ASSERT(nodes.size() == db.nodes.size());
    SI_ASSERT(std::is_sorted(nodes.begin(), nodes.end(),
                             [](const ResearchNode& a, const ResearchNode& b) { return a.id() < b.id(); }));
    SI_ASSERT(std::all_of(nodes.begin(), nodes.end(),
                          [](const ResearchNode& n) { return n.status == ResearchStatus::Locked; }));
  }

  // Definition encoding survives a round trip.
  {
    ResearchDef d;
    d.id = "x";
    d.name = "X";
    d.category = "alignment";
    d.type = ResearchNodeType::Breakthrough;
    d.prerequisites = {"a", "b"};
    d.compute_cost = 12.5;
    d.influence_cost[InfluenceChannel::Public] = 3.0;
    d.effects.influence_multiplier = 1.1;
    d.effects.unlock_deployments = {"chatbot"};
    d.effects.deployment_slots = 2;
    d.risk = ResearchRisk{0.25, 0.5};
    d.deployment_requirements = {"api"};

    const ResearchDef back = research_def_from_json(json::parse(json::stringify(research_def_to_json(d))));
    SI_ASSERT(back.id == "x");
    SI_ASSERT(back.type == ResearchNodeType::Breakthrough);
    SI_ASSERT(back.prerequisites == d.prerequisites);
    SI_ASSERT(back.compute_cost == 12.5);
    SI_ASSERT(back.influence_cost == d.influence_cost);
    SI_ASSERT(back.effects.influence_multiplier && *back.effects.influence_multiplier == 1.1);
    SI_ASSERT(!back.effects.compute_efficiency);
    SI_ASSERT(back.effects.unlock_deployments == d.effects.unlock_deployments);
    SI_ASSERT(back.effects.deployment_slots == 2);
    SI_ASSERT(back.risk && back.risk->severity == 0.5);
    SI_ASSERT(back.deployment_requirements == d.deployment_requirements);
  }

  // Malformed content fails loudly.
  {
    SI_ASSERT(load_error("{\"nodes\": [{\"id\": \"a\"}, {\"id\": \"a\"}]}").find("Duplicate") != std::string::npos);
    SI_ASSERT(load_error("{\"nodes\": [{\"id\": \"a\", \"type\": \"mystery\"}]}").find("mystery") !=
              std::string::npos);
    SI_ASSERT(load_error("{\"nodes\": [{\"id\": \"a\", \"influence_cost\": {\"media\": 1}}]}").find("media") !=
              std::string::npos);
    SI_ASSERT(!load_error("{\"nodes\": [{\"name\": \"no id\"}]}").empty());
    SI_ASSERT(!load_error("{\"items\": []}").empty());

    bool threw = false;
    try {
      (void)load_research_db_from_file("data/research/does_not_exist.json");
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find("does_not_exist") != std::string::npos;
    }
    SI_ASSERT(threw);
  }

  // Validation reports every structural problem.
  {
    const ResearchDB db = load_research_db_from_json(R"({"nodes": [
      {"id": "a", "prerequisites": ["a"]},
      {"id": "b", "prerequisites": ["ghost"], "exclusions": ["c"]},
      {"id": "c", "prerequisites": ["d"], "exclusions": ["d"]},
      {"id": "d", "compute_cost": -1, "influence_cost": {"academic": -2}},
      {"id": "e", "risk": {"probability": 1.5, "severity": 0.1}}
    ]})");
    const auto errors = validate_research_db(db);
    SI_ASSERT(has_error(errors, "'a' lists itself as prerequisite"));
    SI_ASSERT(has_error(errors, "'b' has unknown prerequisite 'ghost'"));
    SI_ASSERT(has_error(errors, "'c' lists 'd' as both prerequisite and exclusion"));
    SI_ASSERT(has_error(errors, "'d' has negative compute_cost"));
    SI_ASSERT(has_error(errors, "'d' has negative influence cost for 'academic'"));
    SI_ASSERT(has_error(errors, "'e' has risk probability outside [0,1]"));
  }

  // Prerequisite cycles are reported once, with a canonical key.
  {
    const ResearchDB db = load_research_db_from_json(R"({"nodes": [
      {"id": "x", "prerequisites": ["z"]},
      {"id": "y", "prerequisites": ["x"]},
      {"id": "z", "prerequisites": ["y"]},
      {"id": "free"}
    ]})");
    const auto errors = validate_research_db(db);
    SI_ASSERT(errors.size() == 1);
    SI_ASSERT(errors[0] == "Research prerequisite cycle detected: x|y|z");
  }

  return 0;
}
