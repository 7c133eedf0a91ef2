#pragma once

#include <optional>
#include <string>

#include "superint/core/game_state.h"

namespace superint {

// String forms used by the save format, content files and bus payloads.
//
// *_from_string returns std::nullopt for unknown strings; callers decide
// whether that is an error (content loading) or falls back to a default.

std::string phase_to_string(Phase p);
std::optional<Phase> phase_from_string(const std::string& s);

std::string organization_type_to_string(OrganizationType t);
std::optional<OrganizationType> organization_type_from_string(const std::string& s);

std::string difficulty_to_string(Difficulty d);
std::optional<Difficulty> difficulty_from_string(const std::string& s);

std::string influence_channel_to_string(InfluenceChannel c);
std::optional<InfluenceChannel> influence_channel_from_string(const std::string& s);

std::string data_type_to_string(DataType t);
std::optional<DataType> data_type_from_string(const std::string& s);

std::string research_status_to_string(ResearchStatus s);
std::optional<ResearchStatus> research_status_from_string(const std::string& s);

std::string research_node_type_to_string(ResearchNodeType t);
std::optional<ResearchNodeType> research_node_type_from_string(const std::string& s);

} // namespace superint
