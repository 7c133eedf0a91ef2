#include "superint/core/enum_strings.h"

namespace superint {

std::string phase_to_string(Phase p) {
  switch (p) {
    case Phase::Start: return "start";
    case Phase::Action: return "action";
    case Phase::Resolution: return "resolution";
    case Phase::End: return "end";
  }
  return "start";
}

std::optional<Phase> phase_from_string(const std::string& s) {
  if (s == "start") return Phase::Start;
  if (s == "action") return Phase::Action;
  if (s == "resolution") return Phase::Resolution;
  if (s == "end") return Phase::End;
  return std::nullopt;
}

std::string organization_type_to_string(OrganizationType t) {
  switch (t) {
    case OrganizationType::Academic: return "academic";
    case OrganizationType::Startup: return "startup";
    case OrganizationType::BigTech: return "big_tech";
    case OrganizationType::Government: return "government";
    case OrganizationType::OpenSource: return "open_source";
  }
  return "academic";
}

std::optional<OrganizationType> organization_type_from_string(const std::string& s) {
  if (s == "academic") return OrganizationType::Academic;
  if (s == "startup") return OrganizationType::Startup;
  if (s == "big_tech") return OrganizationType::BigTech;
  if (s == "government") return OrganizationType::Government;
  if (s == "open_source") return OrganizationType::OpenSource;
  return std::nullopt;
}

std::string difficulty_to_string(Difficulty d) {
  switch (d) {
    case Difficulty::Easy: return "easy";
    case Difficulty::Normal: return "normal";
    case Difficulty::Hard: return "hard";
  }
  return "normal";
}

std::optional<Difficulty> difficulty_from_string(const std::string& s) {
  if (s == "easy") return Difficulty::Easy;
  if (s == "normal") return Difficulty::Normal;
  if (s == "hard") return Difficulty::Hard;
  return std::nullopt;
}

std::string influence_channel_to_string(InfluenceChannel c) {
  switch (c) {
    case InfluenceChannel::Academic: return "academic";
    case InfluenceChannel::Industry: return "industry";
    case InfluenceChannel::Government: return "government";
    case InfluenceChannel::Public: return "public";
    case InfluenceChannel::OpenSource: return "open_source";
  }
  return "academic";
}

std::optional<InfluenceChannel> influence_channel_from_string(const std::string& s) {
  if (s == "academic") return InfluenceChannel::Academic;
  if (s == "industry") return InfluenceChannel::Industry;
  if (s == "government") return InfluenceChannel::Government;
  if (s == "public") return InfluenceChannel::Public;
  // Content written against older tables uses camelCase.
  if (s == "open_source" || s == "openSource") return InfluenceChannel::OpenSource;
  return std::nullopt;
}

std::string data_type_to_string(DataType t) {
  switch (t) {
    case DataType::Text: return "text";
    case DataType::Image: return "image";
    case DataType::Video: return "video";
    case DataType::Synthetic: return "synthetic";
    case DataType::Behavioral: return "behavioral";
    case DataType::Scientific: return "scientific";
  }
  return "text";
}

std::optional<DataType> data_type_from_string(const std::string& s) {
  if (s == "text") return DataType::Text;
  if (s == "image") return DataType::Image;
  if (s == "video") return DataType::Video;
  if (s == "synthetic") return DataType::Synthetic;
  if (s == "behavioral") return DataType::Behavioral;
  if (s == "scientific") return DataType::Scientific;
  return std::nullopt;
}

std::string research_status_to_string(ResearchStatus s) {
  switch (s) {
    case ResearchStatus::Locked: return "locked";
    case ResearchStatus::Unlocked: return "unlocked";
    case ResearchStatus::InProgress: return "in_progress";
    case ResearchStatus::Completed: return "completed";
  }
  return "locked";
}

std::optional<ResearchStatus> research_status_from_string(const std::string& s) {
  if (s == "locked") return ResearchStatus::Locked;
  if (s == "unlocked") return ResearchStatus::Unlocked;
  if (s == "in_progress") return ResearchStatus::InProgress;
  if (s == "completed") return ResearchStatus::Completed;
  return std::nullopt;
}

std::string research_node_type_to_string(ResearchNodeType t) {
  switch (t) {
    case ResearchNodeType::Standard: return "standard";
    case ResearchNodeType::Breakthrough: return "breakthrough";
    case ResearchNodeType::Tiered: return "tiered";
    case ResearchNodeType::Risk: return "risk";
    case ResearchNodeType::Divergent: return "divergent";
  }
  return "standard";
}

std::optional<ResearchNodeType> research_node_type_from_string(const std::string& s) {
  if (s == "standard") return ResearchNodeType::Standard;
  if (s == "breakthrough") return ResearchNodeType::Breakthrough;
  if (s == "tiered") return ResearchNodeType::Tiered;
  if (s == "risk") return ResearchNodeType::Risk;
  if (s == "divergent") return ResearchNodeType::Divergent;
  return std::nullopt;
}

} // namespace superint
