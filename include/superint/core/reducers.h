#pragma once

#include <memory>

#include "superint/core/actions.h"
#include "superint/core/game_state.h"

namespace superint {

// Pure slice reducers. Each reads only its own slice and the action and
// returns its input pointer unchanged when the action does not apply.
std::shared_ptr<const MetaSlice> reduce_meta(const std::shared_ptr<const MetaSlice>& s, const Action& a);
std::shared_ptr<const ResourcesSlice> reduce_resources(const std::shared_ptr<const ResourcesSlice>& s,
                                                       const Action& a);
std::shared_ptr<const ResearchSlice> reduce_research(const std::shared_ptr<const ResearchSlice>& s, const Action& a);
std::shared_ptr<const DeploymentsSlice> reduce_deployments(const std::shared_ptr<const DeploymentsSlice>& s,
                                                           const Action& a);
std::shared_ptr<const CompetitorsSlice> reduce_competitors(const std::shared_ptr<const CompetitorsSlice>& s,
                                                           const Action& a);
std::shared_ptr<const WorldSlice> reduce_world(const std::shared_ptr<const WorldSlice>& s, const Action& a);
std::shared_ptr<const SettingsSlice> reduce_settings(const std::shared_ptr<const SettingsSlice>& s, const Action& a);
std::shared_ptr<const EventsSlice> reduce_events(const std::shared_ptr<const EventsSlice>& s, const Action& a);

// Root reducer: fans the action out to every slice reducer. Returns `state`
// itself when no slice changed.
GameStatePtr reduce_game(const GameStatePtr& state, const Action& a);

} // namespace superint
