#include "superint/core/actions.h"

#include <type_traits>

namespace superint {

std::string action_type_name(const Action& a) {
  return std::visit(
      [](const auto& act) -> std::string {
        using T = std::decay_t<decltype(act)>;
        if constexpr (std::is_same_v<T, AdvanceTurn>) return "ADVANCE_TURN";
        else if constexpr (std::is_same_v<T, SetPhase>) return "SET_PHASE";
        else if constexpr (std::is_same_v<T, MetaUpdate>) return "META_UPDATE";
        else if constexpr (std::is_same_v<T, UpdateGameTime>) return "UPDATE_GAME_TIME";
        else if constexpr (std::is_same_v<T, AddTurnHistory>) return "ADD_TURN_HISTORY";
        else if constexpr (std::is_same_v<T, UpdateTimeCompression>) return "UPDATE_TIME_COMPRESSION";
        else if constexpr (std::is_same_v<T, AllocateComputing>) return "ALLOCATE_COMPUTING";
        else if constexpr (std::is_same_v<T, DeallocateComputing>) return "DEALLOCATE_COMPUTING";
        else if constexpr (std::is_same_v<T, GenerateResources>) return "GENERATE_RESOURCES";
        else if constexpr (std::is_same_v<T, SetComputingEfficiency>) return "SET_COMPUTING_EFFICIENCY";
        else if constexpr (std::is_same_v<T, SpendResources>) return "SPEND_RESOURCES";
        else if constexpr (std::is_same_v<T, AdjustInfluence>) return "ADJUST_INFLUENCE";
        else if constexpr (std::is_same_v<T, UpdateDataType>) return "UPDATE_DATA_TYPE";
        else if constexpr (std::is_same_v<T, GrantDataAccess>) return "GRANT_DATA_ACCESS";
        else if constexpr (std::is_same_v<T, UpdateResourceCaps>) return "UPDATE_RESOURCE_CAPS";
        else if constexpr (std::is_same_v<T, InitializeResearch>) return "INITIALIZE_RESEARCH";
        else if constexpr (std::is_same_v<T, StartResearch>) return "START_RESEARCH";
        else if constexpr (std::is_same_v<T, CancelResearch>) return "CANCEL_RESEARCH";
        else if constexpr (std::is_same_v<T, AllocateResearchCompute>) return "ALLOCATE_RESEARCH_COMPUTE";
        else if constexpr (std::is_same_v<T, UpdateResearchProgress>) return "UPDATE_RESEARCH_PROGRESS";
        else if constexpr (std::is_same_v<T, CompleteResearch>) return "COMPLETE_RESEARCH";
        else if constexpr (std::is_same_v<T, UpdateResearchStatuses>) return "UPDATE_RESEARCH_STATUSES";
        else if constexpr (std::is_same_v<T, SetResearchBoosts>) return "SET_RESEARCH_BOOSTS";
        else if constexpr (std::is_same_v<T, DeploySystem>) return "DEPLOY_SYSTEM";
        else if constexpr (std::is_same_v<T, RemoveDeployment>) return "REMOVE_DEPLOYMENT";
        else if constexpr (std::is_same_v<T, UpdateDeploymentSlots>) return "UPDATE_DEPLOYMENT_SLOTS";
        else if constexpr (std::is_same_v<T, UnlockDeploymentType>) return "UNLOCK_DEPLOYMENT_TYPE";
        else if constexpr (std::is_same_v<T, UpdateCompetitor>) return "UPDATE_COMPETITOR";
        else if constexpr (std::is_same_v<T, UpdatePlayerRanking>) return "UPDATE_PLAYER_RANKING";
        else if constexpr (std::is_same_v<T, UpdateGlobalValues>) return "UPDATE_GLOBAL_VALUES";
        else if constexpr (std::is_same_v<T, UpdateRegion>) return "UPDATE_REGION";
        else if constexpr (std::is_same_v<T, UpdateSettings>) return "UPDATE_SETTINGS";
        else if constexpr (std::is_same_v<T, AddEvent>) return "ADD_EVENT";
        else if constexpr (std::is_same_v<T, ResolveEvent>) return "RESOLVE_EVENT";
        else if constexpr (std::is_same_v<T, StateLoaded>) return "STATE_LOADED";
        else return "UNKNOWN";
      },
      a);
}

} // namespace superint
