// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verdant/user_stats.h>

#include <logging.h>

namespace verdant {

UserStats GetUserStatsOrDefault(const LedgerStateView& view, const uint160& user)
{
    UserStats stats;
    if (!view.GetUserStats(user, stats)) {
        return UserStats();
    }
    return stats;
}

UserStats ApplyVerifiedAction(const UserStats& stats, uint32_t actionType,
                              const RewardSchedule& schedule)
{
    UserStats updated = stats;

    switch (static_cast<ActionType>(actionType)) {
        case ActionType::CLEANUP:          updated.cleanupActions++; break;
        case ActionType::RECYCLING:        updated.recyclingActions++; break;
        case ActionType::ENERGY_REDUCTION: updated.energyActions++; break;
        case ActionType::BIODIVERSITY:     updated.biodiversityActions++; break;
    }

    updated.totalActions++;
    updated.totalTokensEarned += schedule.rewardAmount;
    updated.reputationScore += schedule.reputationBoost;
    return updated;
}

void RecordVerifiedAction(LedgerStateCache& cache, const uint160& user,
                          uint32_t actionType, const RewardSchedule& schedule)
{
    UserStats updated = ApplyVerifiedAction(GetUserStatsOrDefault(cache, user), actionType, schedule);
    cache.WriteUserStats(user, updated);

    LogPrint(VLog::ACTION, "UserStats: %s now has %u actions, reputation %u\n",
             ShortPrincipal(user), updated.totalActions, updated.reputationScore);
}

uint64_t GetActionTypeCount(const UserStats& stats, uint32_t actionType)
{
    switch (static_cast<ActionType>(actionType)) {
        case ActionType::CLEANUP:          return stats.cleanupActions;
        case ActionType::RECYCLING:        return stats.recyclingActions;
        case ActionType::ENERGY_REDUCTION: return stats.energyActions;
        case ActionType::BIODIVERSITY:     return stats.biodiversityActions;
    }
    return 0;
}

} // namespace verdant
