// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verdant/reputation_engine.h>

namespace verdant {

RewardSchedule RewardAndBoost(uint32_t actionType)
{
    switch (static_cast<ActionType>(actionType)) {
        case ActionType::CLEANUP:
            return RewardSchedule(CLEANUP_REWARD, CLEANUP_REPUTATION_BOOST);
        case ActionType::RECYCLING:
            return RewardSchedule(RECYCLING_REWARD, RECYCLING_REPUTATION_BOOST);
        case ActionType::ENERGY_REDUCTION:
            return RewardSchedule(ENERGY_REDUCTION_REWARD, ENERGY_REDUCTION_REPUTATION_BOOST);
        case ActionType::BIODIVERSITY:
            return RewardSchedule(BIODIVERSITY_REWARD, BIODIVERSITY_REPUTATION_BOOST);
    }
    return RewardSchedule();
}

bool IsRewardedActionType(uint32_t actionType)
{
    return RewardAndBoost(actionType).rewardAmount > 0;
}

} // namespace verdant
