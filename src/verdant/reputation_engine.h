// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_VERDANT_REPUTATION_ENGINE_H
#define VERDANT_VERDANT_REPUTATION_ENGINE_H

/**
 * @file reputation_engine.h
 * @brief Fixed reward and reputation schedule per action type
 *
 * | Action type      | Reward | Reputation |
 * |------------------|--------|------------|
 * | Cleanup          | 100    | +10        |
 * | Recycling        | 50     | +5         |
 * | Energy reduction | 75     | +8         |
 * | Biodiversity     | 150    | +15        |
 *
 * Any other code maps to 0/0, which submission rejects as invalid.
 */

#include <amount.h>
#include <verdant/ledger_common.h>

#include <cstdint>

namespace verdant {

static constexpr CAmount CLEANUP_REWARD = 100;
static constexpr CAmount RECYCLING_REWARD = 50;
static constexpr CAmount ENERGY_REDUCTION_REWARD = 75;
static constexpr CAmount BIODIVERSITY_REWARD = 150;

static constexpr uint64_t CLEANUP_REPUTATION_BOOST = 10;
static constexpr uint64_t RECYCLING_REPUTATION_BOOST = 5;
static constexpr uint64_t ENERGY_REDUCTION_REPUTATION_BOOST = 8;
static constexpr uint64_t BIODIVERSITY_REPUTATION_BOOST = 15;

/**
 * @brief Reward and reputation delta earned by one verified action
 */
struct RewardSchedule {
    CAmount rewardAmount;
    uint64_t reputationBoost;

    RewardSchedule() : rewardAmount(0), reputationBoost(0) {}
    RewardSchedule(CAmount reward, uint64_t boost) : rewardAmount(reward), reputationBoost(boost) {}

    bool operator==(const RewardSchedule& other) const {
        return rewardAmount == other.rewardAmount && reputationBoost == other.reputationBoost;
    }
};

/**
 * Look up the schedule of an action type code. Total: unknown codes
 * return a zero schedule.
 */
RewardSchedule RewardAndBoost(uint32_t actionType);

/** Whether the action type code has a non-zero reward configured */
bool IsRewardedActionType(uint32_t actionType);

} // namespace verdant

#endif // VERDANT_VERDANT_REPUTATION_ENGINE_H
