// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_VERDANT_USER_STATS_H
#define VERDANT_VERDANT_USER_STATS_H

#include <uint256.h>
#include <verdant/ledger_state.h>
#include <verdant/reputation_engine.h>
#include <verdant/state_view.h>

#include <cstdint>

namespace verdant {

/** Stats of a user, all-zero if the user has none */
UserStats GetUserStatsOrDefault(const LedgerStateView& view, const uint160& user);

/**
 * Counters after one more verified action: the per-type counter and
 * totalActions grow by one, totalTokensEarned by the reward and
 * reputationScore by the boost.
 */
UserStats ApplyVerifiedAction(const UserStats& stats, uint32_t actionType,
                              const RewardSchedule& schedule);

/**
 * Stage the stats update of a verification as one record write.
 * Only the verification transition calls this.
 */
void RecordVerifiedAction(LedgerStateCache& cache, const uint160& user,
                          uint32_t actionType, const RewardSchedule& schedule);

/** Count of verified actions of one type in a stats record */
uint64_t GetActionTypeCount(const UserStats& stats, uint32_t actionType);

} // namespace verdant

#endif // VERDANT_VERDANT_USER_STATS_H
