// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verdant/ledger_common.h>
#include <verdant/reputation_engine.h>
#include <verdant/user_stats.h>
#include <test/test_verdant.h>

#include <boost/test/unit_test.hpp>

using namespace verdant;

BOOST_FIXTURE_TEST_SUITE(reputation_engine_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(reward_table)
{
    RewardSchedule cleanup = RewardAndBoost(static_cast<uint32_t>(ActionType::CLEANUP));
    BOOST_CHECK_EQUAL(cleanup.rewardAmount, 100);
    BOOST_CHECK_EQUAL(cleanup.reputationBoost, 10U);

    RewardSchedule recycling = RewardAndBoost(static_cast<uint32_t>(ActionType::RECYCLING));
    BOOST_CHECK_EQUAL(recycling.rewardAmount, 50);
    BOOST_CHECK_EQUAL(recycling.reputationBoost, 5U);

    RewardSchedule energy = RewardAndBoost(static_cast<uint32_t>(ActionType::ENERGY_REDUCTION));
    BOOST_CHECK_EQUAL(energy.rewardAmount, 75);
    BOOST_CHECK_EQUAL(energy.reputationBoost, 8U);

    RewardSchedule biodiversity = RewardAndBoost(static_cast<uint32_t>(ActionType::BIODIVERSITY));
    BOOST_CHECK_EQUAL(biodiversity.rewardAmount, 150);
    BOOST_CHECK_EQUAL(biodiversity.reputationBoost, 15U);
}

BOOST_AUTO_TEST_CASE(unknown_types_have_no_reward)
{
    for (uint32_t type : {0U, 5U, 6U, 99U, 0xffffffffU}) {
        RewardSchedule schedule = RewardAndBoost(type);
        BOOST_CHECK_EQUAL(schedule.rewardAmount, 0);
        BOOST_CHECK_EQUAL(schedule.reputationBoost, 0U);
        BOOST_CHECK(!IsRewardedActionType(type));
        BOOST_CHECK_EQUAL(ActionTypeToString(type), "unknown");
    }
    for (uint32_t type = 1; type <= 4; ++type) {
        BOOST_CHECK(IsRewardedActionType(type));
    }
}

/**
 * Property: the schedule is a pure function of the type code
 */
BOOST_AUTO_TEST_CASE(schedule_is_deterministic)
{
    for (int i = 0; i < 200; ++i) {
        uint32_t type = static_cast<uint32_t>(InsecureRandRange(8));
        RewardSchedule a = RewardAndBoost(type);
        RewardSchedule b = RewardAndBoost(type);
        BOOST_CHECK_EQUAL(a.rewardAmount, b.rewardAmount);
        BOOST_CHECK_EQUAL(a.reputationBoost, b.reputationBoost);
        BOOST_CHECK(a.rewardAmount >= 0);
    }
}

// ============================================================================
// User statistics
// ============================================================================

BOOST_AUTO_TEST_CASE(apply_verified_action_counts_per_type)
{
    UserStats stats;
    stats = ApplyVerifiedAction(stats, 1, RewardAndBoost(1));
    stats = ApplyVerifiedAction(stats, 2, RewardAndBoost(2));
    stats = ApplyVerifiedAction(stats, 2, RewardAndBoost(2));
    stats = ApplyVerifiedAction(stats, 4, RewardAndBoost(4));

    BOOST_CHECK_EQUAL(stats.totalActions, 4U);
    BOOST_CHECK_EQUAL(stats.cleanupActions, 1U);
    BOOST_CHECK_EQUAL(stats.recyclingActions, 2U);
    BOOST_CHECK_EQUAL(stats.energyActions, 0U);
    BOOST_CHECK_EQUAL(stats.biodiversityActions, 1U);
    BOOST_CHECK_EQUAL(stats.totalTokensEarned, 100 + 50 + 50 + 150);
    BOOST_CHECK_EQUAL(stats.reputationScore, 10U + 5U + 5U + 15U);

    BOOST_CHECK_EQUAL(GetActionTypeCount(stats, 2), 2U);
    BOOST_CHECK_EQUAL(GetActionTypeCount(stats, 7), 0U);
}

/**
 * Property: totalActions equals the sum of the per-type counters
 */
BOOST_AUTO_TEST_CASE(total_actions_matches_type_counters)
{
    UserStats stats;
    CAmount earned = 0;
    for (int i = 0; i < 500; ++i) {
        uint32_t type = 1 + static_cast<uint32_t>(InsecureRandRange(4));
        RewardSchedule schedule = RewardAndBoost(type);
        earned += schedule.rewardAmount;
        stats = ApplyVerifiedAction(stats, type, schedule);

        BOOST_CHECK_EQUAL(stats.totalActions, stats.cleanupActions + stats.recyclingActions +
                                              stats.energyActions + stats.biodiversityActions);
    }
    BOOST_CHECK_EQUAL(stats.totalActions, 500U);
    BOOST_CHECK_EQUAL(stats.totalTokensEarned, earned);
}

BOOST_AUTO_TEST_SUITE_END()
