// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verdant/action_registry.h>

#include <logging.h>
#include <verdant/reputation_engine.h>
#include <verdant/user_stats.h>

namespace verdant {

ActionRegistry::ActionRegistry(const TokenLedger& token, const VerifierPolicy& policy,
                               LogicalClock& clock, const uint160& owner)
    : token_(token)
    , policy_(policy)
    , clock_(clock)
    , owner_(owner)
{
}

// ============================================================================
// Submission
// ============================================================================

SubmitResult ActionRegistry::SubmitAction(LedgerStateCache& cache, const uint160& caller, uint32_t actionType,
                                          const uint256& locationHash, const uint256& proofHash) const
{
    LedgerGlobals globals = cache.GetGlobals();

    if (!globals.contractEnabled) {
        return SubmitResult::Failure(LedgerError::INVALID_ACTION, "Action registry is disabled");
    }

    RewardSchedule schedule = RewardAndBoost(actionType);
    if (schedule.rewardAmount <= 0) {
        return SubmitResult::Failure(LedgerError::INVALID_ACTION,
            strprintf("Action type %u has no configured reward", actionType));
    }

    const uint64_t actionId = globals.nextActionId;
    const uint64_t now = clock_.Now();

    Action action;
    action.id = actionId;
    action.submitter = caller;
    action.actionType = actionType;
    action.timestamp = now;
    action.locationHash = locationHash;
    action.proofHash = proofHash;
    action.verified = false;
    action.rewardAmount = schedule.rewardAmount;
    cache.WriteAction(action);

    PendingVerification pending;
    pending.actionId = actionId;
    pending.submittedAt = now;
    cache.WritePending(pending);

    globals.nextActionId = actionId + 1;
    cache.WriteGlobals(globals);

    LogPrint(VLog::ACTION, "ActionRegistry: %s submitted %s action %u at tick %u (reward %d)\n",
             ShortPrincipal(caller), ActionTypeToString(actionType), actionId, now, schedule.rewardAmount);

    return SubmitResult::Success(actionId);
}

// ============================================================================
// Verification
// ============================================================================

LedgerResult ActionRegistry::VerifyAction(LedgerStateCache& cache, const uint160& caller,
                                          const uint160& user, uint64_t actionId) const
{
    if (!policy_.IsAuthorized(cache, caller)) {
        return LedgerResult::Failure(LedgerError::OWNER_ONLY,
            strprintf("%s is not an authorized verifier", ShortPrincipal(caller)));
    }

    Action action;
    if (!cache.GetAction(ActionKey(user, actionId), action)) {
        return LedgerResult::Failure(LedgerError::ACTION_NOT_FOUND,
            strprintf("No action %u for %s", actionId, ShortPrincipal(user)));
    }

    if (action.verified) {
        return LedgerResult::Failure(LedgerError::ALREADY_VERIFIED,
            strprintf("Action %u is already verified", actionId));
    }

    action.verified = true;
    cache.WriteAction(action);

    LedgerResult minted = token_.Mint(cache, user, action.rewardAmount);
    if (!minted.success) {
        return LedgerResult::Failure(LedgerError::VERIFICATION_FAILED,
            strprintf("Reward for action %u could not be minted: %s", actionId, minted.errorMessage));
    }

    // The reward paid is the one fixed at submission; only the boost comes from the schedule
    RewardSchedule schedule(action.rewardAmount, RewardAndBoost(action.actionType).reputationBoost);
    RecordVerifiedAction(cache, user, action.actionType, schedule);

    LedgerGlobals globals = cache.GetGlobals();
    globals.totalActionsCompleted++;
    cache.WriteGlobals(globals);

    cache.ErasePending(actionId);

    LogPrint(VLog::ACTION, "ActionRegistry: %s verified action %u of %s, minted %d\n",
             ShortPrincipal(caller), actionId, ShortPrincipal(user), action.rewardAmount);

    return LedgerResult::Success();
}

// ============================================================================
// Administration
// ============================================================================

LedgerResult ActionRegistry::SetContractEnabled(LedgerStateCache& cache, const uint160& caller, bool enabled) const
{
    if (caller != owner_) {
        return LedgerResult::Failure(LedgerError::OWNER_ONLY,
            "Only the contract owner may toggle the registry");
    }

    LedgerGlobals globals = cache.GetGlobals();
    globals.contractEnabled = enabled;
    cache.WriteGlobals(globals);

    LogPrintf("ActionRegistry: Registry %s\n", enabled ? "enabled" : "disabled");
    return LedgerResult::Success();
}

LedgerResult ActionRegistry::AddVerifier(LedgerStateCache& cache, const uint160& caller, const uint160& verifier) const
{
    if (caller != owner_) {
        return LedgerResult::Failure(LedgerError::OWNER_ONLY,
            "Only the contract owner may manage verifiers");
    }
    cache.SetVerifier(verifier, true);

    LogPrintf("ActionRegistry: Added verifier %s\n", verifier.ToString());
    return LedgerResult::Success();
}

LedgerResult ActionRegistry::RemoveVerifier(LedgerStateCache& cache, const uint160& caller, const uint160& verifier) const
{
    if (caller != owner_) {
        return LedgerResult::Failure(LedgerError::OWNER_ONLY,
            "Only the contract owner may manage verifiers");
    }
    cache.SetVerifier(verifier, false);

    LogPrintf("ActionRegistry: Removed verifier %s\n", verifier.ToString());
    return LedgerResult::Success();
}

} // namespace verdant
