// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_VERDANT_ACTION_REGISTRY_H
#define VERDANT_VERDANT_ACTION_REGISTRY_H

/**
 * @file action_registry.h
 * @brief Lifecycle of submitted environmental actions
 *
 * An action is created Pending with its reward fixed from the reputation
 * schedule and an entry in the pending-verification queue. An authorized
 * verifier moves it to Verified, which is terminal: the reward is minted
 * to the submitter, the submitter's stats grow, the completed counter
 * grows and the queue entry is removed. There is no rejected state.
 *
 * Every method stages its writes in the cache it is given; the caller
 * flushes only if the method succeeded.
 */

#include <uint256.h>
#include <verdant/ledger_common.h>
#include <verdant/logical_clock.h>
#include <verdant/state_view.h>
#include <verdant/token_ledger.h>
#include <verdant/verifier_policy.h>

#include <cstdint>

namespace verdant {

class ActionRegistry {
public:
    ActionRegistry(const TokenLedger& token, const VerifierPolicy& policy,
                   LogicalClock& clock, const uint160& owner);

    /**
     * @brief Record a new pending action
     * @return the allocated id, or INVALID_ACTION if the registry is
     *         disabled or the type has no reward
     *
     * The logical clock is not moved here; call AdvanceClock() once the
     * cache has been flushed.
     */
    SubmitResult SubmitAction(LedgerStateCache& cache, const uint160& caller, uint32_t actionType,
                              const uint256& locationHash, const uint256& proofHash) const;

    /** Tick the logical clock after a submission committed */
    void AdvanceClock() { clock_.Advance(); }

    /**
     * @brief Verify a pending action and pay its reward
     * @return OWNER_ONLY if the policy rejects caller, ACTION_NOT_FOUND,
     *         ALREADY_VERIFIED, or VERIFICATION_FAILED if the reward
     *         cannot be minted
     */
    LedgerResult VerifyAction(LedgerStateCache& cache, const uint160& caller,
                              const uint160& user, uint64_t actionId) const;

    /** Open or close the registry to submissions; owner only */
    LedgerResult SetContractEnabled(LedgerStateCache& cache, const uint160& caller, bool enabled) const;

    /** Add a principal to the stored verifier set; owner only */
    LedgerResult AddVerifier(LedgerStateCache& cache, const uint160& caller, const uint160& verifier) const;

    /** Remove a principal from the stored verifier set; owner only */
    LedgerResult RemoveVerifier(LedgerStateCache& cache, const uint160& caller, const uint160& verifier) const;

private:
    const TokenLedger& token_;
    const VerifierPolicy& policy_;
    LogicalClock& clock_;
    uint160 owner_;
};

} // namespace verdant

#endif // VERDANT_VERDANT_ACTION_REGISTRY_H
