// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_VERDANT_REWARD_LEDGER_H
#define VERDANT_VERDANT_REWARD_LEDGER_H

/**
 * @file reward_ledger.h
 * @brief Entry points of the environmental reward ledger
 *
 * RewardLedger serializes every state transition behind one lock. Each
 * transition stages its writes in a LedgerStateCache over the store and
 * commits them with a single batch only when every precondition held, so
 * a failed call leaves the store exactly as it was. If the store refuses
 * the batch, VerifyAction reports VERIFICATION_FAILED and every other
 * transition INVALID_AMOUNT.
 *
 * Callers are already authenticated; the ledger only compares them
 * against the configured owner, the verifier policy and the sponsor and
 * delegate records.
 */

#include <amount.h>
#include <sync.h>
#include <uint256.h>
#include <verdant/action_registry.h>
#include <verdant/ledger_common.h>
#include <verdant/ledger_config.h>
#include <verdant/ledger_query.h>
#include <verdant/ledger_state.h>
#include <verdant/logical_clock.h>
#include <verdant/native_transfer.h>
#include <verdant/sponsor_pool.h>
#include <verdant/state_view.h>
#include <verdant/token_ledger.h>
#include <verdant/verifier_policy.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace verdant {

class RewardLedger {
public:
    /**
     * @param config Deployment configuration
     * @param store Committed state substrate
     * @param native Value transfer used by sponsor contributions
     * @param clock Logical clock stamping submissions
     */
    RewardLedger(const LedgerConfig& config, LedgerStateView& store,
                 NativeTransfer& native, LogicalClock& clock);

    RewardLedger(const RewardLedger&) = delete;
    RewardLedger& operator=(const RewardLedger&) = delete;

    /**
     * @brief Write the deployment state: seeded verifiers, registry
     *        switch and initial token URI
     * @return false if already applied or the store rejected the batch
     */
    bool ApplyGenesis();

    bool IsGenesisApplied() const;

    const LedgerConfig& GetConfig() const { return config_; }
    const uint160& GetOwner() const { return config_.owner; }
    std::string GetPolicyName() const;

    // =========================================================================
    // Action registry
    // =========================================================================

    /** Record a pending action and return its id */
    SubmitResult SubmitAction(const uint160& caller, uint32_t actionType,
                              const uint256& locationHash, const uint256& proofHash);

    /** Verify user's action, mint its reward and update the user's stats */
    LedgerResult VerifyAction(const uint160& caller, const uint160& user, uint64_t actionId);

    /** Open or close the registry to new submissions; owner only */
    LedgerResult ToggleContract(const uint160& caller, bool enabled);

    LedgerResult AddVerifier(const uint160& caller, const uint160& verifier);
    LedgerResult RemoveVerifier(const uint160& caller, const uint160& verifier);

    // =========================================================================
    // Token
    // =========================================================================

    LedgerResult Transfer(const uint160& caller, CAmount amount, const uint160& from,
                          const uint160& to, const std::optional<std::string>& memo = std::nullopt);

    /** Move caller's own tokens to another principal */
    LedgerResult TradeTokens(const uint160& caller, CAmount amount, const uint160& to);

    LedgerResult ApproveDelegate(const uint160& caller, const uint160& delegate);
    LedgerResult RevokeDelegate(const uint160& caller, const uint160& delegate);

    /** Replace or clear the token URI; owner only */
    LedgerResult UpdateTokenUri(const uint160& caller, const std::optional<std::string>& uri);

    // =========================================================================
    // Sponsors
    // =========================================================================

    LedgerResult RegisterSponsor(const uint160& caller, const std::string& name);
    LedgerResult SponsorContribute(const uint160& caller, CAmount amount);

    // =========================================================================
    // Queries
    // =========================================================================

    std::string GetName() const;
    std::string GetSymbol() const;
    uint8_t GetDecimals() const;
    CAmount GetBalance(const uint160& principal) const;
    CAmount GetTotalSupply() const;
    std::optional<std::string> GetTokenUri() const;
    TokenInfo GetTokenInfo() const;

    std::optional<Action> GetUserAction(const uint160& user, uint64_t actionId) const;
    UserStats GetUserStats(const uint160& user) const;
    std::optional<Sponsor> GetSponsorInfo(const uint160& principal) const;
    std::optional<PendingVerification> GetPendingVerification(uint64_t actionId) const;
    std::vector<PendingVerification> ListPendingVerifications() const;
    uint64_t GetTotalActions() const;
    bool GetContractStatus() const;
    bool IsVerifier(const uint160& principal) const;
    LedgerTotals GetTotals() const;

    /** Check totalSupply == totalMinted == sum of balances */
    bool VerifySupplyInvariant() const;

private:
    LedgerQuery Query() const;

    LedgerConfig config_;
    LedgerStateView& store_;
    LogicalClock& clock_;

    std::unique_ptr<VerifierPolicy> policy_;
    TokenLedger token_;
    ActionRegistry registry_;
    SponsorPool sponsors_;

    bool genesisApplied_;

    mutable CCriticalSection cs_ledger_;
};

} // namespace verdant

#endif // VERDANT_VERDANT_REWARD_LEDGER_H
