// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verdant/reward_ledger.h>

#include <logging.h>
#include <util/format.h>

namespace verdant {

namespace {

std::unique_ptr<VerifierPolicy> MakeVerifierPolicy(const LedgerConfig& config)
{
    if (config.useVerifierSet) {
        return std::unique_ptr<VerifierPolicy>(new VerifierSetPolicy(config.owner));
    }
    return std::unique_ptr<VerifierPolicy>(new OwnerVerifierPolicy(config.owner));
}

/**
 * Commit a staged transition if the operation succeeded.
 * Failed operations drop the cache with the caller's scope.
 * A store rejection is reported as commitError.
 */
template <typename Result>
Result CommitTransition(LedgerStateCache& cache, const Result& result, const char* operation,
                        LedgerError commitError = LedgerError::INVALID_AMOUNT)
{
    if (!result.success) {
        LogPrint(VLog::LEDGER, "RewardLedger: %s rejected (%s): %s\n",
                 operation, LedgerErrorToString(result.error), result.errorMessage);
        return result;
    }

    const size_t writes = cache.GetWriteCount();
    if (!cache.Flush()) {
        LogPrintf("RewardLedger: %s could not be committed, state unchanged\n", operation);
        return Result::Failure(commitError, "State store rejected the transition");
    }

    LogPrint(VLog::LEDGER, "RewardLedger: %s committed %u writes\n", operation, writes);
    return result;
}

} // namespace

RewardLedger::RewardLedger(const LedgerConfig& config, LedgerStateView& store,
                           NativeTransfer& native, LogicalClock& clock)
    : config_(config)
    , store_(store)
    , clock_(clock)
    , policy_(MakeVerifierPolicy(config))
    , token_(config.token, config.owner)
    , registry_(token_, *policy_, clock, config.owner)
    , sponsors_(native, config.sponsorPool)
    , genesisApplied_(false)
{
    LogPrintf("RewardLedger: Deployed by %s, token %s (%s), verifier policy %s\n",
              ShortPrincipal(config_.owner), config_.token.tokenName, config_.token.tokenSymbol,
              policy_->GetName());
}

bool RewardLedger::ApplyGenesis()
{
    LOCK(cs_ledger_);

    if (genesisApplied_) {
        LogPrintf("RewardLedger: Genesis already applied\n");
        return false;
    }

    LedgerStateCache cache(&store_);
    for (const uint160& verifier : config_.verifiers) {
        cache.SetVerifier(verifier, true);
    }

    LedgerGlobals globals = cache.GetGlobals();
    globals.contractEnabled = config_.startEnabled;
    if (config_.token.initialUri) {
        globals.tokenUri = config_.token.initialUri;
    }
    cache.WriteGlobals(globals);

    if (!cache.Flush()) {
        LogPrintf("RewardLedger: Genesis rejected by the state store\n");
        return false;
    }

    genesisApplied_ = true;
    LogPrintf("RewardLedger: Applied genesis - %u verifiers, submissions %s\n",
              config_.verifiers.size(), config_.startEnabled ? "enabled" : "disabled");
    return true;
}

bool RewardLedger::IsGenesisApplied() const
{
    LOCK(cs_ledger_);
    return genesisApplied_;
}

std::string RewardLedger::GetPolicyName() const
{
    return policy_->GetName();
}

SubmitResult RewardLedger::SubmitAction(const uint160& caller, uint32_t actionType,
                                        const uint256& locationHash, const uint256& proofHash)
{
    LOCK(cs_ledger_);
    LedgerStateCache cache(&store_);
    SubmitResult result = CommitTransition(cache,
        registry_.SubmitAction(cache, caller, actionType, locationHash, proofHash), "SubmitAction");
    if (result.success) {
        registry_.AdvanceClock();
    }
    return result;
}

LedgerResult RewardLedger::VerifyAction(const uint160& caller, const uint160& user, uint64_t actionId)
{
    LOCK(cs_ledger_);
    LedgerStateCache cache(&store_);
    return CommitTransition(cache, registry_.VerifyAction(cache, caller, user, actionId), "VerifyAction",
                            LedgerError::VERIFICATION_FAILED);
}

LedgerResult RewardLedger::ToggleContract(const uint160& caller, bool enabled)
{
    LOCK(cs_ledger_);
    LedgerStateCache cache(&store_);
    return CommitTransition(cache, registry_.SetContractEnabled(cache, caller, enabled), "ToggleContract");
}

LedgerResult RewardLedger::AddVerifier(const uint160& caller, const uint160& verifier)
{
    LOCK(cs_ledger_);
    LedgerStateCache cache(&store_);
    return CommitTransition(cache, registry_.AddVerifier(cache, caller, verifier), "AddVerifier");
}

LedgerResult RewardLedger::RemoveVerifier(const uint160& caller, const uint160& verifier)
{
    LOCK(cs_ledger_);
    LedgerStateCache cache(&store_);
    return CommitTransition(cache, registry_.RemoveVerifier(cache, caller, verifier), "RemoveVerifier");
}

LedgerResult RewardLedger::Transfer(const uint160& caller, CAmount amount, const uint160& from,
                                    const uint160& to, const std::optional<std::string>& memo)
{
    LOCK(cs_ledger_);
    LedgerStateCache cache(&store_);
    return CommitTransition(cache, token_.Transfer(cache, caller, amount, from, to, memo), "Transfer");
}

LedgerResult RewardLedger::TradeTokens(const uint160& caller, CAmount amount, const uint160& to)
{
    LOCK(cs_ledger_);
    LedgerStateCache cache(&store_);
    return CommitTransition(cache, token_.Transfer(cache, caller, amount, caller, to, std::nullopt), "TradeTokens");
}

LedgerResult RewardLedger::ApproveDelegate(const uint160& caller, const uint160& delegate)
{
    LOCK(cs_ledger_);
    LedgerStateCache cache(&store_);
    return CommitTransition(cache, token_.ApproveDelegate(cache, caller, delegate), "ApproveDelegate");
}

LedgerResult RewardLedger::RevokeDelegate(const uint160& caller, const uint160& delegate)
{
    LOCK(cs_ledger_);
    LedgerStateCache cache(&store_);
    return CommitTransition(cache, token_.RevokeDelegate(cache, caller, delegate), "RevokeDelegate");
}

LedgerResult RewardLedger::UpdateTokenUri(const uint160& caller, const std::optional<std::string>& uri)
{
    LOCK(cs_ledger_);
    LedgerStateCache cache(&store_);
    return CommitTransition(cache, token_.SetTokenUri(cache, caller, uri), "UpdateTokenUri");
}

LedgerResult RewardLedger::RegisterSponsor(const uint160& caller, const std::string& name)
{
    LOCK(cs_ledger_);
    LedgerStateCache cache(&store_);
    return CommitTransition(cache, sponsors_.RegisterSponsor(cache, caller, name), "RegisterSponsor");
}

LedgerResult RewardLedger::SponsorContribute(const uint160& caller, CAmount amount)
{
    LOCK(cs_ledger_);
    LedgerStateCache cache(&store_);
    return CommitTransition(cache, sponsors_.Contribute(cache, caller, amount), "SponsorContribute");
}

LedgerQuery RewardLedger::Query() const
{
    return LedgerQuery(store_, token_, clock_);
}

std::string RewardLedger::GetName() const
{
    return token_.GetName();
}

std::string RewardLedger::GetSymbol() const
{
    return token_.GetSymbol();
}

uint8_t RewardLedger::GetDecimals() const
{
    return token_.GetDecimals();
}

CAmount RewardLedger::GetBalance(const uint160& principal) const
{
    LOCK(cs_ledger_);
    return Query().GetBalance(principal);
}

CAmount RewardLedger::GetTotalSupply() const
{
    LOCK(cs_ledger_);
    return Query().GetTotalSupply();
}

std::optional<std::string> RewardLedger::GetTokenUri() const
{
    LOCK(cs_ledger_);
    return Query().GetTokenUri();
}

TokenInfo RewardLedger::GetTokenInfo() const
{
    LOCK(cs_ledger_);
    return Query().GetTokenInfo();
}

std::optional<Action> RewardLedger::GetUserAction(const uint160& user, uint64_t actionId) const
{
    LOCK(cs_ledger_);
    return Query().GetUserAction(user, actionId);
}

UserStats RewardLedger::GetUserStats(const uint160& user) const
{
    LOCK(cs_ledger_);
    return Query().GetUserStats(user);
}

std::optional<Sponsor> RewardLedger::GetSponsorInfo(const uint160& principal) const
{
    LOCK(cs_ledger_);
    return Query().GetSponsorInfo(principal);
}

std::optional<PendingVerification> RewardLedger::GetPendingVerification(uint64_t actionId) const
{
    LOCK(cs_ledger_);
    return Query().GetPendingVerification(actionId);
}

std::vector<PendingVerification> RewardLedger::ListPendingVerifications() const
{
    LOCK(cs_ledger_);
    return Query().ListPendingVerifications();
}

uint64_t RewardLedger::GetTotalActions() const
{
    LOCK(cs_ledger_);
    return Query().GetTotalActions();
}

bool RewardLedger::GetContractStatus() const
{
    LOCK(cs_ledger_);
    return Query().GetContractStatus();
}

bool RewardLedger::IsVerifier(const uint160& principal) const
{
    LOCK(cs_ledger_);
    return Query().IsVerifier(principal);
}

LedgerTotals RewardLedger::GetTotals() const
{
    LOCK(cs_ledger_);
    return Query().GetTotals();
}

bool RewardLedger::VerifySupplyInvariant() const
{
    LOCK(cs_ledger_);
    return token_.VerifySupplyInvariant(store_);
}

} // namespace verdant
