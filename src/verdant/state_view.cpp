// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verdant/state_view.h>

#include <logging.h>

namespace verdant {

// ============================================================================
// MemoryLedgerStore
// ============================================================================

bool MemoryLedgerStore::GetAction(const ActionKey& key, Action& action) const
{
    auto it = actions_.find(key);
    if (it == actions_.end()) {
        return false;
    }
    action = it->second;
    return true;
}

bool MemoryLedgerStore::GetPending(uint64_t actionId, PendingVerification& pending) const
{
    auto it = pending_.find(actionId);
    if (it == pending_.end()) {
        return false;
    }
    pending = it->second;
    return true;
}

std::vector<PendingVerification> MemoryLedgerStore::ListPending() const
{
    std::vector<PendingVerification> result;
    result.reserve(pending_.size());
    for (const auto& pair : pending_) {
        result.push_back(pair.second);
    }
    return result;
}

bool MemoryLedgerStore::GetUserStats(const uint160& user, UserStats& stats) const
{
    auto it = userStats_.find(user);
    if (it == userStats_.end()) {
        return false;
    }
    stats = it->second;
    return true;
}

bool MemoryLedgerStore::GetSponsor(const uint160& principal, Sponsor& sponsor) const
{
    auto it = sponsors_.find(principal);
    if (it == sponsors_.end()) {
        return false;
    }
    sponsor = it->second;
    return true;
}

CAmount MemoryLedgerStore::GetBalance(const uint160& principal) const
{
    auto it = balances_.find(principal);
    return it == balances_.end() ? 0 : it->second;
}

std::map<uint160, CAmount> MemoryLedgerStore::ListBalances() const
{
    return balances_;
}

bool MemoryLedgerStore::IsDelegate(const uint160& owner, const uint160& delegate) const
{
    return delegates_.count(std::make_pair(owner, delegate)) > 0;
}

bool MemoryLedgerStore::IsVerifier(const uint160& principal) const
{
    return verifiers_.count(principal) > 0;
}

LedgerGlobals MemoryLedgerStore::GetGlobals() const
{
    return globals_;
}

bool MemoryLedgerStore::BatchWrite(const LedgerStateDelta& delta)
{
    // Reject the whole batch before touching anything
    for (const auto& pair : delta.balances) {
        if (!MoneyRange(pair.second)) {
            LogPrintf("MemoryLedgerStore: Rejecting batch - balance %d out of range for %s\n",
                      pair.second, ShortPrincipal(pair.first));
            return false;
        }
    }
    if (delta.globals && !MoneyRange(delta.globals->totalSupply)) {
        LogPrintf("MemoryLedgerStore: Rejecting batch - total supply %d out of range\n",
                  delta.globals->totalSupply);
        return false;
    }

    for (const auto& pair : delta.actions) {
        actions_[pair.first] = pair.second;
    }
    for (const auto& pair : delta.pending) {
        if (pair.second) {
            pending_[pair.first] = *pair.second;
        } else {
            pending_.erase(pair.first);
        }
    }
    for (const auto& pair : delta.userStats) {
        userStats_[pair.first] = pair.second;
    }
    for (const auto& pair : delta.sponsors) {
        sponsors_[pair.first] = pair.second;
    }
    for (const auto& pair : delta.balances) {
        if (pair.second == 0) {
            balances_.erase(pair.first);
        } else {
            balances_[pair.first] = pair.second;
        }
    }
    for (const auto& pair : delta.delegates) {
        if (pair.second) {
            delegates_[pair.first] = true;
        } else {
            delegates_.erase(pair.first);
        }
    }
    for (const auto& pair : delta.verifiers) {
        if (pair.second) {
            verifiers_[pair.first] = true;
        } else {
            verifiers_.erase(pair.first);
        }
    }
    if (delta.globals) {
        globals_ = *delta.globals;
    }

    ++batchCount_;
    LogPrint(VLog::LEDGER, "MemoryLedgerStore: Committed batch %u with %u writes\n",
             batchCount_, delta.GetWriteCount());
    return true;
}

// ============================================================================
// LedgerStateCache
// ============================================================================

LedgerStateCache::LedgerStateCache(LedgerStateView* base)
    : base_(base)
{
}

bool LedgerStateCache::GetAction(const ActionKey& key, Action& action) const
{
    auto it = delta_.actions.find(key);
    if (it != delta_.actions.end()) {
        action = it->second;
        return true;
    }
    return base_->GetAction(key, action);
}

bool LedgerStateCache::GetPending(uint64_t actionId, PendingVerification& pending) const
{
    auto it = delta_.pending.find(actionId);
    if (it != delta_.pending.end()) {
        if (!it->second) {
            return false;
        }
        pending = *it->second;
        return true;
    }
    return base_->GetPending(actionId, pending);
}

std::vector<PendingVerification> LedgerStateCache::ListPending() const
{
    std::map<uint64_t, PendingVerification> merged;
    for (const PendingVerification& pending : base_->ListPending()) {
        merged[pending.actionId] = pending;
    }
    for (const auto& pair : delta_.pending) {
        if (pair.second) {
            merged[pair.first] = *pair.second;
        } else {
            merged.erase(pair.first);
        }
    }

    std::vector<PendingVerification> result;
    result.reserve(merged.size());
    for (const auto& pair : merged) {
        result.push_back(pair.second);
    }
    return result;
}

bool LedgerStateCache::GetUserStats(const uint160& user, UserStats& stats) const
{
    auto it = delta_.userStats.find(user);
    if (it != delta_.userStats.end()) {
        stats = it->second;
        return true;
    }
    return base_->GetUserStats(user, stats);
}

bool LedgerStateCache::GetSponsor(const uint160& principal, Sponsor& sponsor) const
{
    auto it = delta_.sponsors.find(principal);
    if (it != delta_.sponsors.end()) {
        sponsor = it->second;
        return true;
    }
    return base_->GetSponsor(principal, sponsor);
}

CAmount LedgerStateCache::GetBalance(const uint160& principal) const
{
    auto it = delta_.balances.find(principal);
    if (it != delta_.balances.end()) {
        return it->second;
    }
    return base_->GetBalance(principal);
}

std::map<uint160, CAmount> LedgerStateCache::ListBalances() const
{
    std::map<uint160, CAmount> merged = base_->ListBalances();
    for (const auto& pair : delta_.balances) {
        if (pair.second == 0) {
            merged.erase(pair.first);
        } else {
            merged[pair.first] = pair.second;
        }
    }
    return merged;
}

bool LedgerStateCache::IsDelegate(const uint160& owner, const uint160& delegate) const
{
    auto it = delta_.delegates.find(std::make_pair(owner, delegate));
    if (it != delta_.delegates.end()) {
        return it->second;
    }
    return base_->IsDelegate(owner, delegate);
}

bool LedgerStateCache::IsVerifier(const uint160& principal) const
{
    auto it = delta_.verifiers.find(principal);
    if (it != delta_.verifiers.end()) {
        return it->second;
    }
    return base_->IsVerifier(principal);
}

LedgerGlobals LedgerStateCache::GetGlobals() const
{
    if (delta_.globals) {
        return *delta_.globals;
    }
    return base_->GetGlobals();
}

bool LedgerStateCache::BatchWrite(const LedgerStateDelta& delta)
{
    for (const auto& pair : delta.actions) {
        delta_.actions[pair.first] = pair.second;
    }
    for (const auto& pair : delta.pending) {
        delta_.pending[pair.first] = pair.second;
    }
    for (const auto& pair : delta.userStats) {
        delta_.userStats[pair.first] = pair.second;
    }
    for (const auto& pair : delta.sponsors) {
        delta_.sponsors[pair.first] = pair.second;
    }
    for (const auto& pair : delta.balances) {
        delta_.balances[pair.first] = pair.second;
    }
    for (const auto& pair : delta.delegates) {
        delta_.delegates[pair.first] = pair.second;
    }
    for (const auto& pair : delta.verifiers) {
        delta_.verifiers[pair.first] = pair.second;
    }
    if (delta.globals) {
        delta_.globals = delta.globals;
    }
    return true;
}

void LedgerStateCache::WriteAction(const Action& action)
{
    delta_.actions[ActionKey(action.submitter, action.id)] = action;
}

void LedgerStateCache::WritePending(const PendingVerification& pending)
{
    delta_.pending[pending.actionId] = pending;
}

void LedgerStateCache::ErasePending(uint64_t actionId)
{
    delta_.pending[actionId] = std::nullopt;
}

void LedgerStateCache::WriteUserStats(const uint160& user, const UserStats& stats)
{
    delta_.userStats[user] = stats;
}

void LedgerStateCache::WriteSponsor(const uint160& principal, const Sponsor& sponsor)
{
    delta_.sponsors[principal] = sponsor;
}

void LedgerStateCache::WriteBalance(const uint160& principal, CAmount balance)
{
    delta_.balances[principal] = balance;
}

void LedgerStateCache::SetDelegate(const uint160& owner, const uint160& delegate, bool authorized)
{
    delta_.delegates[std::make_pair(owner, delegate)] = authorized;
}

void LedgerStateCache::SetVerifier(const uint160& principal, bool authorized)
{
    delta_.verifiers[principal] = authorized;
}

void LedgerStateCache::WriteGlobals(const LedgerGlobals& globals)
{
    delta_.globals = globals;
}

bool LedgerStateCache::Flush()
{
    if (delta_.IsEmpty()) {
        return true;
    }
    bool fOk = base_->BatchWrite(delta_);
    delta_.Clear();
    return fOk;
}

} // namespace verdant
