// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verdant/ledger_query.h>

#include <verdant/user_stats.h>

namespace verdant {

LedgerQuery::LedgerQuery(const LedgerStateView& view, const TokenLedger& token, const LogicalClock& clock)
    : view_(view)
    , token_(token)
    , clock_(clock)
{
}

std::optional<Action> LedgerQuery::GetUserAction(const uint160& user, uint64_t actionId) const
{
    Action action;
    if (!view_.GetAction(ActionKey(user, actionId), action)) {
        return std::nullopt;
    }
    return action;
}

UserStats LedgerQuery::GetUserStats(const uint160& user) const
{
    return GetUserStatsOrDefault(view_, user);
}

std::optional<Sponsor> LedgerQuery::GetSponsorInfo(const uint160& principal) const
{
    Sponsor sponsor;
    if (!view_.GetSponsor(principal, sponsor)) {
        return std::nullopt;
    }
    return sponsor;
}

std::optional<PendingVerification> LedgerQuery::GetPendingVerification(uint64_t actionId) const
{
    PendingVerification pending;
    if (!view_.GetPending(actionId, pending)) {
        return std::nullopt;
    }
    return pending;
}

std::vector<PendingVerification> LedgerQuery::ListPendingVerifications() const
{
    return view_.ListPending();
}

uint64_t LedgerQuery::GetTotalActions() const
{
    return view_.GetGlobals().totalActionsCompleted;
}

bool LedgerQuery::GetContractStatus() const
{
    return view_.GetGlobals().contractEnabled;
}

CAmount LedgerQuery::GetBalance(const uint160& principal) const
{
    return token_.GetBalance(view_, principal);
}

CAmount LedgerQuery::GetTotalSupply() const
{
    return token_.GetTotalSupply(view_);
}

std::optional<std::string> LedgerQuery::GetTokenUri() const
{
    return token_.GetTokenUri(view_);
}

bool LedgerQuery::IsVerifier(const uint160& principal) const
{
    return view_.IsVerifier(principal);
}

TokenInfo LedgerQuery::GetTokenInfo() const
{
    TokenInfo info;
    info.name = token_.GetName();
    info.symbol = token_.GetSymbol();
    info.decimals = token_.GetDecimals();
    info.uri = token_.GetTokenUri(view_);
    info.totalSupply = token_.GetTotalSupply(view_);
    return info;
}

LedgerTotals LedgerQuery::GetTotals() const
{
    LedgerGlobals globals = view_.GetGlobals();

    LedgerTotals totals;
    totals.nextActionId = globals.nextActionId;
    totals.currentTimestamp = clock_.Now();
    totals.totalActionsCompleted = globals.totalActionsCompleted;
    totals.totalSupply = globals.totalSupply;
    totals.pendingCount = view_.ListPending().size();
    totals.contractEnabled = globals.contractEnabled;
    return totals;
}

} // namespace verdant
