// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <core_io.h>

#include <univalue.h>
#include <verdant/ledger_common.h>
#include <verdant/ledger_query.h>
#include <verdant/ledger_state.h>

std::string PrincipalToHex(const uint160& principal)
{
    return "0x" + principal.GetHex();
}

UniValue ActionToUniv(const verdant::Action& action)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("id", (int64_t)action.id);
    result.pushKV("submitter", PrincipalToHex(action.submitter));
    result.pushKV("actionType", (int64_t)action.actionType);
    result.pushKV("actionTypeName", verdant::ActionTypeToString(action.actionType));
    result.pushKV("timestamp", (int64_t)action.timestamp);
    result.pushKV("locationHash", action.locationHash.GetHex());
    result.pushKV("proofHash", action.proofHash.GetHex());
    result.pushKV("verified", action.verified);
    result.pushKV("rewardAmount", action.rewardAmount);
    return result;
}

UniValue UserStatsToUniv(const uint160& user, const verdant::UserStats& stats)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("user", PrincipalToHex(user));
    result.pushKV("totalActions", (int64_t)stats.totalActions);
    result.pushKV("cleanupActions", (int64_t)stats.cleanupActions);
    result.pushKV("recyclingActions", (int64_t)stats.recyclingActions);
    result.pushKV("energyActions", (int64_t)stats.energyActions);
    result.pushKV("biodiversityActions", (int64_t)stats.biodiversityActions);
    result.pushKV("totalTokensEarned", stats.totalTokensEarned);
    result.pushKV("reputationScore", (int64_t)stats.reputationScore);
    return result;
}

UniValue SponsorToUniv(const uint160& principal, const verdant::Sponsor& sponsor)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("sponsor", PrincipalToHex(principal));
    result.pushKV("name", sponsor.name);
    result.pushKV("totalContributed", sponsor.totalContributed);
    result.pushKV("availableBalance", sponsor.availableBalance);
    result.pushKV("active", sponsor.active);
    return result;
}

UniValue PendingToUniv(const verdant::PendingVerification& pending)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("actionId", (int64_t)pending.actionId);
    if (pending.verifier) {
        result.pushKV("verifier", PrincipalToHex(*pending.verifier));
    } else {
        result.pushKV("verifier", NullUniValue);
    }
    result.pushKV("submittedAt", (int64_t)pending.submittedAt);
    return result;
}

UniValue PendingListToUniv(const std::vector<verdant::PendingVerification>& pending)
{
    UniValue result(UniValue::VARR);
    for (const auto& entry : pending) {
        result.push_back(PendingToUniv(entry));
    }
    return result;
}

UniValue TokenInfoToUniv(const verdant::TokenInfo& info)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("name", info.name);
    result.pushKV("symbol", info.symbol);
    result.pushKV("decimals", (int64_t)info.decimals);
    if (info.uri) {
        result.pushKV("uri", *info.uri);
    } else {
        result.pushKV("uri", NullUniValue);
    }
    result.pushKV("totalSupply", info.totalSupply);
    return result;
}

UniValue TotalsToUniv(const verdant::LedgerTotals& totals)
{
    UniValue result(UniValue::VOBJ);
    result.pushKV("nextActionId", (int64_t)totals.nextActionId);
    result.pushKV("currentTimestamp", (int64_t)totals.currentTimestamp);
    result.pushKV("totalActionsCompleted", (int64_t)totals.totalActionsCompleted);
    result.pushKV("totalSupply", totals.totalSupply);
    result.pushKV("pendingCount", (int64_t)totals.pendingCount);
    result.pushKV("contractEnabled", totals.contractEnabled);
    return result;
}

UniValue LedgerResultToUniv(const verdant::LedgerResult& result)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("success", result.success);
    if (!result.success) {
        obj.pushKV("error", (int64_t)result.error);
        obj.pushKV("errorName", verdant::LedgerErrorToString(result.error));
        obj.pushKV("message", result.errorMessage);
    }
    return obj;
}

UniValue SubmitResultToUniv(const verdant::SubmitResult& result)
{
    UniValue obj(UniValue::VOBJ);
    obj.pushKV("success", result.success);
    if (result.success) {
        obj.pushKV("actionId", (int64_t)result.actionId);
    } else {
        obj.pushKV("error", (int64_t)result.error);
        obj.pushKV("errorName", verdant::LedgerErrorToString(result.error));
        obj.pushKV("message", result.errorMessage);
    }
    return obj;
}
