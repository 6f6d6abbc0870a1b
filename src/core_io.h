// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_CORE_IO_H
#define VERDANT_CORE_IO_H

#include <amount.h>
#include <uint256.h>

#include <string>
#include <vector>

class UniValue;

namespace verdant {
struct Action;
struct LedgerResult;
struct LedgerTotals;
struct PendingVerification;
struct Sponsor;
struct SubmitResult;
struct TokenInfo;
struct UserStats;
} // namespace verdant

// core_write.cpp
std::string PrincipalToHex(const uint160& principal);
UniValue ActionToUniv(const verdant::Action& action);
UniValue UserStatsToUniv(const uint160& user, const verdant::UserStats& stats);
UniValue SponsorToUniv(const uint160& principal, const verdant::Sponsor& sponsor);
UniValue PendingToUniv(const verdant::PendingVerification& pending);
UniValue PendingListToUniv(const std::vector<verdant::PendingVerification>& pending);
UniValue TokenInfoToUniv(const verdant::TokenInfo& info);
UniValue TotalsToUniv(const verdant::LedgerTotals& totals);
UniValue LedgerResultToUniv(const verdant::LedgerResult& result);
UniValue SubmitResultToUniv(const verdant::SubmitResult& result);

#endif // VERDANT_CORE_IO_H
