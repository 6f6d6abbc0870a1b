// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_VERDANT_LEDGER_QUERY_H
#define VERDANT_VERDANT_LEDGER_QUERY_H

/**
 * @file ledger_query.h
 * @brief Read-only projections over the ledger state
 */

#include <amount.h>
#include <uint256.h>
#include <verdant/ledger_state.h>
#include <verdant/logical_clock.h>
#include <verdant/state_view.h>
#include <verdant/token_ledger.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace verdant {

/** Static token metadata plus the current supply */
struct TokenInfo {
    std::string name;
    std::string symbol;
    uint8_t decimals = 0;
    std::optional<std::string> uri;
    CAmount totalSupply = 0;
};

/** Ledger-wide counters */
struct LedgerTotals {
    uint64_t nextActionId = FIRST_ACTION_ID;
    uint64_t currentTimestamp = 0;
    uint64_t totalActionsCompleted = 0;
    CAmount totalSupply = 0;
    uint64_t pendingCount = 0;
    bool contractEnabled = true;
};

class LedgerQuery {
public:
    LedgerQuery(const LedgerStateView& view, const TokenLedger& token, const LogicalClock& clock);

    std::optional<Action> GetUserAction(const uint160& user, uint64_t actionId) const;

    /** All-zero stats for users without verified actions */
    UserStats GetUserStats(const uint160& user) const;

    std::optional<Sponsor> GetSponsorInfo(const uint160& principal) const;
    std::optional<PendingVerification> GetPendingVerification(uint64_t actionId) const;
    std::vector<PendingVerification> ListPendingVerifications() const;

    /** Number of verified actions */
    uint64_t GetTotalActions() const;

    /** Whether submissions are accepted */
    bool GetContractStatus() const;

    CAmount GetBalance(const uint160& principal) const;
    CAmount GetTotalSupply() const;
    std::optional<std::string> GetTokenUri() const;
    bool IsVerifier(const uint160& principal) const;

    TokenInfo GetTokenInfo() const;
    LedgerTotals GetTotals() const;

private:
    const LedgerStateView& view_;
    const TokenLedger& token_;
    const LogicalClock& clock_;
};

} // namespace verdant

#endif // VERDANT_VERDANT_LEDGER_QUERY_H
