// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verdant/token_ledger.h>

#include <logging.h>

namespace verdant {

TokenLedger::TokenLedger(const TokenConfig& config, const uint160& owner)
    : config_(config)
    , owner_(owner)
{
    if (!config_.IsValid()) {
        LogPrintf("TokenLedger: Warning - invalid token configuration\n");
    }

    LogPrint(VLog::TOKEN, "TokenLedger: Initialized token %s (%s), %u decimals\n",
             config_.tokenName, config_.tokenSymbol, static_cast<int>(config_.decimals));
}

CAmount TokenLedger::GetBalance(const LedgerStateView& view, const uint160& principal) const
{
    return view.GetBalance(principal);
}

CAmount TokenLedger::GetTotalSupply(const LedgerStateView& view) const
{
    return view.GetGlobals().totalSupply;
}

std::optional<std::string> TokenLedger::GetTokenUri(const LedgerStateView& view) const
{
    return view.GetGlobals().tokenUri;
}

// ============================================================================
// Transfers
// ============================================================================

LedgerResult TokenLedger::Transfer(LedgerStateCache& cache, const uint160& caller, CAmount amount,
                                   const uint160& from, const uint160& to,
                                   const std::optional<std::string>& memo) const
{
    if (caller != from && !cache.IsDelegate(from, caller)) {
        return LedgerResult::Failure(LedgerError::NOT_TOKEN_OWNER,
            "Caller is neither the token owner nor an authorized delegate");
    }

    if (amount <= 0) {
        return LedgerResult::Failure(LedgerError::INVALID_AMOUNT,
            "Transfer amount must be greater than zero");
    }

    if (memo && memo->size() > MAX_TRANSFER_MEMO_LENGTH) {
        return LedgerResult::Failure(LedgerError::INVALID_ACTION,
            strprintf("Memo exceeds %u bytes", MAX_TRANSFER_MEMO_LENGTH));
    }

    CAmount senderBalance = cache.GetBalance(from);
    if (senderBalance < amount) {
        return LedgerResult::Failure(LedgerError::INSUFFICIENT_BALANCE,
            strprintf("Insufficient balance for transfer (need %d, have %d)", amount, senderBalance));
    }

    if (from != to) {
        CAmount recipientBalance = cache.GetBalance(to);
        if (!MoneyRange(recipientBalance + amount)) {
            return LedgerResult::Failure(LedgerError::INVALID_AMOUNT, "Recipient balance overflow");
        }
        cache.WriteBalance(from, senderBalance - amount);
        cache.WriteBalance(to, recipientBalance + amount);
    }

    LogPrint(VLog::TOKEN, "TokenLedger: Transfer - %s sent %d %s to %s%s\n",
             ShortPrincipal(from), amount, config_.tokenSymbol, ShortPrincipal(to),
             memo ? strprintf(" (memo: %s)", *memo) : std::string());

    return LedgerResult::Success();
}

LedgerResult TokenLedger::ApproveDelegate(LedgerStateCache& cache, const uint160& owner,
                                          const uint160& delegate) const
{
    if (owner == delegate) {
        return LedgerResult::Failure(LedgerError::INVALID_ACTION,
            "A principal cannot delegate to itself");
    }
    cache.SetDelegate(owner, delegate, true);

    LogPrint(VLog::TOKEN, "TokenLedger: %s approved delegate %s\n",
             ShortPrincipal(owner), ShortPrincipal(delegate));
    return LedgerResult::Success();
}

LedgerResult TokenLedger::RevokeDelegate(LedgerStateCache& cache, const uint160& owner,
                                         const uint160& delegate) const
{
    cache.SetDelegate(owner, delegate, false);

    LogPrint(VLog::TOKEN, "TokenLedger: %s revoked delegate %s\n",
             ShortPrincipal(owner), ShortPrincipal(delegate));
    return LedgerResult::Success();
}

LedgerResult TokenLedger::SetTokenUri(LedgerStateCache& cache, const uint160& caller,
                                      const std::optional<std::string>& uri) const
{
    if (caller != owner_) {
        return LedgerResult::Failure(LedgerError::OWNER_ONLY,
            "Only the contract owner may update the token URI");
    }

    if (uri && !TokenConfig::ValidateTokenUri(*uri)) {
        return LedgerResult::Failure(LedgerError::INVALID_ACTION,
            strprintf("Token URI exceeds %u characters", MAX_TOKEN_URI_LENGTH));
    }

    LedgerGlobals globals = cache.GetGlobals();
    globals.tokenUri = uri;
    cache.WriteGlobals(globals);

    LogPrintf("TokenLedger: Token URI set to %s\n", uri ? *uri : std::string("(none)"));
    return LedgerResult::Success();
}

// ============================================================================
// Minting
// ============================================================================

LedgerResult TokenLedger::Mint(LedgerStateCache& cache, const uint160& recipient, CAmount amount) const
{
    if (amount <= 0) {
        return LedgerResult::Failure(LedgerError::INVALID_AMOUNT,
            "Mint amount must be greater than zero");
    }

    LedgerGlobals globals = cache.GetGlobals();
    CAmount balance = cache.GetBalance(recipient);

    if (!MoneyRange(globals.totalSupply + amount) || !MoneyRange(balance + amount)) {
        return LedgerResult::Failure(LedgerError::INVALID_AMOUNT,
            "Mint would exceed the maximum supply");
    }

    cache.WriteBalance(recipient, balance + amount);
    globals.totalSupply += amount;
    globals.totalMinted += amount;
    cache.WriteGlobals(globals);

    LogPrint(VLog::TOKEN, "TokenLedger: Minted %d %s to %s, total supply %d\n",
             amount, config_.tokenSymbol, ShortPrincipal(recipient), globals.totalSupply);

    return LedgerResult::Success();
}

// ============================================================================
// Invariants
// ============================================================================

bool TokenLedger::VerifySupplyInvariant(const LedgerStateView& view) const
{
    LedgerGlobals globals = view.GetGlobals();
    if (globals.totalSupply != globals.totalMinted) {
        LogPrintf("TokenLedger: Supply invariant failed - supply %d, minted %d\n",
                  globals.totalSupply, globals.totalMinted);
        return false;
    }

    CAmount sum = 0;
    for (const auto& pair : view.ListBalances()) {
        if (!MoneyRange(pair.second) || !MoneyRange(sum + pair.second)) {
            LogPrintf("TokenLedger: Balance of %s out of range\n", ShortPrincipal(pair.first));
            return false;
        }
        sum += pair.second;
    }

    if (sum != globals.totalSupply) {
        LogPrintf("TokenLedger: Supply invariant failed - balances sum to %d, supply %d\n",
                  sum, globals.totalSupply);
        return false;
    }
    return true;
}

} // namespace verdant
