// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_VERDANT_TOKEN_LEDGER_H
#define VERDANT_VERDANT_TOKEN_LEDGER_H

/**
 * @file token_ledger.h
 * @brief Fungible reward token: balances, mint and transfer
 *
 * Balances and the supply counters live in the ledger state; this class
 * holds only the static token configuration and the rules. Supply
 * invariant: totalSupply == totalMinted == sum of all balances.
 * Transfers are supply-neutral. Minting is reachable only from the
 * verification transition.
 */

#include <amount.h>
#include <uint256.h>
#include <verdant/ledger_common.h>
#include <verdant/state_view.h>

#include <cstdint>
#include <optional>
#include <string>

namespace verdant {

class ActionRegistry;

/** Minimum token name length */
static constexpr size_t MIN_TOKEN_NAME_LENGTH = 3;

/** Maximum token name length */
static constexpr size_t MAX_TOKEN_NAME_LENGTH = 32;

/** Minimum token symbol length */
static constexpr size_t MIN_TOKEN_SYMBOL_LENGTH = 2;

/** Maximum token symbol length */
static constexpr size_t MAX_TOKEN_SYMBOL_LENGTH = 8;

/** Maximum decimals a token may declare */
static constexpr uint8_t MAX_TOKEN_DECIMALS = 18;

/** Maximum token URI length */
static constexpr size_t MAX_TOKEN_URI_LENGTH = 256;

/**
 * @brief Static token configuration
 */
struct TokenConfig {
    std::string tokenName;
    std::string tokenSymbol;
    uint8_t decimals;

    /** URI a fresh ledger starts with, if any */
    std::optional<std::string> initialUri;

    TokenConfig()
        : tokenName("Verdant Eco Token")
        , tokenSymbol("VERD")
        , decimals(6)
    {}

    TokenConfig(const std::string& name, const std::string& symbol, uint8_t decimals_)
        : tokenName(name)
        , tokenSymbol(symbol)
        , decimals(decimals_)
    {}

    bool IsValid() const {
        return ValidateTokenName(tokenName) &&
               ValidateTokenSymbol(tokenSymbol) &&
               decimals <= MAX_TOKEN_DECIMALS &&
               (!initialUri || ValidateTokenUri(*initialUri));
    }

    static bool ValidateTokenName(const std::string& name) {
        return name.length() >= MIN_TOKEN_NAME_LENGTH &&
               name.length() <= MAX_TOKEN_NAME_LENGTH;
    }

    static bool ValidateTokenSymbol(const std::string& symbol) {
        return symbol.length() >= MIN_TOKEN_SYMBOL_LENGTH &&
               symbol.length() <= MAX_TOKEN_SYMBOL_LENGTH;
    }

    static bool ValidateTokenUri(const std::string& uri) {
        return uri.length() <= MAX_TOKEN_URI_LENGTH;
    }
};

/**
 * @brief Token ledger rules over a state view
 */
class TokenLedger {
public:
    TokenLedger(const TokenConfig& config, const uint160& owner);

    const TokenConfig& GetConfig() const { return config_; }
    std::string GetName() const { return config_.tokenName; }
    std::string GetSymbol() const { return config_.tokenSymbol; }
    uint8_t GetDecimals() const { return config_.decimals; }

    CAmount GetBalance(const LedgerStateView& view, const uint160& principal) const;
    CAmount GetTotalSupply(const LedgerStateView& view) const;
    std::optional<std::string> GetTokenUri(const LedgerStateView& view) const;

    /**
     * @brief Move tokens between principals
     * @param cache Transition cache to stage writes in
     * @param caller Authenticated caller
     * @param amount Amount to move (> 0)
     * @param from Principal debited; caller must be from or its delegate
     * @param to Principal credited
     * @param memo Optional memo (logged, not stored)
     * @return NOT_TOKEN_OWNER, INVALID_AMOUNT, INVALID_ACTION (memo too long)
     *         or INSUFFICIENT_BALANCE on failure
     */
    LedgerResult Transfer(LedgerStateCache& cache, const uint160& caller, CAmount amount,
                          const uint160& from, const uint160& to,
                          const std::optional<std::string>& memo) const;

    /** Let delegate move owner's tokens through Transfer */
    LedgerResult ApproveDelegate(LedgerStateCache& cache, const uint160& owner,
                                 const uint160& delegate) const;

    /** Withdraw a delegate authorization; succeeds if none existed */
    LedgerResult RevokeDelegate(LedgerStateCache& cache, const uint160& owner,
                                const uint160& delegate) const;

    /** Replace the token URI; contract owner only */
    LedgerResult SetTokenUri(LedgerStateCache& cache, const uint160& caller,
                             const std::optional<std::string>& uri) const;

    /**
     * @brief Check totalSupply == totalMinted == sum of balances
     */
    bool VerifySupplyInvariant(const LedgerStateView& view) const;

private:
    friend class ActionRegistry;

    /**
     * @brief Credit newly minted tokens; verification flow only
     * @return INVALID_AMOUNT if amount <= 0 or the supply would leave the money range
     */
    LedgerResult Mint(LedgerStateCache& cache, const uint160& recipient, CAmount amount) const;

    TokenConfig config_;
    uint160 owner_;
};

} // namespace verdant

#endif // VERDANT_VERDANT_TOKEN_LEDGER_H
