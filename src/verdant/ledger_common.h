// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_VERDANT_LEDGER_COMMON_H
#define VERDANT_VERDANT_LEDGER_COMMON_H

/**
 * @file ledger_common.h
 * @brief Common definitions shared by every reward ledger component
 *
 * Action type codes, the typed error kinds every entry point reports,
 * and the result objects that carry them back to the caller.
 */

#include <amount.h>
#include <uint256.h>

#include <cstdint>
#include <ostream>
#include <string>

namespace verdant {

/** Maximum memo length accepted by a token transfer (bytes) */
static constexpr size_t MAX_TRANSFER_MEMO_LENGTH = 34;

/** First action id handed out by a fresh ledger */
static constexpr uint64_t FIRST_ACTION_ID = 1;

/** Environmental action kinds with a configured reward */
enum class ActionType : uint32_t {
    CLEANUP = 1,
    RECYCLING = 2,
    ENERGY_REDUCTION = 3,
    BIODIVERSITY = 4
};

/** Stable name of an action type code; "unknown" for codes without a reward */
std::string ActionTypeToString(uint32_t actionType);

/**
 * @brief Error kinds returned by ledger entry points
 *
 * The numeric values are stable and appear in JSON results.
 */
enum class LedgerError : uint32_t {
    OK = 0,
    OWNER_ONLY = 100,
    NOT_TOKEN_OWNER = 101,
    INSUFFICIENT_BALANCE = 102,
    INVALID_ACTION = 103,
    ALREADY_VERIFIED = 104,
    VERIFICATION_FAILED = 105,
    SPONSOR_NOT_FOUND = 106,
    INSUFFICIENT_SPONSOR_BALANCE = 107,
    INVALID_AMOUNT = 108,
    ACTION_NOT_FOUND = 109
};

/**
 * @brief Convert LedgerError to its stable name (e.g. "already-verified")
 */
std::string LedgerErrorToString(LedgerError error);

/**
 * @brief Stream output operator for LedgerError (needed for Boost.Test)
 */
inline std::ostream& operator<<(std::ostream& os, LedgerError error) {
    return os << LedgerErrorToString(error);
}

/**
 * @brief Outcome of a state-transition entry point
 */
struct LedgerResult {
    /** Whether the whole transition committed */
    bool success = false;

    /** Error kind if the transition was rejected */
    LedgerError error = LedgerError::OK;

    /** Detailed error message */
    std::string errorMessage;

    static LedgerResult Success() {
        LedgerResult result;
        result.success = true;
        return result;
    }

    static LedgerResult Failure(LedgerError err, const std::string& msg) {
        LedgerResult result;
        result.success = false;
        result.error = err;
        result.errorMessage = msg;
        return result;
    }
};

/**
 * @brief Outcome of an action submission
 */
struct SubmitResult {
    bool success = false;
    LedgerError error = LedgerError::OK;
    std::string errorMessage;

    /** Id allocated to the new action */
    uint64_t actionId = 0;

    static SubmitResult Success(uint64_t id) {
        SubmitResult result;
        result.success = true;
        result.actionId = id;
        return result;
    }

    static SubmitResult Failure(LedgerError err, const std::string& msg) {
        SubmitResult result;
        result.success = false;
        result.error = err;
        result.errorMessage = msg;
        return result;
    }
};

/** Short principal form for log lines */
inline std::string ShortPrincipal(const uint160& principal) {
    return principal.ToString().substr(0, 16);
}

} // namespace verdant

#endif // VERDANT_VERDANT_LEDGER_COMMON_H
