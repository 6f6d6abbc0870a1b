// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verdant/ledger_common.h>

namespace verdant {

std::string ActionTypeToString(uint32_t actionType)
{
    switch (static_cast<ActionType>(actionType)) {
        case ActionType::CLEANUP:          return "cleanup";
        case ActionType::RECYCLING:        return "recycling";
        case ActionType::ENERGY_REDUCTION: return "energy-reduction";
        case ActionType::BIODIVERSITY:     return "biodiversity";
    }
    return "unknown";
}

std::string LedgerErrorToString(LedgerError error)
{
    switch (error) {
        case LedgerError::OK:                           return "ok";
        case LedgerError::OWNER_ONLY:                   return "owner-only";
        case LedgerError::NOT_TOKEN_OWNER:              return "not-token-owner";
        case LedgerError::INSUFFICIENT_BALANCE:         return "insufficient-balance";
        case LedgerError::INVALID_ACTION:               return "invalid-action";
        case LedgerError::ALREADY_VERIFIED:             return "already-verified";
        case LedgerError::VERIFICATION_FAILED:          return "verification-failed";
        case LedgerError::SPONSOR_NOT_FOUND:            return "sponsor-not-found";
        case LedgerError::INSUFFICIENT_SPONSOR_BALANCE: return "insufficient-sponsor-balance";
        case LedgerError::INVALID_AMOUNT:               return "invalid-amount";
        case LedgerError::ACTION_NOT_FOUND:             return "action-not-found";
    }
    return "unknown-error";
}

} // namespace verdant
