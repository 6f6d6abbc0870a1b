// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_VERDANT_SPONSOR_POOL_H
#define VERDANT_VERDANT_SPONSOR_POOL_H

/**
 * @file sponsor_pool.h
 * @brief Corporate sponsor registration and contribution bookkeeping
 *
 * Contributions move native currency from the sponsor to the pool
 * principal and raise both totalContributed and availableBalance.
 * Nothing draws availableBalance down: reward minting is not funded
 * from the pool.
 */

#include <amount.h>
#include <uint256.h>
#include <verdant/ledger_common.h>
#include <verdant/native_transfer.h>
#include <verdant/state_view.h>

#include <string>

namespace verdant {

class SponsorPool {
public:
    SponsorPool(NativeTransfer& native, const uint160& poolPrincipal);

    /**
     * @brief (Re)create the caller's sponsor record, zeroed and active
     *
     * Registering again overwrites the previous record, balances included.
     */
    LedgerResult RegisterSponsor(LedgerStateCache& cache, const uint160& caller, const std::string& name) const;

    /**
     * @brief Contribute native currency to the pool
     *
     * The native transfer runs last and cannot be undone, so the staged
     * record relies on LedgerStateView::BatchWrite accepting sponsor-only
     * batches.
     *
     * @return SPONSOR_NOT_FOUND, INVALID_AMOUNT, or INSUFFICIENT_BALANCE if
     *         the native transfer failed
     */
    LedgerResult Contribute(LedgerStateCache& cache, const uint160& caller, CAmount amount) const;

    const uint160& GetPoolPrincipal() const { return poolPrincipal_; }

private:
    NativeTransfer& native_;
    uint160 poolPrincipal_;
};

} // namespace verdant

#endif // VERDANT_VERDANT_SPONSOR_POOL_H
