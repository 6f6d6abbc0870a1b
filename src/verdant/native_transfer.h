// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_VERDANT_NATIVE_TRANSFER_H
#define VERDANT_VERDANT_NATIVE_TRANSFER_H

#include <amount.h>
#include <sync.h>
#include <uint256.h>

#include <map>

namespace verdant {

/**
 * @brief Host primitive moving native currency between principals
 *
 * Independent of the reward token. May fail for lack of funds.
 */
class NativeTransfer {
public:
    virtual ~NativeTransfer() = default;

    /** @return false if the transfer did not happen */
    virtual bool Transfer(const uint160& from, const uint160& to, CAmount amount) = 0;
};

/**
 * @brief In-memory native balances for hosts without a chain underneath
 */
class NativeBalanceBook : public NativeTransfer {
public:
    bool Transfer(const uint160& from, const uint160& to, CAmount amount) override;

    /** Add funds to a principal; false if the balance would leave the money range */
    bool Credit(const uint160& principal, CAmount amount);

    CAmount GetBalance(const uint160& principal) const;

private:
    std::map<uint160, CAmount> balances_;
    mutable CCriticalSection cs_book_;
};

} // namespace verdant

#endif // VERDANT_VERDANT_NATIVE_TRANSFER_H
