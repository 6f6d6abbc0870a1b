// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verdant/native_transfer.h>

#include <logging.h>
#include <verdant/ledger_common.h>

namespace verdant {

bool NativeBalanceBook::Transfer(const uint160& from, const uint160& to, CAmount amount)
{
    LOCK(cs_book_);

    if (amount <= 0 || !MoneyRange(amount)) {
        return false;
    }

    CAmount& fromBalance = balances_[from];
    if (fromBalance < amount) {
        LogPrint(VLog::SPONSOR, "NativeBalanceBook: %s cannot send %d (has %d)\n",
                 ShortPrincipal(from), amount, fromBalance);
        return false;
    }
    if (from == to) {
        return true;
    }

    CAmount& toBalance = balances_[to];
    if (!MoneyRange(toBalance + amount)) {
        return false;
    }

    fromBalance -= amount;
    toBalance += amount;
    return true;
}

bool NativeBalanceBook::Credit(const uint160& principal, CAmount amount)
{
    LOCK(cs_book_);

    if (!MoneyRange(amount)) {
        return false;
    }
    CAmount& balance = balances_[principal];
    if (!MoneyRange(balance + amount)) {
        return false;
    }
    balance += amount;
    return true;
}

CAmount NativeBalanceBook::GetBalance(const uint160& principal) const
{
    LOCK(cs_book_);
    auto it = balances_.find(principal);
    return it == balances_.end() ? 0 : it->second;
}

} // namespace verdant
