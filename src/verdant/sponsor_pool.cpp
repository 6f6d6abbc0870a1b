// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verdant/sponsor_pool.h>

#include <logging.h>

namespace verdant {

SponsorPool::SponsorPool(NativeTransfer& native, const uint160& poolPrincipal)
    : native_(native)
    , poolPrincipal_(poolPrincipal)
{
}

LedgerResult SponsorPool::RegisterSponsor(LedgerStateCache& cache, const uint160& caller, const std::string& name) const
{
    Sponsor sponsor;
    sponsor.name = name;
    sponsor.totalContributed = 0;
    sponsor.availableBalance = 0;
    sponsor.active = true;
    cache.WriteSponsor(caller, sponsor);

    LogPrint(VLog::SPONSOR, "SponsorPool: Registered sponsor %s as \"%s\"\n", ShortPrincipal(caller), name);
    return LedgerResult::Success();
}

LedgerResult SponsorPool::Contribute(LedgerStateCache& cache, const uint160& caller, CAmount amount) const
{
    Sponsor sponsor;
    if (!cache.GetSponsor(caller, sponsor) || !sponsor.active) {
        return LedgerResult::Failure(LedgerError::SPONSOR_NOT_FOUND,
            strprintf("%s is not an active sponsor", ShortPrincipal(caller)));
    }

    if (amount <= 0) {
        return LedgerResult::Failure(LedgerError::INVALID_AMOUNT,
            "Contribution must be greater than zero");
    }
    if (!MoneyRange(amount)) {
        return LedgerResult::Failure(LedgerError::INVALID_AMOUNT,
            "Contribution out of range");
    }

    if (!MoneyRange(sponsor.totalContributed + amount) || !MoneyRange(sponsor.availableBalance + amount)) {
        return LedgerResult::Failure(LedgerError::INVALID_AMOUNT,
            "Contribution would exceed the maximum sponsor balance");
    }

    // Last check: the external transfer cannot be undone
    if (!native_.Transfer(caller, poolPrincipal_, amount)) {
        return LedgerResult::Failure(LedgerError::INSUFFICIENT_BALANCE,
            strprintf("Native transfer of %d from %s failed", amount, ShortPrincipal(caller)));
    }

    sponsor.totalContributed += amount;
    sponsor.availableBalance += amount;
    cache.WriteSponsor(caller, sponsor);

    LogPrint(VLog::SPONSOR, "SponsorPool: %s contributed %d (total %d)\n",
             ShortPrincipal(caller), amount, sponsor.totalContributed);
    return LedgerResult::Success();
}

} // namespace verdant
