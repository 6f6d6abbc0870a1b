// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verdant/verifier_policy.h>

namespace verdant {

bool OwnerVerifierPolicy::IsAuthorized(const LedgerStateView& /* view */, const uint160& caller) const
{
    return caller == owner_;
}

bool VerifierSetPolicy::IsAuthorized(const LedgerStateView& view, const uint160& caller) const
{
    return caller == owner_ || view.IsVerifier(caller);
}

} // namespace verdant
