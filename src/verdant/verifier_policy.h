// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_VERDANT_VERIFIER_POLICY_H
#define VERDANT_VERDANT_VERIFIER_POLICY_H

/**
 * @file verifier_policy.h
 * @brief Who may confirm a pending action
 *
 * OwnerVerifierPolicy admits the contract owner alone. VerifierSetPolicy
 * also admits every principal in the stored verifier set, which the owner
 * manages through the ledger.
 */

#include <uint256.h>
#include <verdant/state_view.h>

#include <string>

namespace verdant {

class VerifierPolicy {
public:
    virtual ~VerifierPolicy() = default;

    /** Whether caller may verify actions against the given state */
    virtual bool IsAuthorized(const LedgerStateView& view, const uint160& caller) const = 0;

    /** Short name for logs and JSON */
    virtual std::string GetName() const = 0;
};

class OwnerVerifierPolicy : public VerifierPolicy {
public:
    explicit OwnerVerifierPolicy(const uint160& owner) : owner_(owner) {}

    bool IsAuthorized(const LedgerStateView& view, const uint160& caller) const override;
    std::string GetName() const override { return "owner"; }

private:
    uint160 owner_;
};

class VerifierSetPolicy : public VerifierPolicy {
public:
    explicit VerifierSetPolicy(const uint160& owner) : owner_(owner) {}

    bool IsAuthorized(const LedgerStateView& view, const uint160& caller) const override;
    std::string GetName() const override { return "verifier-set"; }

private:
    uint160 owner_;
};

} // namespace verdant

#endif // VERDANT_VERDANT_VERIFIER_POLICY_H
