// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_VERDANT_STATE_VIEW_H
#define VERDANT_VERDANT_STATE_VIEW_H

/**
 * @file state_view.h
 * @brief Key-value views over the reward ledger state
 *
 * The host supplies an atomic key-value substrate. LedgerStateView is the
 * read interface plus an all-or-nothing BatchWrite; MemoryLedgerStore is
 * the in-process substrate; LedgerStateCache stages the writes of one
 * transition on top of any view and commits them with a single BatchWrite.
 *
 * A transition builds a cache over the store, performs every read and
 * write through it, and calls Flush() only after all preconditions held.
 * Destroying the cache without Flush() leaves the store untouched.
 */

#include <amount.h>
#include <uint256.h>
#include <verdant/ledger_state.h>

#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace verdant {

/**
 * @brief Writes staged by one transition
 *
 * Pending entries mapped to nullopt are erasures. Delegate and verifier
 * entries mapped to false are erasures.
 */
struct LedgerStateDelta {
    std::map<ActionKey, Action> actions;
    std::map<uint64_t, std::optional<PendingVerification>> pending;
    std::map<uint160, UserStats> userStats;
    std::map<uint160, Sponsor> sponsors;
    std::map<uint160, CAmount> balances;
    std::map<std::pair<uint160, uint160>, bool> delegates;
    std::map<uint160, bool> verifiers;
    std::optional<LedgerGlobals> globals;

    bool IsEmpty() const {
        return actions.empty() && pending.empty() && userStats.empty() &&
               sponsors.empty() && balances.empty() && delegates.empty() &&
               verifiers.empty() && !globals.has_value();
    }

    /** Number of staged record writes */
    size_t GetWriteCount() const {
        return actions.size() + pending.size() + userStats.size() + sponsors.size() +
               balances.size() + delegates.size() + verifiers.size() +
               (globals.has_value() ? 1 : 0);
    }

    void Clear() {
        *this = LedgerStateDelta();
    }
};

/**
 * @brief Abstract view of the ledger state
 */
class LedgerStateView {
public:
    virtual ~LedgerStateView() = default;

    /** Retrieve an action; false if absent */
    virtual bool GetAction(const ActionKey& key, Action& action) const = 0;

    /** Retrieve the pending verification of an action id; false if absent */
    virtual bool GetPending(uint64_t actionId, PendingVerification& pending) const = 0;

    /** All outstanding verifications ordered by action id */
    virtual std::vector<PendingVerification> ListPending() const = 0;

    /** Retrieve the stats of a user; false if the user has none */
    virtual bool GetUserStats(const uint160& user, UserStats& stats) const = 0;

    /** Retrieve a sponsor record; false if never registered */
    virtual bool GetSponsor(const uint160& principal, Sponsor& sponsor) const = 0;

    /** Token balance, zero if absent */
    virtual CAmount GetBalance(const uint160& principal) const = 0;

    /** Every non-zero balance */
    virtual std::map<uint160, CAmount> ListBalances() const = 0;

    /** Whether delegate may move owner's tokens */
    virtual bool IsDelegate(const uint160& owner, const uint160& delegate) const = 0;

    /** Whether principal is in the stored verifier set */
    virtual bool IsVerifier(const uint160& principal) const = 0;

    /** The globals record (defaults for a fresh ledger) */
    virtual LedgerGlobals GetGlobals() const = 0;

    /**
     * Apply every write in delta, or none of them.
     *
     * A store may refuse a batch only for an out-of-range balance or total
     * supply. A batch whose balances and supply are in range must apply:
     * sponsor contributions are committed after their native transfer has
     * already happened.
     *
     * @return true if the delta was applied
     */
    virtual bool BatchWrite(const LedgerStateDelta& delta) = 0;
};

/**
 * @brief In-process key-value substrate holding committed state
 */
class MemoryLedgerStore : public LedgerStateView {
public:
    MemoryLedgerStore() = default;

    bool GetAction(const ActionKey& key, Action& action) const override;
    bool GetPending(uint64_t actionId, PendingVerification& pending) const override;
    std::vector<PendingVerification> ListPending() const override;
    bool GetUserStats(const uint160& user, UserStats& stats) const override;
    bool GetSponsor(const uint160& principal, Sponsor& sponsor) const override;
    CAmount GetBalance(const uint160& principal) const override;
    std::map<uint160, CAmount> ListBalances() const override;
    bool IsDelegate(const uint160& owner, const uint160& delegate) const override;
    bool IsVerifier(const uint160& principal) const override;
    LedgerGlobals GetGlobals() const override;
    bool BatchWrite(const LedgerStateDelta& delta) override;

    /** Number of stored actions */
    size_t GetActionCount() const { return actions_.size(); }

    /** Number of committed batches */
    uint64_t GetBatchCount() const { return batchCount_; }

private:
    std::map<ActionKey, Action> actions_;
    std::map<uint64_t, PendingVerification> pending_;
    std::map<uint160, UserStats> userStats_;
    std::map<uint160, Sponsor> sponsors_;
    std::map<uint160, CAmount> balances_;
    std::map<std::pair<uint160, uint160>, bool> delegates_;
    std::map<uint160, bool> verifiers_;
    LedgerGlobals globals_;
    uint64_t batchCount_ = 0;
};

/**
 * @brief Staged overlay committing to a base view in one batch
 */
class LedgerStateCache : public LedgerStateView {
public:
    explicit LedgerStateCache(LedgerStateView* base);

    LedgerStateCache(const LedgerStateCache&) = delete;
    LedgerStateCache& operator=(const LedgerStateCache&) = delete;

    bool GetAction(const ActionKey& key, Action& action) const override;
    bool GetPending(uint64_t actionId, PendingVerification& pending) const override;
    std::vector<PendingVerification> ListPending() const override;
    bool GetUserStats(const uint160& user, UserStats& stats) const override;
    bool GetSponsor(const uint160& principal, Sponsor& sponsor) const override;
    CAmount GetBalance(const uint160& principal) const override;
    std::map<uint160, CAmount> ListBalances() const override;
    bool IsDelegate(const uint160& owner, const uint160& delegate) const override;
    bool IsVerifier(const uint160& principal) const override;
    LedgerGlobals GetGlobals() const override;

    /** Merge a child cache's delta into this cache (nested transitions) */
    bool BatchWrite(const LedgerStateDelta& delta) override;

    void WriteAction(const Action& action);
    void WritePending(const PendingVerification& pending);
    void ErasePending(uint64_t actionId);
    void WriteUserStats(const uint160& user, const UserStats& stats);
    void WriteSponsor(const uint160& principal, const Sponsor& sponsor);
    void WriteBalance(const uint160& principal, CAmount balance);
    void SetDelegate(const uint160& owner, const uint160& delegate, bool authorized);
    void SetVerifier(const uint160& principal, bool authorized);
    void WriteGlobals(const LedgerGlobals& globals);

    /**
     * Commit the staged writes to the base view in one BatchWrite.
     * The overlay is empty afterwards, whether or not the base accepted it.
     * @return true if the base applied the delta
     */
    bool Flush();

    /** Drop every staged write */
    void Discard() { delta_.Clear(); }

    /** Number of staged record writes */
    size_t GetWriteCount() const { return delta_.GetWriteCount(); }


private:
    LedgerStateView* base_;
    LedgerStateDelta delta_;
};

} // namespace verdant

#endif // VERDANT_VERDANT_STATE_VIEW_H
