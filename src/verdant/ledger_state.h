// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_VERDANT_LEDGER_STATE_H
#define VERDANT_VERDANT_LEDGER_STATE_H

/**
 * @file ledger_state.h
 * @brief Records stored by the reward ledger
 *
 * Every record is a plain value keyed by a principal, an action id or a
 * (submitter, action id) pair. Records never point at each other.
 */

#include <amount.h>
#include <uint256.h>
#include <verdant/ledger_common.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>

namespace verdant {

/**
 * @brief Composite key of an action: (submitter, action id)
 */
struct ActionKey {
    uint160 submitter;
    uint64_t id;

    ActionKey() : id(0) {}
    ActionKey(const uint160& submitter_, uint64_t id_) : submitter(submitter_), id(id_) {}

    bool operator<(const ActionKey& other) const {
        return std::tie(submitter, id) < std::tie(other.submitter, other.id);
    }
    bool operator==(const ActionKey& other) const {
        return submitter == other.submitter && id == other.id;
    }
};

/**
 * @brief A submitted environmental action
 *
 * Created pending; flips to verified exactly once; never deleted.
 */
struct Action {
    /** Action id, unique across all submitters */
    uint64_t id;

    /** Principal that submitted the action */
    uint160 submitter;

    /** Action type code (see ActionType) */
    uint32_t actionType;

    /** Logical clock value at submission */
    uint64_t timestamp;

    /** Opaque digest of where the action took place */
    uint256 locationHash;

    /** Opaque digest of the submitted evidence */
    uint256 proofHash;

    /** Whether the action has been verified and rewarded */
    bool verified;

    /** Reward fixed at submission time */
    CAmount rewardAmount;

    Action()
        : id(0)
        , actionType(0)
        , timestamp(0)
        , verified(false)
        , rewardAmount(0)
    {}

    bool operator==(const Action& other) const {
        return id == other.id &&
               submitter == other.submitter &&
               actionType == other.actionType &&
               timestamp == other.timestamp &&
               locationHash == other.locationHash &&
               proofHash == other.proofHash &&
               verified == other.verified &&
               rewardAmount == other.rewardAmount;
    }

    bool operator!=(const Action& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Outstanding verification work for one action
 */
struct PendingVerification {
    uint64_t actionId;

    /** Reserved for verifier assignment; no flow populates it */
    std::optional<uint160> verifier;

    /** Logical clock value at submission */
    uint64_t submittedAt;

    PendingVerification() : actionId(0), submittedAt(0) {}

    bool operator==(const PendingVerification& other) const {
        return actionId == other.actionId &&
               verifier == other.verifier &&
               submittedAt == other.submittedAt;
    }
};

/**
 * @brief Derived counters for one user
 *
 * Absent users read as all-zero. Only verification mutates it.
 */
struct UserStats {
    uint64_t totalActions;
    uint64_t cleanupActions;
    uint64_t recyclingActions;
    uint64_t energyActions;
    uint64_t biodiversityActions;
    CAmount totalTokensEarned;
    uint64_t reputationScore;

    UserStats()
        : totalActions(0)
        , cleanupActions(0)
        , recyclingActions(0)
        , energyActions(0)
        , biodiversityActions(0)
        , totalTokensEarned(0)
        , reputationScore(0)
    {}

    bool operator==(const UserStats& other) const {
        return totalActions == other.totalActions &&
               cleanupActions == other.cleanupActions &&
               recyclingActions == other.recyclingActions &&
               energyActions == other.energyActions &&
               biodiversityActions == other.biodiversityActions &&
               totalTokensEarned == other.totalTokensEarned &&
               reputationScore == other.reputationScore;
    }

    bool operator!=(const UserStats& other) const {
        return !(*this == other);
    }
};

/**
 * @brief A registered corporate sponsor
 */
struct Sponsor {
    std::string name;
    CAmount totalContributed;
    CAmount availableBalance;
    bool active;

    Sponsor() : totalContributed(0), availableBalance(0), active(false) {}

    bool operator==(const Sponsor& other) const {
        return name == other.name &&
               totalContributed == other.totalContributed &&
               availableBalance == other.availableBalance &&
               active == other.active;
    }
};

/**
 * @brief Singleton record with the ledger-wide counters
 */
struct LedgerGlobals {
    /** Next action id to hand out; strictly increasing */
    uint64_t nextActionId;

    /** Number of actions with verified == true */
    uint64_t totalActionsCompleted;

    /** Registry gate; submissions fail while false */
    bool contractEnabled;

    /** Sum of all balances */
    CAmount totalSupply;

    /** Sum of all successful mints */
    CAmount totalMinted;

    /** Token metadata URI, owner-mutable */
    std::optional<std::string> tokenUri;

    LedgerGlobals()
        : nextActionId(FIRST_ACTION_ID)
        , totalActionsCompleted(0)
        , contractEnabled(true)
        , totalSupply(0)
        , totalMinted(0)
    {}

    bool operator==(const LedgerGlobals& other) const {
        return nextActionId == other.nextActionId &&
               totalActionsCompleted == other.totalActionsCompleted &&
               contractEnabled == other.contractEnabled &&
               totalSupply == other.totalSupply &&
               totalMinted == other.totalMinted &&
               tokenUri == other.tokenUri;
    }
};

} // namespace verdant

#endif // VERDANT_VERDANT_LEDGER_STATE_H
