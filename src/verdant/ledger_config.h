// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_VERDANT_LEDGER_CONFIG_H
#define VERDANT_VERDANT_LEDGER_CONFIG_H

/**
 * @file ledger_config.h
 * @brief Reward ledger configuration from command-line arguments
 */

#include <uint256.h>
#include <verdant/token_ledger.h>

#include <string>
#include <vector>

class ArgsManager;

namespace verdant {

static const bool DEFAULT_LEDGER_DISABLED = false;

/**
 * @brief Everything needed to deploy a ledger
 */
struct LedgerConfig {
    /** Deploying principal; owner-only operations check against it */
    uint160 owner;

    TokenConfig token;

    /** Destination of sponsor contributions */
    uint160 sponsorPool;

    /** Principals seeded into the verifier set */
    std::vector<uint160> verifiers;

    /** Verify through the verifier set instead of the owner alone */
    bool useVerifierSet = false;

    /** Whether submissions are accepted right after deployment */
    bool startEnabled = true;
};

/** Parse a 40-digit hex principal; false on any other input */
bool ParsePrincipal(const std::string& str, uint160& principal);

/**
 * Get ledger help message for command-line options
 * @return Help message string
 */
std::string GetLedgerHelpMessage();

/**
 * Build a ledger configuration from args and the selected network params.
 * Selects the network params named by -chain as a side effect.
 * @param[out] config Configuration on success
 * @param[out] error Reason on failure
 * @return true if every option was valid
 */
bool InitLedgerConfig(const ArgsManager& args, LedgerConfig& config, std::string& error);

} // namespace verdant

#endif // VERDANT_VERDANT_LEDGER_CONFIG_H
