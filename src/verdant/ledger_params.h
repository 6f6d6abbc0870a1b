// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_VERDANT_LEDGER_PARAMS_H
#define VERDANT_VERDANT_LEDGER_PARAMS_H

/**
 * @file ledger_params.h
 * @brief Network-specific defaults for the reward ledger
 *
 * Every value here can be overridden from the command line or the
 * config file (see ledger_config.h).
 */

#include <uint256.h>
#include <verdant/token_ledger.h>

#include <string>

namespace verdant {

struct LedgerParams {
    /** Network name ("main", "test" or "regtest") */
    std::string networkId;

    /** Token metadata used when no -token* option is given */
    TokenConfig token;

    /** Principal that deploys the ledger when -owner is not given */
    uint160 defaultOwner;

    /** Principal receiving sponsor contributions when -pool is not given */
    uint160 sponsorPool;

    /** Whether a fresh ledger accepts submissions */
    bool startEnabled;

    /** Whether verification goes through the stored verifier set by default */
    bool useVerifierSet;
};

const LedgerParams& MainLedgerParams();
const LedgerParams& TestLedgerParams();
const LedgerParams& RegtestLedgerParams();

/** Currently selected params (main until SelectLedgerParams is called) */
const LedgerParams& GetLedgerParams();

/**
 * Select the params of a network.
 * @return false and keep the current selection for an unknown name
 */
bool SelectLedgerParams(const std::string& network);

} // namespace verdant

#endif // VERDANT_VERDANT_LEDGER_PARAMS_H
