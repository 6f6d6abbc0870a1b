// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef VERDANT_REPLAY_H
#define VERDANT_REPLAY_H

#include <amount.h>
#include <uint256.h>
#include <verdant/ledger_config.h>
#include <verdant/logical_clock.h>
#include <verdant/native_transfer.h>
#include <verdant/reward_ledger.h>
#include <verdant/state_view.h>

#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

class UniValue;

static const char DEFAULT_COMMENT_CHAR = '#';

/** A malformed script line */
class ScriptError : public std::runtime_error
{
public:
    explicit ScriptError(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * A fresh ledger over an in-memory store, native balance book and
 * counter clock, driven one script command at a time.
 *
 * Principals are 40 hex digits or the aliases "owner" and "pool".
 */
class ReplayContext
{
public:
    explicit ReplayContext(const verdant::LedgerConfig& config);

    /** Apply the configured genesis state; false if already applied */
    bool Init();

    /**
     * Run one tokenized command.
     * Typed ledger failures are part of the returned result.
     * @throws ScriptError on an unknown command or malformed argument
     */
    UniValue Execute(const std::vector<std::string>& args);

    const verdant::RewardLedger& GetLedger() const { return ledger_; }
    const verdant::NativeBalanceBook& GetNativeBook() const { return native_; }

private:
    uint160 ParsePrincipalArg(const std::string& str) const;
    static uint256 ParseDigestArg(const std::string& str);
    static CAmount ParseAmountArg(const std::string& str);
    static uint64_t ParseIdArg(const std::string& str);
    static void CheckArgCount(const std::vector<std::string>& args, size_t min, size_t max);

    verdant::LedgerConfig config_;
    verdant::MemoryLedgerStore store_;
    verdant::NativeBalanceBook native_;
    verdant::CounterClock clock_;
    verdant::RewardLedger ledger_;
};

/**
 * Replay a script: one command per line, blank lines and lines starting
 * with DEFAULT_COMMENT_CHAR skipped. Writes one JSON object per command
 * to output.
 *
 * @return EXIT_SUCCESS, or EXIT_FAILURE at the first malformed line with
 *         error describing it. Earlier lines stay applied.
 */
int ReplayScript(ReplayContext& context, std::istream& input, std::ostream& output, std::string& error);

#endif // VERDANT_REPLAY_H
