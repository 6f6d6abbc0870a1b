// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verdant/ledger_config.h>

#include <logging.h>
#include <util/format.h>
#include <util/system.h>
#include <utilstrencodings.h>
#include <verdant/ledger_params.h>

namespace verdant {

bool ParsePrincipal(const std::string& str, uint160& principal)
{
    std::string hex = str;
    if (hex.size() > 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }
    if (hex.size() != 2 * principal.size() || !IsHex(hex)) {
        return false;
    }
    principal.SetHex(hex);
    return true;
}

std::string GetLedgerHelpMessage()
{
    std::string strUsage;

    strUsage += HelpMessageGroup("Ledger options:");
    strUsage += HelpMessageOpt("-chain=<net>", "Use the defaults of network <net>: main, test or regtest (default: main)");
    strUsage += HelpMessageOpt("-owner=<hex>", "Principal deploying the ledger (default: network owner)");
    strUsage += HelpMessageOpt("-pool=<hex>", "Principal receiving sponsor contributions (default: network pool)");
    strUsage += HelpMessageOpt("-verifier=<hex>", "Admit <hex> to the verifier set and verify through it (can be specified multiple times)");
    strUsage += HelpMessageOpt("-disabled", strprintf("Deploy with submissions disabled (default: %u)", DEFAULT_LEDGER_DISABLED));

    strUsage += HelpMessageGroup("Token options:");
    strUsage += HelpMessageOpt("-tokenname=<name>", strprintf("Token name, %u to %u characters (default: network token)", MIN_TOKEN_NAME_LENGTH, MAX_TOKEN_NAME_LENGTH));
    strUsage += HelpMessageOpt("-tokensymbol=<sym>", strprintf("Token symbol, %u to %u characters (default: network token)", MIN_TOKEN_SYMBOL_LENGTH, MAX_TOKEN_SYMBOL_LENGTH));
    strUsage += HelpMessageOpt("-tokendecimals=<n>", strprintf("Token decimals, at most %u (default: network token)", MAX_TOKEN_DECIMALS));
    strUsage += HelpMessageOpt("-tokenuri=<uri>", strprintf("Initial token metadata URI, at most %u characters (default: none)", MAX_TOKEN_URI_LENGTH));

    return strUsage;
}

bool InitLedgerConfig(const ArgsManager& args, LedgerConfig& config, std::string& error)
{
    const std::string chain = args.GetChainName();
    if (!SelectLedgerParams(chain)) {
        error = strprintf("Unknown chain %s", chain);
        return false;
    }
    const LedgerParams& params = GetLedgerParams();

    LedgerConfig result;
    result.owner = params.defaultOwner;
    result.token = params.token;
    result.sponsorPool = params.sponsorPool;
    result.useVerifierSet = params.useVerifierSet;
    result.startEnabled = params.startEnabled && !args.GetBoolArg("-disabled", DEFAULT_LEDGER_DISABLED);

    if (args.IsArgSet("-owner") && !ParsePrincipal(args.GetArg("-owner", ""), result.owner)) {
        error = strprintf("Invalid -owner principal '%s'", args.GetArg("-owner", ""));
        return false;
    }
    if (args.IsArgSet("-pool") && !ParsePrincipal(args.GetArg("-pool", ""), result.sponsorPool)) {
        error = strprintf("Invalid -pool principal '%s'", args.GetArg("-pool", ""));
        return false;
    }

    for (const std::string& value : args.GetArgs("-verifier")) {
        uint160 verifier;
        if (!ParsePrincipal(value, verifier)) {
            error = strprintf("Invalid -verifier principal '%s'", value);
            return false;
        }
        result.verifiers.push_back(verifier);
        result.useVerifierSet = true;
    }

    result.token.tokenName = args.GetArg("-tokenname", result.token.tokenName);
    if (!TokenConfig::ValidateTokenName(result.token.tokenName)) {
        error = strprintf("Invalid -tokenname '%s'", result.token.tokenName);
        return false;
    }
    result.token.tokenSymbol = args.GetArg("-tokensymbol", result.token.tokenSymbol);
    if (!TokenConfig::ValidateTokenSymbol(result.token.tokenSymbol)) {
        error = strprintf("Invalid -tokensymbol '%s'", result.token.tokenSymbol);
        return false;
    }
    if (args.IsArgSet("-tokendecimals")) {
        const std::string value = args.GetArg("-tokendecimals", "");
        uint32_t decimals;
        if (!ParseUInt32(value, &decimals) || decimals > MAX_TOKEN_DECIMALS) {
            error = strprintf("Invalid -tokendecimals '%s'", value);
            return false;
        }
        result.token.decimals = static_cast<uint8_t>(decimals);
    }
    if (args.IsArgSet("-tokenuri")) {
        const std::string uri = args.GetArg("-tokenuri", "");
        if (!TokenConfig::ValidateTokenUri(uri)) {
            error = strprintf("Invalid -tokenuri, longer than %u characters", MAX_TOKEN_URI_LENGTH);
            return false;
        }
        result.token.initialUri = uri;
    }

    LogPrint(VLog::CONFIG, "Ledger: chain=%s owner=%s pool=%s verifiers=%u policy=%s enabled=%d\n",
             params.networkId, ShortPrincipal(result.owner), ShortPrincipal(result.sponsorPool),
             result.verifiers.size(), result.useVerifierSet ? "verifier-set" : "owner",
             result.startEnabled);
    LogPrint(VLog::CONFIG, "Ledger: token %s (%s), %d decimals\n",
             result.token.tokenName, result.token.tokenSymbol, static_cast<int>(result.token.decimals));

    config = result;
    return true;
}

} // namespace verdant
