// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <replay.h>

#include <core_io.h>
#include <univalue.h>
#include <util/format.h>
#include <utilstrencodings.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <cstdlib>
#include <optional>

ReplayContext::ReplayContext(const verdant::LedgerConfig& config)
    : config_(config)
    , ledger_(config, store_, native_, clock_)
{
}

bool ReplayContext::Init()
{
    return ledger_.ApplyGenesis();
}

uint160 ReplayContext::ParsePrincipalArg(const std::string& str) const
{
    if (str == "owner") return config_.owner;
    if (str == "pool") return config_.sponsorPool;

    uint160 principal;
    if (!verdant::ParsePrincipal(str, principal)) {
        throw ScriptError(strprintf("invalid principal '%s'", str));
    }
    return principal;
}

uint256 ReplayContext::ParseDigestArg(const std::string& str)
{
    uint256 digest;
    if (str.size() != 2 * digest.size() || !IsHex(str)) {
        throw ScriptError(strprintf("invalid digest '%s'", str));
    }
    digest.SetHex(str);
    return digest;
}

CAmount ReplayContext::ParseAmountArg(const std::string& str)
{
    int64_t amount;
    if (!ParseInt64(str, &amount)) {
        throw ScriptError(strprintf("invalid amount '%s'", str));
    }
    return amount;
}

uint64_t ReplayContext::ParseIdArg(const std::string& str)
{
    int64_t id;
    if (!ParseInt64(str, &id) || id < 0) {
        throw ScriptError(strprintf("invalid id '%s'", str));
    }
    return static_cast<uint64_t>(id);
}

void ReplayContext::CheckArgCount(const std::vector<std::string>& args, size_t min, size_t max)
{
    const size_t count = args.size() - 1;
    if (count < min || count > max) {
        throw ScriptError(strprintf("%s takes %u to %u arguments, got %u", args[0], min, max, count));
    }
}

UniValue ReplayContext::Execute(const std::vector<std::string>& args)
{
    if (args.empty()) {
        throw ScriptError("empty command");
    }
    const std::string& command = args[0];

    if (command == "submit") {
        CheckArgCount(args, 4, 4);
        uint32_t actionType;
        if (!ParseUInt32(args[2], &actionType)) {
            throw ScriptError(strprintf("invalid action type '%s'", args[2]));
        }
        return SubmitResultToUniv(ledger_.SubmitAction(ParsePrincipalArg(args[1]), actionType,
                                                       ParseDigestArg(args[3]), ParseDigestArg(args[4])));
    } else if (command == "verify") {
        CheckArgCount(args, 3, 3);
        return LedgerResultToUniv(ledger_.VerifyAction(ParsePrincipalArg(args[1]), ParsePrincipalArg(args[2]),
                                                       ParseIdArg(args[3])));
    } else if (command == "transfer") {
        CheckArgCount(args, 4, 5);
        std::optional<std::string> memo;
        if (args.size() > 5) memo = args[5];
        return LedgerResultToUniv(ledger_.Transfer(ParsePrincipalArg(args[1]), ParseAmountArg(args[2]),
                                                   ParsePrincipalArg(args[3]), ParsePrincipalArg(args[4]), memo));
    } else if (command == "trade") {
        CheckArgCount(args, 3, 3);
        return LedgerResultToUniv(ledger_.TradeTokens(ParsePrincipalArg(args[1]), ParseAmountArg(args[2]),
                                                      ParsePrincipalArg(args[3])));
    } else if (command == "approve") {
        CheckArgCount(args, 2, 2);
        return LedgerResultToUniv(ledger_.ApproveDelegate(ParsePrincipalArg(args[1]), ParsePrincipalArg(args[2])));
    } else if (command == "revoke") {
        CheckArgCount(args, 2, 2);
        return LedgerResultToUniv(ledger_.RevokeDelegate(ParsePrincipalArg(args[1]), ParsePrincipalArg(args[2])));
    } else if (command == "register") {
        if (args.size() < 3) {
            throw ScriptError("register takes a caller and a name");
        }
        std::string name = args[2];
        for (size_t i = 3; i < args.size(); ++i) {
            name += " " + args[i];
        }
        return LedgerResultToUniv(ledger_.RegisterSponsor(ParsePrincipalArg(args[1]), name));
    } else if (command == "contribute") {
        CheckArgCount(args, 2, 2);
        return LedgerResultToUniv(ledger_.SponsorContribute(ParsePrincipalArg(args[1]), ParseAmountArg(args[2])));
    } else if (command == "toggle") {
        CheckArgCount(args, 2, 2);
        bool enabled;
        if (args[2] == "on" || args[2] == "1") {
            enabled = true;
        } else if (args[2] == "off" || args[2] == "0") {
            enabled = false;
        } else {
            throw ScriptError(strprintf("invalid switch '%s'", args[2]));
        }
        return LedgerResultToUniv(ledger_.ToggleContract(ParsePrincipalArg(args[1]), enabled));
    } else if (command == "seturi") {
        CheckArgCount(args, 1, 2);
        std::optional<std::string> uri;
        if (args.size() > 2) uri = args[2];
        return LedgerResultToUniv(ledger_.UpdateTokenUri(ParsePrincipalArg(args[1]), uri));
    } else if (command == "addverifier") {
        CheckArgCount(args, 2, 2);
        return LedgerResultToUniv(ledger_.AddVerifier(ParsePrincipalArg(args[1]), ParsePrincipalArg(args[2])));
    } else if (command == "removeverifier") {
        CheckArgCount(args, 2, 2);
        return LedgerResultToUniv(ledger_.RemoveVerifier(ParsePrincipalArg(args[1]), ParsePrincipalArg(args[2])));
    } else if (command == "fund") {
        CheckArgCount(args, 2, 2);
        const uint160 principal = ParsePrincipalArg(args[1]);
        UniValue result(UniValue::VOBJ);
        result.pushKV("success", native_.Credit(principal, ParseAmountArg(args[2])));
        result.pushKV("nativeBalance", native_.GetBalance(principal));
        return result;
    } else if (command == "action") {
        CheckArgCount(args, 2, 2);
        std::optional<verdant::Action> action = ledger_.GetUserAction(ParsePrincipalArg(args[1]), ParseIdArg(args[2]));
        return action ? ActionToUniv(*action) : NullUniValue;
    } else if (command == "stats") {
        CheckArgCount(args, 1, 1);
        const uint160 user = ParsePrincipalArg(args[1]);
        return UserStatsToUniv(user, ledger_.GetUserStats(user));
    } else if (command == "sponsor") {
        CheckArgCount(args, 1, 1);
        const uint160 principal = ParsePrincipalArg(args[1]);
        std::optional<verdant::Sponsor> sponsor = ledger_.GetSponsorInfo(principal);
        return sponsor ? SponsorToUniv(principal, *sponsor) : NullUniValue;
    } else if (command == "pending") {
        CheckArgCount(args, 0, 0);
        return PendingListToUniv(ledger_.ListPendingVerifications());
    } else if (command == "balance") {
        CheckArgCount(args, 1, 1);
        const uint160 principal = ParsePrincipalArg(args[1]);
        UniValue result(UniValue::VOBJ);
        result.pushKV("principal", PrincipalToHex(principal));
        result.pushKV("balance", ledger_.GetBalance(principal));
        return result;
    } else if (command == "totals") {
        CheckArgCount(args, 0, 0);
        return TotalsToUniv(ledger_.GetTotals());
    } else if (command == "token") {
        CheckArgCount(args, 0, 0);
        return TokenInfoToUniv(ledger_.GetTokenInfo());
    }

    throw ScriptError(strprintf("unknown command '%s'", command));
}

int ReplayScript(ReplayContext& context, std::istream& input, std::ostream& output, std::string& error)
{
    std::string line;
    int lineNumber = 0;
    while (std::getline(input, line)) {
        ++lineNumber;
        line = TrimString(line);
        if (line.empty() || line[0] == DEFAULT_COMMENT_CHAR) {
            continue;
        }

        std::vector<std::string> args;
        boost::split(args, line, boost::is_any_of(" \t"), boost::token_compress_on);

        UniValue entry(UniValue::VOBJ);
        entry.pushKV("line", (int64_t)lineNumber);
        entry.pushKV("command", args[0]);
        try {
            entry.pushKV("result", context.Execute(args));
        } catch (const ScriptError& e) {
            error = strprintf("line %d: %s", lineNumber, e.what());
            return EXIT_FAILURE;
        }
        output << entry.write() << std::endl;
    }
    return EXIT_SUCCESS;
}
