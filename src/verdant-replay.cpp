// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <fs.h>
#include <logging.h>
#include <replay.h>
#include <util/format.h>
#include <util/system.h>
#include <verdant/ledger_config.h>

#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

static std::string HelpMessage()
{
    std::string strUsage = "verdant-replay: apply a ledger script and print one JSON result per operation\n\n"
                           "Usage:  verdant-replay [options] < script\n\n";

    strUsage += HelpMessageGroup("Options:");
    strUsage += HelpMessageOpt("-?", "This help message");
    strUsage += HelpMessageOpt("-conf=<file>", strprintf("Read options from <file> (default: %s if present)", VERDANT_CONF_FILENAME));
    strUsage += HelpMessageOpt("-script=<file>", "Read the script from <file> instead of standard input");
    strUsage += HelpMessageOpt("-printtoconsole", "Send log output to standard error");
    strUsage += HelpMessageOpt("-debuglogfile=<file>", strprintf("Write log output to <file> (default: %s when set without a value)", DEFAULT_DEBUGLOGFILE));
    strUsage += HelpMessageOpt("-logtimestamps", strprintf("Prepend log output with a timestamp (default: %u)", DEFAULT_LOGTIMESTAMPS));
    strUsage += HelpMessageOpt("-debug=<category>", strprintf("Log <category> messages: %s", ListLogCategories()));
    strUsage += HelpMessageOpt("-debugexclude=<category>", "Exclude <category> messages");
    strUsage += verdant::GetLedgerHelpMessage();

    strUsage += HelpMessageGroup("Script commands (one per line, principals as 40 hex digits or owner/pool):");
    strUsage += HelpMessageOpt("submit CALLER TYPE LOCATION PROOF", "Submit an action; LOCATION and PROOF are 64 hex digits");
    strUsage += HelpMessageOpt("verify CALLER USER ID", "Verify USER's action ID");
    strUsage += HelpMessageOpt("transfer CALLER AMOUNT FROM TO [MEMO]", "Move tokens from FROM to TO");
    strUsage += HelpMessageOpt("trade CALLER AMOUNT TO", "Move CALLER's tokens to TO");
    strUsage += HelpMessageOpt("approve CALLER DELEGATE", "Let DELEGATE move CALLER's tokens");
    strUsage += HelpMessageOpt("revoke CALLER DELEGATE", "Withdraw a delegate");
    strUsage += HelpMessageOpt("register CALLER NAME", "Register CALLER as sponsor NAME");
    strUsage += HelpMessageOpt("contribute CALLER AMOUNT", "Contribute native value to the sponsor pool");
    strUsage += HelpMessageOpt("toggle CALLER on|off", "Open or close the registry");
    strUsage += HelpMessageOpt("seturi CALLER [URI]", "Replace or clear the token URI");
    strUsage += HelpMessageOpt("addverifier CALLER PRINCIPAL", "Admit PRINCIPAL to the verifier set");
    strUsage += HelpMessageOpt("removeverifier CALLER PRINCIPAL", "Remove PRINCIPAL from the verifier set");
    strUsage += HelpMessageOpt("fund PRINCIPAL AMOUNT", "Credit native value to PRINCIPAL");
    strUsage += HelpMessageOpt("action USER ID | stats USER | sponsor PRINCIPAL", "Query records");
    strUsage += HelpMessageOpt("balance PRINCIPAL | pending | totals | token", "Query the ledger");

    return strUsage;
}

static int AppInitReplay(int argc, char* argv[], verdant::LedgerConfig& config)
{
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    if (gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        fprintf(stdout, "%s", HelpMessage().c_str());
        return EXIT_SUCCESS;
    }

    if (!gArgs.ReadConfigFile(fs::path(gArgs.GetArg("-conf", VERDANT_CONF_FILENAME)), error)) {
        fprintf(stderr, "Error reading configuration file: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    if (!InitLogging(error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    if (!verdant::InitLedgerConfig(gArgs, config, error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    // Continue
    return -1;
}

int main(int argc, char* argv[])
{
    verdant::LedgerConfig config;
    int ret = AppInitReplay(argc, argv, config);
    if (ret != -1) {
        return ret;
    }

    ReplayContext context(config);
    if (!context.Init()) {
        fprintf(stderr, "Error: could not deploy the ledger\n");
        return EXIT_FAILURE;
    }

    std::string error;
    try {
        if (gArgs.IsArgSet("-script")) {
            const std::string path = gArgs.GetArg("-script", "");
            fs::ifstream file(path);
            if (!file.good()) {
                fprintf(stderr, "Error: could not open script %s\n", path.c_str());
                return EXIT_FAILURE;
            }
            ret = ReplayScript(context, file, std::cout, error);
        } else {
            ret = ReplayScript(context, std::cin, std::cout, error);
        }
        if (ret != EXIT_SUCCESS) {
            fprintf(stderr, "error: %s\n", error.c_str());
        }
    } catch (const std::exception& e) {
        fprintf(stderr, "error: %s\n", e.what());
        ret = EXIT_FAILURE;
    }

    g_logger->CloseDebugLog();
    return ret;
}
