// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * help text helpers.
 */
#ifndef VERDANT_UTIL_SYSTEM_H
#define VERDANT_UTIL_SYSTEM_H

#include <fs.h>
#include <sync.h>

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

extern const char * const VERDANT_CONF_FILENAME;

/** Chain name strings accepted by -chain= */
namespace CBaseChainParams {
extern const std::string MAIN;
extern const std::string TESTNET;
extern const std::string REGTEST;
}

class ArgsManager
{
protected:
    mutable CCriticalSection cs_args;
    std::map<std::string, std::string> mapArgs;
    std::map<std::string, std::vector<std::string>> mapMultiArgs;

public:
    /**
     * Parse "-name=value" style command-line arguments.
     * @return false and set error if an argument is not an option
     */
    bool ParseParameters(int argc, const char* const argv[], std::string& error);

    /**
     * Read "name=value" lines from a configuration file. Command-line values
     * take precedence over file values for single-valued options.
     * @return false and set error if the file exists but cannot be parsed
     */
    bool ReadConfigFile(const fs::path& path, std::string& error);

    /**
     * Return a vector of strings of the given argument
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return command-line arguments
     */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    /**
     * Return true if the given argument has been manually set
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return true if the argument has been set
     */
    bool IsArgSet(const std::string& strArg) const;

    /**
     * Return string argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param strDefault (e.g. "1")
     * @return command-line argument or default value
     */
    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;

    /**
     * Return integer argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param nDefault (e.g. 1)
     * @return command-line argument (0 if invalid number) or default value
     */
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;

    /**
     * Return boolean argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param fDefault (true or false)
     * @return command-line argument or default value
     */
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /**
     * Set an argument if it doesn't already have a value
     *
     * @param strArg Argument to set (e.g. "-foo")
     * @param strValue Value (e.g. "1")
     * @return true if argument gets set, false if it already had a value
     */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    /**
     * Set a boolean argument if it doesn't already have a value
     *
     * @param strArg Argument to set (e.g. "-foo")
     * @param fValue Value (e.g. false)
     * @return true if argument gets set, false if it already had a value
     */
    bool SoftSetBoolArg(const std::string& strArg, bool fValue);

    // Forces an arg setting. Called by SoftSetArg() if the arg hasn't already
    // been set. Also called directly in testing.
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    /** Drop every parsed argument */
    void ClearArgs();

    /**
     * Looks for -chain=<name>.
     * @return CBaseChainParams::MAIN by default
     */
    std::string GetChainName() const;
};

extern ArgsManager gArgs;

/**
 * Format a string to be used as group of options in help messages
 *
 * @param message Group name (e.g. "Ledger options:")
 * @return the formatted string
 */
std::string HelpMessageGroup(const std::string& message);

/**
 * Format a string to be used as option description in help messages
 *
 * @param option Option message (e.g. "-owner=<hex>")
 * @param message Option description (e.g. "Contract owner principal")
 * @return the formatted string
 */
std::string HelpMessageOpt(const std::string& option, const std::string& message);

/** Configure g_logger from -debug, -printtoconsole, -logtimestamps and -debuglogfile */
bool InitLogging(std::string& error);

#endif // VERDANT_UTIL_SYSTEM_H
