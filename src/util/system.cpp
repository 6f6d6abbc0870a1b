// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <util/system.h>

#include <logging.h>
#include <utilstrencodings.h>

const char * const VERDANT_CONF_FILENAME = "verdant.conf";

namespace CBaseChainParams {
const std::string MAIN = "main";
const std::string TESTNET = "test";
const std::string REGTEST = "regtest";
}

ArgsManager gArgs;

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue) != 0);
}

/** Turn -noX into -X=0 */
static void InterpretNegativeSetting(std::string& strKey, std::string& strValue)
{
    if (strKey.length()>3 && strKey[0]=='-' && strKey[1]=='n' && strKey[2]=='o')
    {
        strKey = "-" + strKey.substr(3);
        strValue = InterpretBool(strValue) ? "0" : "1";
    }
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    LOCK(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();

    for (int i = 1; i < argc; i++)
    {
        std::string str(argv[i]);
        std::string strValue;
        size_t is_index = str.find('=');
        if (is_index != std::string::npos)
        {
            strValue = str.substr(is_index+1);
            str = str.substr(0, is_index);
        }

        if (str.empty() || str[0] != '-') {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        // Interpret --foo as -foo.
        // If both --foo and -foo are set, the last takes effect.
        if (str.length() > 1 && str[1] == '-')
            str = str.substr(1);
        InterpretNegativeSetting(str, strValue);

        mapArgs[str] = strValue;
        mapMultiArgs[str].push_back(strValue);
    }
    return true;
}

bool ArgsManager::ReadConfigFile(const fs::path& path, std::string& error)
{
    fs::ifstream streamConfig(path);
    if (!streamConfig.good()) {
        // A missing file is not an error, the defaults stay in force.
        return true;
    }

    LOCK(cs_args);
    std::string line;
    int lineno = 0;
    while (std::getline(streamConfig, line)) {
        ++lineno;
        size_t comment = line.find('#');
        if (comment != std::string::npos) {
            line = line.substr(0, comment);
        }
        line = TrimString(line);
        if (line.empty()) {
            continue;
        }
        size_t is_index = line.find('=');
        if (is_index == std::string::npos) {
            error = strprintf("parse error on line %i of %s: %s", lineno, path.string(), line);
            return false;
        }
        std::string strKey = "-" + TrimString(line.substr(0, is_index));
        std::string strValue = TrimString(line.substr(is_index + 1));
        InterpretNegativeSetting(strKey, strValue);
        if (mapArgs.count(strKey) == 0) {
            mapArgs[strKey] = strValue;
        }
        mapMultiArgs[strKey].push_back(strValue);
    }
    return true;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    auto it = mapMultiArgs.find(strArg);
    if (it != mapMultiArgs.end()) return it->second;
    return {};
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    LOCK(cs_args);
    return mapArgs.count(strArg);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return it->second;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return atoi64(it->second);
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    LOCK(cs_args);
    auto it = mapArgs.find(strArg);
    if (it != mapArgs.end()) return InterpretBool(it->second);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (IsArgSet(strArg)) return false;
    ForceSetArg(strArg, strValue);
    return true;
}

bool ArgsManager::SoftSetBoolArg(const std::string& strArg, bool fValue)
{
    if (fValue)
        return SoftSetArg(strArg, std::string("1"));
    else
        return SoftSetArg(strArg, std::string("0"));
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    mapArgs[strArg] = strValue;
    mapMultiArgs[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();
}

std::string ArgsManager::GetChainName() const
{
    return GetArg("-chain", CBaseChainParams::MAIN);
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string &message) {
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string &option, const std::string &message) {
    std::string out = std::string(optIndent,' ') + std::string(option) + std::string("\n");
    // Wrap the description on word boundaries
    std::string line = std::string(msgIndent,' ');
    size_t pos = 0;
    while (pos < message.size()) {
        size_t next = message.find(' ', pos);
        if (next == std::string::npos) next = message.size();
        std::string word = message.substr(pos, next - pos);
        if (line.size() > (size_t)msgIndent && line.size() + word.size() + 1 > (size_t)screenWidth) {
            out += line + "\n";
            line = std::string(msgIndent,' ');
        }
        if (line.size() > (size_t)msgIndent) line += ' ';
        line += word;
        pos = next + 1;
    }
    out += line + "\n\n";
    return out;
}

bool InitLogging(std::string& error)
{
    g_logger->m_print_to_console = gArgs.GetBoolArg("-printtoconsole", DEFAULT_PRINTTOCONSOLE);
    g_logger->m_log_timestamps = gArgs.GetBoolArg("-logtimestamps", DEFAULT_LOGTIMESTAMPS);

    if (gArgs.IsArgSet("-debuglogfile")) {
        g_logger->m_file_path = gArgs.GetArg("-debuglogfile", DEFAULT_DEBUGLOGFILE);
        g_logger->m_print_to_file = !g_logger->m_file_path.empty();
        if (g_logger->m_print_to_file && !g_logger->OpenDebugLog()) {
            error = strprintf("Could not open debug log file %s", g_logger->m_file_path);
            return false;
        }
    }

    for (const std::string& cat : gArgs.GetArgs("-debug")) {
        if (!g_logger->EnableCategory(cat)) {
            error = strprintf("Unsupported logging category -debug=%s. Valid categories: %s", cat, ListLogCategories());
            return false;
        }
    }
    for (const std::string& cat : gArgs.GetArgs("-debugexclude")) {
        if (!g_logger->DisableCategory(cat)) {
            error = strprintf("Unsupported logging category -debugexclude=%s. Valid categories: %s", cat, ListLogCategories());
            return false;
        }
    }
    return true;
}
