// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verdant/ledger_params.h>

#include <util/system.h>

namespace verdant {

static LedgerParams CreateMainParams()
{
    LedgerParams params;
    params.networkId = "main";
    params.token = TokenConfig("Verdant Eco Token", "VERD", 6);
    params.defaultOwner = uint160S("76657264616e742d6f776e65722d6d61696e0001");
    params.sponsorPool = uint160S("76657264616e742d706f6f6c2d6d61696e000001");
    params.startEnabled = true;
    params.useVerifierSet = false;
    return params;
}

// Same token, separate principals
static LedgerParams CreateTestParams()
{
    LedgerParams params;
    params.networkId = "test";
    params.token = TokenConfig("Verdant Eco Token", "VERD", 6);
    params.defaultOwner = uint160S("76657264616e742d6f776e65722d746573740001");
    params.sponsorPool = uint160S("76657264616e742d706f6f6c2d74657374000001");
    params.startEnabled = true;
    params.useVerifierSet = false;
    return params;
}

// Short, predictable principals for scripted runs
static LedgerParams CreateRegtestParams()
{
    LedgerParams params;
    params.networkId = "regtest";
    params.token = TokenConfig("Verdant Regtest Token", "tVERD", 6);
    params.defaultOwner = uint160S("0000000000000000000000000000000000000001");
    params.sponsorPool = uint160S("00000000000000000000000000000000000000ff");
    params.startEnabled = true;
    params.useVerifierSet = false;
    return params;
}

static const LedgerParams mainLedgerParams = CreateMainParams();
static const LedgerParams testLedgerParams = CreateTestParams();
static const LedgerParams regtestLedgerParams = CreateRegtestParams();

// Currently selected ledger params
static const LedgerParams* pCurrentLedgerParams = &mainLedgerParams;

const LedgerParams& MainLedgerParams()
{
    return mainLedgerParams;
}

const LedgerParams& TestLedgerParams()
{
    return testLedgerParams;
}

const LedgerParams& RegtestLedgerParams()
{
    return regtestLedgerParams;
}

const LedgerParams& GetLedgerParams()
{
    return *pCurrentLedgerParams;
}

bool SelectLedgerParams(const std::string& network)
{
    if (network == CBaseChainParams::MAIN) {
        pCurrentLedgerParams = &mainLedgerParams;
    } else if (network == CBaseChainParams::TESTNET) {
        pCurrentLedgerParams = &testLedgerParams;
    } else if (network == CBaseChainParams::REGTEST) {
        pCurrentLedgerParams = &regtestLedgerParams;
    } else {
        return false;
    }
    return true;
}

} // namespace verdant
