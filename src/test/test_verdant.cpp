// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <test/test_verdant.h>

#include <logging.h>
#include <util/system.h>
#include <verdant/ledger_params.h>

std::mt19937_64 g_insecure_rand_ctx;

void SeedInsecureRand(uint64_t seed)
{
    g_insecure_rand_ctx.seed(seed);
}

uint160 InsecureRandPrincipal()
{
    uint160 principal;
    for (unsigned char* it = principal.begin(); it != principal.end(); ++it) {
        *it = static_cast<unsigned char>(InsecureRandRange(256));
    }
    return principal;
}

uint256 InsecureRand256()
{
    uint256 digest;
    for (unsigned char* it = digest.begin(); it != digest.end(); ++it) {
        *it = static_cast<unsigned char>(InsecureRandRange(256));
    }
    return digest;
}

uint160 TestPrincipal(unsigned char n)
{
    uint160 principal;
    *principal.begin() = n;
    return principal;
}

BasicTestingSetup::BasicTestingSetup()
{
    SeedInsecureRand();
    gArgs.ClearArgs();
    verdant::SelectLedgerParams(CBaseChainParams::REGTEST);
    g_logger->m_print_to_console = false;
    g_logger->m_print_to_file = false;
    g_logger->EnableCategory(VLog::ALL);
}

BasicTestingSetup::~BasicTestingSetup()
{
    gArgs.ClearArgs();
    g_logger->DisableCategory(VLog::ALL);
    verdant::SelectLedgerParams(CBaseChainParams::MAIN);
}

verdant::LedgerConfig TestLedgerConfig()
{
    const verdant::LedgerParams& params = verdant::RegtestLedgerParams();

    verdant::LedgerConfig config;
    config.owner = TestPrincipal(1);
    config.token = params.token;
    config.sponsorPool = TestPrincipal(0xff);
    config.useVerifierSet = false;
    config.startEnabled = true;
    return config;
}
