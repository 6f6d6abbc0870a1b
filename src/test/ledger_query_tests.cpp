// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verdant/ledger_query.h>
#include <verdant/logical_clock.h>
#include <verdant/state_view.h>
#include <verdant/token_ledger.h>
#include <test/test_verdant.h>

#include <boost/test/unit_test.hpp>

using namespace verdant;

BOOST_FIXTURE_TEST_SUITE(ledger_query_tests, BasicTestingSetup)

BOOST_AUTO_TEST_CASE(absent_records)
{
    MemoryLedgerStore store;
    TokenLedger token(TokenConfig(), TestPrincipal(1));
    CounterClock clock;
    LedgerQuery query(store, token, clock);

    BOOST_CHECK(!query.GetUserAction(TestPrincipal(2), 1));
    BOOST_CHECK(!query.GetSponsorInfo(TestPrincipal(2)));
    BOOST_CHECK(!query.GetPendingVerification(1));
    BOOST_CHECK(query.ListPendingVerifications().empty());
    BOOST_CHECK(query.GetUserStats(TestPrincipal(2)) == UserStats());
    BOOST_CHECK_EQUAL(query.GetTotalActions(), 0U);
    BOOST_CHECK(query.GetContractStatus());
    BOOST_CHECK_EQUAL(query.GetBalance(TestPrincipal(2)), 0);
    BOOST_CHECK(!query.IsVerifier(TestPrincipal(1)));
}

BOOST_AUTO_TEST_CASE(totals_and_token_info)
{
    MemoryLedgerStore store;
    TokenLedger token(TokenConfig("Verdant Eco Token", "VERD", 6), TestPrincipal(1));
    CounterClock clock(7);
    {
        LedgerStateCache cache(&store);
        for (uint64_t id = 1; id <= 3; ++id) {
            PendingVerification pending;
            pending.actionId = id;
            pending.submittedAt = id;
            cache.WritePending(pending);
        }
        LedgerGlobals globals = cache.GetGlobals();
        globals.nextActionId = 6;
        globals.totalActionsCompleted = 2;
        globals.totalSupply = 250;
        globals.totalMinted = 250;
        globals.tokenUri = std::string("ipfs://verdant");
        cache.WriteGlobals(globals);
        cache.WriteBalance(TestPrincipal(2), 250);
        BOOST_REQUIRE(cache.Flush());
    }

    LedgerQuery query(store, token, clock);
    LedgerTotals totals = query.GetTotals();
    BOOST_CHECK_EQUAL(totals.nextActionId, 6U);
    BOOST_CHECK_EQUAL(totals.currentTimestamp, 7U);
    BOOST_CHECK_EQUAL(totals.totalActionsCompleted, 2U);
    BOOST_CHECK_EQUAL(totals.totalSupply, 250);
    BOOST_CHECK_EQUAL(totals.pendingCount, 3U);
    BOOST_CHECK(totals.contractEnabled);

    TokenInfo info = query.GetTokenInfo();
    BOOST_CHECK_EQUAL(info.name, "Verdant Eco Token");
    BOOST_CHECK_EQUAL(info.symbol, "VERD");
    BOOST_CHECK_EQUAL(info.decimals, 6);
    BOOST_REQUIRE(info.uri);
    BOOST_CHECK_EQUAL(*info.uri, "ipfs://verdant");
    BOOST_CHECK_EQUAL(info.totalSupply, 250);

    BOOST_CHECK_EQUAL(query.ListPendingVerifications().size(), 3U);
    BOOST_CHECK(query.GetPendingVerification(2));
}

BOOST_AUTO_TEST_SUITE_END()
