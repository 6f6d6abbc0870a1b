// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verdant/state_view.h>
#include <test/test_verdant.h>

#include <boost/test/unit_test.hpp>

using namespace verdant;

BOOST_FIXTURE_TEST_SUITE(state_view_tests, BasicTestingSetup)

static Action MakeAction(const uint160& submitter, uint64_t id)
{
    Action action;
    action.id = id;
    action.submitter = submitter;
    action.actionType = 1;
    action.timestamp = id;
    action.locationHash = InsecureRand256();
    action.proofHash = InsecureRand256();
    action.rewardAmount = 100;
    return action;
}

static PendingVerification MakePending(uint64_t id)
{
    PendingVerification pending;
    pending.actionId = id;
    pending.submittedAt = id;
    return pending;
}

BOOST_AUTO_TEST_CASE(fresh_store_defaults)
{
    MemoryLedgerStore store;
    Action action;
    UserStats stats;
    Sponsor sponsor;
    PendingVerification pending;

    BOOST_CHECK(!store.GetAction(ActionKey(TestPrincipal(2), 1), action));
    BOOST_CHECK(!store.GetUserStats(TestPrincipal(2), stats));
    BOOST_CHECK(!store.GetSponsor(TestPrincipal(2), sponsor));
    BOOST_CHECK(!store.GetPending(1, pending));
    BOOST_CHECK_EQUAL(store.GetBalance(TestPrincipal(2)), 0);
    BOOST_CHECK(store.ListPending().empty());
    BOOST_CHECK(store.ListBalances().empty());

    LedgerGlobals globals = store.GetGlobals();
    BOOST_CHECK_EQUAL(globals.nextActionId, FIRST_ACTION_ID);
    BOOST_CHECK(globals.contractEnabled);
    BOOST_CHECK_EQUAL(globals.totalSupply, 0);
    BOOST_CHECK(!globals.tokenUri);
}

BOOST_AUTO_TEST_CASE(cache_reads_through_and_stages)
{
    MemoryLedgerStore store;
    const uint160 user = TestPrincipal(2);

    {
        LedgerStateCache cache(&store);
        cache.WriteAction(MakeAction(user, 1));
        cache.WritePending(MakePending(1));
        cache.WriteBalance(user, 40);
        BOOST_CHECK(cache.Flush());
    }
    BOOST_CHECK_EQUAL(store.GetBatchCount(), 1U);

    LedgerStateCache cache(&store);
    Action action;
    BOOST_CHECK(cache.GetAction(ActionKey(user, 1), action));
    BOOST_CHECK_EQUAL(cache.GetBalance(user), 40);

    cache.WriteBalance(user, 55);
    cache.ErasePending(1);

    // Staged writes are visible in the cache only
    BOOST_CHECK_EQUAL(cache.GetBalance(user), 55);
    BOOST_CHECK_EQUAL(store.GetBalance(user), 40);
    PendingVerification pending;
    BOOST_CHECK(!cache.GetPending(1, pending));
    BOOST_CHECK(store.GetPending(1, pending));
    BOOST_CHECK(cache.ListPending().empty());
    BOOST_CHECK_EQUAL(store.ListPending().size(), 1U);
    BOOST_CHECK_EQUAL(cache.GetWriteCount(), 2U);
}

BOOST_AUTO_TEST_CASE(dropped_cache_leaves_store_untouched)
{
    MemoryLedgerStore store;
    const uint160 user = TestPrincipal(3);
    {
        LedgerStateCache cache(&store);
        cache.WriteAction(MakeAction(user, 1));
        cache.WriteBalance(user, 10);
        LedgerGlobals globals = cache.GetGlobals();
        globals.nextActionId = 2;
        cache.WriteGlobals(globals);
    }

    Action action;
    BOOST_CHECK(!store.GetAction(ActionKey(user, 1), action));
    BOOST_CHECK_EQUAL(store.GetBalance(user), 0);
    BOOST_CHECK_EQUAL(store.GetGlobals().nextActionId, FIRST_ACTION_ID);
    BOOST_CHECK_EQUAL(store.GetBatchCount(), 0U);
}

BOOST_AUTO_TEST_CASE(discard_drops_staged_writes)
{
    MemoryLedgerStore store;
    LedgerStateCache cache(&store);
    cache.WriteBalance(TestPrincipal(4), 5);
    cache.SetVerifier(TestPrincipal(5), true);
    cache.Discard();

    BOOST_CHECK_EQUAL(cache.GetWriteCount(), 0U);
    BOOST_CHECK(cache.Flush());
    BOOST_CHECK_EQUAL(store.GetBatchCount(), 0U);
    BOOST_CHECK(!store.IsVerifier(TestPrincipal(5)));
}

BOOST_AUTO_TEST_CASE(out_of_range_batch_is_rejected_whole)
{
    MemoryLedgerStore store;
    LedgerStateCache cache(&store);
    cache.WriteAction(MakeAction(TestPrincipal(2), 1));
    cache.WriteBalance(TestPrincipal(2), MAX_MONEY + 1);

    BOOST_CHECK(!cache.Flush());
    BOOST_CHECK_EQUAL(store.GetActionCount(), 0U);
    BOOST_CHECK_EQUAL(store.GetBalance(TestPrincipal(2)), 0);
    BOOST_CHECK_EQUAL(cache.GetWriteCount(), 0U);
}

BOOST_AUTO_TEST_CASE(sponsor_only_batch_always_applies)
{
    MemoryLedgerStore store;
    LedgerStateCache cache(&store);

    Sponsor sponsor;
    sponsor.name = "Acme Corp";
    sponsor.totalContributed = MAX_MONEY;
    sponsor.availableBalance = MAX_MONEY;
    sponsor.active = true;
    cache.WriteSponsor(TestPrincipal(4), sponsor);

    BOOST_CHECK(cache.Flush());
    Sponsor stored;
    BOOST_REQUIRE(store.GetSponsor(TestPrincipal(4), stored));
    BOOST_CHECK_EQUAL(stored.totalContributed, MAX_MONEY);
    BOOST_CHECK_EQUAL(store.GetBatchCount(), 1U);
}

BOOST_AUTO_TEST_CASE(zero_balances_and_revocations_are_erased)
{
    MemoryLedgerStore store;
    const uint160 a = TestPrincipal(2);
    const uint160 b = TestPrincipal(3);
    {
        LedgerStateCache cache(&store);
        cache.WriteBalance(a, 7);
        cache.SetDelegate(a, b, true);
        cache.SetVerifier(b, true);
        BOOST_CHECK(cache.Flush());
    }
    BOOST_CHECK(store.IsDelegate(a, b));
    BOOST_CHECK(!store.IsDelegate(b, a));
    BOOST_CHECK(store.IsVerifier(b));
    {
        LedgerStateCache cache(&store);
        cache.WriteBalance(a, 0);
        cache.SetDelegate(a, b, false);
        cache.SetVerifier(b, false);
        BOOST_CHECK(cache.ListBalances().empty());
        BOOST_CHECK(cache.Flush());
    }
    BOOST_CHECK(store.ListBalances().empty());
    BOOST_CHECK(!store.IsDelegate(a, b));
    BOOST_CHECK(!store.IsVerifier(b));
}

BOOST_AUTO_TEST_CASE(nested_cache_merges_into_parent)
{
    MemoryLedgerStore store;
    LedgerStateCache parent(&store);
    parent.WriteBalance(TestPrincipal(2), 1);
    {
        LedgerStateCache child(&parent);
        child.WriteBalance(TestPrincipal(3), 2);
        child.WritePending(MakePending(9));
        BOOST_CHECK(child.Flush());
    }
    BOOST_CHECK_EQUAL(parent.GetBalance(TestPrincipal(3)), 2);
    BOOST_CHECK_EQUAL(parent.ListPending().size(), 1U);
    BOOST_CHECK_EQUAL(store.GetBalance(TestPrincipal(3)), 0);

    BOOST_CHECK(parent.Flush());
    BOOST_CHECK_EQUAL(store.GetBalance(TestPrincipal(2)), 1);
    BOOST_CHECK_EQUAL(store.GetBalance(TestPrincipal(3)), 2);
    BOOST_CHECK_EQUAL(store.GetBatchCount(), 1U);
}

/**
 * Property: pending entries are listed in action id order
 */
BOOST_AUTO_TEST_CASE(pending_listed_in_id_order)
{
    MemoryLedgerStore store;
    LedgerStateCache cache(&store);
    for (int i = 0; i < 50; ++i) {
        cache.WritePending(MakePending(1 + InsecureRandRange(1000)));
    }
    BOOST_CHECK(cache.Flush());

    std::vector<PendingVerification> pending = store.ListPending();
    for (size_t i = 1; i < pending.size(); ++i) {
        BOOST_CHECK(pending[i - 1].actionId < pending[i].actionId);
    }
}

BOOST_AUTO_TEST_SUITE_END()
