// Copyright (c) 2026 The Verdant Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <verdant/ledger_config.h>
#include <verdant/logical_clock.h>
#include <verdant/native_transfer.h>
#include <verdant/reputation_engine.h>
#include <verdant/reward_ledger.h>
#include <verdant/state_view.h>
#include <test/test_verdant.h>

#include <boost/test/unit_test.hpp>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using namespace verdant;

namespace {

/** A deployed ledger over fresh in-memory collaborators */
struct LedgerTestingSetup : public BasicTestingSetup {
    LedgerConfig config;
    MemoryLedgerStore store;
    NativeBalanceBook book;
    CounterClock clock;
    std::unique_ptr<RewardLedger> ledger;

    const uint160 owner = TestPrincipal(1);
    const uint160 alice = TestPrincipal(2);
    const uint160 bob = TestPrincipal(3);
    const uint160 acme = TestPrincipal(4);

    LedgerTestingSetup()
    {
        Deploy(TestLedgerConfig());
    }

    void Deploy(const LedgerConfig& newConfig)
    {
        config = newConfig;
        ledger.reset(new RewardLedger(config, store, book, clock));
        BOOST_REQUIRE(ledger->ApplyGenesis());
    }

    uint64_t SubmitCleanup(const uint160& user)
    {
        SubmitResult result = ledger->SubmitAction(user, static_cast<uint32_t>(ActionType::CLEANUP),
                                                   InsecureRand256(), InsecureRand256());
        BOOST_REQUIRE(result.success);
        return result.actionId;
    }
};

/** Store that refuses every batch while refuse is set */
class RefusingStore : public MemoryLedgerStore {
public:
    bool BatchWrite(const LedgerStateDelta& delta) override
    {
        if (refuse) return false;
        return MemoryLedgerStore::BatchWrite(delta);
    }
    bool refuse = false;
};

} // namespace

BOOST_FIXTURE_TEST_SUITE(reward_ledger_tests, LedgerTestingSetup)

BOOST_AUTO_TEST_CASE(deployment_state)
{
    BOOST_CHECK(ledger->IsGenesisApplied());
    BOOST_CHECK(!ledger->ApplyGenesis());
    BOOST_CHECK(ledger->GetOwner() == owner);
    BOOST_CHECK_EQUAL(ledger->GetPolicyName(), "owner");
    BOOST_CHECK_EQUAL(ledger->GetName(), "Verdant Regtest Token");
    BOOST_CHECK_EQUAL(ledger->GetSymbol(), "tVERD");
    BOOST_CHECK_EQUAL(ledger->GetDecimals(), 6);
    BOOST_CHECK_EQUAL(ledger->GetTotalSupply(), 0);
    BOOST_CHECK(ledger->GetContractStatus());
    BOOST_CHECK_EQUAL(ledger->GetTotalActions(), 0U);
    BOOST_CHECK(ledger->ListPendingVerifications().empty());
    BOOST_CHECK(ledger->VerifySupplyInvariant());
}

/**
 * Submit, verify, re-verify and unauthorized verify, end to end
 */
BOOST_AUTO_TEST_CASE(cleanup_action_lifecycle)
{
    SubmitResult submitted = ledger->SubmitAction(alice, static_cast<uint32_t>(ActionType::CLEANUP),
                                                  InsecureRand256(), InsecureRand256());
    BOOST_REQUIRE(submitted.success);
    BOOST_CHECK_EQUAL(submitted.actionId, 1U);

    std::optional<Action> action = ledger->GetUserAction(alice, 1);
    BOOST_REQUIRE(action);
    BOOST_CHECK_EQUAL(action->rewardAmount, 100);
    BOOST_CHECK(!action->verified);

    std::vector<PendingVerification> pending = ledger->ListPendingVerifications();
    BOOST_REQUIRE_EQUAL(pending.size(), 1U);
    BOOST_CHECK_EQUAL(pending[0].actionId, 1U);
    BOOST_CHECK(ledger->GetPendingVerification(1));

    const uint64_t reputationBefore = ledger->GetUserStats(alice).reputationScore;
    BOOST_CHECK(ledger->VerifyAction(owner, alice, 1).success);
    BOOST_CHECK_EQUAL(ledger->GetBalance(alice), 100);
    BOOST_CHECK_EQUAL(ledger->GetTotalActions(), 1U);
    BOOST_CHECK_EQUAL(ledger->GetUserStats(alice).reputationScore, reputationBefore + 10);
    BOOST_CHECK(!ledger->GetPendingVerification(1));
    BOOST_CHECK(ledger->ListPendingVerifications().empty());
    BOOST_CHECK(ledger->GetUserAction(alice, 1)->verified);

    BOOST_CHECK_EQUAL(ledger->VerifyAction(owner, alice, 1).error, LedgerError::ALREADY_VERIFIED);

    const uint64_t fresh = SubmitCleanup(bob);
    const uint64_t batches = store.GetBatchCount();
    const LedgerTotals totals = ledger->GetTotals();

    LedgerResult rejected = ledger->VerifyAction(alice, bob, fresh);
    BOOST_CHECK(!rejected.success);
    BOOST_CHECK_EQUAL(rejected.error, LedgerError::OWNER_ONLY);
    BOOST_CHECK_EQUAL(store.GetBatchCount(), batches);
    BOOST_CHECK_EQUAL(ledger->GetBalance(bob), 0);
    BOOST_CHECK(ledger->GetPendingVerification(fresh));
    BOOST_CHECK(!ledger->GetUserAction(bob, fresh)->verified);
    BOOST_CHECK_EQUAL(ledger->GetTotals().totalActionsCompleted, totals.totalActionsCompleted);
    BOOST_CHECK_EQUAL(ledger->GetTotals().totalSupply, totals.totalSupply);
}

BOOST_AUTO_TEST_CASE(clock_advances_only_on_committed_submissions)
{
    BOOST_CHECK_EQUAL(ledger->GetTotals().currentTimestamp, 0U);
    SubmitCleanup(alice);
    BOOST_CHECK_EQUAL(ledger->GetTotals().currentTimestamp, 1U);

    BOOST_CHECK(!ledger->SubmitAction(alice, 9, uint256(), uint256()).success);
    BOOST_CHECK_EQUAL(ledger->GetTotals().currentTimestamp, 1U);

    BOOST_CHECK(ledger->VerifyAction(owner, alice, 1).success);
    BOOST_CHECK_EQUAL(ledger->GetTotals().currentTimestamp, 1U);

    SubmitCleanup(alice);
    BOOST_CHECK_EQUAL(ledger->GetUserAction(alice, 2)->timestamp, 1U);
    BOOST_CHECK_EQUAL(ledger->GetTotals().nextActionId, 3U);
}

BOOST_AUTO_TEST_CASE(refused_commit_leaves_state_unchanged)
{
    RefusingStore refusing;
    CounterClock localClock;
    RewardLedger local(config, refusing, book, localClock);
    BOOST_REQUIRE(local.ApplyGenesis());

    const uint32_t cleanup = static_cast<uint32_t>(ActionType::CLEANUP);
    SubmitResult submitted = local.SubmitAction(alice, cleanup, InsecureRand256(), InsecureRand256());
    BOOST_REQUIRE(submitted.success);

    refusing.refuse = true;
    BOOST_CHECK_EQUAL(local.VerifyAction(owner, alice, submitted.actionId).error, LedgerError::VERIFICATION_FAILED);
    BOOST_CHECK_EQUAL(local.ToggleContract(owner, false).error, LedgerError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(local.SubmitAction(alice, cleanup, InsecureRand256(), InsecureRand256()).error,
                      LedgerError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(localClock.Now(), 1U);

    refusing.refuse = false;
    std::optional<Action> action = local.GetUserAction(alice, submitted.actionId);
    BOOST_REQUIRE(action);
    BOOST_CHECK(!action->verified);
    BOOST_CHECK_EQUAL(local.GetBalance(alice), 0);
    BOOST_CHECK_EQUAL(local.GetTotals().nextActionId, 2U);
    BOOST_CHECK(local.GetContractStatus());

    BOOST_CHECK(local.VerifyAction(owner, alice, submitted.actionId).success);
    BOOST_CHECK_EQUAL(local.GetBalance(alice), CLEANUP_REWARD);
    BOOST_CHECK(local.VerifySupplyInvariant());
}

BOOST_AUTO_TEST_CASE(toggle_contract)
{
    const uint64_t id = SubmitCleanup(alice);

    BOOST_CHECK_EQUAL(ledger->ToggleContract(alice, false).error, LedgerError::OWNER_ONLY);
    BOOST_CHECK(ledger->GetContractStatus());

    BOOST_CHECK(ledger->ToggleContract(owner, false).success);
    BOOST_CHECK(!ledger->GetContractStatus());
    for (uint32_t type = 1; type <= 4; ++type) {
        BOOST_CHECK_EQUAL(ledger->SubmitAction(bob, type, uint256(), uint256()).error, LedgerError::INVALID_ACTION);
    }

    // Existing actions remain queryable and verifiable
    BOOST_CHECK(ledger->GetUserAction(alice, id));
    BOOST_CHECK(ledger->VerifyAction(owner, alice, id).success);

    BOOST_CHECK(ledger->ToggleContract(owner, true).success);
    BOOST_CHECK_EQUAL(SubmitCleanup(bob), id + 1);
}

BOOST_AUTO_TEST_CASE(trade_and_transfer)
{
    BOOST_CHECK(ledger->VerifyAction(owner, alice, SubmitCleanup(alice)).success);

    BOOST_CHECK(ledger->TradeTokens(alice, 40, bob).success);
    BOOST_CHECK_EQUAL(ledger->GetBalance(alice), 60);
    BOOST_CHECK_EQUAL(ledger->GetBalance(bob), 40);

    BOOST_CHECK_EQUAL(ledger->TradeTokens(alice, 61, bob).error, LedgerError::INSUFFICIENT_BALANCE);
    BOOST_CHECK_EQUAL(ledger->TradeTokens(alice, 0, bob).error, LedgerError::INVALID_AMOUNT);
    BOOST_CHECK_EQUAL(ledger->Transfer(bob, 10, alice, bob).error, LedgerError::NOT_TOKEN_OWNER);

    BOOST_CHECK(ledger->ApproveDelegate(alice, bob).success);
    BOOST_CHECK(ledger->Transfer(bob, 10, alice, bob, std::string("delegated")).success);
    BOOST_CHECK(ledger->RevokeDelegate(alice, bob).success);
    BOOST_CHECK_EQUAL(ledger->Transfer(bob, 10, alice, bob).error, LedgerError::NOT_TOKEN_OWNER);

    BOOST_CHECK_EQUAL(ledger->GetBalance(alice), 50);
    BOOST_CHECK_EQUAL(ledger->GetBalance(bob), 50);
    BOOST_CHECK_EQUAL(ledger->GetTotalSupply(), 100);
    BOOST_CHECK(ledger->VerifySupplyInvariant());
}

BOOST_AUTO_TEST_CASE(token_uri)
{
    BOOST_CHECK(!ledger->GetTokenUri());
    BOOST_CHECK_EQUAL(ledger->UpdateTokenUri(alice, std::string("ipfs://x")).error, LedgerError::OWNER_ONLY);
    BOOST_CHECK(ledger->UpdateTokenUri(owner, std::string("ipfs://verdant")).success);
    BOOST_CHECK_EQUAL(*ledger->GetTokenUri(), "ipfs://verdant");

    TokenInfo info = ledger->GetTokenInfo();
    BOOST_CHECK_EQUAL(info.name, "Verdant Regtest Token");
    BOOST_CHECK_EQUAL(*info.uri, "ipfs://verdant");
    BOOST_CHECK_EQUAL(info.totalSupply, 0);
}

BOOST_AUTO_TEST_CASE(sponsor_flow)
{
    BOOST_REQUIRE(book.Credit(acme, 500));
    BOOST_CHECK_EQUAL(ledger->SponsorContribute(acme, 100).error, LedgerError::SPONSOR_NOT_FOUND);
    BOOST_CHECK(!ledger->GetSponsorInfo(acme));

    BOOST_CHECK(ledger->RegisterSponsor(acme, "Acme Corp").success);
    BOOST_CHECK(ledger->SponsorContribute(acme, 100).success);
    BOOST_CHECK_EQUAL(ledger->SponsorContribute(acme, 401).error, LedgerError::INSUFFICIENT_BALANCE);

    std::optional<Sponsor> sponsor = ledger->GetSponsorInfo(acme);
    BOOST_REQUIRE(sponsor);
    BOOST_CHECK_EQUAL(sponsor->totalContributed, 100);
    BOOST_CHECK_EQUAL(sponsor->availableBalance, 100);
    BOOST_CHECK_EQUAL(book.GetBalance(config.sponsorPool), 100);

    // Contributions do not fund or affect minting
    BOOST_CHECK_EQUAL(ledger->GetTotalSupply(), 0);
    BOOST_CHECK(ledger->VerifyAction(owner, alice, SubmitCleanup(alice)).success);
    BOOST_CHECK_EQUAL(ledger->GetSponsorInfo(acme)->availableBalance, 100);
}

BOOST_AUTO_TEST_CASE(genesis_from_configuration)
{
    LedgerConfig custom = TestLedgerConfig();
    custom.useVerifierSet = true;
    custom.verifiers.push_back(bob);
    custom.startEnabled = false;
    custom.token.initialUri = std::string("ipfs://genesis");
    Deploy(custom);

    BOOST_CHECK_EQUAL(ledger->GetPolicyName(), "verifier-set");
    BOOST_CHECK(ledger->IsVerifier(bob));
    BOOST_CHECK(!ledger->GetContractStatus());
    BOOST_CHECK_EQUAL(*ledger->GetTokenUri(), "ipfs://genesis");

    BOOST_CHECK(ledger->ToggleContract(owner, true).success);
    const uint64_t id = SubmitCleanup(alice);
    BOOST_CHECK(ledger->VerifyAction(bob, alice, id).success);

    BOOST_CHECK(ledger->RemoveVerifier(owner, bob).success);
    BOOST_CHECK(!ledger->IsVerifier(bob));
    BOOST_CHECK_EQUAL(ledger->VerifyAction(bob, alice, SubmitCleanup(alice)).error, LedgerError::OWNER_ONLY);
    BOOST_CHECK_EQUAL(ledger->AddVerifier(bob, bob).error, LedgerError::OWNER_ONLY);
}

/**
 * Property: after any operation sequence the supply equals the rewards of
 * verified actions and matches the sum of balances
 */
BOOST_AUTO_TEST_CASE(random_operation_sequence)
{
    std::vector<uint160> users;
    for (unsigned char i = 2; i < 7; ++i) {
        users.push_back(TestPrincipal(i));
    }
    std::vector<std::pair<uint160, uint64_t>> submitted;
    CAmount minted = 0;

    for (int i = 0; i < 400; ++i) {
        const uint160& user = users[InsecureRandRange(users.size())];
        const uint160& other = users[InsecureRandRange(users.size())];
        const CAmount supplyBefore = ledger->GetTotalSupply();

        switch (InsecureRandRange(5)) {
        case 0:
        case 1: {
            SubmitResult result = ledger->SubmitAction(user, static_cast<uint32_t>(InsecureRandRange(6)),
                                                       InsecureRand256(), InsecureRand256());
            if (result.success) submitted.emplace_back(user, result.actionId);
            break;
        }
        case 2: {
            if (submitted.empty()) break;
            const auto& target = submitted[InsecureRandRange(submitted.size())];
            std::optional<Action> action = ledger->GetUserAction(target.first, target.second);
            BOOST_REQUIRE(action);
            const uint160& caller = InsecureRandBool() ? owner : user;
            LedgerResult result = ledger->VerifyAction(caller, target.first, target.second);
            if (result.success) {
                BOOST_CHECK(!action->verified);
                minted += action->rewardAmount;
            }
            break;
        }
        case 3: {
            ledger->TradeTokens(user, static_cast<CAmount>(InsecureRandRange(120)), other);
            BOOST_CHECK_EQUAL(ledger->GetTotalSupply(), supplyBefore);
            break;
        }
        case 4: {
            ledger->ToggleContract(InsecureRandRange(4) == 0 ? user : owner, InsecureRandRange(3) != 0);
            break;
        }
        }

        BOOST_CHECK_EQUAL(ledger->GetTotalSupply(), minted);
        BOOST_CHECK(ledger->VerifySupplyInvariant());
    }
}

BOOST_AUTO_TEST_SUITE_END()
