//------------------------------------------------------------------------------
/*
    This file is part of mutuald.
    Copyright (c) 2024 The mutuald developers.

    Permission to use, copy, modify, and/or distribute this software for any
    purpose  with  or without fee is hereby granted, provided that the above
    copyright notice and this permission notice appear in all copies.

    THE  SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES
    WITH  REGARD  TO  THIS  SOFTWARE  INCLUDING  ALL  IMPLIED  WARRANTIES  OF
    MERCHANTABILITY  AND  FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR
    ANY  SPECIAL ,  DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
    WHATSOEVER  RESULTING  FROM  LOSS  OF USE, DATA OR PROFITS, WHETHER IN AN
    ACTION  OF  CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
    OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
*/
//==============================================================================

#include <test/jtx/Env.h>

#include <map>

namespace mutual {
namespace test {

class DepositPoster_test : public beast::unit_test::suite
{
    static int
    entryCount(jtx::Env& env)
    {
        auto db = env.app().getDb().checkoutDb();
        int n = 0;
        *db << "SELECT COUNT(*) FROM journal_entries", soci::into(n);
        return n;
    }

    void
    testApprove()
    {
        testcase("approve");

        using namespace jtx;
        Env env(*this, day(2024, 3, 10));

        auto const c = env.cycle(2024);
        auto const alice = env.member("alice");

        auto const [d, p] = env.declareAndProve(
            alice,
            c.id,
            day(2024, 3, 1),
            declared(money("100.00"), money("20.00"), money("10.00")));
        BEAST_EXPECT(p.amount == money("130.00"));

        auto const posting =
            env.require(env.deposits().approveProof(p.id, "treasurer"));

        BEAST_EXPECT(posting.proof.status == ProofStatus::approved);
        BEAST_EXPECT(posting.declaration.status == DeclarationStatus::approved);
        BEAST_EXPECT(!posting.initialRequirement);
        BEAST_EXPECT(!posting.loan);
        BEAST_EXPECT(posting.penaltiesPaid.empty());
        BEAST_EXPECT(posting.excess.empty());

        auto const& e = posting.entry;
        BEAST_EXPECT(
            e.description ==
            "Deposit for 2024-03 by member " + std::to_string(alice));
        BEAST_EXPECT(e.sourceType == std::string(source::depositApproval));
        BEAST_EXPECT(e.sourceRef == p.id);
        BEAST_EXPECT(e.cycle == c.id);
        BEAST_EXPECT(e.createdBy == std::string("treasurer"));

        // One debit to cash, one credit per declared component.
        std::map<std::string, std::pair<Money, Money>> byCode;
        for (auto const& line : e.lines)
        {
            auto const account = env.require(env.ledger().getAccount(line.account));
            byCode[account.code] = {line.debit, line.credit};
        }
        BEAST_EXPECT(e.lines.size() == 4);
        BEAST_EXPECT(byCode[org::bankCash].first == money("130.00"));
        BEAST_EXPECT(
            byCode[LedgerCore::subaccountCode(alice, FundKind::savings)]
                .second == money("100.00"));
        BEAST_EXPECT(
            byCode[LedgerCore::subaccountCode(alice, FundKind::socialFund)]
                .second == money("20.00"));
        BEAST_EXPECT(
            byCode[LedgerCore::subaccountCode(alice, FundKind::adminFund)]
                .second == money("10.00"));

        BEAST_EXPECT(env.balance(org::bankCash) == money("130.00"));
        BEAST_EXPECT(env.ledger().savingsBalance(alice) == money("100.00"));

        auto const approval = env.deposits().approvalForProof(p.id);
        if (BEAST_EXPECT(approval))
        {
            BEAST_EXPECT(approval->entry == e.id);
            BEAST_EXPECT(approval->approvedBy == "treasurer");
        }
        BEAST_EXPECT(
            env.require(env.declarations().getDeclaration(d.id)).status ==
            DeclarationStatus::approved);

        // A second approval of the same proof changes nothing.
        auto const entries = entryCount(env);
        BEAST_EXPECT(Env::failedWith(
            env.deposits().approveProof(p.id, "chair"), tstBAD_STATE));
        BEAST_EXPECT(entryCount(env) == entries);
        BEAST_EXPECT(env.balance(org::bankCash) == money("130.00"));

        BEAST_EXPECT(Env::failedWith(
            env.deposits().approveProof(99, "treasurer"), tnfPROOF));
        BEAST_EXPECT(!env.deposits().approvalForProof(99));
    }

    void
    testPaidAmount()
    {
        testcase("cash is what was paid");

        using namespace jtx;
        Env env(*this, day(2024, 3, 10));

        auto const c = env.cycle(2024);
        auto const hank = env.member("hank");

        auto const d = env.require(env.declarations().createDeclaration(
            hank,
            c.id,
            day(2024, 3, 1),
            declared(money("100.00"), money("20.00"), money("10.00"))));
        BEAST_EXPECT(d.amounts.total() == money("130.00"));

        // Two cents over is refused outright.
        auto const p = env.require(
            env.declarations().uploadProof(d.id, money("130.02")));
        BEAST_EXPECT(Env::failedWith(
            env.deposits().approveProof(p.id, "treasurer"),
            tvlAMOUNT_MISMATCH));
        BEAST_EXPECT(entryCount(env) == 0);
        BEAST_EXPECT(!env.deposits().approvalForProof(p.id));

        env.require(env.declarations().rejectProof(
            p.id, "Amount does not match", "treasurer"));
        env.require(env.declarations().uploadProof(d.id, money("130.01")));

        // One cent over is accepted, and the cent is kept.
        auto const posting =
            env.require(env.deposits().approveProof(p.id, "treasurer"));
        auto const& e = posting.entry;
        BEAST_EXPECT(e.totalDebits() == money("130.01"));
        BEAST_EXPECT(e.totalCredits() == money("130.01"));

        auto const savings = env.require(env.ledger().getOrCreateMemberSubaccount(
            hank, FundKind::savings));
        Money cash;
        Money toSavings;
        bool differenceLine = false;
        for (auto const& line : e.lines)
        {
            auto const account = env.require(env.ledger().getAccount(line.account));
            if (account.code == org::bankCash)
                cash += line.debit;
            if (line.account == savings.id)
            {
                toSavings += line.credit;
                toSavings -= line.debit;
                if (line.memo == std::string("proof difference"))
                    differenceLine = line.credit == money("0.01");
            }
        }
        BEAST_EXPECT(e.lines.size() == 5);
        BEAST_EXPECT(cash == money("130.01"));
        BEAST_EXPECT(toSavings == money("100.01"));
        BEAST_EXPECT(differenceLine);

        BEAST_EXPECT(env.balance(org::bankCash) == money("130.01"));
        BEAST_EXPECT(env.ledger().savingsBalance(hank) == money("100.01"));
        BEAST_EXPECT(env.ledger().unbalancedEntries().empty());
    }

    void
    testRoundTrip()
    {
        testcase("reversal restores balances");

        using namespace jtx;
        Env env(*this);

        auto const c = env.cycle(2024);
        auto const bob = env.member("bob");

        env.deposit(bob, c.id, day(2024, 1, 1), declared(money("40.00")));

        std::vector<std::string> const codes{
            org::bankCash,
            org::interestIncome,
            LedgerCore::subaccountCode(bob, FundKind::savings),
            LedgerCore::subaccountCode(bob, FundKind::socialFund),
            LedgerCore::subaccountCode(bob, FundKind::adminFund),
        };
        std::vector<Money> before;
        for (auto const& code : codes)
            before.push_back(env.balance(code));

        auto const posting = env.deposit(
            bob,
            c.id,
            day(2024, 2, 1),
            declared(money("75.25"), money("12.00"), money("3.50")));
        BEAST_EXPECT(env.balance(org::bankCash) == money("130.75"));

        env.require(env.ledger().reverseEntry(
            posting.entry.id, "Deposit was bounced", "treasurer"));

        for (std::size_t i = 0; i < codes.size(); ++i)
            BEAST_EXPECT(env.balance(codes[i]) == before[i]);
        BEAST_EXPECT(env.ledger().unbalancedEntries().empty());
    }

    void
    testInitialRequirement()
    {
        testcase("initial requirement");

        using namespace jtx;
        Env env(*this);

        auto const c = env.cycle(2024, money("20.00"), money("10.00"));
        auto const carol = env.member("carol");

        auto const first = env.deposit(
            carol,
            c.id,
            day(2024, 1, 1),
            declared(money("50.00"), money("20.00"), money("5.00")));

        if (BEAST_EXPECT(first.initialRequirement))
        {
            auto const& seed = *first.initialRequirement;
            BEAST_EXPECT(
                seed.sourceType == std::string(source::initialRequirement));
            BEAST_EXPECT(seed.sourceRef == carol);
            BEAST_EXPECT(seed.totalDebits() == money("30.00"));
            BEAST_EXPECT(
                seed.description ==
                "Cycle 2024 initial requirement for member " +
                    std::to_string(carol));
        }

        BEAST_EXPECT(env.balance(org::socialFund) == money("20.00"));
        BEAST_EXPECT(env.balance(org::adminFund) == money("10.00"));
        BEAST_EXPECT(env.ledger().socialFundDue(carol) == Money{});
        BEAST_EXPECT(env.ledger().adminFundDue(carol) == money("5.00"));
        BEAST_EXPECT(
            env.ledger().socialFundPayments(carol, c.id) == money("20.00"));
        BEAST_EXPECT(
            env.ledger().adminFundPayments(carol, c.id) == money("5.00"));
        BEAST_EXPECT(env.ledger().adminFundPayments(carol, 99) == Money{});

        auto const second = env.deposit(
            carol,
            c.id,
            day(2024, 2, 1),
            declared(money("50.00"), Money{}, money("5.00")));
        BEAST_EXPECT(!second.initialRequirement);
        BEAST_EXPECT(env.ledger().adminFundDue(carol) == Money{});
        BEAST_EXPECT(
            env.ledger().entriesBySource(source::initialRequirement, carol)
                .size() == 1);

        // A cycle without requirements seeds nothing.
        auto const next = env.cycle(2025);
        env.setToday(day(2025, 1, 15));
        auto const third = env.deposit(
            carol, next.id, day(2025, 1, 1), declared(money("10.00")));
        BEAST_EXPECT(!third.initialRequirement);
    }

    void
    testExcess()
    {
        testcase("excess contributions");

        using namespace jtx;
        Env env(*this);

        auto const c = env.cycle(2024, money("20.00"), money("10.00"));
        auto const dave = env.member("dave");

        auto const first = env.deposit(
            dave,
            c.id,
            day(2024, 1, 1),
            declared(money("100.00"), money("15.00"), money("10.00")));
        BEAST_EXPECT(first.excess.empty());
        BEAST_EXPECT(env.ledger().socialFundDue(dave) == money("5.00"));

        auto const second = env.deposit(
            dave,
            c.id,
            day(2024, 2, 1),
            declared(money("100.00"), money("15.00"), money("2.00")));

        // 30.00 paid against 20.00 social, 12.00 against 10.00 admin.
        if (BEAST_EXPECT(second.excess.size() == 2))
        {
            for (auto const& e : second.excess)
            {
                BEAST_EXPECT(
                    e.sourceType == std::string(source::excessContribution));
                BEAST_EXPECT(e.sourceRef == dave);
                BEAST_EXPECT(e.createdBy == std::string(systemActor));
            }
            BEAST_EXPECT(second.excess[0].totalDebits() == money("10.00"));
            BEAST_EXPECT(second.excess[1].totalDebits() == money("2.00"));
        }
        BEAST_EXPECT(env.ledger().savingsBalance(dave) == money("212.00"));
        BEAST_EXPECT(env.ledger().socialFundDue(dave) == Money{});
        BEAST_EXPECT(env.ledger().adminFundDue(dave) == Money{});
        BEAST_EXPECT(env.balance(dave, FundKind::socialFund) == Money{});

        // Nothing left to move.
        BEAST_EXPECT(
            env.require(env.deposits().sweepExcess(dave, c.id)).empty());
        BEAST_EXPECT(env.deposits().sweepAllExcess() == 0);
        BEAST_EXPECT(Env::failedWith(
            env.deposits().sweepExcess(dave, 99), tnfCYCLE));
        BEAST_EXPECT(env.ledger().unbalancedEntries().empty());
    }

    void
    testPostingLock()
    {
        testcase("posting lock");

        using namespace jtx;
        Env env(*this);

        auto const c = env.cycle(2024);
        auto const erin = env.member("erin");
        auto const [d, p] = env.declareAndProve(
            erin, c.id, day(2024, 3, 1), declared(money("25.00")));

        env.require(env.cycles().lockPostings(
            c.id, "treasurer", std::string("audit")));

        auto const blocked = env.deposits().approveProof(p.id, "treasurer");
        BEAST_EXPECT(Env::failedWith(blocked, tstPOSTING_LOCKED));
        BEAST_EXPECT(
            env.require(env.declarations().getProof(p.id)).status ==
            ProofStatus::submitted);
        BEAST_EXPECT(entryCount(env) == 0);

        env.require(env.cycles().unlockPostings(c.id));
        BEAST_EXPECT(env.deposits().approveProof(p.id, "treasurer"));
        BEAST_EXPECT(env.balance(org::bankCash) == money("25.00"));
    }

    void
    testRollback()
    {
        testcase("failed approval leaves no trace");

        using namespace jtx;
        Env env(*this);

        auto const c = env.cycle(2024);
        auto const frank = env.member("frank");

        // A loan repayment with no loan to apply it to.
        auto const [d, p] = env.declareAndProve(
            frank,
            c.id,
            day(2024, 3, 1),
            declared(
                money("10.00"),
                Money{},
                Money{},
                Money{},
                money("1.00"),
                money("50.00")));

        auto const r = env.deposits().approveProof(p.id, "treasurer");
        BEAST_EXPECT(Env::failedWith(r, tstNO_OPEN_LOAN));

        BEAST_EXPECT(entryCount(env) == 0);
        BEAST_EXPECT(env.balance(org::bankCash) == Money{});
        BEAST_EXPECT(!env.ledger().findAccount(
            LedgerCore::subaccountCode(frank, FundKind::savings)));
        BEAST_EXPECT(!env.deposits().approvalForProof(p.id));
        BEAST_EXPECT(
            env.require(env.declarations().getProof(p.id)).status ==
            ProofStatus::submitted);
        BEAST_EXPECT(
            env.require(env.declarations().getDeclaration(d.id)).status ==
            DeclarationStatus::proof);

        // The treasurer can still turn it down.
        BEAST_EXPECT(env.declarations().rejectProof(
            p.id, "No loan to repay", "treasurer"));
    }

    void
    testMissingAccount()
    {
        testcase("missing organization account");

        using namespace jtx;
        Env env(*this);

        auto const c = env.cycle(2024);
        auto const gina = env.member("gina");
        auto const [d, p] = env.declareAndProve(
            gina, c.id, day(2024, 3, 1), declared(money("10.00")));

        {
            auto db = env.app().getDb().checkoutDb();
            *db << "DELETE FROM accounts WHERE code = 'BANK_CASH'";
        }

        auto const r = env.deposits().approveProof(p.id, "treasurer");
        BEAST_EXPECT(Env::failedWith(r, tcfMISSING_ACCOUNT));
        if (!r)
            BEAST_EXPECT(r.error().kind() == ErrorCategory::configuration);
        BEAST_EXPECT(
            env.require(env.declarations().getProof(p.id)).status ==
            ProofStatus::submitted);

        BEAST_EXPECT(env.ledger().bootstrapChart() == 1);
        BEAST_EXPECT(env.deposits().approveProof(p.id, "treasurer"));
    }

public:
    void
    run() override
    {
        testApprove();
        testPaidAmount();
        testRoundTrip();
        testInitialRequirement();
        testExcess();
        testPostingLock();
        testRollback();
        testMissingAccount();
    }
};

BEAST_DEFINE_TESTSUITE(DepositPoster, app, mutual);

}  // namespace test
}  // namespace mutual
