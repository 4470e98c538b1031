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

namespace mutual {
namespace test {

class Loan_test : public beast::unit_test::suite
{
    // A member with 2000.00 in savings who may borrow twice that at 10%.
    static MemberID
    borrower(jtx::Env& env, Cycle const& c, std::string const& name)
    {
        using namespace jtx;

        auto const member = env.member(name);
        env.deposit(member, c.id, day(2024, 1, 1), declared(money("2000.00")));

        auto tier = env.credit().createTier("Standard", std::nullopt, 1);
        TierID tierId = 0;
        if (tier)
        {
            tierId = tier->id;
            env.require(env.credit().addBorrowingPolicy(
                tierId, rate("2.00"), day(2024, 1, 1)));
            env.require(env.credit().addInterestRange(
                tierId, c.id, std::nullopt, rate("10.00")));
        }
        else
        {
            tierId = env.credit().listTiers().front().id;
        }
        env.require(env.credit().assignTier(member, c.id, tierId, "admin"));
        return member;
    }

    void
    testLifecycle()
    {
        testcase("apply, approve, disburse, repay, close");

        using namespace jtx;
        Env env(*this, day(2024, 3, 10));

        auto const c = env.cycle(2024);
        auto const alice = borrower(env, c, "alice");

        auto const application = env.require(env.loans().apply(
            alice, c.id, money("1000.00"), 12, std::string("Roof repair")));
        BEAST_EXPECT(application.status == ApplicationStatus::pending);
        BEAST_EXPECT(application.amount == money("1000.00"));
        BEAST_EXPECT(application.termMonths == 12);
        BEAST_EXPECT(application.notes == std::string("Roof repair"));

        auto const approved = env.require(env.loans().approve(
            application.id, "chair", std::string("Approved at meeting")));
        BEAST_EXPECT(approved.status == LoanStatus::approved);
        BEAST_EXPECT(approved.interestRate == rate("10.00"));
        BEAST_EXPECT(approved.application == application.id);
        BEAST_EXPECT(approved.amount == money("1000.00"));
        BEAST_EXPECT(!approved.disbursedOn);

        auto const reviewed =
            env.require(env.loans().getApplication(application.id));
        BEAST_EXPECT(reviewed.status == ApplicationStatus::approved);
        BEAST_EXPECT(reviewed.reviewedBy == std::string("chair"));
        BEAST_EXPECT(reviewed.reviewNotes == std::string("Approved at meeting"));

        BEAST_EXPECT(Env::failedWith(
            env.loans().approve(application.id, "chair"), tstBAD_STATE));

        // Nothing to repay before the money goes out.
        BEAST_EXPECT(Env::failedWith(
            env.loans().postRepayment(
                approved.id, money("10.00"), Money{}, "treasurer"),
            tstNO_OPEN_LOAN));

        env.setToday(day(2024, 3, 12));
        auto const loan =
            env.require(env.loans().disburse(approved.id, "treasurer"));
        BEAST_EXPECT(loan.status == LoanStatus::open);
        BEAST_EXPECT(loan.disbursedOn == day(2024, 3, 12));
        BEAST_EXPECT(loan.disbursementEntry);
        BEAST_EXPECT(env.balance(org::loansReceivable) == money("1000.00"));
        BEAST_EXPECT(env.balance(org::bankCash) == money("1000.00"));

        BEAST_EXPECT(Env::failedWith(
            env.loans().disburse(loan.id, "treasurer"), tstBAD_STATE));

        auto const r1 = env.require(env.loans().postRepayment(
            loan.id, money("600.00"), money("50.00"), "treasurer"));
        BEAST_EXPECT(r1.principal == money("600.00"));
        BEAST_EXPECT(r1.interest == money("50.00"));

        {
            auto const b = env.require(env.loans().loanBalance(loan.id));
            BEAST_EXPECT(b.principalPaid == money("600.00"));
            BEAST_EXPECT(b.interestPaid == money("50.00"));
            BEAST_EXPECT(b.outstanding == money("400.00"));
            BEAST_EXPECT(b.expectedInterest == money("100.00"));
            BEAST_EXPECT(!b.paidOff());
        }
        BEAST_EXPECT(
            env.require(env.loans().getLoan(loan.id)).status ==
            LoanStatus::open);

        // The rest comes in with a monthly deposit.
        auto const posting = env.deposit(
            alice,
            c.id,
            day(2024, 3, 1),
            declared(
                money("20.00"),
                Money{},
                Money{},
                Money{},
                money("50.00"),
                money("400.00")));
        BEAST_EXPECT(posting.loan == loan.id);

        auto const closed = env.require(env.loans().getLoan(loan.id));
        BEAST_EXPECT(closed.status == LoanStatus::closed);
        BEAST_EXPECT(closed.closedAt);

        auto const repaid = env.loans().repayments(loan.id);
        if (BEAST_EXPECT(repaid.size() == 2))
        {
            BEAST_EXPECT(repaid[1].entry == posting.entry.id);
            BEAST_EXPECT(repaid[1].principal == money("400.00"));
        }

        BEAST_EXPECT(env.balance(org::loansReceivable) == Money{});
        BEAST_EXPECT(env.balance(org::interestIncome) == money("100.00"));
        BEAST_EXPECT(!env.loans().activeLoanFor(alice));

        // Closed loans do not stand in the way of the next one.
        BEAST_EXPECT(env.loans().apply(alice, c.id, money("500.00"), 6));
        BEAST_EXPECT(env.credit().borrowCount(alice) == 1);
    }

    void
    testInterestBeforeClose()
    {
        testcase("interest must be covered");

        using namespace jtx;
        Env env(*this);

        auto const c = env.cycle(2024);
        auto const bob = borrower(env, c, "bob");

        auto const application =
            env.require(env.loans().apply(bob, c.id, money("1000.00"), 12));
        auto const approved =
            env.require(env.loans().approve(application.id, "chair"));
        auto const loan =
            env.require(env.loans().disburse(approved.id, "treasurer"));

        env.require(env.loans().postRepayment(
            loan.id, money("1000.00"), money("99.99"), "treasurer"));
        BEAST_EXPECT(
            env.require(env.loans().getLoan(loan.id)).status ==
            LoanStatus::open);

        // Principal is settled, only interest may follow.
        BEAST_EXPECT(Env::failedWith(
            env.loans().postRepayment(
                loan.id, money("0.02"), Money{}, "treasurer"),
            tvlEXCEEDS_LIMIT));
        BEAST_EXPECT(env.loans().repayments(loan.id).size() == 1);

        env.require(env.loans().postRepayment(
            loan.id, Money{}, money("0.01"), "treasurer"));
        BEAST_EXPECT(
            env.require(env.loans().getLoan(loan.id)).status ==
            LoanStatus::closed);

        BEAST_EXPECT(Env::failedWith(
            env.loans().postRepayment(
                loan.id, Money{}, money("1.00"), "treasurer"),
            tstNO_OPEN_LOAN));
    }

    void
    testApplyGuards()
    {
        testcase("application guards");

        using namespace jtx;
        Env env(*this);

        auto const c = env.cycle(2024);
        auto const carol = borrower(env, c, "carol");

        BEAST_EXPECT(Env::failedWith(
            env.loans().apply(carol, c.id, Money{}, 12), tvlBAD_AMOUNT));
        BEAST_EXPECT(Env::failedWith(
            env.loans().apply(carol, c.id, money("-5.00"), 12),
            tvlBAD_AMOUNT));
        BEAST_EXPECT(Env::failedWith(
            env.loans().apply(carol, c.id, money("100.00"), 0), tvlBAD_TERM));
        BEAST_EXPECT(Env::failedWith(
            env.loans().apply(99, c.id, money("100.00"), 12), tnfMEMBER));
        BEAST_EXPECT(Env::failedWith(
            env.loans().apply(carol, 99, money("100.00"), 12), tnfCYCLE));
        BEAST_EXPECT(Env::failedWith(
            env.loans().apply(carol, c.id, money("4000.01"), 12),
            tvlEXCEEDS_LIMIT));

        auto const first =
            env.require(env.loans().apply(carol, c.id, money("300.00"), 12));
        BEAST_EXPECT(Env::failedWith(
            env.loans().apply(carol, c.id, money("100.00"), 12),
            tstPENDING_APPLICATION));

        // An approved loan counts as active before it is paid out.
        env.require(env.loans().approve(first.id, "chair"));
        BEAST_EXPECT(Env::failedWith(
            env.loans().apply(carol, c.id, money("100.00"), 12),
            tstACTIVE_LOAN));
        BEAST_EXPECT(env.loans().activeLoanFor(carol));

        // A member without savings may not borrow at all.
        auto const dan = env.member("dan");
        env.require(env.credit().assignTier(
            dan, c.id, env.credit().listTiers().front().id, "admin"));
        BEAST_EXPECT(Env::failedWith(
            env.loans().apply(dan, c.id, money("0.01"), 12),
            tvlEXCEEDS_LIMIT));

        env.require(env.members().setStatus(dan, MemberStatus::inactive));
        BEAST_EXPECT(Env::failedWith(
            env.loans().apply(dan, c.id, money("0.01"), 12),
            tstINACTIVE_MEMBER));

        env.require(env.cycles().closeCycle(c.id));
        BEAST_EXPECT(Env::failedWith(
            env.loans().apply(carol, c.id, money("100.00"), 12),
            tstCYCLE_CLOSED));
    }

    void
    testRejectAndWithdraw()
    {
        testcase("reject and withdraw");

        using namespace jtx;
        Env env(*this);

        auto const c = env.cycle(2024);
        auto const erin = borrower(env, c, "erin");
        auto const frank = borrower(env, c, "frank");

        auto const a1 =
            env.require(env.loans().apply(erin, c.id, money("800.00"), 6));
        auto const rejected = env.require(env.loans().reject(
            a1.id, "chair", std::string("Insufficient guarantors")));
        BEAST_EXPECT(rejected.status == ApplicationStatus::rejected);
        BEAST_EXPECT(rejected.reviewedBy == std::string("chair"));
        BEAST_EXPECT(rejected.reviewedAt);

        BEAST_EXPECT(Env::failedWith(
            env.loans().reject(a1.id, "chair"), tstBAD_STATE));
        BEAST_EXPECT(Env::failedWith(
            env.loans().approve(a1.id, "chair"), tstBAD_STATE));
        BEAST_EXPECT(Env::failedWith(
            env.loans().withdraw(a1.id, erin), tstBAD_STATE));
        BEAST_EXPECT(!env.loans().activeLoanFor(erin));

        auto const a2 =
            env.require(env.loans().apply(erin, c.id, money("700.00"), 6));

        // Only the applicant may withdraw.
        BEAST_EXPECT(Env::failedWith(
            env.loans().withdraw(a2.id, frank), tnfAPPLICATION));

        auto const withdrawn = env.require(env.loans().withdraw(a2.id, erin));
        BEAST_EXPECT(withdrawn.status == ApplicationStatus::withdrawn);
        BEAST_EXPECT(Env::failedWith(
            env.loans().approve(a2.id, "chair"), tstBAD_STATE));

        BEAST_EXPECT(env.loans().apply(erin, c.id, money("600.00"), 6));

        BEAST_EXPECT(Env::failedWith(
            env.loans().reject(99, "chair"), tnfAPPLICATION));
        BEAST_EXPECT(Env::failedWith(env.loans().getLoan(99), tnfLOAN));
        BEAST_EXPECT(
            Env::failedWith(env.loans().loanBalance(99), tnfLOAN));
    }

    void
    testDisbursementLocked()
    {
        testcase("disbursement respects the posting lock");

        using namespace jtx;
        Env env(*this);

        auto const c = env.cycle(2024);
        auto const gina = borrower(env, c, "gina");

        auto const application =
            env.require(env.loans().apply(gina, c.id, money("250.00"), 3));
        auto const loan =
            env.require(env.loans().approve(application.id, "chair"));

        env.require(env.cycles().lockPostings(c.id, "treasurer", std::nullopt));
        BEAST_EXPECT(Env::failedWith(
            env.loans().disburse(loan.id, "treasurer"), tstPOSTING_LOCKED));
        BEAST_EXPECT(
            env.require(env.loans().getLoan(loan.id)).status ==
            LoanStatus::approved);
        BEAST_EXPECT(env.balance(org::loansReceivable) == Money{});

        env.require(env.cycles().unlockPostings(c.id));
        BEAST_EXPECT(env.loans().disburse(loan.id, "treasurer"));
        BEAST_EXPECT(env.balance(org::loansReceivable) == money("250.00"));

        BEAST_EXPECT(Env::failedWith(
            env.loans().postRepayment(
                loan.id, money("-1.00"), Money{}, "treasurer"),
            tvlNEGATIVE_AMOUNT));
        BEAST_EXPECT(Env::failedWith(
            env.loans().postRepayment(loan.id, Money{}, Money{}, "treasurer"),
            tvlBAD_AMOUNT));
    }

public:
    void
    run() override
    {
        testLifecycle();
        testInterestBeforeClose();
        testApplyGuards();
        testRejectAndWithdraw();
        testDisbursementLocked();
    }
};

BEAST_DEFINE_TESTSUITE(Loan, app, mutual);

}  // namespace test
}  // namespace mutual
