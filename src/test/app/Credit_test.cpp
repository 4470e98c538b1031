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

class Credit_test : public beast::unit_test::suite
{
    void
    testLimit()
    {
        testcase("borrowing limit");

        using namespace jtx;
        Env env(*this);

        auto const c = env.cycle(2024);
        auto const alice = env.member("alice");
        env.deposit(alice, c.id, day(2024, 2, 1), declared(money("2000.00")));
        BEAST_EXPECT(env.ledger().savingsBalance(alice) == money("2000.00"));

        auto const tier =
            env.require(env.credit().createTier("Standard", std::nullopt, 1));
        env.require(env.credit().assignTier(alice, c.id, tier.id, "admin"));
        env.require(env.credit().addBorrowingPolicy(
            tier.id, rate("2.00"), day(2024, 1, 1)));
        env.require(env.credit().addInterestRange(
            tier.id, c.id, std::nullopt, rate("10.00")));

        auto const r = env.require(env.credit().resolve(alice, c.id));
        BEAST_EXPECT(r.tier.id == tier.id);
        BEAST_EXPECT(r.multiplier == rate("2.00"));
        BEAST_EXPECT(r.savings == money("2000.00"));
        BEAST_EXPECT(r.maxLoanAmount == money("4000.00"));

        auto const refused =
            env.loans().apply(alice, c.id, money("5000.00"), 12);
        BEAST_EXPECT(Env::failedWith(refused, tvlEXCEEDS_LIMIT));
        if (!refused)
            BEAST_EXPECT(refused.error().kind() == ErrorCategory::validation);

        BEAST_EXPECT(env.loans().apply(alice, c.id, money("4000.00"), 12));
    }

    void
    testPolicies()
    {
        testcase("newest effective policy");

        using namespace jtx;
        Env env(*this);

        auto const c = env.cycle(2024);
        auto const bob = env.member("bob");
        env.deposit(bob, c.id, day(2024, 2, 1), declared(money("2000.00")));

        auto const tier =
            env.require(env.credit().createTier("Silver", std::nullopt, 2));
        env.require(env.credit().assignTier(bob, c.id, tier.id, "admin"));

        env.require(env.credit().addBorrowingPolicy(
            tier.id, rate("2.00"), day(2024, 1, 1)));
        env.require(env.credit().addBorrowingPolicy(
            tier.id, rate("1.50"), day(2024, 6, 1), money("2500.00")));
        // Not yet in effect at the end of the cycle.
        env.require(env.credit().addBorrowingPolicy(
            tier.id, rate("3.00"), day(2025, 1, 1)));

        auto const r = env.require(env.credit().resolve(bob, c.id));
        BEAST_EXPECT(r.multiplier == rate("1.50"));
        // 2000.00 x 1.50 is capped at 2500.00.
        BEAST_EXPECT(r.maxLoanAmount == money("2500.00"));

        BEAST_EXPECT(Env::failedWith(
            env.credit().addBorrowingPolicy(
                tier.id, rate("1.00"), day(2024, 1, 1), money("-1.00")),
            tvlNEGATIVE_AMOUNT));
        BEAST_EXPECT(Env::failedWith(
            env.credit().addBorrowingPolicy(99, rate("1.00"), day(2024, 1, 1)),
            tnfTIER));
    }

    void
    testRates()
    {
        testcase("rates by term");

        using namespace jtx;
        Env env(*this);

        auto const c = env.cycle(2024);
        auto const carol = env.member("carol");
        env.deposit(carol, c.id, day(2024, 2, 1), declared(money("1000.00")));

        auto const tier =
            env.require(env.credit().createTier("Gold", std::nullopt, 0));
        env.require(env.credit().assignTier(carol, c.id, tier.id, "admin"));
        env.require(env.credit().addBorrowingPolicy(
            tier.id, rate("3.00"), day(2024, 1, 1)));

        env.require(
            env.credit().addInterestRange(tier.id, c.id, 6, rate("8.00")));

        {
            auto const r = env.require(env.credit().resolve(carol, c.id));
            BEAST_EXPECT(rateForTerm(r, 6) == rate("8.00"));
            BEAST_EXPECT(!rateForTerm(r, 12));
        }

        // No rate for the term and no rate for every term.
        BEAST_EXPECT(Env::failedWith(
            env.loans().apply(carol, c.id, money("500.00"), 12), tcfNO_RATE));

        env.require(env.credit().addInterestRange(
            tier.id, c.id, std::nullopt, rate("10.00")));

        {
            auto const r = env.require(env.credit().resolve(carol, c.id));
            BEAST_EXPECT(r.wildcardRate == rate("10.00"));
            BEAST_EXPECT(rateForTerm(r, 6) == rate("8.00"));
            BEAST_EXPECT(rateForTerm(r, 12) == rate("10.00"));
            BEAST_EXPECT(rateForTerm(r, 24) == rate("10.00"));
        }

        BEAST_EXPECT(Env::failedWith(
            env.credit().addInterestRange(tier.id, c.id, 6, rate("9.00")),
            tvlDUPLICATE));
        BEAST_EXPECT(Env::failedWith(
            env.credit().addInterestRange(
                tier.id, c.id, std::nullopt, rate("9.00")),
            tvlDUPLICATE));
        BEAST_EXPECT(Env::failedWith(
            env.credit().addInterestRange(tier.id, c.id, 0, rate("9.00")),
            tvlBAD_TERM));
        BEAST_EXPECT(Env::failedWith(
            env.credit().addInterestRange(tier.id, 99, 6, rate("9.00")),
            tnfCYCLE));

        auto const application =
            env.require(env.loans().apply(carol, c.id, money("500.00"), 6));
        auto const loan = env.require(env.loans().approve(application.id, "admin"));
        BEAST_EXPECT(loan.interestRate == rate("8.00"));
    }

    void
    testMissingConfiguration()
    {
        testcase("missing configuration");

        using namespace jtx;
        Env env(*this);

        auto const c = env.cycle(2024);
        auto const dave = env.member("dave");

        auto const noTier = env.credit().resolve(dave, c.id);
        BEAST_EXPECT(Env::failedWith(noTier, tcfNO_TIER_ASSIGNED));
        if (!noTier)
            BEAST_EXPECT(
                noTier.error().kind() == ErrorCategory::configuration);

        auto const tier =
            env.require(env.credit().createTier("Bronze", std::nullopt, 3));
        BEAST_EXPECT(Env::failedWith(
            env.credit().createTier("Bronze", std::nullopt, 4), tvlDUPLICATE));
        BEAST_EXPECT(Env::failedWith(
            env.credit().createTier("", std::nullopt, 4), tvlMISSING_FIELD));

        BEAST_EXPECT(Env::failedWith(
            env.credit().assignTier(dave, c.id, 99, "admin"), tnfTIER));
        BEAST_EXPECT(Env::failedWith(
            env.credit().assignTier(99, c.id, tier.id, "admin"), tnfMEMBER));
        BEAST_EXPECT(Env::failedWith(
            env.credit().assignTier(dave, 99, tier.id, "admin"), tnfCYCLE));

        env.require(env.credit().assignTier(dave, c.id, tier.id, "admin"));
        BEAST_EXPECT(Env::failedWith(
            env.credit().resolve(dave, c.id), tcfNO_POLICY));
        BEAST_EXPECT(Env::failedWith(
            env.credit().resolve(dave, 99), tnfCYCLE));

        // A later assignment replaces the earlier one.
        auto const other =
            env.require(env.credit().createTier("Platinum", std::nullopt, 0));
        env.require(env.credit().assignTier(dave, c.id, other.id, "admin"));
        BEAST_EXPECT(env.credit().assignedTier(dave, c.id) == other.id);

        auto const tiers = env.credit().listTiers();
        if (BEAST_EXPECT(tiers.size() == 2))
        {
            BEAST_EXPECT(tiers[0].name == "Platinum");
            BEAST_EXPECT(tiers[1].name == "Bronze");
        }

        // No savings means nothing to borrow.
        env.require(env.credit().addBorrowingPolicy(
            other.id, rate("2.00"), day(2024, 1, 1)));
        auto const r = env.require(env.credit().resolve(dave, c.id));
        BEAST_EXPECT(r.maxLoanAmount == Money{});
    }

    void
    testBorrowCount()
    {
        testcase("borrow count");

        using namespace jtx;
        Env env(*this);

        auto const c = env.cycle(2024);
        auto const erin = env.member("erin");
        env.deposit(erin, c.id, day(2024, 2, 1), declared(money("1000.00")));

        auto const tier =
            env.require(env.credit().createTier("Standard", std::nullopt, 1));
        env.require(env.credit().assignTier(erin, c.id, tier.id, "admin"));
        env.require(env.credit().addBorrowingPolicy(
            tier.id, rate("2.00"), day(2024, 1, 1)));
        env.require(env.credit().addInterestRange(
            tier.id, c.id, std::nullopt, rate("10.00")));

        BEAST_EXPECT(env.credit().borrowCount(erin) == 0);

        auto const application =
            env.require(env.loans().apply(erin, c.id, money("100.00"), 3));
        auto const loan =
            env.require(env.loans().approve(application.id, "admin"));

        // Approved is not yet received.
        BEAST_EXPECT(env.credit().borrowCount(erin) == 0);

        env.require(env.loans().disburse(loan.id, "treasurer"));
        BEAST_EXPECT(env.credit().borrowCount(erin) == 1);
    }

public:
    void
    run() override
    {
        testLimit();
        testPolicies();
        testRates();
        testMissingConfiguration();
        testBorrowCount();
    }
};

BEAST_DEFINE_TESTSUITE(Credit, app, mutual);

}  // namespace test
}  // namespace mutual
