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

class Cycle_test : public beast::unit_test::suite
{
    void
    testCreate()
    {
        testcase("create");

        using namespace jtx;
        Env env(*this);

        auto const c = env.require(env.cycles().createCycle(
            2024,
            day(2024, 1, 1),
            day(2024, 12, 31),
            money("120.00"),
            std::nullopt,
            "admin"));
        BEAST_EXPECT(c.status == CycleStatus::draft);
        BEAST_EXPECT(c.year == 2024);
        BEAST_EXPECT(c.socialRequired == money("120.00"));
        BEAST_EXPECT(!c.adminRequired);
        BEAST_EXPECT(c.createdBy == "admin");
        BEAST_EXPECT(c.contains(day(2024, 6, 30)));
        BEAST_EXPECT(!c.contains(day(2025, 1, 1)));

        BEAST_EXPECT(Env::failedWith(
            env.cycles().createCycle(
                2024,
                day(2024, 12, 31),
                day(2024, 1, 1),
                std::nullopt,
                std::nullopt,
                "admin"),
            tvlBAD_DATE));
        BEAST_EXPECT(Env::failedWith(
            env.cycles().createCycle(
                2024,
                day(2024, 1, 1),
                day(2024, 12, 31),
                money("-1.00"),
                std::nullopt,
                "admin"),
            tvlNEGATIVE_AMOUNT));

        BEAST_EXPECT(Env::failedWith(env.cycles().getCycle(99), tnfCYCLE));
        BEAST_EXPECT(env.cycles().listCycles().size() == 1);
        BEAST_EXPECT(!env.cycles().activeCycle());
    }

    void
    testSingleActive()
    {
        testcase("one active cycle");

        using namespace jtx;
        Env env(*this, day(2024, 3, 10));

        auto const a = env.cycle(2024);
        BEAST_EXPECT(a.status == CycleStatus::active);

        auto const b = env.require(env.cycles().createCycle(
            2025,
            day(2025, 1, 1),
            day(2025, 12, 31),
            std::nullopt,
            std::nullopt,
            "admin"));

        auto const activated = env.require(env.cycles().activateCycle(b.id));
        BEAST_EXPECT(activated.status == CycleStatus::active);
        BEAST_EXPECT(
            env.require(env.cycles().getCycle(a.id)).status ==
            CycleStatus::draft);

        auto const actives = [&] {
            int n = 0;
            for (auto const& c : env.cycles().listCycles())
                if (c.status == CycleStatus::active)
                    ++n;
            return n;
        };
        BEAST_EXPECT(actives() == 1);

        // Active, but today falls outside its dates.
        BEAST_EXPECT(env.cycles().activeCycle()->id == b.id);
        BEAST_EXPECT(!env.cycles().currentCycle());

        env.require(env.cycles().activateCycle(a.id));
        BEAST_EXPECT(actives() == 1);
        BEAST_EXPECT(env.cycles().currentCycle()->id == a.id);

        // Activating the active cycle again changes nothing.
        env.require(env.cycles().activateCycle(a.id));
        BEAST_EXPECT(actives() == 1);
    }

    void
    testCloseAndReopen()
    {
        testcase("close and reopen");

        using namespace jtx;
        Env env(*this, day(2024, 3, 10));

        auto const old = env.require(env.cycles().createCycle(
            2023,
            day(2023, 1, 1),
            day(2023, 12, 31),
            std::nullopt,
            std::nullopt,
            "admin"));
        auto const current = env.cycle(2024);

        env.require(env.cycles().configurePhase(
            current.id, PhaseType::declaration, 1, 10, std::nullopt, false));
        env.require(env.cycles().openPhase(current.id, PhaseType::declaration));

        BEAST_EXPECT(Env::failedWith(
            env.cycles().reopenCycle(current.id), tstBAD_STATE));

        auto const closed = env.require(env.cycles().closeCycle(current.id));
        BEAST_EXPECT(closed.status == CycleStatus::closed);
        BEAST_EXPECT(
            !env.cycles().getPhase(current.id, PhaseType::declaration)->isOpen);
        BEAST_EXPECT(!env.cycles().activeCycle());

        // Closing twice is harmless.
        BEAST_EXPECT(env.cycles().closeCycle(current.id));

        BEAST_EXPECT(Env::failedWith(
            env.cycles().activateCycle(current.id), tstCYCLE_CLOSED));
        BEAST_EXPECT(Env::failedWith(
            env.cycles().openPhase(current.id, PhaseType::declaration),
            tstCYCLE_CLOSED));
        BEAST_EXPECT(Env::failedWith(
            env.cycles().configurePhase(
                current.id, PhaseType::deposits, 1, 5, std::nullopt, false),
            tstCYCLE_CLOSED));

        // A cycle of this year may be reopened, one of a past year not.
        auto const reopened = env.require(env.cycles().reopenCycle(current.id));
        BEAST_EXPECT(reopened.status == CycleStatus::draft);

        env.require(env.cycles().closeCycle(old.id));
        BEAST_EXPECT(
            Env::failedWith(env.cycles().reopenCycle(old.id), tstBAD_STATE));
        BEAST_EXPECT(
            env.require(env.cycles().getCycle(old.id)).status ==
            CycleStatus::closed);

        BEAST_EXPECT(
            Env::failedWith(env.cycles().reopenCycle(42), tnfCYCLE));
    }

    void
    testPhases()
    {
        testcase("phases");

        using namespace jtx;
        Env env(*this);

        auto const c = env.cycle(2024);
        auto const late = env.require(env.penalties().createPenaltyType(
            "Late declaration", std::nullopt, money("5.00")));

        BEAST_EXPECT(Env::failedWith(
            env.cycles().configurePhase(
                c.id, PhaseType::declaration, 0, 10, std::nullopt, false),
            tvlBAD_DAY));
        BEAST_EXPECT(Env::failedWith(
            env.cycles().configurePhase(
                c.id, PhaseType::declaration, 1, 32, std::nullopt, false),
            tvlBAD_DAY));
        BEAST_EXPECT(Env::failedWith(
            env.cycles().configurePhase(
                c.id, PhaseType::declaration, 1, 10, PenaltyTypeID{77}, true),
            tnfPENALTY_TYPE));
        BEAST_EXPECT(Env::failedWith(
            env.cycles().configurePhase(
                99, PhaseType::declaration, 1, 10, std::nullopt, false),
            tnfCYCLE));

        auto const first = env.require(env.cycles().configurePhase(
            c.id, PhaseType::declaration, 1, 10, std::nullopt, false));
        BEAST_EXPECT(first.startDay == 1);
        BEAST_EXPECT(first.endDay == 10);
        BEAST_EXPECT(!first.isOpen);
        BEAST_EXPECT(!first.autoApply);

        // Configuring again replaces the settings of the same phase.
        auto const second = env.require(env.cycles().configurePhase(
            c.id, PhaseType::declaration, 1, 15, late.id, true));
        BEAST_EXPECT(second.id == first.id);
        BEAST_EXPECT(second.endDay == 15);
        BEAST_EXPECT(second.penaltyType == late.id);
        BEAST_EXPECT(second.autoApply);
        BEAST_EXPECT(env.cycles().phases(c.id).size() == 1);

        BEAST_EXPECT(env.require(env.cycles().openPhase(
                                     c.id, PhaseType::declaration))
                         .isOpen);
        BEAST_EXPECT(!env.require(env.cycles().closePhase(
                                      c.id, PhaseType::declaration))
                          .isOpen);
        BEAST_EXPECT(Env::failedWith(
            env.cycles().openPhase(c.id, PhaseType::payout), tnfPHASE));
        BEAST_EXPECT(!env.cycles().getPhase(c.id, PhaseType::payout));
    }

    void
    testDeadlines()
    {
        testcase("phase deadlines");

        using namespace jtx;

        CyclePhase declaration;
        declaration.type = PhaseType::declaration;
        BEAST_EXPECT(!phaseDeadline(declaration, day(2024, 3, 1)));

        declaration.endDay = 10;
        BEAST_EXPECT(
            phaseDeadline(declaration, day(2024, 3, 17)) == day(2024, 3, 10));

        // The deposits window closes in the following month.
        CyclePhase deposits;
        deposits.type = PhaseType::deposits;
        deposits.endDay = 5;
        BEAST_EXPECT(
            phaseDeadline(deposits, day(2024, 3, 1)) == day(2024, 4, 5));
        BEAST_EXPECT(
            phaseDeadline(deposits, day(2024, 12, 1)) == day(2025, 1, 5));

        // An end day past the end of the month means its last day.
        declaration.endDay = 31;
        BEAST_EXPECT(
            phaseDeadline(declaration, day(2024, 2, 1)) == day(2024, 2, 29));
        deposits.endDay = 31;
        BEAST_EXPECT(
            phaseDeadline(deposits, day(2023, 1, 1)) == day(2023, 2, 28));
        BEAST_EXPECT(
            phaseDeadline(deposits, day(2024, 3, 1)) == day(2024, 4, 30));
    }

    void
    testPostingLock()
    {
        testcase("posting lock");

        using namespace jtx;
        Env env(*this);

        auto const c = env.cycle(2024);
        BEAST_EXPECT(!env.cycles().isPostingLocked(c.id));
        BEAST_EXPECT(env.cycles().checkPostingAllowed(c.id));

        env.require(env.cycles().lockPostings(
            c.id, "treasurer", std::string("year end reconciliation")));
        BEAST_EXPECT(env.cycles().isPostingLocked(c.id));

        auto const lock = env.cycles().postingLock(c.id);
        if (BEAST_EXPECT(lock))
        {
            BEAST_EXPECT(lock->lockedBy == "treasurer");
            BEAST_EXPECT(lock->reason == std::string("year end reconciliation"));
        }

        auto const blocked = env.cycles().checkPostingAllowed(c.id);
        BEAST_EXPECT(!blocked);
        if (!blocked)
            BEAST_EXPECT(blocked.error().kind() == ErrorCategory::state);

        BEAST_EXPECT(Env::failedWith(
            env.cycles().lockPostings(c.id, "admin", std::nullopt),
            tvlDUPLICATE));
        BEAST_EXPECT(Env::failedWith(
            env.cycles().lockPostings(99, "admin", std::nullopt), tnfCYCLE));

        env.require(env.cycles().unlockPostings(c.id));
        BEAST_EXPECT(!env.cycles().isPostingLocked(c.id));

        // Unlocking an unlocked cycle is fine.
        env.require(env.cycles().unlockPostings(c.id));
        BEAST_EXPECT(env.cycles().checkPostingAllowed(c.id));
    }

public:
    void
    run() override
    {
        testCreate();
        testSingleActive();
        testCloseAndReopen();
        testPhases();
        testDeadlines();
        testPostingLock();
    }
};

BEAST_DEFINE_TESTSUITE(Cycle, app, mutual);

}  // namespace test
}  // namespace mutual
