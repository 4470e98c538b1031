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

#ifndef MUTUAL_TEST_JTX_ENV_H_INCLUDED
#define MUTUAL_TEST_JTX_ENV_H_INCLUDED

#include <mutual/app/credit/CreditResolver.h>
#include <mutual/app/cycle/CycleManager.h>
#include <mutual/app/ledger/LedgerCore.h>
#include <mutual/app/loan/LoanManager.h>
#include <mutual/app/main/Application.h>
#include <mutual/app/misc/MemberRegistry.h>
#include <mutual/app/misc/Scheduler.h>
#include <mutual/app/tx/DeclarationWorkflow.h>
#include <mutual/app/tx/DepositPoster.h>
#include <mutual/app/tx/PenaltyApplier.h>
#include <mutual/basics/Log.h>
#include <mutual/basics/contract.h>
#include <mutual/beast/unit_test.h>
#include <mutual/core/Config.h>
#include <mutual/core/DatabaseCon.h>
#include <mutual/core/TimeKeeper.h>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>

namespace mutual {
namespace test {
namespace jtx {

/** A clock the test moves by hand. */
class ManualTimeKeeper : public TimeKeeper
{
    std::mutex mutable mutex_;
    TimePoint now_;

public:
    explicit ManualTimeKeeper(Date const& today)
    {
        set(today);
    }

    TimePoint
    now() const override
    {
        std::lock_guard lock(mutex_);
        return now_;
    }

    /** Noon on the given day. */
    void
    set(Date const& today)
    {
        std::lock_guard lock(mutex_);
        now_ = date::sys_days{today} + std::chrono::hours{12};
    }
};

//------------------------------------------------------------------------------

/** Sends log output to the suite, where it shows up with --unittest-log. */
class SuiteJournalSink : public beast::Journal::Sink
{
    std::string partition_;
    beast::unit_test::suite& suite_;

public:
    SuiteJournalSink(
        std::string const& partition,
        beast::severities::Severity threshold,
        beast::unit_test::suite& suite)
        : Sink(threshold, false), partition_(partition + " "), suite_(suite)
    {
    }

    void
    write(beast::severities::Severity level, std::string const& text) override
    {
        if (level < threshold())
            return;
        suite_.log << partition_ << Logs::toString(level) << ": " << text
                   << std::endl;
    }
};

class SuiteLogs : public Logs
{
    beast::unit_test::suite& suite_;

public:
    explicit SuiteLogs(beast::unit_test::suite& suite)
        : Logs(beast::severities::kError), suite_(suite)
    {
    }

    std::unique_ptr<beast::Journal::Sink>
    makeSink(
        std::string const& partition,
        beast::severities::Severity threshold) override
    {
        return std::make_unique<SuiteJournalSink>(partition, threshold, suite_);
    }
};

//------------------------------------------------------------------------------

/** A configuration with an in-memory database and no background sweeps. */
inline std::unique_ptr<Config>
envconfig()
{
    auto cfg = std::make_unique<Config>();
    cfg->loadFromString(R"(
[database_path]
:memory:

[scheduler]
enabled = 0
)");
    return cfg;
}

/** Parse a literal amount, e.g. money("130.00"). */
inline Money
money(std::string const& s)
{
    auto const m = moneyFromString(s);
    if (!m)
        Throw<std::invalid_argument>("bad money literal " + s);
    return *m;
}

inline Rate
rate(std::string const& s)
{
    auto const r = rateFromString(s);
    if (!r)
        Throw<std::invalid_argument>("bad rate literal " + s);
    return *r;
}

/** Declared amounts, in the order of the declaration form. */
inline DeclaredAmounts
declared(
    Money savings,
    Money social = {},
    Money admin = {},
    Money penalties = {},
    Money interest = {},
    Money loanRepayment = {})
{
    DeclaredAmounts a;
    a.savings = savings;
    a.socialFund = social;
    a.adminFund = admin;
    a.penalties = penalties;
    a.interest = interest;
    a.loanRepayment = loanRepayment;
    return a;
}

inline Date
day(int y, unsigned m, unsigned d)
{
    return date::year{y} / date::month{m} / date::day{d};
}

//------------------------------------------------------------------------------

/** A complete engine on an in-memory store, driven by one suite. */
class Env
{
public:
    beast::unit_test::suite& test;

private:
    ManualTimeKeeper* clock_;
    std::unique_ptr<Application> app_;

public:
    explicit Env(
        beast::unit_test::suite& suite,
        Date const& today = day(2024, 3, 10),
        std::unique_ptr<Config> config = envconfig())
        : test(suite)
    {
        auto clock = std::make_unique<ManualTimeKeeper>(today);
        clock_ = clock.get();
        app_ = make_Application(
            std::move(config),
            std::make_unique<SuiteLogs>(suite),
            std::move(clock));
        if (!app_->setup())
            Throw<std::runtime_error>("Env: application setup failed");
    }

    Env(Env const&) = delete;
    Env&
    operator=(Env const&) = delete;

    Application&
    app()
    {
        return *app_;
    }

    ManualTimeKeeper&
    clock()
    {
        return *clock_;
    }

    /** Move today's date. */
    void
    setToday(Date const& today)
    {
        clock_->set(today);
    }

    MemberRegistry&
    members()
    {
        return app_->getMembers();
    }

    LedgerCore&
    ledger()
    {
        return app_->getLedger();
    }

    CycleManager&
    cycles()
    {
        return app_->getCycles();
    }

    CreditResolver&
    credit()
    {
        return app_->getCredit();
    }

    PenaltyApplier&
    penalties()
    {
        return app_->getPenalties();
    }

    DeclarationWorkflow&
    declarations()
    {
        return app_->getDeclarations();
    }

    DepositPoster&
    deposits()
    {
        return app_->getDepositPoster();
    }

    LoanManager&
    loans()
    {
        return app_->getLoans();
    }

    /** The value of a result the test depends on.
        A failure is reported and ends the current test case.
    */
    template <class T>
    T
    require(Result<T> r, char const* what = "operation")
    {
        if (!r)
        {
            std::ostringstream ss;
            ss << what << " failed: " << r.error();
            test.fail(ss.str(), __FILE__, __LINE__);
            Throw<std::runtime_error>(ss.str());
        }
        return std::move(*r);
    }

    void
    require(Result<void> r, char const* what = "operation")
    {
        if (!r)
        {
            std::ostringstream ss;
            ss << what << " failed: " << r.error();
            test.fail(ss.str(), __FILE__, __LINE__);
            Throw<std::runtime_error>(ss.str());
        }
    }

    /** Returns `true` if the result failed with the given code. */
    template <class T>
    static bool
    failedWith(Result<T> const& r, TER code)
    {
        return !r && r.error().code == code;
    }

    //--------------------------------------------------------------------------

    MemberID
    member(std::string const& name)
    {
        return require(members().create(name), "create member").id;
    }

    /** An active cycle for the calendar year with no fund requirements. */
    Cycle
    cycle(
        int year,
        std::optional<Money> socialRequired = std::nullopt,
        std::optional<Money> adminRequired = std::nullopt)
    {
        auto const c = require(
            cycles().createCycle(
                year,
                day(year, 1, 1),
                day(year, 12, 31),
                socialRequired,
                adminRequired,
                "admin"),
            "create cycle");
        return require(cycles().activateCycle(c.id), "activate cycle");
    }

    /** Declare and upload the matching proof. */
    std::pair<Declaration, DepositProof>
    declareAndProve(
        MemberID member,
        CycleID cycle,
        Date const& month,
        DeclaredAmounts const& amounts)
    {
        auto const d = require(
            declarations().createDeclaration(member, cycle, month, amounts),
            "declare");
        auto const p = require(
            declarations().uploadProof(d.id, amounts.total()), "upload proof");
        return {d, p};
    }

    /** A full monthly deposit, approved by the treasurer. */
    DepositPosting
    deposit(
        MemberID member,
        CycleID cycle,
        Date const& month,
        DeclaredAmounts const& amounts)
    {
        auto const [d, p] = declareAndProve(member, cycle, month, amounts);
        return require(
            deposits().approveProof(p.id, "treasurer"), "approve proof");
    }

    Money
    balance(std::string const& code)
    {
        auto const account = ledger().findAccount(code);
        if (!account)
            return Money{};
        return require(ledger().getAccountBalance(account->id), "balance");
    }

    Money
    balance(MemberID member, FundKind kind)
    {
        return balance(LedgerCore::subaccountCode(member, kind));
    }
};

}  // namespace jtx
}  // namespace test
}  // namespace mutual

#endif
