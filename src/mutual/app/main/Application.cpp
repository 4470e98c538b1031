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

#include <mutual/app/credit/CreditResolver.h>
#include <mutual/app/cycle/CycleManager.h>
#include <mutual/app/ledger/LedgerCore.h>
#include <mutual/app/loan/LoanManager.h>
#include <mutual/app/main/Application.h>
#include <mutual/app/main/DBInit.h>
#include <mutual/app/misc/MemberRegistry.h>
#include <mutual/app/misc/Scheduler.h>
#include <mutual/app/tx/DeclarationWorkflow.h>
#include <mutual/app/tx/DepositPoster.h>
#include <mutual/app/tx/PenaltyApplier.h>
#include <mutual/basics/Log.h>
#include <mutual/basics/contract.h>
#include <mutual/core/Config.h>
#include <mutual/core/DatabaseCon.h>
#include <mutual/core/TimeKeeper.h>
#include <condition_variable>
#include <mutex>

namespace mutual {

class ApplicationImp : public Application
{
private:
    std::unique_ptr<Config> config_;
    std::unique_ptr<Logs> logs_;
    std::unique_ptr<TimeKeeper> timeKeeper_;

    beast::Journal m_journal;

    std::unique_ptr<DatabaseCon> mDatabase;

    std::unique_ptr<MemberRegistry> m_members;
    std::unique_ptr<LedgerCore> m_ledger;
    std::unique_ptr<CycleManager> m_cycles;
    std::unique_ptr<CreditResolver> m_credit;
    std::unique_ptr<PenaltyApplier> m_penalties;
    std::unique_ptr<DeclarationWorkflow> m_declarations;
    std::unique_ptr<DepositPoster> m_depositPoster;
    std::unique_ptr<LoanManager> m_loans;
    std::unique_ptr<Scheduler> m_scheduler;

    std::mutex mutable stopMutex_;
    std::condition_variable stopped_;
    bool isStopping_ = false;

public:
    ApplicationImp(
        std::unique_ptr<Config> config,
        std::unique_ptr<Logs> logs,
        std::unique_ptr<TimeKeeper> timeKeeper)
        : config_(std::move(config))
        , logs_(std::move(logs))
        , timeKeeper_(std::move(timeKeeper))
        , m_journal(logs_->journal("Application"))

        , m_members(std::make_unique<MemberRegistry>(
              *this,
              logs_->journal("Members")))

        , m_ledger(
              std::make_unique<LedgerCore>(*this, logs_->journal("Ledger")))

        , m_cycles(
              std::make_unique<CycleManager>(*this, logs_->journal("Cycles")))

        , m_credit(std::make_unique<CreditResolver>(
              *this,
              logs_->journal("Credit")))

        , m_penalties(std::make_unique<PenaltyApplier>(
              *this,
              logs_->journal("Penalties")))

        , m_declarations(std::make_unique<DeclarationWorkflow>(
              *this,
              logs_->journal("Declarations")))

        , m_depositPoster(std::make_unique<DepositPoster>(
              *this,
              logs_->journal("Deposits")))

        , m_loans(std::make_unique<LoanManager>(*this, logs_->journal("Loans")))

        , m_scheduler(std::make_unique<Scheduler>(
              *this,
              config_->SCHEDULER_INTERVAL,
              logs_->journal("Scheduler")))
    {
    }

    ~ApplicationImp() override
    {
        // The sweeps use the database, stop them first.
        m_scheduler->stop();
    }

    //--------------------------------------------------------------------------

    bool
    setup() override
    {
        if (config_->had_trailing_comments())
        {
            JLOG(m_journal.warn())
                << "Trailing comments were seen in the config file. A '#' "
                   "that is part of a value must be escaped as '\\#'.";
        }

        try
        {
            mDatabase = std::make_unique<DatabaseCon>(
                setup_DatabaseCon(*config_, logs_->journal("DatabaseCon")),
                MutualDBName,
                MutualDBPragma,
                MutualDBInit,
                logs_->journal("DatabaseCon"));
        }
        catch (std::exception const& e)
        {
            JLOG(m_journal.fatal())
                << "Failed to open the database: " << e.what();
            return false;
        }

        if (config_->inMemoryDatabase())
        {
            JLOG(m_journal.warn()) << "Using an in-memory database";
        }

        auto const created = m_ledger->bootstrapChart();
        if (created)
        {
            JLOG(m_journal.info())
                << "Created " << created << " organization account(s)";
        }

        auto const unbalanced = m_ledger->unbalancedEntries();
        for (auto const id : unbalanced)
        {
            JLOG(m_journal.fatal()) << "Journal entry " << id
                                    << " does not balance";
        }
        if (!unbalanced.empty())
            return false;

        return true;
    }

    void
    start() override
    {
        if (config_->SCHEDULER_ENABLED)
            m_scheduler->start();
        else
        {
            JLOG(m_journal.info()) << "Background sweeps are disabled";
        }
    }

    void
    run() override
    {
        {
            std::unique_lock lock(stopMutex_);
            stopped_.wait(lock, [this] { return isStopping_; });
        }

        JLOG(m_journal.info()) << "Received shutdown request";
        m_scheduler->stop();
        JLOG(m_journal.info()) << "Done.";
    }

    void
    signalStop() override
    {
        std::lock_guard lock(stopMutex_);
        if (!isStopping_)
        {
            isStopping_ = true;
            stopped_.notify_all();
        }
    }

    bool
    isStopping() const override
    {
        std::lock_guard lock(stopMutex_);
        return isStopping_;
    }

    //--------------------------------------------------------------------------

    Config&
    config() override
    {
        return *config_;
    }

    Logs&
    logs() override
    {
        return *logs_;
    }

    beast::Journal
    journal(std::string const& name) override
    {
        return logs_->journal(name);
    }

    TimeKeeper&
    timeKeeper() override
    {
        return *timeKeeper_;
    }

    DatabaseCon&
    getDb() override
    {
        if (!mDatabase)
            LogicError("Application: the database is not open");
        return *mDatabase;
    }

    MemberRegistry&
    getMembers() override
    {
        return *m_members;
    }

    LedgerCore&
    getLedger() override
    {
        return *m_ledger;
    }

    CycleManager&
    getCycles() override
    {
        return *m_cycles;
    }

    CreditResolver&
    getCredit() override
    {
        return *m_credit;
    }

    PenaltyApplier&
    getPenalties() override
    {
        return *m_penalties;
    }

    DeclarationWorkflow&
    getDeclarations() override
    {
        return *m_declarations;
    }

    DepositPoster&
    getDepositPoster() override
    {
        return *m_depositPoster;
    }

    LoanManager&
    getLoans() override
    {
        return *m_loans;
    }

    Scheduler&
    getScheduler() override
    {
        return *m_scheduler;
    }
};

//------------------------------------------------------------------------------

std::unique_ptr<Application>
make_Application(
    std::unique_ptr<Config> config,
    std::unique_ptr<Logs> logs,
    std::unique_ptr<TimeKeeper> timeKeeper)
{
    return std::make_unique<ApplicationImp>(
        std::move(config), std::move(logs), std::move(timeKeeper));
}

}  // namespace mutual
