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

#ifndef MUTUAL_APP_MAIN_APPLICATION_H_INCLUDED
#define MUTUAL_APP_MAIN_APPLICATION_H_INCLUDED

#include <mutual/beast/utility/Journal.h>
#include <memory>
#include <string>

namespace mutual {

class Config;
class CreditResolver;
class CycleManager;
class DatabaseCon;
class DeclarationWorkflow;
class DepositPoster;
class LedgerCore;
class LoanManager;
class Logs;
class MemberRegistry;
class PenaltyApplier;
class Scheduler;
class TimeKeeper;

/** The composition root.

    Owns the configuration, the logs, the clock, the database connection
    and every engine component. Components reach each other through here.
*/
class Application
{
public:
    Application() = default;

    virtual ~Application() = default;

    /** Open the store, apply the schema and bootstrap the chart.
        Returns `false` if the node cannot run.
    */
    virtual bool
    setup() = 0;

    /** Start the background sweeps, if enabled. */
    virtual void
    start() = 0;

    /** Block until signalStop() is called. */
    virtual void
    run() = 0;

    virtual void
    signalStop() = 0;

    virtual bool
    isStopping() const = 0;

    virtual Config&
    config() = 0;

    virtual Logs&
    logs() = 0;

    virtual beast::Journal
    journal(std::string const& name) = 0;

    virtual TimeKeeper&
    timeKeeper() = 0;

    virtual DatabaseCon&
    getDb() = 0;

    virtual MemberRegistry&
    getMembers() = 0;

    virtual LedgerCore&
    getLedger() = 0;

    virtual CycleManager&
    getCycles() = 0;

    virtual CreditResolver&
    getCredit() = 0;

    virtual PenaltyApplier&
    getPenalties() = 0;

    virtual DeclarationWorkflow&
    getDeclarations() = 0;

    virtual DepositPoster&
    getDepositPoster() = 0;

    virtual LoanManager&
    getLoans() = 0;

    virtual Scheduler&
    getScheduler() = 0;
};

std::unique_ptr<Application>
make_Application(
    std::unique_ptr<Config> config,
    std::unique_ptr<Logs> logs,
    std::unique_ptr<TimeKeeper> timeKeeper);

}  // namespace mutual

#endif
