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

#ifndef MUTUAL_APP_CYCLE_CYCLEMANAGER_H_INCLUDED
#define MUTUAL_APP_CYCLE_CYCLEMANAGER_H_INCLUDED

#include <mutual/basics/Money.h>
#include <mutual/basics/chrono.h>
#include <mutual/beast/utility/Journal.h>
#include <mutual/protocol/Failure.h>
#include <mutual/protocol/Protocol.h>
#include <optional>
#include <string>
#include <vector>

namespace mutual {

class Application;
class LockedSociSession;

struct Cycle
{
    CycleID id = 0;
    int year = 0;
    Date start;
    Date end;
    CycleStatus status = CycleStatus::draft;

    // What each member must contribute to the funds over the cycle.
    std::optional<Money> socialRequired;
    std::optional<Money> adminRequired;

    std::string createdBy;

    bool
    contains(Date const& d) const
    {
        return start <= d && d <= end;
    }
};

/** A window that recurs every month of a cycle. */
struct CyclePhase
{
    std::int64_t id = 0;
    CycleID cycle = 0;
    PhaseType type = PhaseType::declaration;
    std::optional<int> startDay;
    std::optional<int> endDay;
    bool isOpen = false;
    std::optional<PenaltyTypeID> penaltyType;
    bool autoApply = false;
};

struct PostingLock
{
    CycleID cycle = 0;
    std::string lockedBy;
    std::optional<std::string> reason;
    std::string createdAt;
};

/** The last day of a phase window for an event in the given month.

    The deposits window opens in the event's month and closes in the
    following one; every other window closes in the event's own month. An
    end day past the end of a month means its last day.

    @return nothing if the phase has no end day.
*/
std::optional<Date>
phaseDeadline(CyclePhase const& phase, Date const& effectiveMonth);

//------------------------------------------------------------------------------

/** Annual cycles and their monthly phase calendar. */
class CycleManager
{
    Application& app_;
    beast::Journal const j_;

public:
    CycleManager(Application& app, beast::Journal journal);

    Result<Cycle>
    createCycle(
        int year,
        Date const& start,
        Date const& end,
        std::optional<Money> const& socialRequired,
        std::optional<Money> const& adminRequired,
        std::string const& actor);

    Result<Cycle>
    getCycle(CycleID id);

    std::vector<Cycle>
    listCycles();

    /** Make a cycle the active one.
        Any other active cycle goes back to draft in the same transaction.
    */
    Result<Cycle>
    activateCycle(CycleID id);

    /** Close a cycle and all of its phases. Closing twice is harmless. */
    Result<Cycle>
    closeCycle(CycleID id);

    /** Return a closed cycle of this or a later year to draft. */
    Result<Cycle>
    reopenCycle(CycleID id);

    /** The active cycle, if today falls within it. */
    std::optional<Cycle>
    currentCycle();

    /** The active cycle, whatever its dates. */
    std::optional<Cycle>
    activeCycle();

    //--------------------------------------------------------------------------

    /** Create or replace the configuration of one phase of a cycle. */
    Result<CyclePhase>
    configurePhase(
        CycleID cycle,
        PhaseType type,
        std::optional<int> startDay,
        std::optional<int> endDay,
        std::optional<PenaltyTypeID> penaltyType,
        bool autoApply);

    Result<CyclePhase>
    openPhase(CycleID cycle, PhaseType type);

    Result<CyclePhase>
    closePhase(CycleID cycle, PhaseType type);

    std::optional<CyclePhase>
    getPhase(CycleID cycle, PhaseType type);

    std::vector<CyclePhase>
    phases(CycleID cycle);

    //--------------------------------------------------------------------------

    /** Hold postings into a cycle, e.g. while its books are reconciled. */
    Result<void>
    lockPostings(
        CycleID cycle,
        std::string const& actor,
        std::optional<std::string> const& reason);

    Result<void>
    unlockPostings(CycleID cycle);

    bool
    isPostingLocked(CycleID cycle);

    std::optional<PostingLock>
    postingLock(CycleID cycle);

    /** A StateError when the cycle is locked against postings. */
    Result<void>
    checkPostingAllowed(CycleID cycle);

private:
    std::vector<Cycle>
    selectCycles(LockedSociSession& db, std::string const& where);

    Result<CyclePhase>
    setPhaseOpen(CycleID cycle, PhaseType type, bool open);
};

}  // namespace mutual

#endif
