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

#include <mutual/app/cycle/CycleManager.h>
#include <mutual/app/main/Application.h>
#include <mutual/basics/Log.h>
#include <mutual/core/DatabaseCon.h>
#include <mutual/core/TimeKeeper.h>
#include <algorithm>

namespace mutual {

std::optional<Date>
phaseDeadline(CyclePhase const& phase, Date const& effectiveMonth)
{
    if (!phase.endDay)
        return std::nullopt;

    auto const month = phase.type == PhaseType::deposits
        ? addMonths(effectiveMonth, 1)
        : firstOfMonth(effectiveMonth);

    date::year_month_day_last const last{
        month.year(), date::month_day_last{month.month()}};
    auto const day = std::min(
        static_cast<unsigned>(*phase.endDay),
        static_cast<unsigned>(last.day()));

    return month.year() / month.month() / date::day{day};
}

namespace {

bool
validDay(std::optional<int> const& d)
{
    return !d || (*d >= 1 && *d <= 31);
}

Result<Cycle>
cycleNotFound(CycleID id)
{
    return failure(tnfCYCLE, "No cycle " + std::to_string(id));
}

}  // namespace

CycleManager::CycleManager(Application& app, beast::Journal journal)
    : app_(app), j_(journal)
{
}

Result<Cycle>
CycleManager::createCycle(
    int year,
    Date const& start,
    Date const& end,
    std::optional<Money> const& socialRequired,
    std::optional<Money> const& adminRequired,
    std::string const& actor)
{
    if (!start.ok() || !end.ok() || end < start)
        return failure(
            tvlBAD_DATE,
            "Cycle " + std::to_string(year) + " starts " + to_string(start) +
                " after it ends " + to_string(end));

    if ((socialRequired && socialRequired->signum() < 0) ||
        (adminRequired && adminRequired->signum() < 0))
        return failure(
            tvlNEGATIVE_AMOUNT, "Required fund amounts may not be negative");

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    std::string const s = to_string(start);
    std::string const e = to_string(end);
    std::string const status = to_string(CycleStatus::draft);
    std::string const now = to_string_iso(app_.timeKeeper().now());
    boost::optional<std::int64_t> social;
    boost::optional<std::int64_t> admin;
    if (socialRequired)
        social = socialRequired->cents();
    if (adminRequired)
        admin = adminRequired->cents();

    *db << "INSERT INTO cycles (year, start_date, end_date, status, "
           "social_required, admin_required, created_by, created_at) "
           "VALUES (:year, :start, :end, :status, :social, :admin, :by, :now)",
        soci::use(year), soci::use(s), soci::use(e), soci::use(status),
        soci::use(social), soci::use(admin), soci::use(actor),
        soci::use(now);

    CycleID id = 0;
    *db << "SELECT last_insert_rowid()", soci::into(id);

    tr.commit();

    JLOG(j_.info()) << "Created cycle " << id << " for " << year;
    return getCycle(id);
}

Result<Cycle>
CycleManager::getCycle(CycleID id)
{
    auto db = app_.getDb().checkoutDb();
    auto cycles = selectCycles(db, "WHERE id = " + std::to_string(id));
    if (cycles.empty())
        return cycleNotFound(id);
    return std::move(cycles.front());
}

std::vector<Cycle>
CycleManager::listCycles()
{
    auto db = app_.getDb().checkoutDb();
    return selectCycles(db, "");
}

Result<Cycle>
CycleManager::activateCycle(CycleID id)
{
    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const cycle = getCycle(id);
    if (!cycle)
        return cycle;

    if (cycle->status == CycleStatus::closed)
        return failure(
            tstCYCLE_CLOSED,
            "Cycle " + std::to_string(id) + " is closed; reopen it first");

    std::string const active = to_string(CycleStatus::active);
    std::string const draft = to_string(CycleStatus::draft);

    soci::statement demote =
        (db->prepare << "UPDATE cycles SET status = :draft "
                        "WHERE status = :active AND id != :id",
         soci::use(draft),
         soci::use(active),
         soci::use(id));
    demote.execute(true);
    if (auto const n = demote.get_affected_rows())
    {
        JLOG(j_.info()) << "Demoted " << n << " active cycle(s) to draft";
    }

    *db << "UPDATE cycles SET status = :active WHERE id = :id",
        soci::use(active), soci::use(id);

    int count = 0;
    *db << "SELECT COUNT(*) FROM cycles WHERE status = :active",
        soci::into(count), soci::use(active);
    if (count != 1)
        LogicError("CycleManager::activateCycle : more than one active cycle");

    tr.commit();

    JLOG(j_.info()) << "Activated cycle " << id;
    return getCycle(id);
}

Result<Cycle>
CycleManager::closeCycle(CycleID id)
{
    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const cycle = getCycle(id);
    if (!cycle)
        return cycle;

    if (cycle->status != CycleStatus::closed)
    {
        std::string const closed = to_string(CycleStatus::closed);
        *db << "UPDATE cycles SET status = :closed WHERE id = :id",
            soci::use(closed), soci::use(id);

        JLOG(j_.info()) << "Closed cycle " << id;
    }

    // Ledger balances are untouched: they are sums over every line ever
    // posted and simply carry forward.
    *db << "UPDATE cycle_phases SET is_open = 0 WHERE cycle_id = :id",
        soci::use(id);

    tr.commit();
    return getCycle(id);
}

Result<Cycle>
CycleManager::reopenCycle(CycleID id)
{
    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const cycle = getCycle(id);
    if (!cycle)
        return cycle;

    if (cycle->status != CycleStatus::closed)
        return failure(
            tstBAD_STATE,
            "Cycle " + std::to_string(id) + " is " +
                to_string(cycle->status) + ", not closed");

    int const thisYear =
        static_cast<int>(app_.timeKeeper().today().year());
    if (cycle->year < thisYear)
        return failure(
            tstBAD_STATE,
            "Cycle " + std::to_string(id) + " belongs to past year " +
                std::to_string(cycle->year));

    std::string const draft = to_string(CycleStatus::draft);
    *db << "UPDATE cycles SET status = :draft WHERE id = :id",
        soci::use(draft), soci::use(id);

    tr.commit();

    JLOG(j_.info()) << "Reopened cycle " << id;
    return getCycle(id);
}

std::optional<Cycle>
CycleManager::currentCycle()
{
    auto cycle = activeCycle();
    if (cycle && cycle->contains(app_.timeKeeper().today()))
        return cycle;
    return std::nullopt;
}

std::optional<Cycle>
CycleManager::activeCycle()
{
    auto db = app_.getDb().checkoutDb();
    auto cycles = selectCycles(
        db,
        std::string("WHERE status = '") + to_string(CycleStatus::active) +
            "'");
    if (cycles.empty())
        return std::nullopt;
    return std::move(cycles.front());
}

//------------------------------------------------------------------------------

Result<CyclePhase>
CycleManager::configurePhase(
    CycleID cycleId,
    PhaseType type,
    std::optional<int> startDay,
    std::optional<int> endDay,
    std::optional<PenaltyTypeID> penaltyType,
    bool autoApply)
{
    if (!validDay(startDay) || !validDay(endDay))
        return failure(tvlBAD_DAY);

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const cycle = getCycle(cycleId);
    if (!cycle)
        return Unexpected(cycle.error());

    if (cycle->status == CycleStatus::closed)
        return failure(
            tstCYCLE_CLOSED,
            "Cycle " + std::to_string(cycleId) + " is closed");

    if (penaltyType)
    {
        int found = 0;
        *db << "SELECT COUNT(*) FROM penalty_types WHERE id = :id",
            soci::into(found), soci::use(*penaltyType);
        if (!found)
            return failure(
                tnfPENALTY_TYPE,
                "No penalty type " + std::to_string(*penaltyType));
    }

    std::string const t = to_string(type);
    boost::optional<int> start;
    boost::optional<int> end;
    boost::optional<std::int64_t> penalty;
    if (startDay)
        start = *startDay;
    if (endDay)
        end = *endDay;
    if (penaltyType)
        penalty = *penaltyType;
    int const apply = autoApply ? 1 : 0;

    *db << "INSERT INTO cycle_phases "
           "(cycle_id, phase_type, start_day, end_day, penalty_type_id, "
           "auto_apply) "
           "VALUES (:cycle, :type, :start, :end, :penalty, :apply) "
           "ON CONFLICT (cycle_id, phase_type) DO UPDATE SET "
           "start_day = excluded.start_day, end_day = excluded.end_day, "
           "penalty_type_id = excluded.penalty_type_id, "
           "auto_apply = excluded.auto_apply",
        soci::use(cycleId), soci::use(t), soci::use(start), soci::use(end),
        soci::use(penalty), soci::use(apply);

    tr.commit();

    JLOG(j_.debug()) << "Configured " << t << " phase of cycle " << cycleId;

    auto phase = getPhase(cycleId, type);
    if (!phase)
        LogicError("CycleManager::configurePhase : phase vanished");
    return std::move(*phase);
}

Result<CyclePhase>
CycleManager::openPhase(CycleID cycle, PhaseType type)
{
    return setPhaseOpen(cycle, type, true);
}

Result<CyclePhase>
CycleManager::closePhase(CycleID cycle, PhaseType type)
{
    return setPhaseOpen(cycle, type, false);
}

Result<CyclePhase>
CycleManager::setPhaseOpen(CycleID cycleId, PhaseType type, bool open)
{
    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const cycle = getCycle(cycleId);
    if (!cycle)
        return Unexpected(cycle.error());

    if (open && cycle->status == CycleStatus::closed)
        return failure(
            tstCYCLE_CLOSED,
            "Cycle " + std::to_string(cycleId) + " is closed");

    std::string const t = to_string(type);
    int const flag = open ? 1 : 0;
    soci::statement st =
        (db->prepare << "UPDATE cycle_phases SET is_open = :flag "
                        "WHERE cycle_id = :cycle AND phase_type = :type",
         soci::use(flag),
         soci::use(cycleId),
         soci::use(t));
    st.execute(true);

    if (st.get_affected_rows() == 0)
        return failure(
            tnfPHASE,
            "Cycle " + std::to_string(cycleId) + " has no " + t + " phase");

    tr.commit();

    JLOG(j_.info()) << (open ? "Opened " : "Closed ") << t
                    << " phase of cycle " << cycleId;
    return std::move(*getPhase(cycleId, type));
}

std::optional<CyclePhase>
CycleManager::getPhase(CycleID cycle, PhaseType type)
{
    for (auto& phase : phases(cycle))
    {
        if (phase.type == type)
            return std::move(phase);
    }
    return std::nullopt;
}

std::vector<CyclePhase>
CycleManager::phases(CycleID cycle)
{
    auto db = app_.getDb().checkoutDb();

    std::vector<CyclePhase> result;

    CyclePhase p;
    std::string type;
    boost::optional<int> start;
    boost::optional<int> end;
    int open = 0;
    boost::optional<std::int64_t> penalty;
    int apply = 0;

    soci::statement st =
        (db->prepare << "SELECT id, cycle_id, phase_type, start_day, end_day, "
                        "is_open, penalty_type_id, auto_apply "
                        "FROM cycle_phases WHERE cycle_id = :cycle "
                        "ORDER BY id",
         soci::into(p.id),
         soci::into(p.cycle),
         soci::into(type),
         soci::into(start),
         soci::into(end),
         soci::into(open),
         soci::into(penalty),
         soci::into(apply),
         soci::use(cycle));
    st.execute();
    while (st.fetch())
    {
        CyclePhase row;
        row.id = p.id;
        row.cycle = p.cycle;
        row.type = fromStorage<PhaseType>(type);
        if (start)
            row.startDay = *start;
        if (end)
            row.endDay = *end;
        row.isOpen = open != 0;
        if (penalty)
            row.penaltyType = *penalty;
        row.autoApply = apply != 0;
        result.push_back(row);
    }
    return result;
}

//------------------------------------------------------------------------------

Result<void>
CycleManager::lockPostings(
    CycleID cycleId,
    std::string const& actor,
    std::optional<std::string> const& reason)
{
    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const cycle = getCycle(cycleId);
    if (!cycle)
        return Unexpected(cycle.error());

    if (isPostingLocked(cycleId))
        return failure(
            tvlDUPLICATE,
            "Cycle " + std::to_string(cycleId) + " is already locked");

    boost::optional<std::string> why;
    if (reason)
        why = *reason;
    std::string const now = to_string_iso(app_.timeKeeper().now());

    *db << "INSERT INTO posting_locks (cycle_id, locked_by, reason, "
           "created_at) VALUES (:cycle, :by, :reason, :now)",
        soci::use(cycleId), soci::use(actor), soci::use(why), soci::use(now);

    tr.commit();

    JLOG(j_.warn()) << "Postings into cycle " << cycleId << " locked by "
                    << actor;
    return {};
}

Result<void>
CycleManager::unlockPostings(CycleID cycleId)
{
    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const cycle = getCycle(cycleId);
    if (!cycle)
        return Unexpected(cycle.error());

    soci::statement st =
        (db->prepare << "DELETE FROM posting_locks WHERE cycle_id = :cycle",
         soci::use(cycleId));
    st.execute(true);

    tr.commit();

    if (st.get_affected_rows())
    {
        JLOG(j_.warn()) << "Postings into cycle " << cycleId << " unlocked";
    }
    return {};
}

bool
CycleManager::isPostingLocked(CycleID cycle)
{
    return postingLock(cycle).has_value();
}

std::optional<PostingLock>
CycleManager::postingLock(CycleID cycle)
{
    auto db = app_.getDb().checkoutDb();

    PostingLock lock;
    boost::optional<std::string> reason;
    *db << "SELECT cycle_id, locked_by, reason, created_at "
           "FROM posting_locks WHERE cycle_id = :cycle",
        soci::into(lock.cycle), soci::into(lock.lockedBy), soci::into(reason),
        soci::into(lock.createdAt), soci::use(cycle);

    if (!db->got_data())
        return std::nullopt;
    if (reason)
        lock.reason = *reason;
    return lock;
}

Result<void>
CycleManager::checkPostingAllowed(CycleID cycle)
{
    if (auto const lock = postingLock(cycle))
        return failure(
            tstPOSTING_LOCKED,
            "Cycle " + std::to_string(cycle) + " was locked by " +
                lock->lockedBy +
                (lock->reason ? ": " + *lock->reason : std::string{}));
    return {};
}

//------------------------------------------------------------------------------

std::vector<Cycle>
CycleManager::selectCycles(LockedSociSession& db, std::string const& where)
{
    std::vector<Cycle> result;

    Cycle c;
    std::string start;
    std::string end;
    std::string status;
    boost::optional<std::int64_t> social;
    boost::optional<std::int64_t> admin;

    soci::statement st =
        (db->prepare << "SELECT id, year, start_date, end_date, status, "
                        "social_required, admin_required, created_by "
                        "FROM cycles " +
                 where + " ORDER BY id",
         soci::into(c.id),
         soci::into(c.year),
         soci::into(start),
         soci::into(end),
         soci::into(status),
         soci::into(social),
         soci::into(admin),
         soci::into(c.createdBy));
    st.execute();
    while (st.fetch())
    {
        Cycle row;
        row.id = c.id;
        row.year = c.year;
        auto const s = dateFromString(start);
        auto const e = dateFromString(end);
        if (!s || !e)
            Throw<std::runtime_error>(
                "Cycle " + std::to_string(c.id) + " has a bad date");
        row.start = *s;
        row.end = *e;
        row.status = fromStorage<CycleStatus>(status);
        if (social)
            row.socialRequired = Money{*social};
        if (admin)
            row.adminRequired = Money{*admin};
        row.createdBy = c.createdBy;
        result.push_back(std::move(row));
    }
    return result;
}

}  // namespace mutual
