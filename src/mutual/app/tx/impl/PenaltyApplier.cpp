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
#include <mutual/app/ledger/LedgerCore.h>
#include <mutual/app/main/Application.h>
#include <mutual/app/misc/MemberRegistry.h>
#include <mutual/app/tx/PenaltyApplier.h>
#include <mutual/basics/Log.h>
#include <mutual/core/DatabaseCon.h>
#include <mutual/core/TimeKeeper.h>

namespace mutual {

namespace {

std::string
lateNote(PhaseType phase, Date const& month)
{
    return std::string("Late ") + to_string(phase) + " for " +
        to_string(month).substr(0, 7);
}

}  // namespace

PenaltyApplier::PenaltyApplier(Application& app, beast::Journal journal)
    : app_(app), j_(journal)
{
}

Result<std::optional<PenaltyRecord>>
PenaltyApplier::applyIfLate(
    MemberID member,
    CycleID cycle,
    PhaseType phaseType,
    Date const& effectiveMonth)
{
    auto const phase = app_.getCycles().getPhase(cycle, phaseType);
    if (!phase || !phase->autoApply || !phase->endDay || !phase->penaltyType)
        return std::nullopt;

    auto const type = getPenaltyType(*phase->penaltyType);
    if (!type)
        return Unexpected(type.error());
    if (!type->enabled)
    {
        JLOG(j_.trace()) << "Penalty type '" << type->name
                         << "' is disabled";
        return std::nullopt;
    }

    auto const month = firstOfMonth(effectiveMonth);
    auto const deadline = phaseDeadline(*phase, month);
    auto const today = app_.timeKeeper().today();
    if (!deadline || today <= *deadline)
        return std::nullopt;

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    std::string const m = to_string(month);
    std::string const issued = to_string(today);
    std::string const note = lateNote(phaseType, month);

    int existing = 0;
    *db << "SELECT COUNT(*) FROM penalty_records "
           "WHERE member_id = :member AND penalty_type_id = :type "
           "AND (effective_month = :month OR notes = :note "
           "OR (effective_month IS NULL AND date_issued = :issued))",
        soci::into(existing), soci::use(member), soci::use(type->id),
        soci::use(m), soci::use(note), soci::use(issued);

    if (existing)
    {
        JLOG(j_.debug()) << "Member " << member << " already has '"
                         << type->name << "' for " << m;
        return std::nullopt;
    }

    std::string const approved = to_string(PenaltyStatus::approved);
    std::string const actor = systemActor;
    std::string const now = to_string_iso(app_.timeKeeper().now());

    *db << "INSERT INTO penalty_records (member_id, penalty_type_id, status, "
           "effective_month, date_issued, notes, created_by, created_at, "
           "approved_by, approved_at) VALUES (:member, :type, :status, "
           ":month, :issued, :note, :by, :now, :approver, :at)",
        soci::use(member), soci::use(type->id), soci::use(approved),
        soci::use(m), soci::use(issued), soci::use(note), soci::use(actor),
        soci::use(now), soci::use(actor), soci::use(now);

    PenaltyID id = 0;
    *db << "SELECT last_insert_rowid()", soci::into(id);

    auto record = getPenalty(id);
    if (!record)
        LogicError("PenaltyApplier::applyIfLate : record vanished");

    auto const entry = postCharge(*record, *type);
    if (!entry)
        return Unexpected(entry.error());
    record->journalEntry = *entry;

    tr.commit();

    JLOG(j_.info()) << "Member " << member << " late for " << to_string(phaseType)
                    << " " << m << " (deadline " << to_string(*deadline)
                    << "): penalty " << id << " of " << type->fee;
    return std::optional<PenaltyRecord>(std::move(*record));
}

std::vector<PenaltyID>
PenaltyApplier::settle(MemberID member, Money const& amount)
{
    std::vector<PenaltyID> paid;
    if (amount.signum() <= 0)
        return paid;

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    std::string const approved = to_string(PenaltyStatus::approved);

    std::vector<std::pair<PenaltyID, Money>> candidates;
    {
        PenaltyID id = 0;
        std::int64_t fee = 0;
        soci::statement st =
            (db->prepare << "SELECT r.id, t.fee FROM penalty_records r "
                            "JOIN penalty_types t ON t.id = r.penalty_type_id "
                            "WHERE r.member_id = :member "
                            "AND r.status = :status "
                            "ORDER BY r.date_issued, r.id",
             soci::into(id),
             soci::into(fee),
             soci::use(member),
             soci::use(approved));
        st.execute();
        while (st.fetch())
            candidates.emplace_back(id, Money{fee});
    }

    std::string const status = to_string(PenaltyStatus::paid);
    std::string const now = to_string_iso(app_.timeKeeper().now());
    auto remaining = amount;

    for (auto const& [id, fee] : candidates)
    {
        if (remaining < fee)
            continue;

        soci::statement st =
            (db->prepare << "UPDATE penalty_records SET status = :paid, "
                            "paid_at = :now WHERE id = :id "
                            "AND status = :approved",
             soci::use(status),
             soci::use(now),
             soci::use(id),
             soci::use(approved));
        st.execute(true);
        if (st.get_affected_rows() == 0)
            continue;

        remaining -= fee;
        paid.push_back(id);

        JLOG(j_.debug()) << "Penalty " << id << " of " << fee << " paid";
    }

    tr.commit();

    if (remaining.signum() > 0)
    {
        JLOG(j_.info()) << "Member " << member << ": " << remaining
                        << " of declared penalties matched no penalty";
    }
    return paid;
}

//------------------------------------------------------------------------------

Result<PenaltyType>
PenaltyApplier::createPenaltyType(
    std::string const& name,
    std::optional<std::string> const& description,
    Money const& fee,
    bool enabled)
{
    if (name.empty())
        return failure(tvlMISSING_FIELD, "A penalty type needs a name");
    if (fee.signum() <= 0)
        return failure(tvlBAD_AMOUNT, "A penalty fee must be positive");

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    int found = 0;
    *db << "SELECT COUNT(*) FROM penalty_types WHERE name = :name",
        soci::into(found), soci::use(name);
    if (found)
        return failure(tvlDUPLICATE, "Penalty type '" + name + "' exists");

    boost::optional<std::string> descr;
    if (description)
        descr = *description;
    std::int64_t const cents = fee.cents();
    int const on = enabled ? 1 : 0;

    *db << "INSERT INTO penalty_types (name, description, fee, enabled) "
           "VALUES (:name, :descr, :fee, :enabled)",
        soci::use(name), soci::use(descr), soci::use(cents), soci::use(on);

    PenaltyType type;
    *db << "SELECT last_insert_rowid()", soci::into(type.id);
    type.name = name;
    type.description = description;
    type.fee = fee;
    type.enabled = enabled;

    tr.commit();

    JLOG(j_.info()) << "Created penalty type " << type.id << " '" << name
                    << "' of " << fee;
    return type;
}

Result<PenaltyType>
PenaltyApplier::getPenaltyType(PenaltyTypeID id)
{
    auto db = app_.getDb().checkoutDb();

    PenaltyType type;
    boost::optional<std::string> descr;
    std::int64_t fee = 0;
    int enabled = 0;

    *db << "SELECT id, name, description, fee, enabled FROM penalty_types "
           "WHERE id = :id",
        soci::into(type.id), soci::into(type.name), soci::into(descr),
        soci::into(fee), soci::into(enabled), soci::use(id);

    if (!db->got_data())
        return failure(tnfPENALTY_TYPE, "No penalty type " + std::to_string(id));

    if (descr)
        type.description = *descr;
    type.fee = Money{fee};
    type.enabled = enabled != 0;
    return type;
}

std::vector<PenaltyType>
PenaltyApplier::listPenaltyTypes()
{
    std::vector<PenaltyTypeID> ids;
    {
        auto db = app_.getDb().checkoutDb();
        PenaltyTypeID id = 0;
        soci::statement st =
            (db->prepare << "SELECT id FROM penalty_types ORDER BY id",
             soci::into(id));
        st.execute();
        while (st.fetch())
            ids.push_back(id);
    }

    std::vector<PenaltyType> result;
    for (auto const id : ids)
    {
        if (auto type = getPenaltyType(id))
            result.push_back(std::move(*type));
    }
    return result;
}

Result<PenaltyRecord>
PenaltyApplier::recordPenalty(
    MemberID member,
    PenaltyTypeID typeId,
    std::string const& actor,
    std::optional<std::string> const& notes)
{
    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    if (auto const m = app_.getMembers().get(member); !m)
        return Unexpected(m.error());
    auto const type = getPenaltyType(typeId);
    if (!type)
        return Unexpected(type.error());

    std::string const pending = to_string(PenaltyStatus::pending);
    std::string const issued = to_string(app_.timeKeeper().today());
    std::string const now = to_string_iso(app_.timeKeeper().now());
    boost::optional<std::string> note;
    if (notes)
        note = *notes;

    *db << "INSERT INTO penalty_records (member_id, penalty_type_id, status, "
           "date_issued, notes, created_by, created_at) VALUES (:member, "
           ":type, :status, :issued, :note, :by, :now)",
        soci::use(member), soci::use(typeId), soci::use(pending),
        soci::use(issued), soci::use(note), soci::use(actor), soci::use(now);

    PenaltyID id = 0;
    *db << "SELECT last_insert_rowid()", soci::into(id);

    tr.commit();

    JLOG(j_.info()) << "Penalty " << id << " '" << type->name
                    << "' recorded against member " << member << " by "
                    << actor;
    return getPenalty(id);
}

Result<PenaltyRecord>
PenaltyApplier::approvePenalty(PenaltyID id, std::string const& actor)
{
    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto record = getPenalty(id);
    if (!record)
        return record;

    if (record->status != PenaltyStatus::pending)
        return failure(
            tstBAD_STATE,
            "Penalty " + std::to_string(id) + " is " +
                to_string(record->status) + ", not pending");

    auto const type = getPenaltyType(record->type);
    if (!type)
        return Unexpected(type.error());

    std::string const approved = to_string(PenaltyStatus::approved);
    std::string const pending = to_string(PenaltyStatus::pending);
    std::string const now = to_string_iso(app_.timeKeeper().now());

    soci::statement st =
        (db->prepare << "UPDATE penalty_records SET status = :approved, "
                        "approved_by = :by, approved_at = :now "
                        "WHERE id = :id AND status = :pending",
         soci::use(approved),
         soci::use(actor),
         soci::use(now),
         soci::use(id),
         soci::use(pending));
    st.execute(true);

    if (st.get_affected_rows() == 0)
        return failure(
            tstCONCURRENT_UPDATE,
            "Penalty " + std::to_string(id) + " was decided concurrently");

    record->approvedBy = actor;
    auto const entry = postCharge(*record, *type);
    if (!entry)
        return Unexpected(entry.error());

    tr.commit();

    JLOG(j_.info()) << "Penalty " << id << " approved by " << actor;
    return getPenalty(id);
}

Result<PenaltyRecord>
PenaltyApplier::getPenalty(PenaltyID id)
{
    auto db = app_.getDb().checkoutDb();
    auto records = selectRecords(db, "WHERE id = " + std::to_string(id));
    if (records.empty())
        return failure(tnfPENALTY, "No penalty " + std::to_string(id));
    return std::move(records.front());
}

std::vector<PenaltyRecord>
PenaltyApplier::penaltiesForMember(
    MemberID member,
    std::optional<PenaltyStatus> status)
{
    auto db = app_.getDb().checkoutDb();

    std::string where = "WHERE member_id = " + std::to_string(member);
    if (status)
        where += std::string(" AND status = '") + to_string(*status) + "'";
    return selectRecords(db, where);
}

//------------------------------------------------------------------------------

Result<EntryID>
PenaltyApplier::postCharge(PenaltyRecord const& record, PenaltyType const& type)
{
    auto& ledger = app_.getLedger();

    auto const income = ledger.requireAccount(org::penaltyIncome);
    if (!income)
        return Unexpected(income.error());

    auto const payable =
        ledger.getOrCreateMemberSubaccount(record.member, FundKind::penalties);
    if (!payable)
        return Unexpected(payable.error());

    std::optional<CycleID> cycle;
    if (auto const active = app_.getCycles().activeCycle())
        cycle = active->id;

    auto const entry = ledger.createJournalEntry(
        "Penalty " + std::to_string(record.id) + " - " + type.name,
        {debitLine(payable->id, type.fee), creditLine(income->id, type.fee)},
        cycle,
        record.id,
        std::string(source::penalty),
        record.approvedBy.value_or(systemActor));
    if (!entry)
        return Unexpected(entry.error());

    auto db = app_.getDb().checkoutDb();
    *db << "UPDATE penalty_records SET journal_entry_id = :entry "
           "WHERE id = :id",
        soci::use(entry->id), soci::use(record.id);

    return entry->id;
}

std::vector<PenaltyRecord>
PenaltyApplier::selectRecords(LockedSociSession& db, std::string const& where)
{
    std::vector<PenaltyRecord> result;

    PenaltyRecord r;
    std::string status;
    boost::optional<std::string> month;
    std::string issued;
    boost::optional<std::string> notes;
    boost::optional<std::string> approvedBy;
    boost::optional<std::string> approvedAt;
    boost::optional<std::string> paidAt;
    boost::optional<std::int64_t> entry;

    soci::statement st =
        (db->prepare << "SELECT id, member_id, penalty_type_id, status, "
                        "effective_month, date_issued, notes, created_by, "
                        "created_at, approved_by, approved_at, paid_at, "
                        "journal_entry_id FROM penalty_records " +
                 where + " ORDER BY date_issued, id",
         soci::into(r.id),
         soci::into(r.member),
         soci::into(r.type),
         soci::into(status),
         soci::into(month),
         soci::into(issued),
         soci::into(notes),
         soci::into(r.createdBy),
         soci::into(r.createdAt),
         soci::into(approvedBy),
         soci::into(approvedAt),
         soci::into(paidAt),
         soci::into(entry));
    st.execute();
    while (st.fetch())
    {
        PenaltyRecord row;
        row.id = r.id;
        row.member = r.member;
        row.type = r.type;
        row.status = fromStorage<PenaltyStatus>(status);
        if (month)
            row.effectiveMonth = dateFromString(*month);
        auto const d = dateFromString(issued);
        if (!d)
            Throw<std::runtime_error>(
                "Penalty " + std::to_string(r.id) + " has a bad date");
        row.dateIssued = *d;
        if (notes)
            row.notes = *notes;
        row.createdBy = r.createdBy;
        row.createdAt = r.createdAt;
        if (approvedBy)
            row.approvedBy = *approvedBy;
        if (approvedAt)
            row.approvedAt = *approvedAt;
        if (paidAt)
            row.paidAt = *paidAt;
        if (entry)
            row.journalEntry = *entry;
        result.push_back(std::move(row));
    }
    return result;
}

}  // namespace mutual
