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

#ifndef MUTUAL_APP_TX_PENALTYAPPLIER_H_INCLUDED
#define MUTUAL_APP_TX_PENALTYAPPLIER_H_INCLUDED

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

struct PenaltyType
{
    PenaltyTypeID id = 0;
    std::string name;
    std::optional<std::string> description;
    Money fee;
    bool enabled = true;
};

struct PenaltyRecord
{
    PenaltyID id = 0;
    MemberID member = 0;
    PenaltyTypeID type = 0;
    PenaltyStatus status = PenaltyStatus::pending;

    // First day of the month the penalty is for, when it was assessed
    // automatically.
    std::optional<Date> effectiveMonth;
    Date dateIssued;
    std::optional<std::string> notes;
    std::string createdBy;
    std::string createdAt;
    std::optional<std::string> approvedBy;
    std::optional<std::string> approvedAt;
    std::optional<std::string> paidAt;

    // The entry that charged the fee to the member.
    std::optional<EntryID> journalEntry;
};

/** Late penalties and their administration.

    Cycle-defined penalties are assessed automatically when a member acts
    after the end of a phase window. They are approved on creation and
    charged to the member's penalties payable account at once.
*/
class PenaltyApplier
{
    Application& app_;
    beast::Journal const j_;

public:
    PenaltyApplier(Application& app, beast::Journal journal);

    /** Assess the phase's penalty if the event is late.

        Does nothing unless the phase of the cycle auto-applies an enabled
        penalty type and has an end day. Assessing the same member, type and
        month again finds the existing record and creates nothing.

        @return The record created, if any.
    */
    Result<std::optional<PenaltyRecord>>
    applyIfLate(
        MemberID member,
        CycleID cycle,
        PhaseType phase,
        Date const& effectiveMonth);

    /** Mark approved penalties paid, oldest first.

        A penalty is paid when its whole fee fits in what remains of the
        amount. Penalties are matched by fee, not by type.

        @return The penalties marked paid.
    */
    std::vector<PenaltyID>
    settle(MemberID member, Money const& amount);

    //--------------------------------------------------------------------------

    Result<PenaltyType>
    createPenaltyType(
        std::string const& name,
        std::optional<std::string> const& description,
        Money const& fee,
        bool enabled = true);

    Result<PenaltyType>
    getPenaltyType(PenaltyTypeID id);

    std::vector<PenaltyType>
    listPenaltyTypes();

    /** A penalty raised by hand. It is charged only once approved. */
    Result<PenaltyRecord>
    recordPenalty(
        MemberID member,
        PenaltyTypeID type,
        std::string const& actor,
        std::optional<std::string> const& notes = std::nullopt);

    Result<PenaltyRecord>
    approvePenalty(PenaltyID id, std::string const& actor);

    Result<PenaltyRecord>
    getPenalty(PenaltyID id);

    std::vector<PenaltyRecord>
    penaltiesForMember(
        MemberID member,
        std::optional<PenaltyStatus> status = std::nullopt);

private:
    Result<EntryID>
    postCharge(PenaltyRecord const& record, PenaltyType const& type);

    std::vector<PenaltyRecord>
    selectRecords(LockedSociSession& db, std::string const& where);
};

}  // namespace mutual

#endif
