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
#include <mutual/app/misc/MemberRegistry.h>
#include <mutual/app/tx/DeclarationWorkflow.h>
#include <mutual/app/tx/PenaltyApplier.h>
#include <mutual/basics/Log.h>
#include <mutual/core/Config.h>
#include <mutual/core/DatabaseCon.h>
#include <mutual/core/TimeKeeper.h>

namespace mutual {

Result<void>
checkProofAmount(Declaration const& declaration, DepositProof const& proof)
{
    auto const declared = declaration.amounts.total();
    if (!withinTolerance(proof.amount, declared))
        return failure(
            tvlAMOUNT_MISMATCH,
            "Proof " + std::to_string(proof.id) + " of " +
                to_string(proof.amount) + " does not match the " +
                to_string(declared) + " declared");
    return {};
}

namespace {

Result<void>
checkAmounts(DeclaredAmounts const& amounts)
{
    if (amounts.anyNegative())
        return failure(
            tvlNEGATIVE_AMOUNT, "Declared amounts may not be negative");
    if (amounts.empty())
        return failure(tvlBAD_AMOUNT, "Nothing was declared");
    return {};
}

}  // namespace

DeclarationWorkflow::DeclarationWorkflow(Application& app, beast::Journal journal)
    : app_(app), j_(journal)
{
}

Result<Declaration>
DeclarationWorkflow::createDeclaration(
    MemberID member,
    CycleID cycleId,
    Date const& effectiveMonth,
    DeclaredAmounts const& amounts)
{
    if (auto const r = checkAmounts(amounts); !r)
        return Unexpected(r.error());
    if (!effectiveMonth.ok())
        return failure(tvlBAD_DATE);

    auto const month = firstOfMonth(effectiveMonth);

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    if (auto const m = app_.getMembers().requireActive(member); !m)
        return Unexpected(m.error());

    auto const cycle = app_.getCycles().getCycle(cycleId);
    if (!cycle)
        return Unexpected(cycle.error());
    if (cycle->status == CycleStatus::closed)
        return failure(
            tstCYCLE_CLOSED,
            "Cycle " + std::to_string(cycleId) + " is closed");
    if (month < firstOfMonth(cycle->start) || cycle->end < month)
        return failure(
            tvlBAD_DATE,
            to_string(month) + " is outside cycle " +
                std::to_string(cycleId));

    if (findDeclaration(member, cycleId, month))
        return failure(
            tvlDUPLICATE,
            "Member " + std::to_string(member) + " already declared for " +
                to_string(month));

    std::string const m = to_string(month);
    std::string const status = to_string(DeclarationStatus::pending);
    std::string const now = to_string_iso(app_.timeKeeper().now());
    std::int64_t const savings = amounts.savings.cents();
    std::int64_t const social = amounts.socialFund.cents();
    std::int64_t const admin = amounts.adminFund.cents();
    std::int64_t const penalties = amounts.penalties.cents();
    std::int64_t const interest = amounts.interest.cents();
    std::int64_t const repayment = amounts.loanRepayment.cents();

    *db << "INSERT INTO declarations (member_id, cycle_id, effective_month, "
           "savings, social_fund, admin_fund, penalties, interest, "
           "loan_repayment, status, created_at) VALUES (:member, :cycle, "
           ":month, :sav, :soc, :adm, :pen, :int, :rep, :status, :now)",
        soci::use(member), soci::use(cycleId), soci::use(m),
        soci::use(savings), soci::use(social), soci::use(admin),
        soci::use(penalties), soci::use(interest), soci::use(repayment),
        soci::use(status), soci::use(now);

    DeclarationID id = 0;
    *db << "SELECT last_insert_rowid()", soci::into(id);

    auto const penalty = app_.getPenalties().applyIfLate(
        member, cycleId, PhaseType::declaration, month);
    if (!penalty)
        return Unexpected(penalty.error());

    tr.commit();

    JLOG(j_.info()) << "Declaration " << id << " by member " << member
                    << " for " << m << ": " << amounts.total();
    return getDeclaration(id);
}

Result<Declaration>
DeclarationWorkflow::updateDeclaration(
    DeclarationID id,
    DeclaredAmounts const& amounts,
    std::string const& actor)
{
    if (auto const r = checkAmounts(amounts); !r)
        return Unexpected(r.error());

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const declaration = getDeclaration(id);
    if (!declaration)
        return declaration;

    auto const proof = proofForDeclaration(id);
    bool const reopened = proof && proof->status == ProofStatus::rejected &&
        declaration->status == DeclarationStatus::pending;

    if (!reopened)
    {
        if (declaration->status != DeclarationStatus::pending)
            return failure(
                tstEDIT_CLOSED,
                "Declaration " + std::to_string(id) + " is " +
                    to_string(declaration->status));

        auto const today = app_.timeKeeper().today();
        if (declaration->effectiveMonth != firstOfMonth(today))
            return failure(
                tstEDIT_CLOSED,
                "Declaration " + std::to_string(id) +
                    " is not for the current month");

        auto const cutoff = app_.config().DECLARATION_EDIT_CUTOFF;
        if (static_cast<unsigned>(today.day()) >
            static_cast<unsigned>(cutoff))
            return failure(
                tstEDIT_CLOSED,
                "Declarations close for edits after day " +
                    std::to_string(cutoff));
    }

    std::string const now = to_string_iso(app_.timeKeeper().now());
    std::string const pending = to_string(DeclarationStatus::pending);
    std::int64_t const savings = amounts.savings.cents();
    std::int64_t const social = amounts.socialFund.cents();
    std::int64_t const admin = amounts.adminFund.cents();
    std::int64_t const penalties = amounts.penalties.cents();
    std::int64_t const interest = amounts.interest.cents();
    std::int64_t const repayment = amounts.loanRepayment.cents();

    soci::statement st =
        (db->prepare << "UPDATE declarations SET savings = :sav, "
                        "social_fund = :soc, admin_fund = :adm, "
                        "penalties = :pen, interest = :int, "
                        "loan_repayment = :rep, updated_by = :by, "
                        "updated_at = :now "
                        "WHERE id = :id AND status = :pending",
         soci::use(savings),
         soci::use(social),
         soci::use(admin),
         soci::use(penalties),
         soci::use(interest),
         soci::use(repayment),
         soci::use(actor),
         soci::use(now),
         soci::use(id),
         soci::use(pending));
    st.execute(true);

    if (st.get_affected_rows() == 0)
        return failure(
            tstCONCURRENT_UPDATE,
            "Declaration " + std::to_string(id) + " changed concurrently");

    tr.commit();

    JLOG(j_.info()) << "Declaration " << id << " updated by " << actor
                    << ": " << amounts.total();
    return getDeclaration(id);
}

Result<DepositProof>
DeclarationWorkflow::uploadProof(
    DeclarationID id,
    Money const& amount,
    std::optional<std::string> const& reference)
{
    if (amount.signum() <= 0)
        return failure(tvlBAD_AMOUNT);

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const declaration = getDeclaration(id);
    if (!declaration)
        return Unexpected(declaration.error());

    if (declaration->status != DeclarationStatus::pending)
        return failure(
            tstBAD_STATE,
            "Declaration " + std::to_string(id) + " is " +
                to_string(declaration->status) + ", not pending");

    auto const existing = proofForDeclaration(id);
    if (existing && existing->status != ProofStatus::rejected)
        return failure(
            tstPROOF_EXISTS,
            "Declaration " + std::to_string(id) + " already has proof " +
                std::to_string(existing->id));

    std::int64_t const cents = amount.cents();
    boost::optional<std::string> ref;
    if (reference)
        ref = *reference;
    std::string const submitted = to_string(ProofStatus::submitted);
    std::string const rejected = to_string(ProofStatus::rejected);
    std::string const now = to_string_iso(app_.timeKeeper().now());

    ProofID proofId = 0;
    if (existing)
    {
        // Resubmission keeps the rejection trail.
        soci::statement st =
            (db->prepare << "UPDATE deposit_proofs SET amount = :amount, "
                            "reference = :ref, status = :submitted, "
                            "uploaded_at = :now "
                            "WHERE id = :id AND status = :rejected",
             soci::use(cents),
             soci::use(ref),
             soci::use(submitted),
             soci::use(now),
             soci::use(existing->id),
             soci::use(rejected));
        st.execute(true);
        if (st.get_affected_rows() == 0)
            return failure(
                tstCONCURRENT_UPDATE,
                "Proof " + std::to_string(existing->id) +
                    " changed concurrently");
        proofId = existing->id;
    }
    else
    {
        *db << "INSERT INTO deposit_proofs (declaration_id, amount, "
               "reference, status, uploaded_at) "
               "VALUES (:decl, :amount, :ref, :status, :now)",
            soci::use(id), soci::use(cents), soci::use(ref),
            soci::use(submitted), soci::use(now);
        *db << "SELECT last_insert_rowid()", soci::into(proofId);
    }

    std::string const pending = to_string(DeclarationStatus::pending);
    std::string const proofState = to_string(DeclarationStatus::proof);
    soci::statement st =
        (db->prepare << "UPDATE declarations SET status = :proof "
                        "WHERE id = :id AND status = :pending",
         soci::use(proofState),
         soci::use(id),
         soci::use(pending));
    st.execute(true);
    if (st.get_affected_rows() == 0)
        return failure(
            tstCONCURRENT_UPDATE,
            "Declaration " + std::to_string(id) + " changed concurrently");

    if (!withinTolerance(amount, declaration->amounts.total()))
    {
        JLOG(j_.warn()) << "Proof " << proofId << " of " << amount
                        << " differs from the " << declaration->amounts.total()
                        << " declared";
    }

    auto const penalty = app_.getPenalties().applyIfLate(
        declaration->member,
        declaration->cycle,
        PhaseType::deposits,
        declaration->effectiveMonth);
    if (!penalty)
        return Unexpected(penalty.error());

    tr.commit();

    JLOG(j_.info()) << (existing ? "Resubmitted" : "Uploaded") << " proof "
                    << proofId << " for declaration " << id << ": "
                    << amount;
    return getProof(proofId);
}

Result<DepositProof>
DeclarationWorkflow::rejectProof(
    ProofID id,
    std::string const& comment,
    std::string const& actor)
{
    if (comment.empty())
        return failure(tvlMISSING_FIELD, "A rejection needs a comment");

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const proof = getProof(id);
    if (!proof)
        return proof;

    if (proof->status != ProofStatus::submitted)
        return failure(
            tstBAD_STATE,
            "Proof " + std::to_string(id) + " is " +
                to_string(proof->status) + ", not submitted");

    std::string const rejected = to_string(ProofStatus::rejected);
    std::string const submitted = to_string(ProofStatus::submitted);
    std::string const now = to_string_iso(app_.timeKeeper().now());

    {
        soci::statement st =
            (db->prepare << "UPDATE deposit_proofs SET status = :rejected, "
                            "rejection_comment = :comment, rejected_by = :by, "
                            "rejected_at = :now "
                            "WHERE id = :id AND status = :submitted",
             soci::use(rejected),
             soci::use(comment),
             soci::use(actor),
             soci::use(now),
             soci::use(id),
             soci::use(submitted));
        st.execute(true);
        if (st.get_affected_rows() == 0)
            return failure(
                tstCONCURRENT_UPDATE,
                "Proof " + std::to_string(id) + " was decided concurrently");
    }

    // The declaration must still be waiting on this proof.
    {
        std::string const pending = to_string(DeclarationStatus::pending);
        std::string const proofState = to_string(DeclarationStatus::proof);
        soci::statement st =
            (db->prepare << "UPDATE declarations SET status = :pending "
                            "WHERE id = :id AND status = :proof",
             soci::use(pending),
             soci::use(proof->declaration),
             soci::use(proofState));
        st.execute(true);
        if (st.get_affected_rows() == 0)
            return failure(
                tstCONCURRENT_UPDATE,
                "Declaration " + std::to_string(proof->declaration) +
                    " changed concurrently");
    }

    tr.commit();

    JLOG(j_.info()) << "Proof " << id << " rejected by " << actor << ": "
                    << comment;
    return getProof(id);
}

Result<DepositProof>
DeclarationWorkflow::respondToRejection(
    ProofID id,
    std::string const& response)
{
    if (response.empty())
        return failure(tvlMISSING_FIELD, "The response is empty");

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const proof = getProof(id);
    if (!proof)
        return proof;

    if (proof->status != ProofStatus::rejected)
        return failure(
            tstBAD_STATE,
            "Proof " + std::to_string(id) + " is " +
                to_string(proof->status) + ", not rejected");

    std::string const now = to_string_iso(app_.timeKeeper().now());
    *db << "UPDATE deposit_proofs SET member_response = :response, "
           "responded_at = :now WHERE id = :id",
        soci::use(response), soci::use(now), soci::use(id);

    tr.commit();
    return getProof(id);
}

//------------------------------------------------------------------------------

Result<Declaration>
DeclarationWorkflow::getDeclaration(DeclarationID id)
{
    auto db = app_.getDb().checkoutDb();
    auto found = selectDeclarations(db, "WHERE id = " + std::to_string(id));
    if (found.empty())
        return failure(tnfDECLARATION, "No declaration " + std::to_string(id));
    return std::move(found.front());
}

std::optional<Declaration>
DeclarationWorkflow::findDeclaration(
    MemberID member,
    CycleID cycle,
    Date const& month)
{
    auto db = app_.getDb().checkoutDb();
    auto found = selectDeclarations(
        db,
        "WHERE member_id = " + std::to_string(member) +
            " AND cycle_id = " + std::to_string(cycle) +
            " AND effective_month = '" + to_string(firstOfMonth(month)) +
            "'");
    if (found.empty())
        return std::nullopt;
    return std::move(found.front());
}

std::vector<Declaration>
DeclarationWorkflow::declarationsFor(
    MemberID member,
    std::optional<CycleID> cycle)
{
    auto db = app_.getDb().checkoutDb();
    std::string where = "WHERE member_id = " + std::to_string(member);
    if (cycle)
        where += " AND cycle_id = " + std::to_string(*cycle);
    return selectDeclarations(db, where);
}

Result<DepositProof>
DeclarationWorkflow::getProof(ProofID id)
{
    auto db = app_.getDb().checkoutDb();
    if (auto proof = selectProof(db, "WHERE id = " + std::to_string(id)))
        return std::move(*proof);
    return failure(tnfPROOF, "No deposit proof " + std::to_string(id));
}

std::optional<DepositProof>
DeclarationWorkflow::proofForDeclaration(DeclarationID id)
{
    auto db = app_.getDb().checkoutDb();
    return selectProof(db, "WHERE declaration_id = " + std::to_string(id));
}

//------------------------------------------------------------------------------

std::vector<Declaration>
DeclarationWorkflow::selectDeclarations(
    LockedSociSession& db,
    std::string const& where)
{
    std::vector<Declaration> result;

    Declaration d;
    std::string month;
    std::int64_t savings = 0;
    std::int64_t social = 0;
    std::int64_t admin = 0;
    std::int64_t penalties = 0;
    std::int64_t interest = 0;
    std::int64_t repayment = 0;
    std::string status;
    boost::optional<std::string> updatedBy;
    boost::optional<std::string> updatedAt;

    soci::statement st =
        (db->prepare << "SELECT id, member_id, cycle_id, effective_month, "
                        "savings, social_fund, admin_fund, penalties, "
                        "interest, loan_repayment, status, created_at, "
                        "updated_by, updated_at FROM declarations " +
                 where + " ORDER BY effective_month, id",
         soci::into(d.id),
         soci::into(d.member),
         soci::into(d.cycle),
         soci::into(month),
         soci::into(savings),
         soci::into(social),
         soci::into(admin),
         soci::into(penalties),
         soci::into(interest),
         soci::into(repayment),
         soci::into(status),
         soci::into(d.createdAt),
         soci::into(updatedBy),
         soci::into(updatedAt));
    st.execute();
    while (st.fetch())
    {
        Declaration row;
        row.id = d.id;
        row.member = d.member;
        row.cycle = d.cycle;
        auto const m = dateFromString(month);
        if (!m)
            Throw<std::runtime_error>(
                "Declaration " + std::to_string(d.id) + " has a bad month");
        row.effectiveMonth = *m;
        row.amounts.savings = Money{savings};
        row.amounts.socialFund = Money{social};
        row.amounts.adminFund = Money{admin};
        row.amounts.penalties = Money{penalties};
        row.amounts.interest = Money{interest};
        row.amounts.loanRepayment = Money{repayment};
        row.status = fromStorage<DeclarationStatus>(status);
        row.createdAt = d.createdAt;
        if (updatedBy)
            row.updatedBy = *updatedBy;
        if (updatedAt)
            row.updatedAt = *updatedAt;
        result.push_back(std::move(row));
    }
    return result;
}

std::optional<DepositProof>
DeclarationWorkflow::selectProof(LockedSociSession& db, std::string const& where)
{
    DepositProof p;
    std::int64_t amount = 0;
    boost::optional<std::string> reference;
    std::string status;
    boost::optional<std::string> comment;
    boost::optional<std::string> rejectedBy;
    boost::optional<std::string> rejectedAt;
    boost::optional<std::string> response;
    boost::optional<std::string> respondedAt;

    *db << "SELECT id, declaration_id, amount, reference, status, "
           "uploaded_at, rejection_comment, rejected_by, rejected_at, "
           "member_response, responded_at FROM deposit_proofs " + where,
        soci::into(p.id), soci::into(p.declaration), soci::into(amount),
        soci::into(reference), soci::into(status), soci::into(p.uploadedAt),
        soci::into(comment), soci::into(rejectedBy), soci::into(rejectedAt),
        soci::into(response), soci::into(respondedAt);

    if (!db->got_data())
        return std::nullopt;

    p.amount = Money{amount};
    if (reference)
        p.reference = *reference;
    p.status = fromStorage<ProofStatus>(status);
    if (comment)
        p.rejectionComment = *comment;
    if (rejectedBy)
        p.rejectedBy = *rejectedBy;
    if (rejectedAt)
        p.rejectedAt = *rejectedAt;
    if (response)
        p.memberResponse = *response;
    if (respondedAt)
        p.respondedAt = *respondedAt;
    return p;
}

}  // namespace mutual
