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
#include <mutual/app/loan/LoanManager.h>
#include <mutual/app/main/Application.h>
#include <mutual/app/misc/MemberRegistry.h>
#include <mutual/app/tx/DepositPoster.h>
#include <mutual/app/tx/PenaltyApplier.h>
#include <mutual/basics/Log.h>
#include <mutual/core/DatabaseCon.h>
#include <mutual/core/TimeKeeper.h>

namespace mutual {

DepositPoster::DepositPoster(Application& app, beast::Journal journal)
    : app_(app), j_(journal)
{
}

Result<DepositPosting>
DepositPoster::approveProof(ProofID proofId, std::string const& actor)
{
    auto& declarations = app_.getDeclarations();
    auto& ledger = app_.getLedger();

    DepositPosting posting;

    {
        auto db = app_.getDb().checkoutDb();
        SavepointTransaction tr(db);

        auto proof = declarations.getProof(proofId);
        if (!proof)
            return Unexpected(proof.error());
        if (proof->status != ProofStatus::submitted)
            return failure(
                tstBAD_STATE,
                "Proof " + std::to_string(proofId) + " is " +
                    to_string(proof->status));

        auto declaration = declarations.getDeclaration(proof->declaration);
        if (!declaration)
            return Unexpected(declaration.error());
        if (declaration->status != DeclarationStatus::proof)
            return failure(
                tstBAD_STATE,
                "Declaration " + std::to_string(declaration->id) + " is " +
                    to_string(declaration->status));

        if (auto const r = checkProofAmount(*declaration, *proof); !r)
            return Unexpected(r.error());

        MemberID const member = declaration->member;
        CycleID const cycle = declaration->cycle;
        auto const& amounts = declaration->amounts;

        if (auto const r = app_.getCycles().checkPostingAllowed(cycle); !r)
            return Unexpected(r.error());

        // Claim the proof before anything is posted against it.
        {
            std::string const approved = to_string(ProofStatus::approved);
            std::string const submitted = to_string(ProofStatus::submitted);
            soci::statement st =
                (db->prepare << "UPDATE deposit_proofs SET status = :approved "
                                "WHERE id = :id AND status = :submitted",
                 soci::use(approved),
                 soci::use(proofId),
                 soci::use(submitted));
            st.execute(true);
            if (st.get_affected_rows() == 0)
                return failure(
                    tstCONCURRENT_UPDATE,
                    "Proof " + std::to_string(proofId) +
                        " was decided concurrently");
        }

        auto initial = postInitialRequirement(member, cycle, actor);
        if (!initial)
            return Unexpected(initial.error());
        posting.initialRequirement = std::move(*initial);

        auto const cash = ledger.requireAccount(org::bankCash);
        if (!cash)
            return Unexpected(cash.error());

        std::vector<LineSpec> lines{debitLine(cash->id, proof->amount)};

        auto const toMember = [&](FundKind kind,
                                  Money const& amount,
                                  char const* memo) -> Result<void> {
            if (!amount)
                return {};
            auto const account = ledger.getOrCreateMemberSubaccount(member, kind);
            if (!account)
                return Unexpected(account.error());
            lines.push_back(creditLine(account->id, amount, memo));
            return {};
        };

        auto const toOrg = [&](char const* code,
                               Money const& amount,
                               char const* memo) -> Result<void> {
            if (!amount)
                return {};
            auto const account = ledger.requireAccount(code);
            if (!account)
                return Unexpected(account.error());
            lines.push_back(creditLine(account->id, amount, memo));
            return {};
        };

        if (auto const r =
                toMember(FundKind::savings, amounts.savings, "savings");
            !r)
            return Unexpected(r.error());
        if (auto const r = toMember(
                FundKind::socialFund, amounts.socialFund, "social fund");
            !r)
            return Unexpected(r.error());
        if (auto const r =
                toMember(FundKind::adminFund, amounts.adminFund, "admin fund");
            !r)
            return Unexpected(r.error());
        if (auto const r =
                toMember(FundKind::penalties, amounts.penalties, "penalties");
            !r)
            return Unexpected(r.error());
        if (auto const r =
                toOrg(org::interestIncome, amounts.interest, "interest");
            !r)
            return Unexpected(r.error());
        if (auto const r = toOrg(
                org::loansReceivable, amounts.loanRepayment, "loan repayment");
            !r)
            return Unexpected(r.error());

        // Cash is what was paid. A difference within the tolerance goes to
        // savings so the entry balances.
        if (auto const diff = proof->amount - amounts.total(); diff)
        {
            auto const savings =
                ledger.getOrCreateMemberSubaccount(member, FundKind::savings);
            if (!savings)
                return Unexpected(savings.error());
            lines.push_back(
                diff.signum() > 0
                    ? creditLine(savings->id, diff, "proof difference")
                    : debitLine(savings->id, -diff, "proof difference"));
            JLOG(j_.info()) << "Proof " << proofId << " of " << proof->amount
                            << " differs from the " << amounts.total()
                            << " declared by " << diff;
        }

        auto entry = ledger.createJournalEntry(
            "Deposit for " + to_string(declaration->effectiveMonth).substr(0, 7) +
                " by member " + std::to_string(member),
            lines,
            cycle,
            proofId,
            std::string(source::depositApproval),
            actor);
        if (!entry)
            return Unexpected(entry.error());

        std::string const now = to_string_iso(app_.timeKeeper().now());
        *db << "INSERT INTO deposit_approvals (proof_id, journal_entry_id, "
               "approved_by, approved_at) VALUES (:proof, :entry, :by, :now)",
            soci::use(proofId), soci::use(entry->id), soci::use(actor),
            soci::use(now);

        {
            std::string const approved = to_string(DeclarationStatus::approved);
            std::string const inProof = to_string(DeclarationStatus::proof);
            soci::statement st =
                (db->prepare << "UPDATE declarations SET status = :approved, "
                                "updated_by = :by, updated_at = :now "
                                "WHERE id = :id AND status = :proof",
                 soci::use(approved),
                 soci::use(actor),
                 soci::use(now),
                 soci::use(declaration->id),
                 soci::use(inProof));
            st.execute(true);
            if (st.get_affected_rows() == 0)
                return failure(
                    tstCONCURRENT_UPDATE,
                    "Declaration " + std::to_string(declaration->id) +
                        " changed concurrently");
        }

        if (amounts.loanRepayment || amounts.interest)
        {
            auto const loan = app_.getLoans().activeLoanFor(member);
            if (!loan ||
                (loan->status != LoanStatus::open &&
                 loan->status != LoanStatus::disbursed))
                return failure(
                    tstNO_OPEN_LOAN,
                    "Member " + std::to_string(member) +
                        " declared a loan payment with no open loan");

            auto const repayment = app_.getLoans().recordRepayment(
                loan->id, entry->id, amounts.loanRepayment, amounts.interest);
            if (!repayment)
                return Unexpected(repayment.error());
            posting.loan = loan->id;
        }

        if (amounts.penalties)
            posting.penaltiesPaid =
                app_.getPenalties().settle(member, amounts.penalties);

        tr.commit();

        proof->status = ProofStatus::approved;
        declaration->status = DeclarationStatus::approved;
        declaration->updatedBy = actor;
        declaration->updatedAt = now;
        posting.proof = std::move(*proof);
        posting.declaration = std::move(*declaration);
        posting.entry = std::move(*entry);
    }

    JLOG(j_.info()) << "Proof " << proofId << " approved by " << actor
                    << " as entry " << posting.entry.id;

    // Reclassifying overpayments is not part of the approval; a failure
    // here leaves the approval standing.
    try
    {
        auto excess = sweepExcess(
            posting.declaration.member, posting.declaration.cycle);
        if (excess)
            posting.excess = std::move(*excess);
        else
        {
            JLOG(j_.warn()) << "Excess sweep after proof " << proofId
                            << " failed: " << excess.error();
        }
    }
    catch (std::exception const& e)
    {
        JLOG(j_.error()) << "Excess sweep after proof " << proofId
                         << " threw: " << e.what();
    }

    return posting;
}

Result<std::vector<JournalEntry>>
DepositPoster::sweepExcess(MemberID member, CycleID cycleId)
{
    auto& ledger = app_.getLedger();

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const cycle = app_.getCycles().getCycle(cycleId);
    if (!cycle)
        return Unexpected(cycle.error());

    std::vector<JournalEntry> posted;

    for (auto const kind : {FundKind::socialFund, FundKind::adminFund})
    {
        auto const& required = kind == FundKind::socialFund
            ? cycle->socialRequired
            : cycle->adminRequired;
        if (!required)
            continue;

        auto const receivable =
            ledger.findAccount(LedgerCore::subaccountCode(member, kind));
        if (!receivable)
            continue;

        auto const [debit, credit] = ledger.lineTotals(receivable->id);
        auto const excess = credit - debit;
        if (excess.signum() <= 0)
            continue;

        auto const savings =
            ledger.getOrCreateMemberSubaccount(member, FundKind::savings);
        if (!savings)
            return Unexpected(savings.error());

        auto entry = ledger.createJournalEntry(
            std::string("Excess ") + to_string(kind) + " contribution of " +
                to_string(excess) + " to savings",
            {debitLine(receivable->id, excess),
             creditLine(savings->id, excess)},
            cycleId,
            member,
            std::string(source::excessContribution),
            std::string(systemActor));
        if (!entry)
            return Unexpected(entry.error());

        JLOG(j_.info()) << "Member " << member << " paid " << excess
                        << " over the " << to_string(kind)
                        << " requirement, moved to savings";
        posted.push_back(std::move(*entry));
    }

    tr.commit();
    return posted;
}

std::size_t
DepositPoster::sweepAllExcess()
{
    auto const cycle = app_.getCycles().activeCycle();
    if (!cycle)
    {
        JLOG(j_.debug()) << "No active cycle to sweep";
        return 0;
    }

    std::size_t count = 0;
    for (auto const& member : app_.getMembers().list(MemberStatus::active))
    {
        try
        {
            auto const r = sweepExcess(member.id, cycle->id);
            if (r)
                count += r->size();
            else
            {
                JLOG(j_.warn()) << "Excess sweep of member " << member.id
                                << " failed: " << r.error();
            }
        }
        catch (std::exception const& e)
        {
            JLOG(j_.error()) << "Excess sweep of member " << member.id
                             << " threw: " << e.what();
        }
    }
    return count;
}

std::optional<DepositApproval>
DepositPoster::approvalForProof(ProofID proof)
{
    auto db = app_.getDb().checkoutDb();

    DepositApproval a;
    *db << "SELECT id, proof_id, journal_entry_id, approved_by, approved_at "
           "FROM deposit_approvals WHERE proof_id = :proof",
        soci::into(a.id), soci::into(a.proof), soci::into(a.entry),
        soci::into(a.approvedBy), soci::into(a.approvedAt), soci::use(proof);

    if (!db->got_data())
        return std::nullopt;
    return a;
}

//------------------------------------------------------------------------------

Result<std::optional<JournalEntry>>
DepositPoster::postInitialRequirement(
    MemberID member,
    CycleID cycleId,
    std::string const& actor)
{
    auto& ledger = app_.getLedger();

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const cycle = app_.getCycles().getCycle(cycleId);
    if (!cycle)
        return Unexpected(cycle.error());

    Money const social = cycle->socialRequired.value_or(Money{});
    Money const admin = cycle->adminRequired.value_or(Money{});
    if (social.signum() <= 0 && admin.signum() <= 0)
        return std::optional<JournalEntry>{};

    int existing = 0;
    std::string const type = source::initialRequirement;
    *db << "SELECT COUNT(*) FROM journal_entries WHERE source_type = :type "
           "AND source_ref = :member AND cycle_id = :cycle "
           "AND reversed_at IS NULL",
        soci::into(existing), soci::use(type), soci::use(member),
        soci::use(cycleId);
    if (existing)
        return std::optional<JournalEntry>{};

    std::vector<LineSpec> lines;

    auto const seed =
        [&](FundKind kind, Money const& amount, char const* fund) -> Result<void> {
        if (amount.signum() <= 0)
            return {};
        auto const receivable = ledger.getOrCreateMemberSubaccount(member, kind);
        if (!receivable)
            return Unexpected(receivable.error());
        auto const contra = ledger.requireAccount(fund);
        if (!contra)
            return Unexpected(contra.error());
        lines.push_back(debitLine(receivable->id, amount));
        lines.push_back(creditLine(contra->id, amount));
        return {};
    };

    if (auto const r = seed(FundKind::socialFund, social, org::socialFund); !r)
        return Unexpected(r.error());
    if (auto const r = seed(FundKind::adminFund, admin, org::adminFund); !r)
        return Unexpected(r.error());

    auto entry = ledger.createJournalEntry(
        "Cycle " + std::to_string(cycle->year) +
            " initial requirement for member " + std::to_string(member),
        lines,
        cycleId,
        member,
        type,
        actor);
    if (!entry)
        return Unexpected(entry.error());

    tr.commit();

    JLOG(j_.info()) << "Member " << member << " owes " << social
                    << " social and " << admin << " admin for cycle "
                    << cycle->year;
    return std::optional<JournalEntry>{std::move(*entry)};
}

}  // namespace mutual
