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

#ifndef MUTUAL_APP_TX_DEPOSITPOSTER_H_INCLUDED
#define MUTUAL_APP_TX_DEPOSITPOSTER_H_INCLUDED

#include <mutual/app/ledger/LedgerCore.h>
#include <mutual/app/tx/DeclarationWorkflow.h>
#include <mutual/beast/utility/Journal.h>
#include <mutual/protocol/Failure.h>
#include <mutual/protocol/Protocol.h>
#include <optional>
#include <string>
#include <vector>

namespace mutual {

class Application;

struct DepositApproval
{
    std::int64_t id = 0;
    ProofID proof = 0;
    EntryID entry = 0;
    std::string approvedBy;
    std::string approvedAt;
};

/** Everything one approval did. */
struct DepositPosting
{
    DepositProof proof;
    Declaration declaration;
    JournalEntry entry;

    // Posted when this was the member's first deposit of the cycle.
    std::optional<JournalEntry> initialRequirement;

    std::vector<PenaltyID> penaltiesPaid;

    // The loan a repayment or interest component was applied to.
    std::optional<LoanID> loan;

    // Reclassifications into savings made after the approval committed.
    std::vector<JournalEntry> excess;
};

/** Turns an approved proof of deposit into ledger postings.

    One balanced entry debits cash for the deposit and credits each
    declared component to the account it pays down. Declaration, proof,
    repayment and penalty state change in the same transaction, so either
    all of it happens or none of it.
*/
class DepositPoster
{
    Application& app_;
    beast::Journal const j_;

public:
    DepositPoster(Application& app, beast::Journal journal);

    /** Approve a submitted proof and post it. */
    Result<DepositPosting>
    approveProof(ProofID proof, std::string const& actor);

    /** Move what the member paid into a fund beyond what the cycle
        requires into savings. Safe to run any number of times.

        @return The entries posted.
    */
    Result<std::vector<JournalEntry>>
    sweepExcess(MemberID member, CycleID cycle);

    /** Sweep every active member for the active cycle.

        A member whose sweep fails is logged and skipped.

        @return The number of entries posted.
    */
    std::size_t
    sweepAllExcess();

    std::optional<DepositApproval>
    approvalForProof(ProofID proof);

private:
    Result<std::optional<JournalEntry>>
    postInitialRequirement(
        MemberID member,
        CycleID cycle,
        std::string const& actor);
};

}  // namespace mutual

#endif
