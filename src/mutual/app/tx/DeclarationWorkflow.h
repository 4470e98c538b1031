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

#ifndef MUTUAL_APP_TX_DECLARATIONWORKFLOW_H_INCLUDED
#define MUTUAL_APP_TX_DECLARATIONWORKFLOW_H_INCLUDED

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

/** What a member says they will pay for a month. Zero means not declared. */
struct DeclaredAmounts
{
    Money savings;
    Money socialFund;
    Money adminFund;
    Money penalties;
    Money interest;
    Money loanRepayment;

    Money
    total() const
    {
        return savings + socialFund + adminFund + penalties + interest +
            loanRepayment;
    }

    bool
    anyNegative() const
    {
        return savings.signum() < 0 || socialFund.signum() < 0 ||
            adminFund.signum() < 0 || penalties.signum() < 0 ||
            interest.signum() < 0 || loanRepayment.signum() < 0;
    }

    bool
    empty() const
    {
        return !savings && !socialFund && !adminFund && !penalties &&
            !interest && !loanRepayment;
    }
};

struct Declaration
{
    DeclarationID id = 0;
    MemberID member = 0;
    CycleID cycle = 0;
    Date effectiveMonth;
    DeclaredAmounts amounts;
    DeclarationStatus status = DeclarationStatus::pending;
    std::string createdAt;
    std::optional<std::string> updatedBy;
    std::optional<std::string> updatedAt;
};

struct DepositProof
{
    ProofID id = 0;
    DeclarationID declaration = 0;
    Money amount;
    std::optional<std::string> reference;
    ProofStatus status = ProofStatus::submitted;
    std::string uploadedAt;

    std::optional<std::string> rejectionComment;
    std::optional<std::string> rejectedBy;
    std::optional<std::string> rejectedAt;
    std::optional<std::string> memberResponse;
    std::optional<std::string> respondedAt;
};

/** A proof must pay what was declared, give or take one cent. The
    approval books any such difference to the member's savings.
*/
Result<void>
checkProofAmount(Declaration const& declaration, DepositProof const& proof);

/** Member declarations and their proofs of payment.

    A declaration starts pending. Uploading a proof moves it to proof; the
    treasurer either approves the proof, which posts it to the ledger, or
    rejects it, which sends the declaration back to pending until a new
    proof is uploaded.
*/
class DeclarationWorkflow
{
    Application& app_;
    beast::Journal const j_;

public:
    DeclarationWorkflow(Application& app, beast::Journal journal);

    /** Declare a month's payments. One declaration per member, cycle and
        month; late declarations are penalized.
    */
    Result<Declaration>
    createDeclaration(
        MemberID member,
        CycleID cycle,
        Date const& effectiveMonth,
        DeclaredAmounts const& amounts);

    /** Change the declared amounts.

        Allowed while pending for the current month up to the configured
        edit cutoff day, or at any time after the declaration's proof was
        rejected.
    */
    Result<Declaration>
    updateDeclaration(
        DeclarationID id,
        DeclaredAmounts const& amounts,
        std::string const& actor);

    /** Submit the proof of payment, or resubmit a rejected one. */
    Result<DepositProof>
    uploadProof(
        DeclarationID id,
        Money const& amount,
        std::optional<std::string> const& reference = std::nullopt);

    /** Send a submitted proof back to the member with a comment. */
    Result<DepositProof>
    rejectProof(
        ProofID id,
        std::string const& comment,
        std::string const& actor);

    /** The member's reply to a rejection. */
    Result<DepositProof>
    respondToRejection(ProofID id, std::string const& response);

    Result<Declaration>
    getDeclaration(DeclarationID id);

    std::optional<Declaration>
    findDeclaration(MemberID member, CycleID cycle, Date const& month);

    std::vector<Declaration>
    declarationsFor(
        MemberID member,
        std::optional<CycleID> cycle = std::nullopt);

    Result<DepositProof>
    getProof(ProofID id);

    std::optional<DepositProof>
    proofForDeclaration(DeclarationID id);

private:
    std::vector<Declaration>
    selectDeclarations(LockedSociSession& db, std::string const& where);

    std::optional<DepositProof>
    selectProof(LockedSociSession& db, std::string const& where);
};

}  // namespace mutual

#endif
