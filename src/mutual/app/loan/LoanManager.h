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

#ifndef MUTUAL_APP_LOAN_LOANMANAGER_H_INCLUDED
#define MUTUAL_APP_LOAN_LOANMANAGER_H_INCLUDED

#include <mutual/basics/Money.h>
#include <mutual/basics/Rate.h>
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

struct LoanApplication
{
    ApplicationID id = 0;
    MemberID member = 0;
    CycleID cycle = 0;
    Money amount;
    int termMonths = 0;
    ApplicationStatus status = ApplicationStatus::pending;
    std::optional<std::string> notes;
    std::string appliedAt;
    std::optional<std::string> reviewedBy;
    std::optional<std::string> reviewedAt;
    std::optional<std::string> reviewNotes;
};

struct Loan
{
    LoanID id = 0;
    std::optional<ApplicationID> application;
    MemberID member = 0;
    CycleID cycle = 0;
    Money amount;
    Rate interestRate;
    int termMonths = 0;
    LoanStatus status = LoanStatus::approved;
    std::string createdAt;
    std::optional<Date> disbursedOn;
    std::optional<EntryID> disbursementEntry;
    std::optional<std::string> closedAt;
};

struct Repayment
{
    std::int64_t id = 0;
    LoanID loan = 0;
    EntryID entry = 0;
    Money principal;
    Money interest;
    Date date;
};

struct LoanBalance
{
    Money principalPaid;
    Money interestPaid;
    Money outstanding;
    Money expectedInterest;

    /** The principal is repaid, to the cent, and the interest is covered. */
    bool
    paidOff() const
    {
        return outstanding <= moneyTolerance &&
            interestPaid >= expectedInterest;
    }
};

/** Loan applications and the loans they become.

    An application is approved, rejected or withdrawn. Approval creates the
    loan at the rate the member's tier gives for the term; disbursement
    pays it out and opens it; repayments, whether posted directly or as part
    of a monthly deposit, bring it to its close.
*/
class LoanManager
{
    Application& app_;
    beast::Journal const j_;

public:
    LoanManager(Application& app, beast::Journal journal);

    Result<LoanApplication>
    apply(
        MemberID member,
        CycleID cycle,
        Money const& amount,
        int termMonths,
        std::optional<std::string> const& notes = std::nullopt);

    Result<Loan>
    approve(
        ApplicationID id,
        std::string const& actor,
        std::optional<std::string> const& notes = std::nullopt);

    Result<LoanApplication>
    reject(
        ApplicationID id,
        std::string const& actor,
        std::optional<std::string> const& notes = std::nullopt);

    /** The applicant takes back a pending application. */
    Result<LoanApplication>
    withdraw(ApplicationID id, MemberID member);

    /** Pay out an approved loan. */
    Result<Loan>
    disburse(LoanID id, std::string const& actor);

    /** Post cash received for a loan outside the monthly deposits. */
    Result<Repayment>
    postRepayment(
        LoanID id,
        Money const& principal,
        Money const& interest,
        std::string const& actor);

    /** Record a repayment already posted by another entry, then close the
        loan if that paid it off.
    */
    Result<Repayment>
    recordRepayment(
        LoanID id,
        EntryID entry,
        Money const& principal,
        Money const& interest);

    Result<LoanBalance>
    loanBalance(LoanID id);

    Result<Loan>
    getLoan(LoanID id);

    Result<LoanApplication>
    getApplication(ApplicationID id);

    /** The member's approved, disbursed or open loan, if any. */
    std::optional<Loan>
    activeLoanFor(MemberID member);

    std::vector<Repayment>
    repayments(LoanID id);

    /** Close every open loan that is paid off.
        @return The loans closed.
    */
    std::vector<LoanID>
    closePaidOffLoans();

private:
    LoanBalance
    balanceOf(Loan const& loan);

    bool
    closeIfPaidOff(Loan const& loan);

    std::vector<Loan>
    selectLoans(LockedSociSession& db, std::string const& where);

    std::vector<LoanApplication>
    selectApplications(LockedSociSession& db, std::string const& where);
};

}  // namespace mutual

#endif
