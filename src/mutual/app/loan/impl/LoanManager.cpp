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

#include <mutual/app/credit/CreditResolver.h>
#include <mutual/app/cycle/CycleManager.h>
#include <mutual/app/ledger/LedgerCore.h>
#include <mutual/app/loan/LoanManager.h>
#include <mutual/app/main/Application.h>
#include <mutual/app/misc/MemberRegistry.h>
#include <mutual/app/tx/PenaltyApplier.h>
#include <mutual/basics/Log.h>
#include <mutual/core/DatabaseCon.h>
#include <mutual/core/TimeKeeper.h>

namespace mutual {

namespace {

std::string
activeStatuses()
{
    return std::string("('") + to_string(LoanStatus::approved) + "', '" +
        to_string(LoanStatus::disbursed) + "', '" +
        to_string(LoanStatus::open) + "')";
}

boost::optional<std::string>
toBoost(std::optional<std::string> const& v)
{
    if (v)
        return *v;
    return boost::none;
}

}  // namespace

LoanManager::LoanManager(Application& app, beast::Journal journal)
    : app_(app), j_(journal)
{
}

Result<LoanApplication>
LoanManager::apply(
    MemberID member,
    CycleID cycleId,
    Money const& amount,
    int termMonths,
    std::optional<std::string> const& notes)
{
    if (amount.signum() <= 0)
        return failure(tvlBAD_AMOUNT);
    if (termMonths <= 0)
        return failure(tvlBAD_TERM);

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

    int pending = 0;
    std::string const p = to_string(ApplicationStatus::pending);
    *db << "SELECT COUNT(*) FROM loan_applications "
           "WHERE member_id = :member AND status = :pending",
        soci::into(pending), soci::use(member), soci::use(p);
    if (pending)
        return failure(
            tstPENDING_APPLICATION,
            "Member " + std::to_string(member) +
                " already has a pending application");

    if (auto const loan = activeLoanFor(member))
    {
        auto const balance = balanceOf(*loan);
        if (balance.outstanding > moneyTolerance)
            return failure(
                tstACTIVE_LOAN,
                "Member " + std::to_string(member) + " still owes " +
                    to_string(balance.outstanding) + " on loan " +
                    std::to_string(loan->id));
    }

    auto const credit = app_.getCredit().resolve(member, cycleId);
    if (!credit)
        return Unexpected(credit.error());

    if (amount > credit->maxLoanAmount)
        return failure(
            tvlEXCEEDS_LIMIT,
            "Requested " + to_string(amount) + " exceeds the limit of " +
                to_string(credit->maxLoanAmount));

    if (!rateForTerm(*credit, termMonths))
        return failure(
            tcfNO_RATE,
            "Tier '" + credit->tier.name + "' has no rate for " +
                std::to_string(termMonths) + " months");

    std::int64_t const cents = amount.cents();
    auto const n = toBoost(notes);
    std::string const now = to_string_iso(app_.timeKeeper().now());

    *db << "INSERT INTO loan_applications (member_id, cycle_id, amount, "
           "term_months, status, notes, applied_at) VALUES (:member, "
           ":cycle, :amount, :term, :status, :notes, :now)",
        soci::use(member), soci::use(cycleId), soci::use(cents),
        soci::use(termMonths), soci::use(p), soci::use(n), soci::use(now);

    ApplicationID id = 0;
    *db << "SELECT last_insert_rowid()", soci::into(id);

    auto const penalty = app_.getPenalties().applyIfLate(
        member,
        cycleId,
        PhaseType::loanApplication,
        app_.timeKeeper().today());
    if (!penalty)
        return Unexpected(penalty.error());

    tr.commit();

    JLOG(j_.info()) << "Application " << id << " by member " << member
                    << " for " << amount << " over " << termMonths
                    << " months";
    return getApplication(id);
}

Result<Loan>
LoanManager::approve(
    ApplicationID id,
    std::string const& actor,
    std::optional<std::string> const& notes)
{
    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const application = getApplication(id);
    if (!application)
        return Unexpected(application.error());

    if (application->status != ApplicationStatus::pending)
        return failure(
            tstBAD_STATE,
            "Application " + std::to_string(id) + " is " +
                to_string(application->status));

    auto const credit =
        app_.getCredit().resolve(application->member, application->cycle);
    if (!credit)
        return Unexpected(credit.error());

    auto const rate = rateForTerm(*credit, application->termMonths);
    if (!rate)
        return failure(
            tcfNO_RATE,
            "Tier '" + credit->tier.name + "' has no rate for " +
                std::to_string(application->termMonths) + " months");

    std::string const approved = to_string(ApplicationStatus::approved);
    std::string const pending = to_string(ApplicationStatus::pending);
    std::string const now = to_string_iso(app_.timeKeeper().now());
    auto const n = toBoost(notes);

    soci::statement st =
        (db->prepare << "UPDATE loan_applications SET status = :approved, "
                        "reviewed_by = :by, reviewed_at = :now, "
                        "review_notes = :notes "
                        "WHERE id = :id AND status = :pending",
         soci::use(approved),
         soci::use(actor),
         soci::use(now),
         soci::use(n),
         soci::use(id),
         soci::use(pending));
    st.execute(true);
    if (st.get_affected_rows() == 0)
        return failure(
            tstCONCURRENT_UPDATE,
            "Application " + std::to_string(id) + " was decided concurrently");

    std::int64_t const cents = application->amount.cents();
    std::int64_t const r = rate->hundredths();
    std::string const status = to_string(LoanStatus::approved);

    *db << "INSERT INTO loans (application_id, member_id, cycle_id, amount, "
           "interest_rate, term_months, status, created_at) VALUES (:app, "
           ":member, :cycle, :amount, :rate, :term, :status, :now)",
        soci::use(id), soci::use(application->member),
        soci::use(application->cycle), soci::use(cents), soci::use(r),
        soci::use(application->termMonths), soci::use(status),
        soci::use(now);

    LoanID loanId = 0;
    *db << "SELECT last_insert_rowid()", soci::into(loanId);

    tr.commit();

    JLOG(j_.info()) << "Application " << id << " approved by " << actor
                    << " as loan " << loanId << " at " << *rate << "%";
    return getLoan(loanId);
}

Result<LoanApplication>
LoanManager::reject(
    ApplicationID id,
    std::string const& actor,
    std::optional<std::string> const& notes)
{
    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const application = getApplication(id);
    if (!application)
        return application;

    if (application->status != ApplicationStatus::pending)
        return failure(
            tstBAD_STATE,
            "Application " + std::to_string(id) + " is " +
                to_string(application->status));

    std::string const rejected = to_string(ApplicationStatus::rejected);
    std::string const pending = to_string(ApplicationStatus::pending);
    std::string const now = to_string_iso(app_.timeKeeper().now());
    auto const n = toBoost(notes);

    soci::statement st =
        (db->prepare << "UPDATE loan_applications SET status = :rejected, "
                        "reviewed_by = :by, reviewed_at = :now, "
                        "review_notes = :notes "
                        "WHERE id = :id AND status = :pending",
         soci::use(rejected),
         soci::use(actor),
         soci::use(now),
         soci::use(n),
         soci::use(id),
         soci::use(pending));
    st.execute(true);
    if (st.get_affected_rows() == 0)
        return failure(
            tstCONCURRENT_UPDATE,
            "Application " + std::to_string(id) + " was decided concurrently");

    tr.commit();

    JLOG(j_.info()) << "Application " << id << " rejected by " << actor;
    return getApplication(id);
}

Result<LoanApplication>
LoanManager::withdraw(ApplicationID id, MemberID member)
{
    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const application = getApplication(id);
    if (!application)
        return application;

    if (application->member != member)
        return failure(
            tnfAPPLICATION,
            "Member " + std::to_string(member) + " has no application " +
                std::to_string(id));

    if (application->status != ApplicationStatus::pending)
        return failure(
            tstBAD_STATE,
            "Application " + std::to_string(id) + " is " +
                to_string(application->status));

    std::string const withdrawn = to_string(ApplicationStatus::withdrawn);
    std::string const pending = to_string(ApplicationStatus::pending);

    soci::statement st =
        (db->prepare << "UPDATE loan_applications SET status = :withdrawn "
                        "WHERE id = :id AND status = :pending",
         soci::use(withdrawn),
         soci::use(id),
         soci::use(pending));
    st.execute(true);
    if (st.get_affected_rows() == 0)
        return failure(
            tstCONCURRENT_UPDATE,
            "Application " + std::to_string(id) + " was decided concurrently");

    tr.commit();

    JLOG(j_.info()) << "Application " << id << " withdrawn";
    return getApplication(id);
}

Result<Loan>
LoanManager::disburse(LoanID id, std::string const& actor)
{
    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const loan = getLoan(id);
    if (!loan)
        return loan;

    if (loan->status != LoanStatus::approved)
        return failure(
            tstBAD_STATE,
            "Loan " + std::to_string(id) + " is " + to_string(loan->status) +
                ", not approved");

    if (auto const allowed = app_.getCycles().checkPostingAllowed(loan->cycle);
        !allowed)
        return Unexpected(allowed.error());

    auto& ledger = app_.getLedger();
    auto const receivable = ledger.requireAccount(org::loansReceivable);
    if (!receivable)
        return Unexpected(receivable.error());
    auto const cash = ledger.requireAccount(org::bankCash);
    if (!cash)
        return Unexpected(cash.error());

    auto const entry = ledger.createJournalEntry(
        "Disbursement of loan " + std::to_string(id),
        {debitLine(receivable->id, loan->amount),
         creditLine(cash->id, loan->amount)},
        loan->cycle,
        id,
        std::string(source::loanDisbursement),
        actor);
    if (!entry)
        return Unexpected(entry.error());

    std::string const open = to_string(LoanStatus::open);
    std::string const approved = to_string(LoanStatus::approved);
    std::string const today = to_string(app_.timeKeeper().today());

    soci::statement st =
        (db->prepare << "UPDATE loans SET status = :open, "
                        "disbursed_on = :today, "
                        "disbursement_entry_id = :entry "
                        "WHERE id = :id AND status = :approved",
         soci::use(open),
         soci::use(today),
         soci::use(entry->id),
         soci::use(id),
         soci::use(approved));
    st.execute(true);
    if (st.get_affected_rows() == 0)
        return failure(
            tstCONCURRENT_UPDATE,
            "Loan " + std::to_string(id) + " was disbursed concurrently");

    tr.commit();

    JLOG(j_.info()) << "Loan " << id << " of " << loan->amount
                    << " disbursed by " << actor;
    return getLoan(id);
}

Result<Repayment>
LoanManager::postRepayment(
    LoanID id,
    Money const& principal,
    Money const& interest,
    std::string const& actor)
{
    if (principal.signum() < 0 || interest.signum() < 0)
        return failure(tvlNEGATIVE_AMOUNT);
    if (!principal && !interest)
        return failure(tvlBAD_AMOUNT);

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const loan = getLoan(id);
    if (!loan)
        return Unexpected(loan.error());

    if (loan->status != LoanStatus::open &&
        loan->status != LoanStatus::disbursed)
        return failure(
            tstNO_OPEN_LOAN,
            "Loan " + std::to_string(id) + " is " + to_string(loan->status));

    auto& ledger = app_.getLedger();
    auto const cash = ledger.requireAccount(org::bankCash);
    if (!cash)
        return Unexpected(cash.error());
    auto const receivable = ledger.requireAccount(org::loansReceivable);
    if (!receivable)
        return Unexpected(receivable.error());
    auto const income = ledger.requireAccount(org::interestIncome);
    if (!income)
        return Unexpected(income.error());

    std::vector<LineSpec> lines{debitLine(cash->id, principal + interest)};
    if (principal)
        lines.push_back(creditLine(receivable->id, principal, "principal"));
    if (interest)
        lines.push_back(creditLine(income->id, interest, "interest"));

    auto const entry = ledger.createJournalEntry(
        "Repayment of loan " + std::to_string(id),
        lines,
        loan->cycle,
        id,
        std::string(source::repayment),
        actor);
    if (!entry)
        return Unexpected(entry.error());

    auto repayment = recordRepayment(id, entry->id, principal, interest);
    if (!repayment)
        return repayment;

    tr.commit();
    return repayment;
}

Result<Repayment>
LoanManager::recordRepayment(
    LoanID id,
    EntryID entry,
    Money const& principal,
    Money const& interest)
{
    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const loan = getLoan(id);
    if (!loan)
        return Unexpected(loan.error());

    auto const before = balanceOf(*loan);
    if (principal > before.outstanding + moneyTolerance)
        return failure(
            tvlEXCEEDS_LIMIT,
            "Repayment of " + to_string(principal) + " exceeds the " +
                to_string(before.outstanding) + " outstanding on loan " +
                std::to_string(id));

    Repayment r;
    r.loan = id;
    r.entry = entry;
    r.principal = principal;
    r.interest = interest;
    r.date = app_.timeKeeper().today();

    std::int64_t const p = principal.cents();
    std::int64_t const i = interest.cents();
    std::string const date = to_string(r.date);
    std::string const now = to_string_iso(app_.timeKeeper().now());

    *db << "INSERT INTO repayments (loan_id, journal_entry_id, principal, "
           "interest, repayment_date, created_at) VALUES (:loan, :entry, "
           ":principal, :interest, :date, :now)",
        soci::use(id), soci::use(entry), soci::use(p), soci::use(i),
        soci::use(date), soci::use(now);
    *db << "SELECT last_insert_rowid()", soci::into(r.id);

    JLOG(j_.debug()) << "Loan " << id << " repaid " << principal
                     << " principal, " << interest << " interest";

    closeIfPaidOff(*loan);

    tr.commit();
    return r;
}

Result<LoanBalance>
LoanManager::loanBalance(LoanID id)
{
    auto const loan = getLoan(id);
    if (!loan)
        return Unexpected(loan.error());
    return balanceOf(*loan);
}

Result<Loan>
LoanManager::getLoan(LoanID id)
{
    auto db = app_.getDb().checkoutDb();
    auto loans = selectLoans(db, "WHERE id = " + std::to_string(id));
    if (loans.empty())
        return failure(tnfLOAN, "No loan " + std::to_string(id));
    return std::move(loans.front());
}

Result<LoanApplication>
LoanManager::getApplication(ApplicationID id)
{
    auto db = app_.getDb().checkoutDb();
    auto found = selectApplications(db, "WHERE id = " + std::to_string(id));
    if (found.empty())
        return failure(
            tnfAPPLICATION, "No loan application " + std::to_string(id));
    return std::move(found.front());
}

std::optional<Loan>
LoanManager::activeLoanFor(MemberID member)
{
    auto db = app_.getDb().checkoutDb();
    auto loans = selectLoans(
        db,
        "WHERE member_id = " + std::to_string(member) + " AND status IN " +
            activeStatuses());
    if (loans.empty())
        return std::nullopt;
    if (loans.size() > 1)
    {
        JLOG(j_.warn()) << "Member " << member << " has " << loans.size()
                        << " active loans";
    }
    return std::move(loans.front());
}

std::vector<Repayment>
LoanManager::repayments(LoanID id)
{
    auto db = app_.getDb().checkoutDb();

    std::vector<Repayment> result;
    Repayment r;
    std::int64_t principal = 0;
    std::int64_t interest = 0;
    std::string date;

    soci::statement st =
        (db->prepare << "SELECT id, loan_id, journal_entry_id, principal, "
                        "interest, repayment_date FROM repayments "
                        "WHERE loan_id = :loan ORDER BY id",
         soci::into(r.id),
         soci::into(r.loan),
         soci::into(r.entry),
         soci::into(principal),
         soci::into(interest),
         soci::into(date),
         soci::use(id));
    st.execute();
    while (st.fetch())
    {
        Repayment row = r;
        row.principal = Money{principal};
        row.interest = Money{interest};
        auto const d = dateFromString(date);
        if (!d)
            Throw<std::runtime_error>(
                "Repayment " + std::to_string(r.id) + " has a bad date");
        row.date = *d;
        result.push_back(row);
    }
    return result;
}

std::vector<LoanID>
LoanManager::closePaidOffLoans()
{
    std::vector<Loan> loans;
    {
        auto db = app_.getDb().checkoutDb();
        loans = selectLoans(
            db,
            std::string("WHERE status IN ('") + to_string(LoanStatus::open) +
                "', '" + to_string(LoanStatus::disbursed) + "')");
    }

    std::vector<LoanID> closed;
    for (auto const& loan : loans)
    {
        auto db = app_.getDb().checkoutDb();
        SavepointTransaction tr(db);
        if (closeIfPaidOff(loan))
            closed.push_back(loan.id);
        tr.commit();
    }

    if (!closed.empty())
    {
        JLOG(j_.info()) << "Closed " << closed.size() << " paid off loan(s)";
    }
    return closed;
}

//------------------------------------------------------------------------------

LoanBalance
LoanManager::balanceOf(Loan const& loan)
{
    auto db = app_.getDb().checkoutDb();

    std::int64_t principal = 0;
    std::int64_t interest = 0;
    *db << "SELECT COALESCE(SUM(principal), 0), COALESCE(SUM(interest), 0) "
           "FROM repayments WHERE loan_id = :loan",
        soci::into(principal), soci::into(interest), soci::use(loan.id);

    LoanBalance b;
    b.principalPaid = Money{principal};
    b.interestPaid = Money{interest};
    b.outstanding = loan.amount - b.principalPaid;
    b.expectedInterest = percentOf(loan.amount, loan.interestRate);
    return b;
}

bool
LoanManager::closeIfPaidOff(Loan const& loan)
{
    if (loan.status != LoanStatus::open && loan.status != LoanStatus::disbursed)
        return false;

    auto const balance = balanceOf(loan);
    if (!balance.paidOff())
        return false;

    auto db = app_.getDb().checkoutDb();

    std::string const closed = to_string(LoanStatus::closed);
    std::string const now = to_string_iso(app_.timeKeeper().now());
    std::string const open = to_string(LoanStatus::open);
    std::string const disbursed = to_string(LoanStatus::disbursed);

    soci::statement st =
        (db->prepare << "UPDATE loans SET status = :closed, closed_at = :now "
                        "WHERE id = :id AND status IN (:open, :disbursed)",
         soci::use(closed),
         soci::use(now),
         soci::use(loan.id),
         soci::use(open),
         soci::use(disbursed));
    st.execute(true);

    if (st.get_affected_rows() == 0)
        return false;

    JLOG(j_.info()) << "Loan " << loan.id << " paid off and closed: "
                    << balance.principalPaid << " principal, "
                    << balance.interestPaid << " interest";
    return true;
}

std::vector<Loan>
LoanManager::selectLoans(LockedSociSession& db, std::string const& where)
{
    std::vector<Loan> result;

    Loan l;
    boost::optional<std::int64_t> application;
    std::int64_t amount = 0;
    std::int64_t rate = 0;
    std::string status;
    boost::optional<std::string> disbursedOn;
    boost::optional<std::int64_t> entry;
    boost::optional<std::string> closedAt;

    soci::statement st =
        (db->prepare << "SELECT id, application_id, member_id, cycle_id, "
                        "amount, interest_rate, term_months, status, "
                        "created_at, disbursed_on, disbursement_entry_id, "
                        "closed_at FROM loans " +
                 where + " ORDER BY id",
         soci::into(l.id),
         soci::into(application),
         soci::into(l.member),
         soci::into(l.cycle),
         soci::into(amount),
         soci::into(rate),
         soci::into(l.termMonths),
         soci::into(status),
         soci::into(l.createdAt),
         soci::into(disbursedOn),
         soci::into(entry),
         soci::into(closedAt));
    st.execute();
    while (st.fetch())
    {
        Loan row;
        row.id = l.id;
        if (application)
            row.application = *application;
        row.member = l.member;
        row.cycle = l.cycle;
        row.amount = Money{amount};
        row.interestRate = Rate{rate};
        row.termMonths = l.termMonths;
        row.status = fromStorage<LoanStatus>(status);
        row.createdAt = l.createdAt;
        if (disbursedOn)
            row.disbursedOn = dateFromString(*disbursedOn);
        if (entry)
            row.disbursementEntry = *entry;
        if (closedAt)
            row.closedAt = *closedAt;
        result.push_back(std::move(row));
    }
    return result;
}

std::vector<LoanApplication>
LoanManager::selectApplications(
    LockedSociSession& db,
    std::string const& where)
{
    std::vector<LoanApplication> result;

    LoanApplication a;
    std::int64_t amount = 0;
    std::string status;
    boost::optional<std::string> notes;
    boost::optional<std::string> reviewedBy;
    boost::optional<std::string> reviewedAt;
    boost::optional<std::string> reviewNotes;

    soci::statement st =
        (db->prepare << "SELECT id, member_id, cycle_id, amount, "
                        "term_months, status, notes, applied_at, "
                        "reviewed_by, reviewed_at, review_notes "
                        "FROM loan_applications " +
                 where + " ORDER BY id",
         soci::into(a.id),
         soci::into(a.member),
         soci::into(a.cycle),
         soci::into(amount),
         soci::into(a.termMonths),
         soci::into(status),
         soci::into(notes),
         soci::into(a.appliedAt),
         soci::into(reviewedBy),
         soci::into(reviewedAt),
         soci::into(reviewNotes));
    st.execute();
    while (st.fetch())
    {
        LoanApplication row;
        row.id = a.id;
        row.member = a.member;
        row.cycle = a.cycle;
        row.amount = Money{amount};
        row.termMonths = a.termMonths;
        row.status = fromStorage<ApplicationStatus>(status);
        if (notes)
            row.notes = *notes;
        row.appliedAt = a.appliedAt;
        if (reviewedBy)
            row.reviewedBy = *reviewedBy;
        if (reviewedAt)
            row.reviewedAt = *reviewedAt;
        if (reviewNotes)
            row.reviewNotes = *reviewNotes;
        result.push_back(std::move(row));
    }
    return result;
}

}  // namespace mutual
