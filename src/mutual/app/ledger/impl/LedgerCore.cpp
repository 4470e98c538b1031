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

#include <mutual/app/ledger/LedgerCore.h>
#include <mutual/app/main/Application.h>
#include <mutual/basics/Log.h>
#include <mutual/basics/StringUtilities.h>
#include <mutual/core/DatabaseCon.h>
#include <mutual/core/TimeKeeper.h>

namespace mutual {

namespace {

// Every entry date is earlier than this, so it stands in for "no limit".
char const* const endOfTime = "9999-12-31";

char const*
fundName(FundKind kind)
{
    switch (kind)
    {
        case FundKind::savings:
            return "Member Savings";
        case FundKind::socialFund:
            return "Member Social Fund";
        case FundKind::adminFund:
            return "Member Admin Fund";
        case FundKind::penalties:
            return "Member Penalties Payable";
    }
    LogicError("fundName : unknown fund kind");
}

template <class T>
std::optional<T>
toStd(boost::optional<T> const& v)
{
    if (v)
        return *v;
    return std::nullopt;
}

template <class T>
boost::optional<T>
toBoost(std::optional<T> const& v)
{
    if (v)
        return *v;
    return boost::none;
}

}  // namespace

Money
JournalEntry::totalDebits() const
{
    Money total;
    for (auto const& line : lines)
        total += line.debit;
    return total;
}

Money
JournalEntry::totalCredits() const
{
    Money total;
    for (auto const& line : lines)
        total += line.credit;
    return total;
}

//------------------------------------------------------------------------------

LedgerCore::LedgerCore(Application& app, beast::Journal journal)
    : app_(app), j_(journal)
{
}

std::size_t
LedgerCore::bootstrapChart()
{
    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    std::string const now = to_string_iso(app_.timeKeeper().now());
    std::size_t created = 0;

    for (auto const& a : org::chart)
    {
        std::string const code = a.code;
        std::string type;
        *db << "SELECT type FROM accounts WHERE code = :code",
            soci::into(type), soci::use(code);

        if (db->got_data())
        {
            if (fromStorage<AccountType>(type) != a.type)
            {
                JLOG(j_.warn()) << "Account " << code << " is " << type
                                << ", expected " << to_string(a.type);
            }
            continue;
        }

        std::string const name = a.name;
        std::string const t = to_string(a.type);
        *db << "INSERT INTO accounts (code, name, type, created_at) "
               "VALUES (:code, :name, :type, :now)",
            soci::use(code), soci::use(name), soci::use(t), soci::use(now);
        ++created;

        JLOG(j_.info()) << "Created organization account " << code;
    }

    tr.commit();
    return created;
}

Result<JournalEntry>
LedgerCore::createJournalEntry(
    std::string const& description,
    std::vector<LineSpec> const& lines,
    std::optional<CycleID> cycle,
    std::optional<std::int64_t> sourceRef,
    std::optional<std::string> const& sourceType,
    std::optional<std::string> const& actor)
{
    if (lines.empty())
    {
        JLOG(j_.error()) << "Rejected entry '" << description
                         << "': no lines";
        return failure(tvlEMPTY_ENTRY, "Entry '" + description + "' is empty");
    }

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    Money debits;
    Money credits;

    for (auto const& line : lines)
    {
        if (line.debit.signum() < 0 || line.credit.signum() < 0)
        {
            JLOG(j_.error())
                << "Rejected line on account " << line.account
                << ": negative amount " << line.debit << "/" << line.credit;
            return failure(
                tvlNEGATIVE_AMOUNT,
                "Line on account " + std::to_string(line.account) +
                    " has a negative amount");
        }

        int found = 0;
        *db << "SELECT COUNT(*) FROM accounts WHERE id = :id",
            soci::into(found), soci::use(line.account);
        if (!found)
        {
            JLOG(j_.error()) << "Rejected line: unknown account "
                             << line.account;
            return failure(
                tnfACCOUNT,
                "Unknown ledger account " + std::to_string(line.account));
        }

        debits += line.debit;
        credits += line.credit;
    }

    if (debits != credits)
    {
        JLOG(j_.error()) << "Rejected entry '" << description
                         << "': debits " << debits << " != credits "
                         << credits;
        return failure(
            tvlIMBALANCED_ENTRY,
            "Entry '" + description + "' debits " + to_string(debits) +
                " do not equal credits " + to_string(credits));
    }

    if (!debits)
    {
        JLOG(j_.error()) << "Rejected entry '" << description
                         << "': nothing to post";
        return failure(
            tvlBAD_AMOUNT, "Entry '" + description + "' moves no money");
    }

    if (cycle)
    {
        int found = 0;
        *db << "SELECT COUNT(*) FROM cycles WHERE id = :id",
            soci::into(found), soci::use(*cycle);
        if (!found)
            return failure(tnfCYCLE, "No cycle " + std::to_string(*cycle));
    }

    std::string const date = to_string(app_.timeKeeper().today());
    std::string const now = to_string_iso(app_.timeKeeper().now());
    auto const cycleId = toBoost(cycle);
    auto const ref = toBoost(sourceRef);
    auto const type = toBoost(sourceType);
    auto const by = toBoost(actor);

    *db << "INSERT INTO journal_entries (entry_date, description, cycle_id, "
           "source_type, source_ref, created_by, created_at) "
           "VALUES (:date, :descr, :cycle, :type, :ref, :by, :now)",
        soci::use(date), soci::use(description), soci::use(cycleId),
        soci::use(type), soci::use(ref), soci::use(by), soci::use(now);

    EntryID id = 0;
    *db << "SELECT last_insert_rowid()", soci::into(id);

    for (auto const& line : lines)
    {
        boost::optional<std::string> memo;
        if (!line.memo.empty())
            memo = line.memo;
        std::int64_t const debit = line.debit.cents();
        std::int64_t const credit = line.credit.cents();

        *db << "INSERT INTO journal_lines "
               "(entry_id, account_id, debit, credit, memo) "
               "VALUES (:entry, :account, :debit, :credit, :memo)",
            soci::use(id), soci::use(line.account), soci::use(debit),
            soci::use(credit), soci::use(memo);
    }

    auto entry = loadEntry(db, id);
    if (!entry)
        LogicError("LedgerCore::createJournalEntry : entry vanished");

    tr.commit();

    JLOG(j_.debug()) << "Posted entry " << id << " '" << description
                     << "' for " << debits;
    return std::move(*entry);
}

Result<JournalEntry>
LedgerCore::reverseEntry(
    EntryID entryId,
    std::string const& reason,
    std::string const& actor)
{
    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    auto const original = loadEntry(db, entryId);
    if (!original)
        return failure(tnfENTRY, "No journal entry " + std::to_string(entryId));

    if (original->isReversed())
        return failure(
            tstALREADY_REVERSED,
            "Entry " + std::to_string(entryId) + " was already reversed");

    if (original->lines.empty())
        return failure(
            tvlEMPTY_ENTRY,
            "Entry " + std::to_string(entryId) + " has no lines to reverse");

    std::vector<LineSpec> lines;
    lines.reserve(original->lines.size());
    for (auto const& line : original->lines)
        lines.push_back(
            {line.account, line.credit, line.debit, line.memo.value_or("")});

    auto reversal = createJournalEntry(
        "Reversal of entry " + std::to_string(entryId) + " - " + reason,
        lines,
        original->cycle,
        entryId,
        std::string(source::reversal),
        actor);
    if (!reversal)
        return reversal;

    std::string const now = to_string_iso(app_.timeKeeper().now());
    soci::statement st =
        (db->prepare << "UPDATE journal_entries SET reversed_by = :by, "
                        "reversed_at = :at, reversal_reason = :reason, "
                        "reversal_entry_id = :rev "
                        "WHERE id = :id AND reversed_at IS NULL",
         soci::use(actor),
         soci::use(now),
         soci::use(reason),
         soci::use(reversal->id),
         soci::use(entryId));
    st.execute(true);

    if (st.get_affected_rows() != 1)
        return failure(
            tstALREADY_REVERSED,
            "Entry " + std::to_string(entryId) + " was already reversed");

    tr.commit();

    JLOG(j_.info()) << "Entry " << entryId << " reversed by entry "
                    << reversal->id << ": " << reason;
    return reversal;
}

Result<JournalEntry>
LedgerCore::getEntry(EntryID id)
{
    auto db = app_.getDb().checkoutDb();
    if (auto entry = loadEntry(db, id))
        return std::move(*entry);
    return failure(tnfENTRY, "No journal entry " + std::to_string(id));
}

std::vector<JournalEntry>
LedgerCore::entriesBySource(std::string const& sourceType, std::int64_t sourceRef)
{
    auto db = app_.getDb().checkoutDb();

    std::vector<EntryID> ids;
    EntryID id = 0;
    soci::statement st =
        (db->prepare << "SELECT id FROM journal_entries "
                        "WHERE source_type = :type AND source_ref = :ref "
                        "ORDER BY id",
         soci::into(id),
         soci::use(sourceType),
         soci::use(sourceRef));
    st.execute();
    while (st.fetch())
        ids.push_back(id);

    std::vector<JournalEntry> result;
    result.reserve(ids.size());
    for (auto const i : ids)
    {
        if (auto entry = loadEntry(db, i))
            result.push_back(std::move(*entry));
    }
    return result;
}

std::vector<EntryID>
LedgerCore::unbalancedEntries()
{
    auto db = app_.getDb().checkoutDb();

    std::vector<EntryID> result;
    EntryID id = 0;
    soci::statement st =
        (db->prepare << "SELECT e.id FROM journal_entries e "
                        "LEFT JOIN journal_lines l ON l.entry_id = e.id "
                        "GROUP BY e.id "
                        "HAVING COALESCE(SUM(l.debit), 0) != "
                        "COALESCE(SUM(l.credit), 0) "
                        "OR COUNT(l.id) = 0",
         soci::into(id));
    st.execute();
    while (st.fetch())
        result.push_back(id);
    return result;
}

//------------------------------------------------------------------------------

std::pair<Money, Money>
LedgerCore::lineTotals(AccountID account, std::optional<Date> const& asOf)
{
    auto db = app_.getDb().checkoutDb();

    std::string const limit = asOf ? to_string(*asOf) : endOfTime;
    std::int64_t debit = 0;
    std::int64_t credit = 0;

    *db << "SELECT COALESCE(SUM(l.debit), 0), COALESCE(SUM(l.credit), 0) "
           "FROM journal_lines l "
           "JOIN journal_entries e ON e.id = l.entry_id "
           "WHERE l.account_id = :account AND e.entry_date <= :limit",
        soci::into(debit), soci::into(credit), soci::use(account),
        soci::use(limit);

    return {Money{debit}, Money{credit}};
}

Result<Money>
LedgerCore::getAccountBalance(AccountID id, std::optional<Date> const& asOf)
{
    auto const account = getAccount(id);
    if (!account)
        return Unexpected(account.error());

    auto const [debit, credit] = lineTotals(id, asOf);
    if (isDebitNormal(account->type))
        return debit - credit;
    return credit - debit;
}

Result<LedgerAccount>
LedgerCore::getAccount(AccountID id)
{
    auto db = app_.getDb().checkoutDb();

    LedgerAccount a;
    std::string type;
    boost::optional<std::int64_t> member;
    boost::optional<std::string> fund;

    *db << "SELECT id, code, name, type, member_id, fund_kind "
           "FROM accounts WHERE id = :id",
        soci::into(a.id), soci::into(a.code), soci::into(a.name),
        soci::into(type), soci::into(member), soci::into(fund),
        soci::use(id);

    if (!db->got_data())
        return failure(tnfACCOUNT, "No ledger account " + std::to_string(id));

    a.type = fromStorage<AccountType>(type);
    a.member = toStd(member);
    if (fund)
        a.fundKind = fromStorage<FundKind>(*fund);
    return a;
}

std::optional<LedgerAccount>
LedgerCore::findAccount(std::string const& code)
{
    AccountID id = 0;
    {
        auto db = app_.getDb().checkoutDb();
        *db << "SELECT id FROM accounts WHERE code = :code",
            soci::into(id), soci::use(code);
        if (!db->got_data())
            return std::nullopt;
    }

    auto account = getAccount(id);
    if (!account)
        return std::nullopt;
    return std::move(*account);
}

Result<LedgerAccount>
LedgerCore::requireAccount(std::string const& code)
{
    if (auto account = findAccount(code))
        return std::move(*account);

    JLOG(j_.error()) << "Required account " << code << " is missing";
    return failure(
        tcfMISSING_ACCOUNT,
        "Required organization account " + code + " does not exist");
}

std::string
LedgerCore::subaccountCode(MemberID member, FundKind kind)
{
    return subaccountPrefix(kind) +
        toFixedHex(static_cast<std::uint64_t>(member), 8);
}

Result<LedgerAccount>
LedgerCore::getOrCreateMemberSubaccount(MemberID member, FundKind kind)
{
    LedgerAccount a;
    a.code = subaccountCode(member, kind);
    a.name = std::string(fundName(kind)) + " " +
        toFixedHex(static_cast<std::uint64_t>(member), 8);
    a.type = subaccountType(kind);
    a.member = member;
    a.fundKind = kind;

    auto db = app_.getDb().checkoutDb();

    auto& memo = db.state().memo;
    if (auto const iter = memo.find(a.code); iter != memo.end())
    {
        a.id = iter->second;
        return a;
    }

    SavepointTransaction tr(db);

    *db << "SELECT id FROM accounts WHERE code = :code",
        soci::into(a.id), soci::use(a.code);

    if (!db->got_data())
    {
        int found = 0;
        *db << "SELECT COUNT(*) FROM members WHERE id = :id",
            soci::into(found), soci::use(member);
        if (!found)
            return failure(tnfMEMBER, "No member " + std::to_string(member));

        std::string const type = to_string(a.type);
        std::string const fund = to_string(kind);
        std::string const now = to_string_iso(app_.timeKeeper().now());

        *db << "INSERT INTO accounts "
               "(code, name, type, member_id, fund_kind, created_at) "
               "VALUES (:code, :name, :type, :member, :fund, :now)",
            soci::use(a.code), soci::use(a.name), soci::use(type),
            soci::use(member), soci::use(fund), soci::use(now);
        *db << "SELECT last_insert_rowid()", soci::into(a.id);

        JLOG(j_.debug()) << "Created sub-account " << a.code;
    }

    tr.commit();

    // Remembered only while an enclosing transaction is open. Ending or
    // rolling back that transaction clears the memo.
    if (db.state().depth > 0)
        db.state().memo[a.code] = a.id;
    return a;
}

//------------------------------------------------------------------------------

Money
LedgerCore::savingsBalance(MemberID member)
{
    auto const account = findAccount(subaccountCode(member, FundKind::savings));
    if (!account)
        return Money{};
    auto const [debit, credit] = lineTotals(account->id);
    return credit - debit;
}

Money
LedgerCore::fundDue(MemberID member, FundKind kind)
{
    auto const account = findAccount(subaccountCode(member, kind));
    if (!account)
        return Money{};
    auto const [debit, credit] = lineTotals(account->id);
    auto const due = debit - credit;
    return due.signum() > 0 ? due : Money{};
}

Money
LedgerCore::fundPayments(
    MemberID member,
    FundKind kind,
    std::optional<CycleID> cycle)
{
    auto const account = findAccount(subaccountCode(member, kind));
    if (!account)
        return Money{};

    auto db = app_.getDb().checkoutDb();

    std::string const type = source::depositApproval;
    std::int64_t const anyCycle = cycle ? 0 : 1;
    std::int64_t const cycleId = cycle.value_or(0);
    std::int64_t total = 0;

    *db << "SELECT COALESCE(SUM(l.credit), 0) FROM journal_lines l "
           "JOIN journal_entries e ON e.id = l.entry_id "
           "WHERE l.account_id = :account AND e.source_type = :type "
           "AND e.reversed_at IS NULL "
           "AND (:any = 1 OR e.cycle_id = :cycle)",
        soci::into(total), soci::use(account->id), soci::use(type),
        soci::use(anyCycle), soci::use(cycleId);

    return Money{total};
}

Money
LedgerCore::penaltiesDue(MemberID member)
{
    return fundDue(member, FundKind::penalties);
}

//------------------------------------------------------------------------------

std::optional<JournalEntry>
LedgerCore::loadEntry(LockedSociSession& db, EntryID id)
{
    JournalEntry e;
    std::string date;
    boost::optional<std::int64_t> cycle;
    boost::optional<std::string> sourceType;
    boost::optional<std::int64_t> sourceRef;
    boost::optional<std::string> createdBy;
    boost::optional<std::string> reversedBy;
    boost::optional<std::string> reversedAt;
    boost::optional<std::string> reason;
    boost::optional<std::int64_t> reversalEntry;

    *db << "SELECT id, entry_date, description, cycle_id, source_type, "
           "source_ref, created_by, created_at, reversed_by, reversed_at, "
           "reversal_reason, reversal_entry_id "
           "FROM journal_entries WHERE id = :id",
        soci::into(e.id), soci::into(date), soci::into(e.description),
        soci::into(cycle), soci::into(sourceType), soci::into(sourceRef),
        soci::into(createdBy), soci::into(e.createdAt),
        soci::into(reversedBy), soci::into(reversedAt), soci::into(reason),
        soci::into(reversalEntry), soci::use(id);

    if (!db->got_data())
        return std::nullopt;

    auto const d = dateFromString(date);
    if (!d)
        Throw<std::runtime_error>(
            "Entry " + std::to_string(id) + " has a bad date: " + date);
    e.date = *d;
    e.cycle = toStd(cycle);
    e.sourceType = toStd(sourceType);
    e.sourceRef = toStd(sourceRef);
    e.createdBy = toStd(createdBy);
    e.reversedBy = toStd(reversedBy);
    e.reversedAt = toStd(reversedAt);
    e.reversalReason = toStd(reason);
    e.reversalEntry = toStd(reversalEntry);

    JournalLine line;
    std::int64_t debit = 0;
    std::int64_t credit = 0;
    boost::optional<std::string> memo;

    soci::statement st =
        (db->prepare << "SELECT id, account_id, debit, credit, memo "
                        "FROM journal_lines WHERE entry_id = :id ORDER BY id",
         soci::into(line.id),
         soci::into(line.account),
         soci::into(debit),
         soci::into(credit),
         soci::into(memo),
         soci::use(id));
    st.execute();
    while (st.fetch())
    {
        JournalLine l = line;
        l.debit = Money{debit};
        l.credit = Money{credit};
        l.memo = toStd(memo);
        e.lines.push_back(std::move(l));
    }

    return e;
}

}  // namespace mutual
