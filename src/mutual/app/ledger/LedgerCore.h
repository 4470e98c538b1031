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

#ifndef MUTUAL_APP_LEDGER_LEDGERCORE_H_INCLUDED
#define MUTUAL_APP_LEDGER_LEDGERCORE_H_INCLUDED

#include <mutual/basics/Money.h>
#include <mutual/basics/chrono.h>
#include <mutual/beast/utility/Journal.h>
#include <mutual/protocol/Failure.h>
#include <mutual/protocol/Protocol.h>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mutual {

class Application;
class LockedSociSession;

struct LedgerAccount
{
    AccountID id = 0;
    std::string code;
    std::string name;
    AccountType type = AccountType::asset;

    // Set only on member sub-accounts.
    std::optional<MemberID> member;
    std::optional<FundKind> fundKind;
};

struct JournalLine
{
    std::int64_t id = 0;
    AccountID account = 0;
    Money debit;
    Money credit;
    std::optional<std::string> memo;
};

struct JournalEntry
{
    EntryID id = 0;
    Date date;
    std::string description;
    std::optional<CycleID> cycle;
    std::optional<std::string> sourceType;
    std::optional<std::int64_t> sourceRef;
    std::optional<std::string> createdBy;
    std::string createdAt;

    std::optional<std::string> reversedBy;
    std::optional<std::string> reversedAt;
    std::optional<std::string> reversalReason;
    std::optional<EntryID> reversalEntry;

    std::vector<JournalLine> lines;

    bool
    isReversed() const
    {
        return reversedAt.has_value();
    }

    Money
    totalDebits() const;

    Money
    totalCredits() const;
};

/** A line of an entry that has not been posted yet. */
struct LineSpec
{
    AccountID account = 0;
    Money debit;
    Money credit;
    std::string memo;
};

inline LineSpec
debitLine(AccountID account, Money amount, std::string memo = {})
{
    return {account, amount, Money{}, std::move(memo)};
}

inline LineSpec
creditLine(AccountID account, Money amount, std::string memo = {})
{
    return {account, Money{}, amount, std::move(memo)};
}

//------------------------------------------------------------------------------

/** The double-entry ledger.

    Owns the chart of accounts and the journal. Every amount that moves in
    the cooperative is posted here as a balanced entry; entries are never
    edited or deleted, only reversed by a mirror entry.
*/
class LedgerCore
{
    Application& app_;
    beast::Journal const j_;

public:
    LedgerCore(Application& app, beast::Journal journal);

    /** Create any missing organization account.
        @return The number of accounts created.
    */
    std::size_t
    bootstrapChart();

    /** Post a balanced entry.

        The header and all lines are written in one transaction, or nothing
        is written. Refuses an entry with no lines, a negative amount, an
        unknown account, or debits that do not equal credits.
    */
    Result<JournalEntry>
    createJournalEntry(
        std::string const& description,
        std::vector<LineSpec> const& lines,
        std::optional<CycleID> cycle = std::nullopt,
        std::optional<std::int64_t> sourceRef = std::nullopt,
        std::optional<std::string> const& sourceType = std::nullopt,
        std::optional<std::string> const& actor = std::nullopt);

    /** Post the mirror image of an entry and mark the original reversed. */
    Result<JournalEntry>
    reverseEntry(
        EntryID entry,
        std::string const& reason,
        std::string const& actor);

    Result<JournalEntry>
    getEntry(EntryID id);

    /** Entries posted for a source, oldest first. */
    std::vector<JournalEntry>
    entriesBySource(std::string const& sourceType, std::int64_t sourceRef);

    /** Entries whose debits do not equal their credits. Always empty. */
    std::vector<EntryID>
    unbalancedEntries();

    //--------------------------------------------------------------------------

    /** Balance of an account as of the end of a day.

        Debit-normal accounts report debits less credits, the others
        credits less debits. With no date, every line counts.
    */
    Result<Money>
    getAccountBalance(
        AccountID account,
        std::optional<Date> const& asOf = std::nullopt);

    /** Raw debit and credit totals of an account. */
    std::pair<Money, Money>
    lineTotals(AccountID account, std::optional<Date> const& asOf = std::nullopt);

    Result<LedgerAccount>
    getAccount(AccountID id);

    std::optional<LedgerAccount>
    findAccount(std::string const& code);

    /** An organization account that must exist.
        Its absence is a configuration failure.
    */
    Result<LedgerAccount>
    requireAccount(std::string const& code);

    /** The member's sub-account for a fund, created on first use.

        Lookups are remembered until the outermost transaction on the
        connection ends.
    */
    Result<LedgerAccount>
    getOrCreateMemberSubaccount(MemberID member, FundKind kind);

    /** The code of a member sub-account. */
    static std::string
    subaccountCode(MemberID member, FundKind kind);

    //--------------------------------------------------------------------------

    Money
    savingsBalance(MemberID member);

    /** Amount the member still owes a fund, never negative. */
    Money
    fundDue(MemberID member, FundKind kind);

    Money
    socialFundDue(MemberID member)
    {
        return fundDue(member, FundKind::socialFund);
    }

    Money
    adminFundDue(MemberID member)
    {
        return fundDue(member, FundKind::adminFund);
    }

    /** Credits to a fund receivable by deposits that still stand. */
    Money
    fundPayments(
        MemberID member,
        FundKind kind,
        std::optional<CycleID> cycle = std::nullopt);

    Money
    socialFundPayments(
        MemberID member,
        std::optional<CycleID> cycle = std::nullopt)
    {
        return fundPayments(member, FundKind::socialFund, cycle);
    }

    Money
    adminFundPayments(
        MemberID member,
        std::optional<CycleID> cycle = std::nullopt)
    {
        return fundPayments(member, FundKind::adminFund, cycle);
    }

    /** Penalties charged and not yet paid, never negative. */
    Money
    penaltiesDue(MemberID member);

private:
    std::optional<JournalEntry>
    loadEntry(LockedSociSession& db, EntryID id);
};

}  // namespace mutual

#endif
