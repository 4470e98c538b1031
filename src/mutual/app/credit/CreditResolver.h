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

#ifndef MUTUAL_APP_CREDIT_CREDITRESOLVER_H_INCLUDED
#define MUTUAL_APP_CREDIT_CREDITRESOLVER_H_INCLUDED

#include <mutual/basics/Money.h>
#include <mutual/basics/Rate.h>
#include <mutual/basics/chrono.h>
#include <mutual/beast/utility/Journal.h>
#include <mutual/protocol/Failure.h>
#include <mutual/protocol/Protocol.h>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mutual {

class Application;

struct CreditTier
{
    TierID id = 0;
    std::string name;
    std::optional<std::string> description;
    int order = 0;
};

/** How much a tier may borrow against savings, from a date onward. */
struct BorrowingPolicy
{
    std::int64_t id = 0;
    TierID tier = 0;
    Rate multiplier;
    Date effectiveFrom;
    std::optional<Money> maxAmount;
};

/** The interest rate of a tier in a cycle. No term means every term. */
struct InterestRange
{
    std::int64_t id = 0;
    TierID tier = 0;
    CycleID cycle = 0;
    std::optional<int> termMonths;
    Rate rate;
};

struct CreditResolution
{
    MemberID member = 0;
    CycleID cycle = 0;
    CreditTier tier;
    Rate multiplier;
    Money savings;
    Money maxLoanAmount;

    // Rate for terms with no explicit entry.
    std::optional<Rate> wildcardRate;

    // Explicit rates, by term in months.
    std::map<int, Rate> ratesByTerm;
};

/** The rate for a term: its own entry first, then the wildcard. */
std::optional<Rate>
rateForTerm(CreditResolution const& resolution, int termMonths);

/** Resolves what a member may borrow, and at what rate. */
class CreditResolver
{
    Application& app_;
    beast::Journal const j_;

public:
    CreditResolver(Application& app, beast::Journal journal);

    /** Work out the member's borrowing terms for a cycle.

        The tier comes from the member's assignment for the cycle, the
        multiplier from the newest policy of that tier effective on or
        before the cycle's end date.
    */
    Result<CreditResolution>
    resolve(MemberID member, CycleID cycle);

    Result<CreditTier>
    createTier(
        std::string const& name,
        std::optional<std::string> const& description,
        int order);

    Result<CreditTier>
    getTier(TierID id);

    std::vector<CreditTier>
    listTiers();

    /** Put a member in a tier for a cycle, replacing any earlier choice. */
    Result<void>
    assignTier(
        MemberID member,
        CycleID cycle,
        TierID tier,
        std::string const& actor);

    std::optional<TierID>
    assignedTier(MemberID member, CycleID cycle);

    Result<BorrowingPolicy>
    addBorrowingPolicy(
        TierID tier,
        Rate const& multiplier,
        Date const& effectiveFrom,
        std::optional<Money> const& maxAmount = std::nullopt);

    Result<InterestRange>
    addInterestRange(
        TierID tier,
        CycleID cycle,
        std::optional<int> termMonths,
        Rate const& rate);

    /** Loans the member has ever actually received. */
    int
    borrowCount(MemberID member);
};

}  // namespace mutual

#endif
