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
#include <mutual/app/main/Application.h>
#include <mutual/app/misc/MemberRegistry.h>
#include <mutual/basics/Log.h>
#include <mutual/core/DatabaseCon.h>
#include <mutual/core/TimeKeeper.h>

namespace mutual {

std::optional<Rate>
rateForTerm(CreditResolution const& resolution, int termMonths)
{
    auto const iter = resolution.ratesByTerm.find(termMonths);
    if (iter != resolution.ratesByTerm.end())
        return iter->second;
    return resolution.wildcardRate;
}

CreditResolver::CreditResolver(Application& app, beast::Journal journal)
    : app_(app), j_(journal)
{
}

Result<CreditResolution>
CreditResolver::resolve(MemberID member, CycleID cycleId)
{
    auto const cycle = app_.getCycles().getCycle(cycleId);
    if (!cycle)
        return Unexpected(cycle.error());

    auto const tierId = assignedTier(member, cycleId);
    if (!tierId)
        return failure(
            tcfNO_TIER_ASSIGNED,
            "Member " + std::to_string(member) +
                " has no credit tier for cycle " + std::to_string(cycleId));

    auto tier = getTier(*tierId);
    if (!tier)
        return Unexpected(tier.error());

    auto db = app_.getDb().checkoutDb();

    std::int64_t multiplier = 0;
    boost::optional<std::int64_t> maxAmount;
    std::string const end = to_string(cycle->end);

    *db << "SELECT multiplier, max_amount FROM borrowing_policies "
           "WHERE tier_id = :tier AND effective_from <= :end "
           "ORDER BY effective_from DESC, id DESC LIMIT 1",
        soci::into(multiplier), soci::into(maxAmount), soci::use(*tierId),
        soci::use(end);

    if (!db->got_data())
        return failure(
            tcfNO_POLICY,
            "Tier '" + tier->name + "' has no borrowing policy effective by " +
                end);

    CreditResolution r;
    r.member = member;
    r.cycle = cycleId;
    r.tier = std::move(*tier);
    r.multiplier = Rate{multiplier};
    r.savings = app_.getLedger().savingsBalance(member);
    r.maxLoanAmount = multiply(r.savings, r.multiplier);
    if (maxAmount && Money{*maxAmount} < r.maxLoanAmount)
        r.maxLoanAmount = Money{*maxAmount};
    if (r.maxLoanAmount.signum() < 0)
        r.maxLoanAmount = Money{};

    boost::optional<int> term;
    std::int64_t rate = 0;
    soci::statement st =
        (db->prepare << "SELECT term_months, rate FROM interest_ranges "
                        "WHERE tier_id = :tier AND cycle_id = :cycle",
         soci::into(term),
         soci::into(rate),
         soci::use(*tierId),
         soci::use(cycleId));
    st.execute();
    while (st.fetch())
    {
        if (term)
            r.ratesByTerm[*term] = Rate{rate};
        else
            r.wildcardRate = Rate{rate};
    }

    JLOG(j_.debug()) << "Member " << member << " tier '" << r.tier.name
                     << "' savings " << r.savings << " x" << r.multiplier
                     << " max " << r.maxLoanAmount;
    return r;
}

Result<CreditTier>
CreditResolver::createTier(
    std::string const& name,
    std::optional<std::string> const& description,
    int order)
{
    if (name.empty())
        return failure(tvlMISSING_FIELD, "A credit tier needs a name");

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    int found = 0;
    *db << "SELECT COUNT(*) FROM credit_tiers WHERE name = :name",
        soci::into(found), soci::use(name);
    if (found)
        return failure(tvlDUPLICATE, "Credit tier '" + name + "' exists");

    boost::optional<std::string> descr;
    if (description)
        descr = *description;

    *db << "INSERT INTO credit_tiers (name, description, tier_order) "
           "VALUES (:name, :descr, :ord)",
        soci::use(name), soci::use(descr), soci::use(order);

    CreditTier tier;
    *db << "SELECT last_insert_rowid()", soci::into(tier.id);
    tier.name = name;
    tier.description = description;
    tier.order = order;

    tr.commit();

    JLOG(j_.info()) << "Created credit tier " << tier.id << " '" << name
                    << "'";
    return tier;
}

Result<CreditTier>
CreditResolver::getTier(TierID id)
{
    auto db = app_.getDb().checkoutDb();

    CreditTier tier;
    boost::optional<std::string> descr;
    *db << "SELECT id, name, description, tier_order FROM credit_tiers "
           "WHERE id = :id",
        soci::into(tier.id), soci::into(tier.name), soci::into(descr),
        soci::into(tier.order), soci::use(id);

    if (!db->got_data())
        return failure(tnfTIER, "No credit tier " + std::to_string(id));
    if (descr)
        tier.description = *descr;
    return tier;
}

std::vector<CreditTier>
CreditResolver::listTiers()
{
    auto db = app_.getDb().checkoutDb();

    std::vector<CreditTier> result;
    CreditTier tier;
    boost::optional<std::string> descr;

    soci::statement st =
        (db->prepare << "SELECT id, name, description, tier_order "
                        "FROM credit_tiers ORDER BY tier_order, id",
         soci::into(tier.id),
         soci::into(tier.name),
         soci::into(descr),
         soci::into(tier.order));
    st.execute();
    while (st.fetch())
    {
        CreditTier row = tier;
        row.description.reset();
        if (descr)
            row.description = *descr;
        result.push_back(std::move(row));
    }
    return result;
}

Result<void>
CreditResolver::assignTier(
    MemberID member,
    CycleID cycle,
    TierID tier,
    std::string const& actor)
{
    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    if (auto const m = app_.getMembers().get(member); !m)
        return Unexpected(m.error());
    if (auto const c = app_.getCycles().getCycle(cycle); !c)
        return Unexpected(c.error());
    if (auto const t = getTier(tier); !t)
        return Unexpected(t.error());

    std::string const now = to_string_iso(app_.timeKeeper().now());

    *db << "INSERT INTO member_credit_ratings "
           "(member_id, cycle_id, tier_id, assigned_by, assigned_at) "
           "VALUES (:member, :cycle, :tier, :by, :now) "
           "ON CONFLICT (member_id, cycle_id) DO UPDATE SET "
           "tier_id = excluded.tier_id, assigned_by = excluded.assigned_by, "
           "assigned_at = excluded.assigned_at",
        soci::use(member), soci::use(cycle), soci::use(tier),
        soci::use(actor), soci::use(now);

    tr.commit();

    JLOG(j_.info()) << "Member " << member << " assigned tier " << tier
                    << " for cycle " << cycle << " by " << actor;
    return {};
}

std::optional<TierID>
CreditResolver::assignedTier(MemberID member, CycleID cycle)
{
    auto db = app_.getDb().checkoutDb();

    TierID tier = 0;
    *db << "SELECT tier_id FROM member_credit_ratings "
           "WHERE member_id = :member AND cycle_id = :cycle",
        soci::into(tier), soci::use(member), soci::use(cycle);

    if (!db->got_data())
        return std::nullopt;
    return tier;
}

Result<BorrowingPolicy>
CreditResolver::addBorrowingPolicy(
    TierID tier,
    Rate const& multiplier,
    Date const& effectiveFrom,
    std::optional<Money> const& maxAmount)
{
    if (multiplier.hundredths() < 0)
        return failure(tvlNEGATIVE_AMOUNT, "Multiplier may not be negative");
    if (maxAmount && maxAmount->signum() < 0)
        return failure(tvlNEGATIVE_AMOUNT, "Maximum may not be negative");
    if (!effectiveFrom.ok())
        return failure(tvlBAD_DATE);

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    if (auto const t = getTier(tier); !t)
        return Unexpected(t.error());

    std::int64_t const m = multiplier.hundredths();
    std::string const from = to_string(effectiveFrom);
    boost::optional<std::int64_t> cap;
    if (maxAmount)
        cap = maxAmount->cents();

    *db << "INSERT INTO borrowing_policies "
           "(tier_id, multiplier, effective_from, max_amount) "
           "VALUES (:tier, :mult, :from, :cap)",
        soci::use(tier), soci::use(m), soci::use(from), soci::use(cap);

    BorrowingPolicy policy;
    *db << "SELECT last_insert_rowid()", soci::into(policy.id);
    policy.tier = tier;
    policy.multiplier = multiplier;
    policy.effectiveFrom = effectiveFrom;
    policy.maxAmount = maxAmount;

    tr.commit();

    JLOG(j_.info()) << "Tier " << tier << " multiplier " << multiplier
                    << " from " << from;
    return policy;
}

Result<InterestRange>
CreditResolver::addInterestRange(
    TierID tier,
    CycleID cycle,
    std::optional<int> termMonths,
    Rate const& rate)
{
    if (termMonths && *termMonths <= 0)
        return failure(tvlBAD_TERM);
    if (rate.hundredths() < 0)
        return failure(tvlNEGATIVE_AMOUNT, "Rate may not be negative");

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    if (auto const t = getTier(tier); !t)
        return Unexpected(t.error());
    if (auto const c = app_.getCycles().getCycle(cycle); !c)
        return Unexpected(c.error());

    int const termKey = termMonths.value_or(0);
    int found = 0;
    *db << "SELECT COUNT(*) FROM interest_ranges WHERE tier_id = :tier "
           "AND cycle_id = :cycle AND IFNULL(term_months, 0) = :term",
        soci::into(found), soci::use(tier), soci::use(cycle),
        soci::use(termKey);
    if (found)
        return failure(
            tvlDUPLICATE,
            "Tier " + std::to_string(tier) + " already has a rate for " +
                (termMonths ? std::to_string(*termMonths) + " months"
                            : std::string("all terms")));

    boost::optional<int> term;
    if (termMonths)
        term = *termMonths;
    std::int64_t const r = rate.hundredths();

    *db << "INSERT INTO interest_ranges (tier_id, cycle_id, term_months, "
           "rate) VALUES (:tier, :cycle, :term, :rate)",
        soci::use(tier), soci::use(cycle), soci::use(term), soci::use(r);

    InterestRange range;
    *db << "SELECT last_insert_rowid()", soci::into(range.id);
    range.tier = tier;
    range.cycle = cycle;
    range.termMonths = termMonths;
    range.rate = rate;

    tr.commit();
    return range;
}

int
CreditResolver::borrowCount(MemberID member)
{
    auto db = app_.getDb().checkoutDb();

    std::string const disbursed = to_string(LoanStatus::disbursed);
    std::string const open = to_string(LoanStatus::open);
    std::string const closed = to_string(LoanStatus::closed);
    int count = 0;

    *db << "SELECT COUNT(*) FROM loans WHERE member_id = :member "
           "AND status IN (:a, :b, :c)",
        soci::into(count), soci::use(member), soci::use(disbursed),
        soci::use(open), soci::use(closed);
    return count;
}

}  // namespace mutual
