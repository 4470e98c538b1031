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

#include <mutual/protocol/Status.h>
#include <algorithm>
#include <array>
#include <utility>

namespace mutual {

namespace {

template <class E>
using NameTable = std::pair<E, char const*>;

// clang-format off
constexpr std::array<NameTable<AccountType>, 5> accountTypeNames{{
    {AccountType::asset,        "asset"},
    {AccountType::liability,    "liability"},
    {AccountType::income,       "income"},
    {AccountType::expense,      "expense"},
    {AccountType::equity,       "equity"},
}};

constexpr std::array<NameTable<FundKind>, 4> fundKindNames{{
    {FundKind::savings,         "savings"},
    {FundKind::socialFund,      "social_fund"},
    {FundKind::adminFund,       "admin_fund"},
    {FundKind::penalties,       "penalties"},
}};

constexpr std::array<NameTable<MemberStatus>, 2> memberStatusNames{{
    {MemberStatus::active,      "active"},
    {MemberStatus::inactive,    "inactive"},
}};

constexpr std::array<NameTable<CycleStatus>, 3> cycleStatusNames{{
    {CycleStatus::draft,        "draft"},
    {CycleStatus::active,       "active"},
    {CycleStatus::closed,       "closed"},
}};

constexpr std::array<NameTable<PhaseType>, 5> phaseTypeNames{{
    {PhaseType::declaration,     "declaration"},
    {PhaseType::loanApplication, "loan_application"},
    {PhaseType::deposits,        "deposits"},
    {PhaseType::payout,          "payout"},
    {PhaseType::shareout,        "shareout"},
}};

constexpr std::array<NameTable<DeclarationStatus>, 4> declarationStatusNames{{
    {DeclarationStatus::pending,  "pending"},
    {DeclarationStatus::proof,    "proof"},
    {DeclarationStatus::approved, "approved"},
    {DeclarationStatus::rejected, "rejected"},
}};

constexpr std::array<NameTable<ProofStatus>, 3> proofStatusNames{{
    {ProofStatus::submitted,    "submitted"},
    {ProofStatus::approved,     "approved"},
    {ProofStatus::rejected,     "rejected"},
}};

constexpr std::array<NameTable<PenaltyStatus>, 3> penaltyStatusNames{{
    {PenaltyStatus::pending,    "pending"},
    {PenaltyStatus::approved,   "approved"},
    {PenaltyStatus::paid,       "paid"},
}};

constexpr std::array<NameTable<ApplicationStatus>, 4> applicationStatusNames{{
    {ApplicationStatus::pending,   "pending"},
    {ApplicationStatus::approved,  "approved"},
    {ApplicationStatus::rejected,  "rejected"},
    {ApplicationStatus::withdrawn, "withdrawn"},
}};

constexpr std::array<NameTable<LoanStatus>, 7> loanStatusNames{{
    {LoanStatus::pending,       "pending"},
    {LoanStatus::approved,      "approved"},
    {LoanStatus::disbursed,     "disbursed"},
    {LoanStatus::open,          "open"},
    {LoanStatus::closed,        "closed"},
    {LoanStatus::withdrawn,     "withdrawn"},
    {LoanStatus::rejected,      "rejected"},
}};
// clang-format on

template <class E, std::size_t N>
char const*
nameOf(std::array<NameTable<E>, N> const& table, E v)
{
    auto const it = std::find_if(
        table.begin(), table.end(), [v](auto const& p) { return p.first == v; });
    if (it == table.end())
        LogicError("to_string: enum value without a name");
    return it->second;
}

template <class E, std::size_t N>
std::optional<E>
valueOf(std::array<NameTable<E>, N> const& table, std::string const& s)
{
    auto const it = std::find_if(table.begin(), table.end(), [&s](auto const& p) {
        return s == p.second;
    });
    if (it == table.end())
        return std::nullopt;
    return it->first;
}

}  // namespace

#define MUTUAL_ENUM_NAMES(Enum, table)                 \
    char const* to_string(Enum v)                      \
    {                                                  \
        return nameOf(table, v);                       \
    }                                                  \
    template <>                                        \
    std::optional<Enum> enumFromString<Enum>(std::string const& s) \
    {                                                  \
        return valueOf(table, s);                      \
    }

MUTUAL_ENUM_NAMES(AccountType, accountTypeNames)
MUTUAL_ENUM_NAMES(FundKind, fundKindNames)
MUTUAL_ENUM_NAMES(MemberStatus, memberStatusNames)
MUTUAL_ENUM_NAMES(CycleStatus, cycleStatusNames)
MUTUAL_ENUM_NAMES(PhaseType, phaseTypeNames)
MUTUAL_ENUM_NAMES(DeclarationStatus, declarationStatusNames)
MUTUAL_ENUM_NAMES(ProofStatus, proofStatusNames)
MUTUAL_ENUM_NAMES(PenaltyStatus, penaltyStatusNames)
MUTUAL_ENUM_NAMES(ApplicationStatus, applicationStatusNames)
MUTUAL_ENUM_NAMES(LoanStatus, loanStatusNames)

#undef MUTUAL_ENUM_NAMES

}  // namespace mutual
