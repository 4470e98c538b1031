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

#ifndef MUTUAL_PROTOCOL_STATUS_H_INCLUDED
#define MUTUAL_PROTOCOL_STATUS_H_INCLUDED

#include <mutual/basics/contract.h>
#include <optional>
#include <stdexcept>
#include <string>

namespace mutual {

// Every status or kind column has exactly one of these enums. The stored
// text is the canonical lower-case spelling produced by to_string; text is
// validated once, where it enters the engine, with enumFromString.

enum class AccountType { asset, liability, income, expense, equity };

enum class FundKind { savings, socialFund, adminFund, penalties };

enum class MemberStatus { active, inactive };

enum class CycleStatus { draft, active, closed };

enum class PhaseType {
    declaration,
    loanApplication,
    deposits,
    payout,
    shareout
};

enum class DeclarationStatus { pending, proof, approved, rejected };

enum class ProofStatus { submitted, approved, rejected };

enum class PenaltyStatus { pending, approved, paid };

enum class ApplicationStatus { pending, approved, rejected, withdrawn };

enum class LoanStatus {
    pending,
    approved,
    disbursed,
    open,
    closed,
    withdrawn,
    rejected
};

char const*
to_string(AccountType v);
char const*
to_string(FundKind v);
char const*
to_string(MemberStatus v);
char const*
to_string(CycleStatus v);
char const*
to_string(PhaseType v);
char const*
to_string(DeclarationStatus v);
char const*
to_string(ProofStatus v);
char const*
to_string(PenaltyStatus v);
char const*
to_string(ApplicationStatus v);
char const*
to_string(LoanStatus v);

/** Parse the canonical spelling of an enum value.
    Returns nothing if the text is not an exact match.
*/
template <class E>
std::optional<E>
enumFromString(std::string const& s);

template <>
std::optional<AccountType>
enumFromString<AccountType>(std::string const& s);
template <>
std::optional<FundKind>
enumFromString<FundKind>(std::string const& s);
template <>
std::optional<MemberStatus>
enumFromString<MemberStatus>(std::string const& s);
template <>
std::optional<CycleStatus>
enumFromString<CycleStatus>(std::string const& s);
template <>
std::optional<PhaseType>
enumFromString<PhaseType>(std::string const& s);
template <>
std::optional<DeclarationStatus>
enumFromString<DeclarationStatus>(std::string const& s);
template <>
std::optional<ProofStatus>
enumFromString<ProofStatus>(std::string const& s);
template <>
std::optional<PenaltyStatus>
enumFromString<PenaltyStatus>(std::string const& s);
template <>
std::optional<ApplicationStatus>
enumFromString<ApplicationStatus>(std::string const& s);
template <>
std::optional<LoanStatus>
enumFromString<LoanStatus>(std::string const& s);

/** Parse a value read back from the database.
    Anything the engine did not write itself means the store is corrupt.
*/
template <class E>
E
fromStorage(std::string const& s)
{
    if (auto const v = enumFromString<E>(s))
        return *v;
    Throw<std::runtime_error>("Unrecognized stored value '" + s + "'");
}

/** Debit-normal accounts grow with debits. */
inline bool
isDebitNormal(AccountType t)
{
    return t == AccountType::asset || t == AccountType::expense;
}

}  // namespace mutual

#endif
