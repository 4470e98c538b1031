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

#ifndef MUTUAL_PROTOCOL_PROTOCOL_H_INCLUDED
#define MUTUAL_PROTOCOL_PROTOCOL_H_INCLUDED

#include <mutual/protocol/Status.h>
#include <array>
#include <cstdint>

namespace mutual {

/** Row identifiers. */
using MemberID = std::int64_t;
using AccountID = std::int64_t;
using EntryID = std::int64_t;
using CycleID = std::int64_t;
using DeclarationID = std::int64_t;
using ProofID = std::int64_t;
using PenaltyTypeID = std::int64_t;
using PenaltyID = std::int64_t;
using TierID = std::int64_t;
using ApplicationID = std::int64_t;
using LoanID = std::int64_t;

/** The actor recorded on everything the engine does on its own. */
inline constexpr char const systemActor[] = "system";

/** Classification stamped on every journal entry. */
namespace source {

inline constexpr char const depositApproval[] = "deposit_approval";
inline constexpr char const initialRequirement[] = "cycle_initial_requirement";
inline constexpr char const excessContribution[] = "excess_contribution";
inline constexpr char const loanDisbursement[] = "loan_disbursement";
inline constexpr char const repayment[] = "repayment";
inline constexpr char const penalty[] = "penalty";
inline constexpr char const reversal[] = "reversal";

}  // namespace source

/** Organization accounts every posting may depend on. */
namespace org {

inline constexpr char const bankCash[] = "BANK_CASH";
inline constexpr char const loansReceivable[] = "LOANS_RECEIVABLE";
inline constexpr char const interestIncome[] = "INTEREST_INCOME";
inline constexpr char const penaltyIncome[] = "PENALTY_INCOME";
inline constexpr char const socialFund[] = "SOCIAL_FUND";
inline constexpr char const adminFund[] = "ADMIN_FUND";
inline constexpr char const memberEquity[] = "MEMBER_EQUITY";

struct ChartAccount
{
    char const* code;
    char const* name;
    AccountType type;
};

inline constexpr std::array<ChartAccount, 7> chart{{
    {bankCash, "Bank Cash", AccountType::asset},
    {loansReceivable, "Loans Receivable", AccountType::asset},
    {interestIncome, "Interest Income", AccountType::income},
    {penaltyIncome, "Penalty Income", AccountType::income},
    {socialFund, "Social Fund", AccountType::liability},
    {adminFund, "Admin Fund", AccountType::liability},
    {memberEquity, "Member Equity", AccountType::equity},
}};

}  // namespace org

/** Code prefix of a member sub-account. */
inline char const*
subaccountPrefix(FundKind kind)
{
    switch (kind)
    {
        case FundKind::savings:
            return "MEM_SAV_";
        case FundKind::socialFund:
            return "MEM_SOC_";
        case FundKind::adminFund:
            return "MEM_ADM_";
        case FundKind::penalties:
            return "PEN_PAY_";
    }
    LogicError("subaccountPrefix : unknown fund kind");
}

/** Savings and penalties payable are owed to the member; the fund
    sub-accounts are receivables owed by the member.
*/
inline AccountType
subaccountType(FundKind kind)
{
    switch (kind)
    {
        case FundKind::savings:
        case FundKind::penalties:
            return AccountType::liability;
        case FundKind::socialFund:
        case FundKind::adminFund:
            return AccountType::asset;
    }
    LogicError("subaccountType : unknown fund kind");
}

}  // namespace mutual

#endif
