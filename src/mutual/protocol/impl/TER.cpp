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

#include <mutual/basics/contract.h>
#include <mutual/protocol/TER.h>
#include <boost/range/adaptor/transformed.hpp>
#include <boost/range/iterator_range.hpp>
#include <type_traits>

namespace mutual {

std::unordered_map<
    TERUnderlyingType,
    std::pair<char const* const, char const* const>> const&
transResults()
{
    // clang-format off

    // Macros are generally ugly, but they can help make code readable to
    // humans without affecting the compiler.
#define MAKE_ERROR(code, desc) { code, { #code, desc } }

    static
    std::unordered_map<
        TERUnderlyingType,
        std::pair<char const* const, char const* const>> const results
    {
        MAKE_ERROR(tvlIMBALANCED_ENTRY,      "Journal entry debits do not equal credits."),
        MAKE_ERROR(tvlEMPTY_ENTRY,           "Journal entry has no lines."),
        MAKE_ERROR(tvlNEGATIVE_AMOUNT,       "Amounts may not be negative."),
        MAKE_ERROR(tvlBAD_AMOUNT,            "Amount must be greater than zero."),
        MAKE_ERROR(tvlAMOUNT_MISMATCH,       "Amount does not match the declared total."),
        MAKE_ERROR(tvlBAD_DATE,              "Malformed or inconsistent date."),
        MAKE_ERROR(tvlBAD_DAY,               "Day of month must be between 1 and 31."),
        MAKE_ERROR(tvlBAD_TERM,              "Loan term must be a positive number of months."),
        MAKE_ERROR(tvlDUPLICATE,             "An identical record already exists."),
        MAKE_ERROR(tvlEXCEEDS_LIMIT,         "Amount exceeds the permitted maximum."),
        MAKE_ERROR(tvlBAD_STATUS,            "Unknown or invalid status."),
        MAKE_ERROR(tvlMISSING_FIELD,         "A required field is empty."),

        MAKE_ERROR(tnfACCOUNT,               "Ledger account not found."),
        MAKE_ERROR(tnfENTRY,                 "Journal entry not found."),
        MAKE_ERROR(tnfMEMBER,                "Member not found."),
        MAKE_ERROR(tnfCYCLE,                 "Cycle not found."),
        MAKE_ERROR(tnfPHASE,                 "Cycle phase not found."),
        MAKE_ERROR(tnfDECLARATION,           "Declaration not found."),
        MAKE_ERROR(tnfPROOF,                 "Deposit proof not found."),
        MAKE_ERROR(tnfPENALTY_TYPE,          "Penalty type not found."),
        MAKE_ERROR(tnfPENALTY,               "Penalty record not found."),
        MAKE_ERROR(tnfTIER,                  "Credit rating tier not found."),
        MAKE_ERROR(tnfAPPLICATION,           "Loan application not found."),
        MAKE_ERROR(tnfLOAN,                  "Loan not found."),

        MAKE_ERROR(tstALREADY_REVERSED,      "Journal entry has already been reversed."),
        MAKE_ERROR(tstBAD_STATE,             "Operation not permitted in the current state."),
        MAKE_ERROR(tstCYCLE_CLOSED,          "Cycle is closed."),
        MAKE_ERROR(tstEDIT_CLOSED,           "Declaration can no longer be edited."),
        MAKE_ERROR(tstPROOF_EXISTS,          "A deposit proof is already awaiting review."),
        MAKE_ERROR(tstPENDING_APPLICATION,   "Member already has a pending loan application."),
        MAKE_ERROR(tstACTIVE_LOAN,           "Member has an active loan with an outstanding balance."),
        MAKE_ERROR(tstNO_OPEN_LOAN,          "Member has no open loan to repay."),
        MAKE_ERROR(tstPOSTING_LOCKED,        "Postings to this cycle are locked."),
        MAKE_ERROR(tstINACTIVE_MEMBER,       "Member is not active."),
        MAKE_ERROR(tstCONCURRENT_UPDATE,     "Record was changed by another operation."),

        MAKE_ERROR(tcfMISSING_ACCOUNT,       "Required organization ledger account is absent."),
        MAKE_ERROR(tcfNO_TIER_ASSIGNED,      "Member has no credit rating for the cycle."),
        MAKE_ERROR(tcfNO_POLICY,             "No borrowing limit policy for the credit tier."),
        MAKE_ERROR(tcfNO_RATE,               "No interest rate configured for the term."),

        MAKE_ERROR(tesSUCCESS,               "The operation was applied."),
    };
    // clang-format on

#undef MAKE_ERROR

    return results;
}

bool
transResultInfo(TER code, std::string& token, std::string& text)
{
    auto& results = transResults();

    auto const r = results.find(TERtoInt(code));

    if (r == results.end())
        return false;

    token = r->second.first;
    text = r->second.second;
    return true;
}

std::string
transToken(TER code)
{
    std::string token;
    std::string text;

    return transResultInfo(code, token, text) ? token : "-";
}

std::string
transHuman(TER code)
{
    std::string token;
    std::string text;

    return transResultInfo(code, token, text) ? text : "-";
}

std::optional<TER>
transCode(std::string const& token)
{
    static auto const results = [] {
        auto& byTer = transResults();
        auto range = boost::make_iterator_range(byTer.begin(), byTer.end());
        auto tRange = boost::adaptors::transform(range, [](auto const& r) {
            return std::make_pair(r.second.first, r.first);
        });
        std::unordered_map<std::string, TERUnderlyingType> const byToken(
            tRange.begin(), tRange.end());
        return byToken;
    }();

    auto const r = results.find(token);

    if (r == results.end())
        return std::nullopt;

    return TER::fromInt(r->second);
}

ErrorCategory
category(TER code)
{
    if (isTesSuccess(code))
        return ErrorCategory::success;
    if (isTvlValidation(code))
        return ErrorCategory::validation;
    if (isTnfNotFound(code))
        return ErrorCategory::notFound;
    if (isTstState(code))
        return ErrorCategory::state;
    if (isTcfConfiguration(code))
        return ErrorCategory::configuration;
    LogicError("category: result code out of range");
}

std::string
to_string(ErrorCategory c)
{
    switch (c)
    {
        case ErrorCategory::success:
            return "Success";
        case ErrorCategory::validation:
            return "ValidationError";
        case ErrorCategory::notFound:
            return "NotFoundError";
        case ErrorCategory::state:
            return "StateError";
        case ErrorCategory::configuration:
            return "ConfigurationError";
    }
    LogicError("to_string: unknown ErrorCategory");
}

}  // namespace mutual
