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

#ifndef MUTUAL_PROTOCOL_TER_H_INCLUDED
#define MUTUAL_PROTOCOL_TER_H_INCLUDED

#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace mutual {

// "Transaction Engine Result": the reason an engine operation was refused.
//
// Codes are grouped in ranges, one range per kind of refusal, so a caller
// can classify any code without knowing it individually.
//
using TERUnderlyingType = int;

//------------------------------------------------------------------------------

enum TVLcodes : TERUnderlyingType {
    // -399 .. -300: V Validation. The request itself is unacceptable and
    // would be refused in any state. Correct the input and resubmit.
    tvlIMBALANCED_ENTRY = -399,
    tvlEMPTY_ENTRY,
    tvlNEGATIVE_AMOUNT,
    tvlBAD_AMOUNT,
    tvlAMOUNT_MISMATCH,
    tvlBAD_DATE,
    tvlBAD_DAY,
    tvlBAD_TERM,
    tvlDUPLICATE,
    tvlEXCEEDS_LIMIT,
    tvlBAD_STATUS,
    tvlMISSING_FIELD,
};

//------------------------------------------------------------------------------

enum TNFcodes : TERUnderlyingType {
    // -299 .. -200: N Not found. A referenced object does not exist.
    tnfACCOUNT = -299,
    tnfENTRY,
    tnfMEMBER,
    tnfCYCLE,
    tnfPHASE,
    tnfDECLARATION,
    tnfPROOF,
    tnfPENALTY_TYPE,
    tnfPENALTY,
    tnfTIER,
    tnfAPPLICATION,
    tnfLOAN,
};

//------------------------------------------------------------------------------

enum TSTcodes : TERUnderlyingType {
    // -199 .. -100: S State. The request is well formed but the current
    // state of the object does not permit it. A retry fails the same way
    // until the state changes.
    tstALREADY_REVERSED = -199,
    tstBAD_STATE,
    tstCYCLE_CLOSED,
    tstEDIT_CLOSED,
    tstPROOF_EXISTS,
    tstPENDING_APPLICATION,
    tstACTIVE_LOAN,
    tstNO_OPEN_LOAN,
    tstPOSTING_LOCKED,
    tstINACTIVE_MEMBER,
    tstCONCURRENT_UPDATE,
};

//------------------------------------------------------------------------------

enum TCFcodes : TERUnderlyingType {
    // -99 .. -1: C Configuration. The cooperative has not been set up for
    // the request: a required account, tier, policy or rate is missing.
    tcfMISSING_ACCOUNT = -99,
    tcfNO_TIER_ASSIGNED,
    tcfNO_POLICY,
    tcfNO_RATE,
};

//------------------------------------------------------------------------------

enum TEScodes : TERUnderlyingType {
    // 0: S Success.
    tesSUCCESS = 0
};

//------------------------------------------------------------------------------

// For generic purposes, a free function that returns the value of a T*codes.
constexpr TERUnderlyingType
TERtoInt(TVLcodes v)
{
    return static_cast<TERUnderlyingType>(v);
}

constexpr TERUnderlyingType
TERtoInt(TNFcodes v)
{
    return static_cast<TERUnderlyingType>(v);
}

constexpr TERUnderlyingType
TERtoInt(TSTcodes v)
{
    return static_cast<TERUnderlyingType>(v);
}

constexpr TERUnderlyingType
TERtoInt(TCFcodes v)
{
    return static_cast<TERUnderlyingType>(v);
}

constexpr TERUnderlyingType
TERtoInt(TEScodes v)
{
    return static_cast<TERUnderlyingType>(v);
}

template <class T>
class CanCvtToTER : public std::false_type
{
};

template <>
class CanCvtToTER<TVLcodes> : public std::true_type
{
};
template <>
class CanCvtToTER<TNFcodes> : public std::true_type
{
};
template <>
class CanCvtToTER<TSTcodes> : public std::true_type
{
};
template <>
class CanCvtToTER<TCFcodes> : public std::true_type
{
};
template <>
class CanCvtToTER<TEScodes> : public std::true_type
{
};

/** A result code from any of the ranges. */
class TER
{
    TERUnderlyingType code_;

    constexpr explicit TER(int rhs) : code_(rhs)
    {
    }

public:
    constexpr TER() : code_(tesSUCCESS)
    {
    }

    static constexpr TER
    fromInt(int from)
    {
        return TER(from);
    }

    template <
        typename T,
        typename = std::enable_if_t<
            CanCvtToTER<std::remove_cv_t<std::remove_reference_t<T>>>::value>>
    constexpr TER(T rhs) : code_(TERtoInt(rhs))
    {
    }

    // Conversion to bool: true for anything but success.
    explicit operator bool() const
    {
        return code_ != tesSUCCESS;
    }

    friend std::ostream&
    operator<<(std::ostream& os, TER const& rhs)
    {
        return os << rhs.code_;
    }

    // Only a named conversion to the underlying value, so a TER never
    // silently becomes an int.
    friend constexpr TERUnderlyingType
    TERtoInt(TER v)
    {
        return v.code_;
    }
};

// Comparison operators.
template <typename L, typename R>
constexpr auto
operator==(L const& lhs, R const& rhs) -> std::enable_if_t<
    std::is_same<decltype(TERtoInt(lhs)), int>::value &&
        std::is_same<decltype(TERtoInt(rhs)), int>::value,
    bool>
{
    return TERtoInt(lhs) == TERtoInt(rhs);
}

template <typename L, typename R>
constexpr auto
operator!=(L const& lhs, R const& rhs) -> std::enable_if_t<
    std::is_same<decltype(TERtoInt(lhs)), int>::value &&
        std::is_same<decltype(TERtoInt(rhs)), int>::value,
    bool>
{
    return TERtoInt(lhs) != TERtoInt(rhs);
}

template <typename L, typename R>
constexpr auto
operator<(L const& lhs, R const& rhs) -> std::enable_if_t<
    std::is_same<decltype(TERtoInt(lhs)), int>::value &&
        std::is_same<decltype(TERtoInt(rhs)), int>::value,
    bool>
{
    return TERtoInt(lhs) < TERtoInt(rhs);
}

template <typename L, typename R>
constexpr auto
operator>=(L const& lhs, R const& rhs) -> std::enable_if_t<
    std::is_same<decltype(TERtoInt(lhs)), int>::value &&
        std::is_same<decltype(TERtoInt(rhs)), int>::value,
    bool>
{
    return TERtoInt(lhs) >= TERtoInt(rhs);
}

//------------------------------------------------------------------------------

/** The four kinds of refusal, plus success. */
enum class ErrorCategory {
    success,
    validation,
    notFound,
    state,
    configuration,
};

inline bool
isTvlValidation(TER x)
{
    return x >= tvlIMBALANCED_ENTRY && x < tnfACCOUNT;
}

inline bool
isTnfNotFound(TER x)
{
    return x >= tnfACCOUNT && x < tstALREADY_REVERSED;
}

inline bool
isTstState(TER x)
{
    return x >= tstALREADY_REVERSED && x < tcfMISSING_ACCOUNT;
}

inline bool
isTcfConfiguration(TER x)
{
    return x >= tcfMISSING_ACCOUNT && x < tesSUCCESS;
}

inline bool
isTesSuccess(TER x)
{
    return x == tesSUCCESS;
}

ErrorCategory
category(TER code);

std::string
to_string(ErrorCategory c);

std::unordered_map<
    TERUnderlyingType,
    std::pair<char const* const, char const* const>> const&
transResults();

bool
transResultInfo(TER code, std::string& token, std::string& text);

std::string
transToken(TER code);

std::string
transHuman(TER code);

std::optional<TER>
transCode(std::string const& token);

}  // namespace mutual

#endif
