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

#ifndef MUTUAL_BASICS_RATE_H_INCLUDED
#define MUTUAL_BASICS_RATE_H_INCLUDED

#include <mutual/basics/Money.h>

#include <boost/operators.hpp>

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

namespace mutual {

/** A non-negative decimal with two fractional digits.

    Used both for interest rates, where 10.00 means ten percent, and for
    savings multipliers, where 2.00 means twice the balance.
*/
class Rate : private boost::totally_ordered<Rate>
{
public:
    using value_type = std::int64_t;

private:
    value_type hundredths_ = 0;

public:
    Rate() = default;

    constexpr explicit Rate(value_type hundredths) : hundredths_(hundredths)
    {
    }

    bool
    operator==(Rate const& other) const
    {
        return hundredths_ == other.hundredths_;
    }

    bool
    operator<(Rate const& other) const
    {
        return hundredths_ < other.hundredths_;
    }

    constexpr value_type
    hundredths() const
    {
        return hundredths_;
    }
};

template <class Char, class Traits>
std::basic_ostream<Char, Traits>&
operator<<(std::basic_ostream<Char, Traits>& os, Rate const& r)
{
    return os << detail::formatHundredths(r.hundredths());
}

inline std::string
to_string(Rate const& r)
{
    return detail::formatHundredths(r.hundredths());
}

/** Parse a rate. Negative rates are rejected. */
inline std::optional<Rate>
rateFromString(std::string const& s)
{
    auto const v = detail::parseHundredths(s);
    if (!v || *v < 0)
        return std::nullopt;
    return Rate{*v};
}

/** Scale an amount by a multiplier, e.g. 2000.00 x 2.00 = 4000.00 */
inline Money
multiply(Money const& amount, Rate const& multiplier)
{
    return mulRatio(amount, multiplier.hundredths(), 100, false);
}

/** The given percentage of an amount, e.g. 10.00% of 1000.00 = 100.00 */
inline Money
percentOf(Money const& amount, Rate const& percent)
{
    return mulRatio(amount, percent.hundredths(), 10'000, false);
}

}  // namespace mutual

#endif
