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

#ifndef MUTUAL_BASICS_MONEY_H_INCLUDED
#define MUTUAL_BASICS_MONEY_H_INCLUDED

#include <mutual/basics/contract.h>

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/operators.hpp>

#include <cstdint>
#include <limits>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

namespace mutual {

namespace detail {

// Fixed-point text with two fractional digits, e.g. "-12.50".
std::optional<std::int64_t>
parseHundredths(std::string const& s);

std::string
formatHundredths(std::int64_t value);

}  // namespace detail

/** An amount of money held as a whole number of cents.

    Every amount the engine stores or posts is a Money. Arithmetic is exact
    and throws std::overflow_error rather than wrap; the only rounding
    happens in mulRatio.
*/
class Money : private boost::totally_ordered<Money>,
              private boost::additive<Money>
{
public:
    using value_type = std::int64_t;

private:
    value_type cents_ = 0;

public:
    Money() = default;
    constexpr Money(Money const& other) = default;
    constexpr Money&
    operator=(Money const& other) = default;

    constexpr explicit Money(value_type cents) : cents_(cents)
    {
    }

    Money&
    operator+=(Money const& other)
    {
        using limits = std::numeric_limits<value_type>;
        if ((other.cents_ > 0 && cents_ > limits::max() - other.cents_) ||
            (other.cents_ < 0 && cents_ < limits::min() - other.cents_))
            Throw<std::overflow_error>("Money addition overflow");
        cents_ += other.cents_;
        return *this;
    }

    Money&
    operator-=(Money const& other)
    {
        using limits = std::numeric_limits<value_type>;
        if ((other.cents_ < 0 && cents_ > limits::max() + other.cents_) ||
            (other.cents_ > 0 && cents_ < limits::min() + other.cents_))
            Throw<std::overflow_error>("Money subtraction overflow");
        cents_ -= other.cents_;
        return *this;
    }

    Money
    operator-() const
    {
        if (cents_ == std::numeric_limits<value_type>::min())
            Throw<std::overflow_error>("Money negation overflow");
        return Money{-cents_};
    }

    bool
    operator==(Money const& other) const
    {
        return cents_ == other.cents_;
    }

    bool
    operator<(Money const& other) const
    {
        return cents_ < other.cents_;
    }

    /** Returns true if the amount is not zero */
    explicit constexpr operator bool() const noexcept
    {
        return cents_ != 0;
    }

    /** Return the sign of the amount */
    constexpr int
    signum() const noexcept
    {
        return (cents_ < 0) ? -1 : (cents_ ? 1 : 0);
    }

    /** Returns the number of cents */
    constexpr value_type
    cents() const
    {
        return cents_;
    }
};

/** The comparison tolerance for paid and owed amounts: one cent. */
constexpr Money moneyTolerance{1};

/** Returns `true` if the two amounts differ by no more than the tolerance. */
inline bool
withinTolerance(Money const& a, Money const& b)
{
    auto const diff = a.cents() - b.cents();
    return diff <= moneyTolerance.cents() && -diff <= moneyTolerance.cents();
}

inline Money
abs(Money const& m)
{
    return m.signum() < 0 ? -m : m;
}

template <class Char, class Traits>
std::basic_ostream<Char, Traits>&
operator<<(std::basic_ostream<Char, Traits>& os, Money const& m)
{
    return os << detail::formatHundredths(m.cents());
}

/** Render as decimal text, e.g. "130.00". */
inline std::string
to_string(Money const& m)
{
    return detail::formatHundredths(m.cents());
}

/** Parse decimal text with at most two fractional digits. */
inline std::optional<Money>
moneyFromString(std::string const& s)
{
    if (auto const v = detail::parseHundredths(s))
        return Money{*v};
    return std::nullopt;
}

/** Returns amt * num / den, rounded toward zero unless roundUp is set. */
inline Money
mulRatio(Money const& amt, std::int64_t num, std::int64_t den, bool roundUp)
{
    using namespace boost::multiprecision;

    if (!den)
        Throw<std::runtime_error>("division by zero");

    int128_t const amt128(amt.cents());
    auto const neg = (amt.cents() < 0) != (num < 0);
    auto const m = amt128 * num;
    auto r = m / den;
    if (m % den)
    {
        if (!neg && roundUp)
            r += 1;
        if (neg && roundUp)
            r -= 1;
    }
    if (r > std::numeric_limits<Money::value_type>::max() ||
        r < std::numeric_limits<Money::value_type>::min())
        Throw<std::overflow_error>("Money mulRatio overflow");
    return Money{r.convert_to<Money::value_type>()};
}

}  // namespace mutual

#endif
