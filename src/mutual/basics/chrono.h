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

#ifndef MUTUAL_BASICS_CHRONO_H_INCLUDED
#define MUTUAL_BASICS_CHRONO_H_INCLUDED

#include <date/date.h>

#include <chrono>
#include <optional>
#include <string>

namespace mutual {

// A few handy aliases

using days = std::chrono::duration<
    int,
    std::ratio_multiply<std::chrono::hours::period, std::ratio<24>>>;

/** A calendar date with no time of day, as stored in the database. */
using Date = date::year_month_day;

/** A wall-clock instant, used for audit stamps. */
using TimePoint = std::chrono::system_clock::time_point;

template <class Duration>
std::string
to_string(date::sys_time<Duration> tp)
{
    return date::format("%Y-%b-%d %T %Z", tp);
}

template <class Duration>
std::string
to_string_iso(date::sys_time<Duration> tp)
{
    using namespace std::chrono;
    return date::format("%FT%TZ", date::floor<seconds>(tp));
}

/** Render a date as YYYY-MM-DD. */
std::string
to_string(Date const& d);

/** Parse a YYYY-MM-DD date. Returns nothing on a malformed or invalid date. */
std::optional<Date>
dateFromString(std::string const& s);

/** Returns the first day of the month containing the date. */
inline Date
firstOfMonth(Date const& d)
{
    return d.year() / d.month() / date::day{1};
}

/** Returns the first day of the month `n` months after the date's month. */
inline Date
addMonths(Date const& d, int n)
{
    return firstOfMonth(d) + date::months{n};
}

/** Returns `true` if both dates fall in the same calendar month. */
inline bool
sameMonth(Date const& a, Date const& b)
{
    return a.year() == b.year() && a.month() == b.month();
}

/** Returns the date part of an instant, in UTC. */
inline Date
toDate(TimePoint tp)
{
    return Date{date::floor<date::days>(tp)};
}

}  // namespace mutual

#endif
