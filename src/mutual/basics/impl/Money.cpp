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

#include <mutual/basics/Money.h>
#include <boost/regex.hpp>

namespace mutual {
namespace detail {

std::optional<std::int64_t>
parseHundredths(std::string const& s)
{
    static boost::regex const re(
        "^"
        "([+-])?"          // sign (optional)
        "([0-9]{1,15})"    // integer part
        "(?:\\.([0-9]{1,2}))?"  // fraction, at most two digits
        "$");

    boost::smatch match;
    if (!boost::regex_match(s, match, re))
        return std::nullopt;

    std::int64_t value = std::stoll(match[2]) * 100;
    if (match[3].matched)
    {
        auto frac = match[3].str();
        if (frac.size() == 1)
            frac += '0';
        value += std::stoll(frac);
    }
    if (match[1] == "-")
        value = -value;
    return value;
}

std::string
formatHundredths(std::int64_t value)
{
    bool const neg = value < 0;
    // Avoid negating the most negative value
    auto const mag = neg ? -static_cast<std::uint64_t>(value)
                         : static_cast<std::uint64_t>(value);
    auto const frac = mag % 100;
    std::string ret = neg ? "-" : "";
    ret += std::to_string(mag / 100);
    ret += '.';
    if (frac < 10)
        ret += '0';
    ret += std::to_string(frac);
    return ret;
}

}  // namespace detail
}  // namespace mutual
