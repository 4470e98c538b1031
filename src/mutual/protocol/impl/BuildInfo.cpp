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
#include <mutual/protocol/BuildInfo.h>
#include <boost/regex.hpp>

namespace mutual {

namespace BuildInfo {

// The build version number. Edit this for each release, following the
// format described at http://semver.org/
char const* const versionString = "1.0.0";

std::string const&
getVersionString()
{
    static std::string const value = [] {
        std::string const s = versionString;
        static boost::regex const re(
            "^(0|[1-9][0-9]*)\\.(0|[1-9][0-9]*)\\.(0|[1-9][0-9]*)"
            "(-[0-9A-Za-z.-]+)?(\\+[0-9A-Za-z.-]+)?$");
        if (!boost::regex_match(s, re))
            LogicError("Invalid version string " + s);
        return s;
    }();
    return value;
}

std::string const&
getFullVersionString()
{
    static std::string const value = "mutuald-" + getVersionString();
    return value;
}

}  // namespace BuildInfo

}  // namespace mutual
