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

#ifndef MUTUAL_BASICS_BASICCONFIG_H_INCLUDED
#define MUTUAL_BASICS_BASICCONFIG_H_INCLUDED

#include <mutual/basics/contract.h>
#include <boost/beast/core/string.hpp>
#include <boost/lexical_cast.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mutual {

/** Raw lines of an ini-style file, keyed by section name. */
using IniFileSections = std::map<std::string, std::vector<std::string>>;

//------------------------------------------------------------------------------

/** One [section] of a configuration file.

    Every non-empty line is kept in order. Lines of the form `key = value`
    are also indexed by key, case-insensitively. A `#` starts a comment
    unless it is escaped as `\#`.
*/
class Section
{
public:
    using Pairs = std::map<std::string, std::string, boost::beast::iless>;

private:
    std::string name_;
    Pairs pairs_;
    std::vector<std::string> lines_;
    bool trailingComments_ = false;

public:
    explicit Section(std::string name = {});

    std::string const&
    name() const
    {
        return name_;
    }

    std::vector<std::string> const&
    lines() const
    {
        return lines_;
    }

    Pairs const&
    pairs() const
    {
        return pairs_;
    }

    /** The single line of a section that holds one bare value, such as a
        path. Empty when the section has no lines.

        @throws std::runtime_error if the section has more than one line.
    */
    std::string
    legacy() const;

    bool
    exists(std::string const& key) const
    {
        return pairs_.find(key) != pairs_.end();
    }

    /** Returns the value converted to T, or nothing if the key is absent.

        @throws boost::bad_lexical_cast if the value does not convert.
    */
    template <class T>
    std::optional<T>
    get(std::string const& key) const
    {
        auto const it = pairs_.find(key);
        if (it == pairs_.end())
            return std::nullopt;
        return boost::lexical_cast<T>(it->second);
    }

    void
    append(std::vector<std::string> const& lines);

    /** `true` if any line carried a comment after its value. */
    bool
    had_trailing_comments() const
    {
        return trailingComments_;
    }
};

//------------------------------------------------------------------------------

/** The sections of a configuration file, before any interpretation.
    Each consumer reads and validates the sections it owns.
*/
class BasicConfig
{
    std::map<std::string, Section, boost::beast::iless> map_;

public:
    bool
    exists(std::string const& name) const
    {
        return map_.find(name) != map_.end();
    }

    /** Returns the named section, or an empty one if it is absent. */
    Section const&
    section(std::string const& name) const;

    /** Shorthand for section(name).legacy(). */
    std::string
    legacy(std::string const& name) const
    {
        return section(name).legacy();
    }

    bool
    had_trailing_comments() const;

protected:
    void
    build(IniFileSections const& ifs);
};

//------------------------------------------------------------------------------

/** Assign a value from a section.
    The target is left alone if the key is absent or does not convert.
    @return `true` if the target was assigned.
*/
template <class T>
bool
set(T& target, std::string const& key, Section const& section)
{
    try
    {
        if (auto const v = section.get<T>(key))
        {
            target = *v;
            return true;
        }
    }
    catch (boost::bad_lexical_cast const&)
    {
    }
    return false;
}

template <class T>
bool
get_if_exists(Section const& section, std::string const& key, T& v)
{
    return set<T>(v, key, section);
}

/** Booleans are written as 0 or 1. */
template <>
inline bool
get_if_exists<bool>(Section const& section, std::string const& key, bool& v)
{
    int n = 0;
    if (!set(n, key, section))
        return false;
    v = n != 0;
    return true;
}

}  // namespace mutual

#endif
