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

#include <mutual/basics/BasicConfig.h>
#include <mutual/basics/StringUtilities.h>
#include <boost/regex.hpp>
#include <algorithm>

namespace mutual {

namespace {

/** Remove the comment from a line and resolve `\#` escapes.
    Returns `true` if text before the comment survived.
*/
bool
stripComment(std::string& line)
{
    std::string out;
    out.reserve(line.size());
    bool commented = false;
    for (std::size_t i = 0; i < line.size(); ++i)
    {
        if (line[i] != '#')
        {
            out += line[i];
        }
        else if (!out.empty() && out.back() == '\\')
        {
            out.back() = '#';
        }
        else
        {
            commented = true;
            break;
        }
    }
    line = trim_whitespace(std::move(out));
    return commented && !line.empty();
}

}  // namespace

Section::Section(std::string name) : name_(std::move(name))
{
}

std::string
Section::legacy() const
{
    if (lines_.empty())
        return {};
    if (lines_.size() != 1)
        Throw<std::runtime_error>(
            "Section [" + name_ + "] must hold a single value");
    return lines_.front();
}

void
Section::append(std::vector<std::string> const& lines)
{
    static boost::regex const keyValue(
        R"(^\s*([A-Za-z][A-Za-z0-9_]*)\s*=\s*(\S.*?)\s*$)");

    for (auto line : lines)
    {
        if (stripComment(line))
            trailingComments_ = true;
        if (line.empty())
            continue;

        boost::smatch m;
        if (boost::regex_match(line, m, keyValue))
            pairs_.insert_or_assign(m[1].str(), m[2].str());
        lines_.push_back(std::move(line));
    }
}

//------------------------------------------------------------------------------

Section const&
BasicConfig::section(std::string const& name) const
{
    static Section const empty;
    auto const it = map_.find(name);
    return it == map_.end() ? empty : it->second;
}

bool
BasicConfig::had_trailing_comments() const
{
    return std::any_of(map_.begin(), map_.end(), [](auto const& entry) {
        return entry.second.had_trailing_comments();
    });
}

void
BasicConfig::build(IniFileSections const& ifs)
{
    for (auto const& [name, lines] : ifs)
        map_.try_emplace(name, name).first->second.append(lines);
}

}  // namespace mutual
