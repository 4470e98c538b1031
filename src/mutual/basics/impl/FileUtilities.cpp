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

#include <mutual/basics/FileUtilities.h>
#include <boost/system/error_code.hpp>
#include <cerrno>
#include <fstream>
#include <sstream>

namespace mutual {

std::string
readTextFile(
    boost::filesystem::path const& path,
    boost::system::error_code& ec)
{
    namespace errc = boost::system::errc;

    auto const size = boost::filesystem::file_size(path, ec);
    if (ec)
        return {};
    if (size > maxTextFileSize)
    {
        ec = errc::make_error_code(errc::file_too_large);
        return {};
    }

    std::ifstream in(path.string());
    if (!in)
    {
        ec = errc::make_error_code(static_cast<errc::errc_t>(errno));
        return {};
    }

    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad())
    {
        ec = errc::make_error_code(errc::io_error);
        return {};
    }
    return contents.str();
}

}  // namespace mutual
