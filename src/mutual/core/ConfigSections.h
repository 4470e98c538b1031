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

#ifndef MUTUAL_CORE_CONFIGSECTIONS_H_INCLUDED
#define MUTUAL_CORE_CONFIGSECTIONS_H_INCLUDED

#include <string>

namespace mutual {

struct ConfigSection
{
    explicit ConfigSection() = default;

    static std::string
    sqlite()
    {
        return "sqlite";
    }

    static std::string
    scheduler()
    {
        return "scheduler";
    }

    static std::string
    logging()
    {
        return "logging";
    }

    static std::string
    declarations()
    {
        return "declarations";
    }
};

#define SECTION_DEFAULT_NAME            ""
#define SECTION_DATABASE_PATH           "database_path"
#define SECTION_DEBUG_LOGFILE           "debug_logfile"

}  // namespace mutual

#endif
