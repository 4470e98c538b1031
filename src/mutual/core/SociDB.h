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

#ifndef MUTUAL_CORE_SOCIDB_H_INCLUDED
#define MUTUAL_CORE_SOCIDB_H_INCLUDED

/** An embedded database wrapper with an intuitive, type-safe interface.

    This collection of classes let's you access embedded SQLite databases
    using C++ syntax that is very similar to regular SQL.

    This module requires the @ref beast_sqlite external module.
*/

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated"
#endif

#include <soci/boost-optional.h>
#include <soci/soci.h>

#if defined(__clang__)
#pragma clang diagnostic pop
#endif

#include <mutual/beast/utility/Journal.h>
#include <cstdint>
#include <map>
#include <string>

namespace mutual {

/** Open a soci session.

    @param s Session to open.
    @param beName Backend name.
    @param connectionString Connection string to forward to soci::open.
           see the soci::open documentation for how to use this.
*/
void
open(
    soci::session& s,
    std::string const& beName,
    std::string const& connectionString);

/** Bookkeeping shared by every checkout of one connection. */
struct SessionState
{
    explicit SessionState(beast::Journal j) : journal(j)
    {
    }

    beast::Journal journal;

    // Number of open SavepointTransactions on the connection.
    int depth = 0;

    // Used to name savepoints uniquely.
    std::uint64_t sequence = 0;

    // Lookups cached for the lifetime of the outermost transaction.
    std::map<std::string, std::int64_t> memo;
};

}  // namespace mutual

#endif
