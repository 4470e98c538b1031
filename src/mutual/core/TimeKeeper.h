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

#ifndef MUTUAL_CORE_TIMEKEEPER_H_INCLUDED
#define MUTUAL_CORE_TIMEKEEPER_H_INCLUDED

#include <mutual/basics/chrono.h>
#include <chrono>

namespace mutual {

/** Manages the times used by the engine.

    Every "today" the business rules depend on comes from here, so that
    lateness and cycle membership can be evaluated against a controlled
    clock in tests.
*/
class TimeKeeper
{
public:
    virtual ~TimeKeeper() = default;

    /** Returns the current wall-clock time, in UTC. */
    [[nodiscard]] virtual TimePoint
    now() const
    {
        return std::chrono::system_clock::now();
    }

    /** Returns the current calendar date, in UTC. */
    [[nodiscard]] Date
    today() const
    {
        return toDate(now());
    }
};

}  // namespace mutual

#endif
