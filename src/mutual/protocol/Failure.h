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

#ifndef MUTUAL_PROTOCOL_FAILURE_H_INCLUDED
#define MUTUAL_PROTOCOL_FAILURE_H_INCLUDED

#include <mutual/basics/Expected.h>
#include <mutual/protocol/TER.h>
#include <ostream>
#include <string>

namespace mutual {

/** Why an engine operation was refused.

    The code classifies the refusal; the message names the objects involved
    so the caller can render it for a person.
*/
struct Failure
{
    TER code;
    std::string message;

    ErrorCategory
    kind() const
    {
        return category(code);
    }
};

inline std::ostream&
operator<<(std::ostream& os, Failure const& f)
{
    return os << transToken(f.code) << ": " << f.message;
}

/** Convenience for `return failure(tnfLOAN, "...")` */
inline Unexpected<Failure>
failure(TER code, std::string message)
{
    return Unexpected<Failure>(Failure{code, std::move(message)});
}

/** A failure whose message is the code's standard description. */
inline Unexpected<Failure>
failure(TER code)
{
    return Unexpected<Failure>(Failure{code, transHuman(code)});
}

template <class T>
using Result = Expected<T, Failure>;

}  // namespace mutual

#endif
