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

#ifndef MUTUAL_APP_MISC_MEMBERREGISTRY_H_INCLUDED
#define MUTUAL_APP_MISC_MEMBERREGISTRY_H_INCLUDED

#include <mutual/beast/utility/Journal.h>
#include <mutual/protocol/Failure.h>
#include <mutual/protocol/Protocol.h>
#include <optional>
#include <string>
#include <vector>

namespace mutual {

class Application;

struct Member
{
    MemberID id = 0;
    std::string name;
    std::optional<std::string> userRef;
    MemberStatus status = MemberStatus::active;
};

/** The member profiles the engine needs for lookups and sweeps. */
class MemberRegistry
{
    Application& app_;
    beast::Journal const j_;

public:
    MemberRegistry(Application& app, beast::Journal journal);

    Result<Member>
    create(
        std::string const& name,
        std::optional<std::string> const& userRef = std::nullopt);

    Result<Member>
    get(MemberID id);

    /** Look a member up by the identity of the user behind it. */
    Result<Member>
    findByUser(std::string const& userRef);

    Result<void>
    setStatus(MemberID id, MemberStatus status);

    /** Fails with tnfMEMBER for an unknown member and tstINACTIVE_MEMBER
        for one that is not active.
    */
    Result<Member>
    requireActive(MemberID id);

    std::vector<Member>
    list(std::optional<MemberStatus> status = std::nullopt);
};

}  // namespace mutual

#endif
