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

#include <mutual/app/main/Application.h>
#include <mutual/app/misc/MemberRegistry.h>
#include <mutual/basics/Log.h>
#include <mutual/basics/chrono.h>
#include <mutual/core/DatabaseCon.h>
#include <mutual/core/TimeKeeper.h>

namespace mutual {

MemberRegistry::MemberRegistry(Application& app, beast::Journal journal)
    : app_(app), j_(journal)
{
}

Result<Member>
MemberRegistry::create(
    std::string const& name,
    std::optional<std::string> const& userRef)
{
    if (name.empty())
        return failure(tvlMISSING_FIELD, "A member needs a name");

    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    if (userRef)
    {
        int count = 0;
        *db << "SELECT COUNT(*) FROM members WHERE user_ref = :u",
            soci::into(count), soci::use(*userRef);
        if (count)
            return failure(
                tvlDUPLICATE, "User " + *userRef + " already has a member");
    }

    boost::optional<std::string> ref;
    if (userRef)
        ref = *userRef;
    std::string const status = to_string(MemberStatus::active);
    std::string const now = to_string_iso(app_.timeKeeper().now());

    *db << "INSERT INTO members (name, user_ref, status, created_at) "
           "VALUES (:name, :ref, :status, :now)",
        soci::use(name), soci::use(ref), soci::use(status), soci::use(now);

    Member m;
    *db << "SELECT last_insert_rowid()", soci::into(m.id);
    m.name = name;
    m.userRef = userRef;
    m.status = MemberStatus::active;

    tr.commit();

    JLOG(j_.info()) << "Created member " << m.id << " '" << name << "'";
    return m;
}

Result<Member>
MemberRegistry::get(MemberID id)
{
    auto db = app_.getDb().checkoutDb();

    Member m;
    boost::optional<std::string> ref;
    std::string status;
    *db << "SELECT id, name, user_ref, status FROM members WHERE id = :id",
        soci::into(m.id), soci::into(m.name), soci::into(ref),
        soci::into(status), soci::use(id);

    if (!db->got_data())
        return failure(tnfMEMBER, "No member " + std::to_string(id));

    if (ref)
        m.userRef = *ref;
    m.status = fromStorage<MemberStatus>(status);
    return m;
}

Result<Member>
MemberRegistry::findByUser(std::string const& userRef)
{
    MemberID id = 0;
    {
        auto db = app_.getDb().checkoutDb();
        *db << "SELECT id FROM members WHERE user_ref = :u",
            soci::into(id), soci::use(userRef);
        if (!db->got_data())
            return failure(tnfMEMBER, "No member for user " + userRef);
    }
    return get(id);
}

Result<void>
MemberRegistry::setStatus(MemberID id, MemberStatus status)
{
    auto db = app_.getDb().checkoutDb();
    SavepointTransaction tr(db);

    std::string const s = to_string(status);
    soci::statement st =
        (db->prepare << "UPDATE members SET status = :s WHERE id = :id",
         soci::use(s),
         soci::use(id));
    st.execute(true);

    if (st.get_affected_rows() == 0)
        return failure(tnfMEMBER, "No member " + std::to_string(id));

    tr.commit();

    JLOG(j_.info()) << "Member " << id << " is now " << s;
    return {};
}

Result<Member>
MemberRegistry::requireActive(MemberID id)
{
    auto m = get(id);
    if (!m)
        return m;
    if (m->status != MemberStatus::active)
        return failure(
            tstINACTIVE_MEMBER,
            "Member " + std::to_string(id) + " is not active");
    return m;
}

std::vector<Member>
MemberRegistry::list(std::optional<MemberStatus> status)
{
    auto db = app_.getDb().checkoutDb();

    std::vector<Member> result;

    Member m;
    boost::optional<std::string> ref;
    std::string s;

    std::string sql = "SELECT id, name, user_ref, status FROM members";
    if (status)
        sql += std::string(" WHERE status = '") + to_string(*status) + "'";
    sql += " ORDER BY id";

    soci::statement st =
        (db->prepare << sql,
         soci::into(m.id),
         soci::into(m.name),
         soci::into(ref),
         soci::into(s));
    st.execute();
    while (st.fetch())
    {
        Member row = m;
        row.userRef.reset();
        if (ref)
            row.userRef = *ref;
        row.status = fromStorage<MemberStatus>(s);
        result.push_back(std::move(row));
    }
    return result;
}

}  // namespace mutual
