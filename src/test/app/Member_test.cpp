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
#include <test/jtx/Env.h>

namespace mutual {
namespace test {

class Member_test : public beast::unit_test::suite
{
    void
    testCreate()
    {
        testcase("create and look up");

        using namespace jtx;
        Env env(*this);

        auto const alice =
            env.require(env.members().create("Alice", std::string("u-17")));
        BEAST_EXPECT(alice.id > 0);
        BEAST_EXPECT(alice.status == MemberStatus::active);

        auto const bob = env.require(env.members().create("Bob"));
        BEAST_EXPECT(bob.id != alice.id);
        BEAST_EXPECT(!bob.userRef);

        auto const found = env.require(env.members().findByUser("u-17"));
        BEAST_EXPECT(found.id == alice.id);
        BEAST_EXPECT(found.name == "Alice");
        BEAST_EXPECT(found.userRef == std::string("u-17"));

        BEAST_EXPECT(
            Env::failedWith(env.members().findByUser("u-99"), tnfMEMBER));
        BEAST_EXPECT(Env::failedWith(env.members().get(999), tnfMEMBER));

        // One member per user identity.
        BEAST_EXPECT(Env::failedWith(
            env.members().create("Alice again", std::string("u-17")),
            tvlDUPLICATE));
        BEAST_EXPECT(
            Env::failedWith(env.members().create(""), tvlMISSING_FIELD));

        BEAST_EXPECT(env.members().list().size() == 2);
    }

    void
    testStatus()
    {
        testcase("status");

        using namespace jtx;
        Env env(*this);

        auto const alice = env.member("alice");
        auto const bob = env.member("bob");

        BEAST_EXPECT(env.members().requireActive(alice));

        env.require(env.members().setStatus(bob, MemberStatus::inactive));
        BEAST_EXPECT(
            env.require(env.members().get(bob)).status ==
            MemberStatus::inactive);
        BEAST_EXPECT(Env::failedWith(
            env.members().requireActive(bob), tstINACTIVE_MEMBER));
        BEAST_EXPECT(
            Env::failedWith(env.members().requireActive(999), tnfMEMBER));
        BEAST_EXPECT(Env::failedWith(
            env.members().setStatus(999, MemberStatus::inactive), tnfMEMBER));

        auto const active = env.members().list(MemberStatus::active);
        if (BEAST_EXPECT(active.size() == 1))
            BEAST_EXPECT(active.front().id == alice);
        BEAST_EXPECT(env.members().list(MemberStatus::inactive).size() == 1);
        BEAST_EXPECT(env.members().list().size() == 2);

        env.require(env.members().setStatus(bob, MemberStatus::active));
        BEAST_EXPECT(env.members().requireActive(bob));
    }

public:
    void
    run() override
    {
        testCreate();
        testStatus();
    }
};

BEAST_DEFINE_TESTSUITE(Member, app, mutual);

}  // namespace test
}  // namespace mutual
