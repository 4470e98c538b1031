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

#include <mutual/basics/contract.h>
#include <mutual/beast/unit_test.h>
#include <mutual/core/DatabaseCon.h>

namespace mutual {

class SavepointTransaction_test : public beast::unit_test::suite
{
    static constexpr std::array<char const*, 1> pragma{{
        "PRAGMA foreign_keys=ON;"}};

    static constexpr std::array<char const*, 1> init{{
        "CREATE TABLE Things (Value INTEGER NOT NULL);"}};

    std::unique_ptr<DatabaseCon>
    makeDb()
    {
        DatabaseCon::Setup setup;
        return std::make_unique<DatabaseCon>(
            setup,
            "test.db",
            pragma,
            init,
            beast::Journal{beast::Journal::getNullSink()});
    }

    int
    count(DatabaseCon& con)
    {
        auto db = con.checkoutDb();
        int n = 0;
        *db << "SELECT COUNT(*) FROM Things", soci::into(n);
        return n;
    }

    void
    insert(LockedSociSession& db, int v)
    {
        *db << "INSERT INTO Things (Value) VALUES (:v)", soci::use(v);
    }

    void
    testCommit()
    {
        testcase("commit");

        auto con = makeDb();
        {
            auto db = con->checkoutDb();
            SavepointTransaction tr(db);
            insert(db, 1);
            insert(db, 2);
            tr.commit();
            BEAST_EXPECT(db.state().depth == 0);
        }
        BEAST_EXPECT(count(*con) == 2);
    }

    void
    testRollbackOnScopeExit()
    {
        testcase("rollback on scope exit");

        auto con = makeDb();
        {
            auto db = con->checkoutDb();
            SavepointTransaction tr(db);
            insert(db, 1);
        }
        BEAST_EXPECT(count(*con) == 0);

        // An exception unwinding through the guard rolls back too.
        try
        {
            auto db = con->checkoutDb();
            SavepointTransaction tr(db);
            insert(db, 1);
            Throw<std::runtime_error>("abandon");
        }
        catch (std::runtime_error const&)
        {
        }
        BEAST_EXPECT(count(*con) == 0);
    }

    void
    testNested()
    {
        testcase("nested savepoints");

        auto con = makeDb();
        {
            auto db = con->checkoutDb();
            SavepointTransaction outer(db);
            insert(db, 1);

            {
                // A second checkout of the same connection on this thread
                // joins the open transaction.
                auto inner = con->checkoutDb();
                SavepointTransaction tr(inner);
                BEAST_EXPECT(inner.state().depth == 2);
                insert(inner, 2);
                // Dropped without commit: only the inner work goes.
            }

            {
                auto inner = con->checkoutDb();
                SavepointTransaction tr(inner);
                insert(inner, 3);
                tr.commit();
            }

            BEAST_EXPECT(db.state().depth == 1);
            outer.commit();
        }

        auto db = con->checkoutDb();
        std::vector<int> values(10);
        *db << "SELECT Value FROM Things ORDER BY Value", soci::into(values);
        BEAST_EXPECT(values.size() == 2);
        BEAST_EXPECT(values[0] == 1 && values[1] == 3);
    }

    void
    testOuterRollbackDiscardsInner()
    {
        testcase("outer rollback discards committed savepoints");

        auto con = makeDb();
        {
            auto db = con->checkoutDb();
            SavepointTransaction outer(db);
            {
                SavepointTransaction tr(db);
                insert(db, 7);
                tr.commit();
            }
            outer.rollback();
        }
        BEAST_EXPECT(count(*con) == 0);
    }

    void
    testMemo()
    {
        testcase("memo lifetime");

        auto con = makeDb();
        auto db = con->checkoutDb();
        {
            SavepointTransaction outer(db);
            db.state().memo["k"] = 1;
            {
                SavepointTransaction tr(db);
                tr.commit();
            }
            BEAST_EXPECT(db.state().memo.count("k") == 1);
            outer.commit();
        }
        BEAST_EXPECT(db.state().memo.empty());

        {
            SavepointTransaction outer(db);
            {
                SavepointTransaction tr(db);
                db.state().memo["k"] = 1;
            }
            // The rolled back savepoint may have created what was memoized.
            BEAST_EXPECT(db.state().memo.empty());
            outer.commit();
        }
    }

public:
    void
    run() override
    {
        testCommit();
        testRollbackOnScopeExit();
        testNested();
        testOuterRollbackDiscardsInner();
        testMemo();
    }
};

BEAST_DEFINE_TESTSUITE(SavepointTransaction, core, mutual);

}  // namespace mutual
