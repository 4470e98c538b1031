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

#ifndef MUTUAL_CORE_DATABASECON_H_INCLUDED
#define MUTUAL_CORE_DATABASECON_H_INCLUDED

#include <mutual/core/Config.h>
#include <mutual/core/SociDB.h>
#include <boost/filesystem/path.hpp>
#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mutual {

class LockedSociSession
{
public:
    using mutex = std::recursive_mutex;

private:
    std::shared_ptr<soci::session> session_;
    SessionState* state_;
    std::unique_lock<mutex> lock_;

public:
    LockedSociSession(
        std::shared_ptr<soci::session> it,
        SessionState& state,
        mutex& m)
        : session_(std::move(it)), state_(&state), lock_(m)
    {
    }
    LockedSociSession(LockedSociSession&& rhs) noexcept
        : session_(std::move(rhs.session_))
        , state_(rhs.state_)
        , lock_(std::move(rhs.lock_))
    {
    }
    LockedSociSession() = delete;
    LockedSociSession(LockedSociSession const& rhs) = delete;
    LockedSociSession&
    operator=(LockedSociSession const& rhs) = delete;

    soci::session*
    get()
    {
        return session_.get();
    }
    soci::session&
    operator*()
    {
        return *session_;
    }
    soci::session*
    operator->()
    {
        return session_.get();
    }
    explicit operator bool() const
    {
        return bool(session_);
    }

    SessionState&
    state()
    {
        return *state_;
    }
};

//------------------------------------------------------------------------------

/** A transaction on a checked-out session.

    The outermost guard on a connection begins a transaction; guards created
    while one is open nest inside it as savepoints. A guard that is destroyed
    without commit() rolls back everything done since it was created, so an
    operation that returns early, or throws, leaves no trace.
*/
class SavepointTransaction
{
    LockedSociSession& session_;
    std::string name_;
    bool done_ = false;

public:
    explicit SavepointTransaction(LockedSociSession& session);

    SavepointTransaction(SavepointTransaction const&) = delete;
    SavepointTransaction&
    operator=(SavepointTransaction const&) = delete;

    ~SavepointTransaction();

    void
    commit();

    void
    rollback();

private:
    void
    finish();
};

//------------------------------------------------------------------------------

class DatabaseCon
{
public:
    struct Setup
    {
        explicit Setup() = default;

        /** Directory for the database file, empty for memory. */
        boost::filesystem::path dataDir;

        /** Pragmas from the [sqlite] section, applied to every open. */
        std::vector<std::string> commonPragma;
    };

    template <std::size_t N, std::size_t M>
    DatabaseCon(
        Setup const& setup,
        std::string const& dbName,
        std::array<char const*, N> const& pragma,
        std::array<char const*, M> const& initSQL,
        beast::Journal journal)
        : session_(std::make_shared<soci::session>()), state_(journal)
    {
        open(
            *session_,
            "sqlite3",
            setup.dataDir.empty() ? ":memory:"
                                  : (setup.dataDir / dbName).string());

        for (auto const& p : setup.commonPragma)
        {
            soci::statement st = session_->prepare << p;
            st.execute(true);
        }
        for (auto const& p : pragma)
        {
            soci::statement st = session_->prepare << p;
            st.execute(true);
        }
        for (auto const& sql : initSQL)
        {
            soci::statement st = session_->prepare << sql;
            st.execute(true);
        }
    }

    ~DatabaseCon() = default;

    LockedSociSession
    checkoutDb()
    {
        return LockedSociSession(session_, state_, lock_);
    }

private:
    LockedSociSession::mutex lock_;

    std::shared_ptr<soci::session> const session_;
    SessionState state_;
};

DatabaseCon::Setup
setup_DatabaseCon(Config const& c, beast::Journal j);

}  // namespace mutual

#endif
