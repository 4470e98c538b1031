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

#include <mutual/basics/Log.h>
#include <mutual/basics/contract.h>
#include <mutual/core/ConfigSections.h>
#include <mutual/core/DatabaseCon.h>
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>

namespace mutual {

SavepointTransaction::SavepointTransaction(LockedSociSession& session)
    : session_(session)
{
    auto& state = session_.state();
    name_ = "sp_" + std::to_string(++state.sequence);

    if (state.depth == 0)
        *session_ << "BEGIN IMMEDIATE";
    else
        *session_ << "SAVEPOINT " << name_;

    ++state.depth;
}

SavepointTransaction::~SavepointTransaction()
{
    if (done_)
        return;

    try
    {
        rollback();
    }
    catch (std::exception const& e)
    {
        JLOG(session_.state().journal.error())
            << "Rollback of " << name_ << " failed: " << e.what();
    }
}

void
SavepointTransaction::commit()
{
    if (done_)
        LogicError("SavepointTransaction::commit : already finished");

    auto& state = session_.state();
    finish();

    if (state.depth == 0)
    {
        *session_ << "COMMIT";
        state.memo.clear();
    }
    else
    {
        *session_ << "RELEASE " << name_;
    }
}

void
SavepointTransaction::rollback()
{
    if (done_)
        LogicError("SavepointTransaction::rollback : already finished");

    auto& state = session_.state();
    finish();

    // Anything memoized inside the rolled back work may name rows that
    // no longer exist.
    state.memo.clear();

    if (state.depth == 0)
    {
        *session_ << "ROLLBACK";
    }
    else
    {
        *session_ << "ROLLBACK TO " << name_;
        *session_ << "RELEASE " << name_;
    }

    JLOG(state.journal.debug()) << "Rolled back " << name_;
}

void
SavepointTransaction::finish()
{
    done_ = true;
    --session_.state().depth;
}

//------------------------------------------------------------------------------

DatabaseCon::Setup
setup_DatabaseCon(Config const& c, beast::Journal j)
{
    DatabaseCon::Setup setup;

    if (!c.inMemoryDatabase())
    {
        setup.dataDir = c.DATABASE_DIR;
        boost::filesystem::create_directories(setup.dataDir);
    }

    auto const& sqlite = c.section(ConfigSection::sqlite());

    // An in-memory database has no journal file to tune.
    if (!c.inMemoryDatabase())
    {
        std::string journalMode = "wal";
        set(journalMode, "journal_mode", sqlite);
        if (!boost::iequals(journalMode, "wal") &&
            !boost::iequals(journalMode, "delete") &&
            !boost::iequals(journalMode, "truncate") &&
            !boost::iequals(journalMode, "memory") &&
            !boost::iequals(journalMode, "off"))
        {
            Throw<std::runtime_error>(
                "Invalid " + ConfigSection::sqlite() +
                " journal_mode: " + journalMode);
        }
        setup.commonPragma.push_back(
            "PRAGMA journal_mode=" + journalMode + ";");
    }

    std::string synchronous = "normal";
    set(synchronous, "synchronous", sqlite);
    if (!boost::iequals(synchronous, "off") &&
        !boost::iequals(synchronous, "normal") &&
        !boost::iequals(synchronous, "full") &&
        !boost::iequals(synchronous, "extra"))
    {
        Throw<std::runtime_error>(
            "Invalid " + ConfigSection::sqlite() +
            " synchronous: " + synchronous);
    }
    setup.commonPragma.push_back("PRAGMA synchronous=" + synchronous + ";");

    int busyTimeout = 5000;
    set(busyTimeout, "busy_timeout", sqlite);
    if (busyTimeout < 0)
        Throw<std::runtime_error>(boost::str(
            boost::format("Invalid %s busy_timeout: %d") %
            ConfigSection::sqlite() % busyTimeout));
    setup.commonPragma.push_back(
        "PRAGMA busy_timeout=" + std::to_string(busyTimeout) + ";");

    JLOG(j.debug()) << "Database at "
                    << (setup.dataDir.empty() ? std::string(":memory:")
                                              : setup.dataDir.string());

    return setup;
}

}  // namespace mutual
