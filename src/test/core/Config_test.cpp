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
#include <mutual/beast/unit_test.h>
#include <mutual/core/Config.h>
#include <mutual/core/ConfigSections.h>
#include <mutual/core/DatabaseCon.h>
#include <boost/format.hpp>
#include <algorithm>

namespace mutual {

class Config_test : public beast::unit_test::suite
{
    void
    testParseIni()
    {
        testcase("ini parsing");

        auto const sections = parseIniFile(
            "# comment\r\n"
            "top level\n"
            "[first]\n"
            "  a = 1  \n"
            "\n"
            "[second]\r"
            "b=2\n"
            "[first]\n"
            "c = 3\n",
            true);

        BEAST_EXPECT(sections.at("").size() == 1);
        BEAST_EXPECT(sections.at("").front() == "top level");
        BEAST_EXPECT(sections.at("first").size() == 2);
        BEAST_EXPECT(sections.at("first")[0] == "a = 1");
        BEAST_EXPECT(sections.at("first")[1] == "c = 3");
        BEAST_EXPECT(sections.at("second").size() == 1);
    }

    void
    testTrailingComments()
    {
        testcase("trailing comments");

        {
            Config c;
            c.loadFromString(R"(
[logging]
# a whole-line comment is not trailing
severity = debug
)");
            BEAST_EXPECT(!c.had_trailing_comments());
            BEAST_EXPECT(c.LOG_THRESHOLD == beast::severities::kDebug);
        }
        {
            Config c;
            c.loadFromString(R"(
[logging]
severity = warning   # quieter
Ledger = trace#noisy
)");
            BEAST_EXPECT(c.had_trailing_comments());
            BEAST_EXPECT(c.LOG_THRESHOLD == beast::severities::kWarning);
            BEAST_EXPECT(c.LOG_PARTITIONS.size() == 1);
            BEAST_EXPECT(c.LOG_PARTITIONS.front().first == "Ledger");
            BEAST_EXPECT(
                c.LOG_PARTITIONS.front().second == beast::severities::kTrace);
        }
        {
            Config c;
            c.loadFromString(R"(
[debug_logfile]
logs/debug\#1.log
)");
            BEAST_EXPECT(!c.had_trailing_comments());
            BEAST_EXPECT(
                c.getDebugLogFile().filename().string() == "debug#1.log");
        }
    }

    void
    testDefaults()
    {
        testcase("defaults");

        Config c;
        c.loadFromString("");
        BEAST_EXPECT(c.inMemoryDatabase());
        BEAST_EXPECT(c.LOG_THRESHOLD == beast::severities::kInfo);
        BEAST_EXPECT(c.LOG_PARTITIONS.empty());
        BEAST_EXPECT(c.SCHEDULER_ENABLED);
        BEAST_EXPECT(c.SCHEDULER_INTERVAL == std::chrono::minutes{60});
        BEAST_EXPECT(c.getDebugLogFile().empty());
        BEAST_EXPECT(c.DECLARATION_EDIT_CUTOFF == 20);
    }

    void
    testSettings()
    {
        testcase("settings");

        Config c;
        c.loadFromString(boost::str(
            boost::format(R"(
[%1%]
:memory:

[%2%]
severity = warning
Ledger = trace
Loans = error

[%3%]
enabled = 0
interval_minutes = 15

[%4%]
synchronous = full

[%5%]
edit_cutoff_day = 25
)") % SECTION_DATABASE_PATH %
            ConfigSection::logging() % ConfigSection::scheduler() %
            ConfigSection::sqlite() % ConfigSection::declarations()));

        BEAST_EXPECT(c.inMemoryDatabase());
        BEAST_EXPECT(c.LOG_THRESHOLD == beast::severities::kWarning);
        BEAST_EXPECT(c.LOG_PARTITIONS.size() == 2);
        for (auto const& [partition, severity] : c.LOG_PARTITIONS)
        {
            if (partition == "Ledger")
                BEAST_EXPECT(severity == beast::severities::kTrace);
            else if (partition == "Loans")
                BEAST_EXPECT(severity == beast::severities::kError);
            else
                fail("unexpected partition " + partition);
        }
        BEAST_EXPECT(!c.SCHEDULER_ENABLED);
        BEAST_EXPECT(c.SCHEDULER_INTERVAL == std::chrono::minutes{15});
        BEAST_EXPECT(c.DECLARATION_EDIT_CUTOFF == 25);

        auto const setup = setup_DatabaseCon(c, beast::Journal{beast::Journal::getNullSink()});
        BEAST_EXPECT(setup.dataDir.empty());
        BEAST_EXPECT(
            std::find(
                setup.commonPragma.begin(),
                setup.commonPragma.end(),
                "PRAGMA synchronous=full;") != setup.commonPragma.end());
    }

    void
    testErrors()
    {
        testcase("invalid settings");

        auto const rejects = [this](std::string const& text) {
            Config c;
            try
            {
                c.loadFromString(text);
                fail("accepted: " + text);
            }
            catch (std::runtime_error const&)
            {
                pass();
            }
        };

        rejects("[logging]\nseverity = loud\n");
        rejects("[logging]\nLedger = 3\n");
        rejects("[scheduler]\ninterval_minutes = 0\n");
        rejects("[scheduler]\ninterval_minutes = -5\n");
        rejects("[scheduler]\ninterval_minutes = soon\n");
        rejects("[declarations]\nedit_cutoff_day = 0\n");
        rejects("[declarations]\nedit_cutoff_day = 32\n");
        rejects("[declarations]\nedit_cutoff_day = late\n");

        {
            Config c;
            c.loadFromString("[sqlite]\nsynchronous = sometimes\n");
            try
            {
                (void)setup_DatabaseCon(c, beast::Journal{beast::Journal::getNullSink()});
                fail("bad synchronous setting accepted");
            }
            catch (std::runtime_error const&)
            {
                pass();
            }
        }
    }

public:
    void
    run() override
    {
        testParseIni();
        testTrailingComments();
        testDefaults();
        testSettings();
        testErrors();
    }
};

BEAST_DEFINE_TESTSUITE(Config, core, mutual);

}  // namespace mutual
