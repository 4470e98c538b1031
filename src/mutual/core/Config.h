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

#ifndef MUTUAL_CORE_CONFIG_H_INCLUDED
#define MUTUAL_CORE_CONFIG_H_INCLUDED

#include <mutual/basics/BasicConfig.h>
#include <mutual/beast/utility/Journal.h>

#include <boost/filesystem.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace mutual {

/** Split the text of an ini-style file into its sections. */
IniFileSections
parseIniFile(std::string const& strInput, bool const bTrim);

class Config : public BasicConfig
{
public:
    // Settings related to the configuration file location and directories
    static char const* const configFileName;

    /** Returns the full path and filename of the debug log file. */
    boost::filesystem::path
    getDebugLogFile() const;

private:
    boost::filesystem::path CONFIG_FILE;
    boost::filesystem::path DEBUG_LOGFILE;

    void
    load();

public:
    boost::filesystem::path CONFIG_DIR;

    /** Directory holding the database, empty for an in-memory store. */
    boost::filesystem::path DATABASE_DIR;

    bool QUIET = false;   // Minimize logging verbosity.
    bool SILENT = false;  // No output to console after startup.

    /** Threshold for every log partition without an explicit override. */
    beast::severities::Severity LOG_THRESHOLD = beast::severities::kInfo;

    /** Per-partition thresholds from the [logging] section. */
    std::vector<std::pair<std::string, beast::severities::Severity>>
        LOG_PARTITIONS;

    /** Run the background sweep jobs. */
    bool SCHEDULER_ENABLED = true;

    /** Time between two runs of the sweep jobs. */
    std::chrono::minutes SCHEDULER_INTERVAL{60};

    /** Last day of a month on which that month's declarations may be
        edited.
    */
    int DECLARATION_EDIT_CUTOFF = 20;

public:
    Config() = default;

    /** Load the configuration file, or the one found in the default
        location when strConf is empty.
    */
    void
    setup(std::string const& strConf, bool bQuiet, bool bSilent);

    /** Load the configuration from the contents of the string.

        @param fileContents String representing the config contents.
    */
    void
    loadFromString(std::string const& fileContents);

    /** Returns `true` when the database lives only in memory. */
    bool
    inMemoryDatabase() const
    {
        return DATABASE_DIR.empty();
    }

    bool
    quiet() const
    {
        return QUIET;
    }

    bool
    silent() const
    {
        return SILENT;
    }
};

}  // namespace mutual

#endif
