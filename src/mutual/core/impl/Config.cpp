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

#include <mutual/basics/FileUtilities.h>
#include <mutual/basics/Log.h>
#include <mutual/basics/contract.h>
#include <mutual/core/Config.h>
#include <mutual/core/ConfigSections.h>
#include <boost/algorithm/string.hpp>
#include <boost/format.hpp>
#include <cstdlib>
#include <iostream>

namespace mutual {

IniFileSections
parseIniFile(std::string const& strInput, bool const bTrim)
{
    std::string strData(strInput);
    std::vector<std::string> vLines;
    IniFileSections secResult;

    // Convert DOS format to unix.
    boost::algorithm::replace_all(strData, "\r\n", "\n");

    // Convert MacOS format to unix.
    boost::algorithm::replace_all(strData, "\r", "\n");

    boost::algorithm::split(vLines, strData, boost::algorithm::is_any_of("\n"));

    // Set the default Section name.
    std::string strSection = SECTION_DEFAULT_NAME;

    // Initialize the default Section.
    secResult[strSection] = IniFileSections::mapped_type();

    // Parse each line.
    for (auto& strValue : vLines)
    {
        if (bTrim)
            boost::algorithm::trim(strValue);

        if (strValue.empty() || strValue[0] == '#')
        {
            // Blank line or comment, do nothing.
        }
        else if (strValue[0] == '[' && strValue[strValue.length() - 1] == ']')
        {
            // New Section.
            strSection = strValue.substr(1, strValue.length() - 2);
            secResult.emplace(strSection, IniFileSections::mapped_type{});
        }
        else
        {
            // Another line for Section.
            secResult[strSection].push_back(strValue);
        }
    }

    return secResult;
}

//------------------------------------------------------------------------------

char const* const Config::configFileName = "mutuald.cfg";

void
Config::setup(std::string const& strConf, bool bQuiet, bool bSilent)
{
    QUIET = bQuiet || bSilent;
    SILENT = bSilent;

    if (!strConf.empty())
    {
        // --conf=<path> : everything is relative to that file.
        CONFIG_FILE = strConf;
        CONFIG_DIR = boost::filesystem::absolute(CONFIG_FILE);
        CONFIG_DIR.remove_filename();
    }
    else
    {
        CONFIG_DIR = boost::filesystem::current_path();
        CONFIG_FILE = CONFIG_DIR / configFileName;

        // Fall back to the XDG location, then the system-wide one.
        if (!boost::filesystem::exists(CONFIG_FILE))
        {
            if (char const* home = std::getenv("HOME"))
            {
                auto const xdg =
                    boost::filesystem::path(home) / ".config" / "mutuald";
                if (boost::filesystem::exists(xdg / configFileName))
                {
                    CONFIG_DIR = xdg;
                    CONFIG_FILE = xdg / configFileName;
                }
            }
        }

        if (!boost::filesystem::exists(CONFIG_FILE))
        {
            CONFIG_DIR = "/etc/opt/mutuald";
            CONFIG_FILE = CONFIG_DIR / configFileName;
        }
    }

    load();
}

void
Config::load()
{
    if (!QUIET)
        std::cerr << "Loading: " << CONFIG_FILE << "\n";

    boost::system::error_code ec;
    auto const fileContents = readTextFile(CONFIG_FILE, ec);

    if (ec)
    {
        std::cerr << "Failed to read '" << CONFIG_FILE << "'." << ec.value()
                  << ": " << ec.message() << std::endl;
        Throw<std::runtime_error>(
            "Unable to read configuration file " + CONFIG_FILE.string());
    }

    loadFromString(fileContents);
}

void
Config::loadFromString(std::string const& fileContents)
{
    IniFileSections secConfig = parseIniFile(fileContents, true);

    build(secConfig);

    if (exists(SECTION_DATABASE_PATH))
    {
        auto const dbPath =
            boost::algorithm::trim_copy(legacy(SECTION_DATABASE_PATH));
        if (dbPath == ":memory:")
            DATABASE_DIR.clear();
        else if (!dbPath.empty())
            DATABASE_DIR = boost::filesystem::absolute(dbPath, CONFIG_DIR);
    }
    else if (!CONFIG_DIR.empty())
    {
        DATABASE_DIR = CONFIG_DIR / "db";
    }

    if (exists(SECTION_DEBUG_LOGFILE))
    {
        auto const logFile =
            boost::algorithm::trim_copy(legacy(SECTION_DEBUG_LOGFILE));
        if (!logFile.empty())
            DEBUG_LOGFILE = boost::filesystem::absolute(logFile, CONFIG_DIR);
    }

    if (exists(ConfigSection::logging()))
    {
        auto const& section = this->section(ConfigSection::logging());
        for (auto const& [key, value] : section.pairs())
        {
            auto const sev = Logs::fromString(value);
            if (!sev)
                Throw<std::runtime_error>(
                    "Invalid log severity '" + value + "' for " + key +
                    " in [" + ConfigSection::logging() + "]");
            if (boost::iequals(key, "severity"))
                LOG_THRESHOLD = *sev;
            else
                LOG_PARTITIONS.emplace_back(key, *sev);
        }
    }

    if (exists(ConfigSection::scheduler()))
    {
        auto const& section = this->section(ConfigSection::scheduler());
        get_if_exists(section, "enabled", SCHEDULER_ENABLED);

        if (section.exists("interval_minutes"))
        {
            int minutes = 0;
            if (!get_if_exists(section, "interval_minutes", minutes) ||
                minutes <= 0)
                Throw<std::runtime_error>(boost::str(
                    boost::format("Invalid [%s] interval_minutes: must be a "
                                  "positive number of minutes") %
                    ConfigSection::scheduler()));
            SCHEDULER_INTERVAL = std::chrono::minutes{minutes};
        }
    }

    if (exists(ConfigSection::declarations()))
    {
        auto const& section = this->section(ConfigSection::declarations());
        if (section.exists("edit_cutoff_day"))
        {
            int cutoff = 0;
            if (!get_if_exists(section, "edit_cutoff_day", cutoff) ||
                cutoff < 1 || cutoff > 31)
                Throw<std::runtime_error>(boost::str(
                    boost::format("Invalid [%s] edit_cutoff_day: must be a "
                                  "day of the month") %
                    ConfigSection::declarations()));
            DECLARATION_EDIT_CUTOFF = cutoff;
        }
    }
}

boost::filesystem::path
Config::getDebugLogFile() const
{
    return DEBUG_LOGFILE;
}

}  // namespace mutual
