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
#include <mutual/basics/Log.h>
#include <mutual/beast/unit_test.h>
#include <mutual/core/Config.h>
#include <mutual/core/TimeKeeper.h>
#include <mutual/protocol/BuildInfo.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <thread>

namespace po = boost::program_options;

namespace mutual {

void
printHelp(po::options_description const& desc)
{
    std::cerr << "mutuald [options]\n"
              << desc << std::endl;
}

//------------------------------------------------------------------------------

static int
runUnitTests(std::string const& pattern)
{
    using namespace beast::unit_test;
    reporter r(std::cout);
    bool const failed = r.run_each_if(global_suites(), match_auto(pattern));
    if (failed)
        return EXIT_FAILURE;
    return EXIT_SUCCESS;
}

//------------------------------------------------------------------------------

int
run(int argc, char** argv)
{
    po::variables_map vm;

    // Set up option parsing.
    //
    po::options_description desc("General Options");
    // clang-format off
    desc.add_options()
    ("help,h", "Display this message.")
    ("conf", po::value<std::string>(), "Specify the configuration file.")
    ("unittest,u", po::value<std::string>()->implicit_value(""),
        "Perform unit tests. The optional argument specifies the names of "
        "the suites to run.")
    ("quiet,q", "Reduce diagnotics.")
    ("silent", "No output to the console after startup.")
    ("verbose,v", "Verbose logging.")
    ("version", "Display the build version.")
    ;
    // clang-format on

    // Parse options, if no error.
    try
    {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);
    }
    catch (std::exception const& ex)
    {
        std::cerr << "mutuald: " << ex.what() << std::endl;
        std::cerr << "Try 'mutuald --help' for a list of options."
                  << std::endl;
        return 1;
    }

    if (vm.count("help"))
    {
        printHelp(desc);
        return 0;
    }

    if (vm.count("version"))
    {
        std::cout << "mutuald version " << BuildInfo::getVersionString()
                  << std::endl;
        return 0;
    }

    // Run the unit tests if requested.
    // The unit tests will exit the application with an appropriate return code.
    //
    if (vm.count("unittest"))
        return runUnitTests(vm["unittest"].as<std::string>());

    auto config = std::make_unique<Config>();

    try
    {
        config->setup(
            vm.count("conf") ? vm["conf"].as<std::string>() : "",
            vm.count("quiet") > 0,
            vm.count("silent") > 0);
    }
    catch (std::exception const& e)
    {
        std::cerr << "mutuald: " << e.what() << std::endl;
        return 1;
    }

    auto logs = std::make_unique<Logs>(config->LOG_THRESHOLD);
    if (vm.count("quiet"))
        logs->threshold(beast::severities::kFatal);
    else if (vm.count("verbose"))
        logs->threshold(beast::severities::kTrace);

    for (auto const& [partition, severity] : config->LOG_PARTITIONS)
        logs->get(partition).threshold(severity);

    auto const logFile = config->getDebugLogFile();
    if (!logFile.empty())
    {
        boost::system::error_code ec;
        boost::filesystem::create_directories(logFile.parent_path(), ec);
        if (ec)
        {
            std::cerr << "Unable to create log file path " << logFile << ": "
                      << ec.message() << '\n';
        }

        if (!logs->open(logFile))
            std::cerr << "Can't open log file " << logFile << '\n';
    }

    logs->silent(config->silent());

    setDebugLogSink(logs->makeSink("Debug", beast::severities::kTrace));

    auto const j = logs->journal("Application");
    JLOG(j.info()) << BuildInfo::getFullVersionString() << " starting";

    auto app = make_Application(
        std::move(config), std::move(logs), std::make_unique<TimeKeeper>());

    if (!app->setup())
        return 1;

    // Stop on SIGINT or SIGTERM.
    boost::asio::io_context signals_context;
    boost::asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait(
        [&app, j](boost::system::error_code const& ec, int signum) {
            if (ec)
                return;
            JLOG(j.warn()) << "Received signal " << signum;
            app->signalStop();
        });

    // Reopen the debug log on SIGHUP so it can be rotated externally.
    boost::asio::signal_set hangups(signals_context, SIGHUP);
    std::function<void(boost::system::error_code const&, int)> onHangup =
        [&](boost::system::error_code const& ec, int) {
            if (ec)
                return;
            JLOG(j.info()) << app->logs().rotate();
            hangups.async_wait(onHangup);
        };
    hangups.async_wait(onHangup);

    std::thread signalThread([&signals_context] { signals_context.run(); });

    app->start();
    app->run();  // Blocks till we get a stop signal.

    signals.cancel();
    hangups.cancel();
    signalThread.join();

    return 0;
}

}  // namespace mutual

int
main(int argc, char** argv)
{
    return mutual::run(argc, argv);
}
