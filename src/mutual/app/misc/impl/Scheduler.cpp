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

#include <mutual/app/loan/LoanManager.h>
#include <mutual/app/main/Application.h>
#include <mutual/app/misc/Scheduler.h>
#include <mutual/app/tx/DepositPoster.h>
#include <mutual/basics/Log.h>
#include <mutual/basics/contract.h>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>

namespace mutual {

Scheduler::Scheduler(
    Application& app,
    std::chrono::minutes interval,
    beast::Journal journal)
    : app_(app)
    , j_(journal)
    , interval_(interval)
    , timer_(io_context_)
{
    if (interval_.count() <= 0)
        LogicError("Scheduler: interval must be positive");
}

Scheduler::~Scheduler()
{
    stop();
}

void
Scheduler::start()
{
    {
        std::lock_guard lock(mutex_);
        if (thread_.joinable())
            return;
        stopping_ = false;
    }

    io_context_.restart();
    work_.emplace(boost::asio::make_work_guard(io_context_));
    setTimer();

    thread_ = std::thread([this] { io_context_.run(); });

    JLOG(j_.info()) << "Sweeps every " << interval_.count() << " minute(s)";
}

void
Scheduler::stop()
{
    {
        std::lock_guard lock(mutex_);
        if (!thread_.joinable())
            return;
        stopping_ = true;
    }

    boost::asio::post(io_context_, [this] { timer_.cancel(); });
    work_.reset();
    thread_.join();

    JLOG(j_.debug()) << "Stopped";
}

void
Scheduler::runOnce()
{
    std::size_t closed = 0;
    std::size_t swept = 0;
    std::size_t failed = 0;

    try
    {
        closed = app_.getLoans().closePaidOffLoans().size();
    }
    catch (std::exception const& e)
    {
        ++failed;
        JLOG(j_.error()) << "Closing paid off loans threw: " << e.what();
    }

    try
    {
        swept = app_.getDepositPoster().sweepAllExcess();
    }
    catch (std::exception const& e)
    {
        ++failed;
        JLOG(j_.error()) << "Excess sweep threw: " << e.what();
    }

    {
        std::lock_guard lock(mutex_);
        ++stats_.runs;
        stats_.loansClosed += closed;
        stats_.excessEntries += swept;
        stats_.failures += failed;
    }

    JLOG(j_.debug()) << "Sweep closed " << closed << " loan(s), posted "
                     << swept << " excess entr" << (swept == 1 ? "y" : "ies");
}

Scheduler::Stats
Scheduler::stats() const
{
    std::lock_guard lock(mutex_);
    return stats_;
}

void
Scheduler::setTimer()
{
    timer_.expires_after(interval_);
    timer_.async_wait(
        [this](boost::system::error_code const& ec) { onTimer(ec); });
}

void
Scheduler::onTimer(boost::system::error_code const& ec)
{
    if (ec == boost::asio::error::operation_aborted)
        return;

    if (ec)
    {
        JLOG(j_.error()) << "Timer failed: " << ec.message();
        return;
    }

    runOnce();

    std::lock_guard lock(mutex_);
    if (!stopping_)
        setTimer();
}

}  // namespace mutual
