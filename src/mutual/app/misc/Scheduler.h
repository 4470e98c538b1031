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

#ifndef MUTUAL_APP_MISC_SCHEDULER_H_INCLUDED
#define MUTUAL_APP_MISC_SCHEDULER_H_INCLUDED

#include <mutual/beast/utility/Journal.h>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <thread>

namespace mutual {

class Application;

/** Runs the periodic sweeps on a thread of its own.

    Each run closes paid off loans, then moves fund overpayments into
    savings. Both jobs are idempotent, so a run that overlaps work done by
    a request, or a run repeated after a restart, changes nothing.
*/
class Scheduler
{
public:
    using clock_type = std::chrono::steady_clock;

    struct Stats
    {
        std::size_t runs = 0;
        std::size_t loansClosed = 0;
        std::size_t excessEntries = 0;
        std::size_t failures = 0;
    };

private:
    Application& app_;
    beast::Journal const j_;
    std::chrono::minutes const interval_;

    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<
        boost::asio::io_context::executor_type>>
        work_;
    boost::asio::steady_timer timer_;
    std::thread thread_;

    std::mutex mutable mutex_;
    Stats stats_;
    bool stopping_ = false;

public:
    Scheduler(
        Application& app,
        std::chrono::minutes interval,
        beast::Journal journal);

    Scheduler(Scheduler const&) = delete;
    Scheduler&
    operator=(Scheduler const&) = delete;

    ~Scheduler();

    /** Start the thread. The first run happens one interval from now. */
    void
    start();

    /** Cancel the timer and join the thread.
        It is okay to call this on a scheduler that was never started.
    */
    void
    stop();

    /** Run both jobs on the calling thread. */
    void
    runOnce();

    std::chrono::minutes
    interval() const
    {
        return interval_;
    }

    Stats
    stats() const;

private:
    void
    setTimer();

    void
    onTimer(boost::system::error_code const& ec);
};

}  // namespace mutual

#endif
