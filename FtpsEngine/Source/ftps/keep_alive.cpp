// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "keep_alive.h"

using namespace fse;
using namespace ftps;


KeepAliveMonitor::KeepAliveMonitor(ControlChannel& control) :
    control_(control),
    active_(control.getControlKeepAliveTimeout() > std::chrono::milliseconds(0))
{
    if (active_)
    {
        const std::chrono::milliseconds interval     = control.getControlKeepAliveTimeout();
        const std::chrono::milliseconds replyTimeout = control.getControlKeepAliveReplyTimeout();

        worker_ = InterruptibleThread([this, interval, replyTimeout]
        {
            setCurrentThreadName("Keep-alive[FTPS]");
            runKeepAlive(interval, replyTimeout); //throw ThreadStopRequest
        });
    }
}


void KeepAliveMonitor::stop()
{
    if (worker_.joinable())
    {
        worker_.requestStop();
        worker_.join();
    }
}


std::string KeepAliveMonitor::getDegradationMessage() const
{
    std::lock_guard dummy(lockMessage_);
    return degradationMessage_;
}


//context of worker thread:
void KeepAliveMonitor::runKeepAlive(std::chrono::milliseconds interval, std::chrono::milliseconds replyTimeout) //throw ThreadStopRequest
{
    for (;;)
    {
        interruptibleSleep(interval); //throw ThreadStopRequest

        try
        {
            control_.sendKeepAlive(replyTimeout); //throw SysError, ThreadStopRequest
            ++keepAliveCount_;
        }
        catch (const SysError& e)
        {
            {
                std::lock_guard dummy(lockMessage_);
                degradationMessage_ = e.toString();
            }
            degraded_ = true;
            control_.getLog().logWarning("Control connection keep-alive failed: " + e.toString());
            return; //degraded: no more NOOPs piling up for the rest of the transfer
        }
    }
}
