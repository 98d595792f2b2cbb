// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef KEEP_ALIVE_H_9018273645019283746
#define KEEP_ALIVE_H_9018273645019283746

#include <atomic>
#include "control_channel.h"


namespace ftps
{
/*  NOOP pings on the control connection while a (slow) data transfer is running: some routers and servers drop
    control connections that are idle for too long.

    - bound to the life time of one data connection: start right after opening, destroy right after closing
    - no worker thread at all if the control keep-alive timeout is zero
    - failures never interrupt the transfer: they are reported via isDegraded() afterwards                   */
class KeepAliveMonitor
{
public:
    explicit KeepAliveMonitor(ControlChannel& control);
    ~KeepAliveMonitor() { stop(); }

    void stop(); //stop + join worker thread; idempotent

    bool isActive() const { return active_; }
    bool isDegraded() const { return degraded_; }
    std::string getDegradationMessage() const;
    int getKeepAliveCount() const { return keepAliveCount_; } //successful NOOP round trips

private:
    KeepAliveMonitor           (const KeepAliveMonitor&) = delete;
    KeepAliveMonitor& operator=(const KeepAliveMonitor&) = delete;

    void runKeepAlive(std::chrono::milliseconds interval, std::chrono::milliseconds replyTimeout); //throw ThreadStopRequest

    ControlChannel& control_;
    const bool active_;

    std::atomic<bool> degraded_{false};
    std::atomic<int> keepAliveCount_{0};

    mutable std::mutex lockMessage_;
    std::string degradationMessage_;

    fse::InterruptibleThread worker_;
};
}

#endif //KEEP_ALIVE_H_9018273645019283746
