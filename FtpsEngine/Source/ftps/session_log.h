// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SESSION_LOG_H_3309182736450918273
#define SESSION_LOG_H_3309182736450918273

#include <functional>
#include <fse/error_log.h>
#include <fse/thread.h>


namespace ftps
{
//protocol + event log of one FTPS session: written by the caller's thread *and* the keep-alive thread
class SessionLog
{
public:
    using LogCallback = std::function<void(const fse::LogEntry& entry)>; //noexcept! called while the log is locked

    void logInfo   (const std::string& msg) { log(msg, fse::MSG_TYPE_INFO); }
    void logWarning(const std::string& msg) { log(msg, fse::MSG_TYPE_WARNING); }
    void logError  (const std::string& msg) { log(msg, fse::MSG_TYPE_ERROR); }

    void logCommand(const std::string& cmdLine)
    {
        if (fse::startsWithAsciiNoCase(cmdLine, "PASS "))
            logInfo("> PASS ********");
        else
            logInfo("> " + cmdLine);
    }

    void logReplyLine(const std::string& line) { logInfo("< " + line); }

    void setCallback(const LogCallback& cb) { log_.access([&](Data& d) { d.callback = cb; }); }

    fse::ErrorLog fetchLog() //hand over collected entries
    {
        fse::ErrorLog output;
        log_.access([&](Data& d) { output = std::exchange(d.entries, {}); });
        return output;
    }

private:
    void log(const std::string& msg, fse::MessageType type)
    {
        log_.access([&](Data& d)
        {
            fse::logMsg(d.entries, msg, type);
            if (d.callback)
                d.callback(d.entries.back());
        });
    }

    struct Data
    {
        fse::ErrorLog entries;
        LogCallback callback;
    };
    fse::Protected<Data> log_;
};
}

#endif //SESSION_LOG_H_3309182736450918273
