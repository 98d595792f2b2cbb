// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ERROR_LOG_H_7810293847561029384
#define ERROR_LOG_H_7810293847561029384

#include <vector>
#include "time.h"


namespace fse
{
enum MessageType
{
    MSG_TYPE_INFO    = 0x1,
    MSG_TYPE_WARNING = 0x2,
    MSG_TYPE_ERROR   = 0x4,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MSG_TYPE_ERROR;
    std::string message;
};

using ErrorLog = std::vector<LogEntry>;


inline
void logMsg(ErrorLog& log, const std::string& msg, MessageType type, time_t time = std::time(nullptr))
{
    log.push_back({time, type, msg});
}


struct ErrorLogStats
{
    int info    = 0;
    int warning = 0;
    int error   = 0;
};

inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats stats;
    for (const LogEntry& entry : log)
        ++(entry.type == MSG_TYPE_ERROR   ? stats.error :
           entry.type == MSG_TYPE_WARNING ? stats.warning : stats.info);
    return stats;
}


//"[2024-03-01 14:22:07]  Warning:  first line
//                                  continuation lines aligned to the message"
inline
std::string formatMessage(const LogEntry& entry)
{
    const char* typeLabel = entry.type == MSG_TYPE_ERROR   ? "Error" :
                            entry.type == MSG_TYPE_WARNING ? "Warning" : "Info";

    std::string output = '[' + formatTime(formatIsoTimeTag, getLocalTime(entry.time)) + "]  " + typeLabel + ":  ";
    const std::string indent(output.size(), ' ');

    bool firstLine = true;
    for (const std::string& line : splitCpy(trimCpy(entry.message), '\n', SplitOnEmpty::skip))
    {
        if (!firstLine)
            output += '\n' + indent;
        output += line;
        firstLine = false;
    }
    output += '\n';
    return output;
}
}

#endif //ERROR_LOG_H_7810293847561029384
