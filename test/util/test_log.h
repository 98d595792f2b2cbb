// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TEST_LOG_H_8817263540918273645
#define TEST_LOG_H_8817263540918273645

#include <iostream>
#include "ftps/ftps_client.h"


namespace ftps::test
{
inline bool& showFtpsLog()
{
    static bool show = false; //"--show-ftps-log"
    return show;
}


inline void attachTestLog(FtpsClient& client)
{
    if (showFtpsLog())
        client.setLogCallback([](const fse::LogEntry& entry) { std::cout << fse::formatMessage(entry) << std::flush; });
}


inline std::string findLogEntry(const fse::ErrorLog& log, const std::string& text)
{
    for (const fse::LogEntry& entry : log)
        if (fse::contains(entry.message, text))
            return entry.message;
    return {};
}
}

#endif //TEST_LOG_H_8817263540918273645
