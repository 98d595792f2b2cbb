// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef EXTRA_LOG_H_2098374650192837465
#define EXTRA_LOG_H_2098374650192837465

#include <functional>
#include "error_log.h"
#include "thread.h"


namespace fse
{
//process-wide sink for errors nobody can be told about: nothrow clean up, e.g. FtpsClient::disconnect()
//entries not fetched until shutdown go to the report function passed to initExtraLog()
void initExtraLog(const std::function<void(const ErrorLog& log)>& reportOutstanding /*nothrow! runs during static destruction*/);
ErrorLog fetchExtraLog();
void logExtraError(const std::string& msg); //nothrow








//######################## implementation ##########################
namespace impl
{
struct ExtraLogState
{
    ~ExtraLogState()
    {
        if (!entries.empty() && reportOutstanding)
            reportOutstanding(entries);
    }

    ErrorLog entries;
    std::function<void(const ErrorLog& log)> reportOutstanding;
};

inline
Protected<ExtraLogState>& getExtraLog()
{
    static Protected<ExtraLogState> extraLog; //thread-safe init
    return extraLog;
}
}


inline
void initExtraLog(const std::function<void(const ErrorLog& log)>& reportOutstanding)
{
    impl::getExtraLog().access([&](impl::ExtraLogState& state) { state.reportOutstanding = reportOutstanding; });
}


inline
ErrorLog fetchExtraLog()
{
    return impl::getExtraLog().access([](impl::ExtraLogState& state) { return std::exchange(state.entries, {}); });
}


inline
void logExtraError(const std::string& msg)
{
    impl::getExtraLog().access([&](impl::ExtraLogState& state) { logMsg(state.entries, msg, MSG_TYPE_ERROR); });
}
}

#endif //EXTRA_LOG_H_2098374650192837465
