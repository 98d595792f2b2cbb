// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "timestamp_query.h"

using namespace fse;
using namespace ftps;


FtpTimestamp ftps::parseMdtmReply(const FtpReply& reply) //throw ProtocolError
{
    //https://tools.ietf.org/html/rfc3659#section-3
    //213<space>YYYYMMDDHHMMSS[.sss]: "Time values are always represented in UTC (GMT)"
    if (reply.code == 213 && !reply.lines.empty())
    {
        const std::string& line = reply.lines.back();
        if (startsWith(line, "213 "))
        {
            const std::string_view value = trimCpy(std::string_view(line).substr(4), TrimSide::both, [](char c) { return isWhiteSpace(c); });
            const std::string_view datePart = beforeFirst(value, '.', IfNotFoundReturn::all);
            const std::string_view fraction = afterFirst (value, '.', IfNotFoundReturn::none);

            if (datePart.size() == 14 &&
                std::all_of(fraction.begin(), fraction.end(), [](char c) { return isDigit(c); }) &&
                (fraction.empty() == !contains(value, '.')))
                if (const TimeComp tc = parseTime("%Y%m%d%H%M%S", datePart);
                    tc != TimeComp())
                    if (const auto [modTime, timeValid] = utcToTimeT(tc);
                        timeValid)
                    {
                        int ms = 0;
                        if (!fraction.empty())
                        {
                            const std::string_view msStr = fraction.substr(0, 3);
                            ms = stringTo<int>(msStr);
                            for (size_t i = msStr.size(); i < 3; ++i)
                                ms *= 10;
                        }

                        FtpTimestamp ts;
                        ts.calendar    = tc;
                        ts.millisecond = ms;
                        ts.modTime     = modTime;
                        ts.instant     = std::chrono::system_clock::from_time_t(modTime) + std::chrono::milliseconds(ms);
                        return ts;
                    }
        }
    }
    throw ProtocolError("Unexpected FTP response. (" + reply.getText() + ')', reply.code);
}


FtpTimestamp ftps::makeFtpTimestamp(std::chrono::system_clock::time_point instant) //throw SysError
{
    using namespace std::chrono;
    const time_t modTime = system_clock::to_time_t(floor<seconds>(instant));

    const TimeComp tc = getUtcTime(modTime);
    if (tc == TimeComp())
        throw SysError("Invalid modification time (time_t: " + numberTo<std::string>(modTime) + ')');

    FtpTimestamp ts;
    ts.calendar    = tc;
    ts.millisecond = static_cast<int>(duration_cast<milliseconds>(instant - floor<seconds>(instant)).count());
    ts.modTime     = modTime;
    ts.instant     = system_clock::from_time_t(modTime) + milliseconds(ts.millisecond);
    return ts;
}


FtpFile ftps::makeFileRecord(const std::string& pathname, const FtpTimestamp& ts)
{
    FtpFile item;
    item.name = afterLast(pathname, '/', IfNotFoundReturn::all);
    item.modTime = ts.instant;
    return item;
}


FtpTimestamp TimestampQuery::queryModificationTime(const std::string& pathname) //throw ConnectionError, ProtocolError, NotFoundError
{
    const FtpReply reply = control_.executeCommand("MDTM", pathname); //throw ConnectionError, ProtocolError

    if (classifyReply(reply.code) == ReplyClass::permanentNegative) //throw ProtocolError
        throw NotFoundError(pathname + ": " + formatFtpReply(reply), reply.code);

    return parseMdtmReply(reply); //throw ProtocolError
}


void TimestampQuery::setModificationTime(const std::string& pathname, const FtpTimestamp& ts) //throw ConnectionError, ProtocolError, NotFoundError
{
    std::string isoTime = formatTime("%Y%m%d%H%M%S", ts.calendar); //returns empty string on error
    if (isoTime.empty())
        throw ProtocolError("Invalid modification time (time_t: " + numberTo<std::string>(ts.modTime) + ')', 0);

    if (ts.millisecond != 0)
    {
        const std::string msStr = numberTo<std::string>(ts.millisecond);
        isoTime += '.' + std::string(3 - std::min<size_t>(msStr.size(), 3), '0') + msStr;
    }

    //"213 Modify=20170113063314; readme.txt"
    const FtpReply reply = control_.executeCommand("MFMT", isoTime + ' ' + pathname); //throw ConnectionError, ProtocolError

    if (reply.code == 213)
        return;
    if (reply.code == 550)
        throw NotFoundError(pathname + ": " + formatFtpReply(reply), reply.code);

    throw ProtocolError("Cannot write modification time of \"" + pathname + "\". " + formatFtpReply(reply), reply.code);
}
