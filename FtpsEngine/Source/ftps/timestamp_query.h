// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef TIMESTAMP_QUERY_H_6619203847561092837
#define TIMESTAMP_QUERY_H_6619203847561092837

#include <fse/time.h>
#include "control_channel.h"
#include "ftp_listing.h"


namespace ftps
{
//one modification instant in all representations: derived from a single MDTM reply => always consistent
struct FtpTimestamp
{
    fse::TimeComp calendar; //UTC
    int millisecond = 0;    //0..999
    std::chrono::system_clock::time_point instant;
    time_t modTime = 0;     //seconds since epoch, fraction truncated

    bool operator==(const FtpTimestamp&) const = default;
};

//"213 20170113063314" or "213 20170113063314.123"
FtpTimestamp parseMdtmReply(const FtpReply& reply); //throw ProtocolError

FtpTimestamp makeFtpTimestamp(std::chrono::system_clock::time_point instant); //throw SysError

//file record view: name = last path component
FtpFile makeFileRecord(const std::string& pathname, const FtpTimestamp& ts);


class TimestampQuery
{
public:
    explicit TimestampQuery(ControlChannel& control) : control_(control) {}

    FtpTimestamp queryModificationTime(const std::string& pathname); //throw ConnectionError, ProtocolError, NotFoundError

    //MFMT: https://tools.ietf.org/html/draft-somers-ftp-mfxx-04
    void setModificationTime(const std::string& pathname, const FtpTimestamp& ts); //throw ConnectionError, ProtocolError, NotFoundError

private:
    TimestampQuery           (const TimestampQuery&) = delete;
    TimestampQuery& operator=(const TimestampQuery&) = delete;

    ControlChannel& control_;
};
}

#endif //TIMESTAMP_QUERY_H_6619203847561092837
