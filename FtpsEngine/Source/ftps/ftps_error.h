// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTPS_ERROR_H_8231094756102938471
#define FTPS_ERROR_H_8231094756102938471

#include <fse/sys_error.h>


namespace ftps
{
//socket, TLS handshake or transport failure on the control channel
DEFINE_NEW_SYS_ERROR(ConnectionError)

//certificate does not match the expected server identity: never downgraded
DEFINE_NEW_SYS_ERROR(SecurityError)

//data connection could not be established, transferred or closed
DEFINE_NEW_SYS_ERROR(DataConnectionError)


//malformed or unexpected server reply
struct ProtocolError : public fse::SysError
{
    ProtocolError(const std::string& msg, int replyCode) : SysError(msg), ftpReplyCode(replyCode) {}

    int ftpReplyCode; //0 if no reply code is available (e.g. malformed status line)
};


//permanent negative reply for a path: 550 on MDTM, LIST, RETR...
struct NotFoundError : public fse::SysError
{
    NotFoundError(const std::string& msg, int replyCode) : SysError(msg), ftpReplyCode(replyCode) {}

    int ftpReplyCode;
};
}

#endif //FTPS_ERROR_H_8231094756102938471
