// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "sys_error.h"
#include <cstring> //strerror_r

using namespace fse;


namespace
{
//symbolic names for what sockets and the TLS transport report; anything else by number
std::string formatSystemErrorCode(ErrorCode ec)
{
    switch (ec)
    {
            FSE_CHECK_CASE_FOR_CONSTANT(EINTR);
            FSE_CHECK_CASE_FOR_CONSTANT(EIO);
            FSE_CHECK_CASE_FOR_CONSTANT(EBADF);
            FSE_CHECK_CASE_FOR_CONSTANT(EAGAIN);
            FSE_CHECK_CASE_FOR_CONSTANT(ENOMEM);
            FSE_CHECK_CASE_FOR_CONSTANT(EACCES);
            FSE_CHECK_CASE_FOR_CONSTANT(EINVAL);
            FSE_CHECK_CASE_FOR_CONSTANT(EMFILE);
            FSE_CHECK_CASE_FOR_CONSTANT(EPIPE);
            FSE_CHECK_CASE_FOR_CONSTANT(EPROTO);
            FSE_CHECK_CASE_FOR_CONSTANT(ENOTSOCK);
            FSE_CHECK_CASE_FOR_CONSTANT(EAFNOSUPPORT);
            FSE_CHECK_CASE_FOR_CONSTANT(EADDRINUSE);
            FSE_CHECK_CASE_FOR_CONSTANT(EADDRNOTAVAIL);
            FSE_CHECK_CASE_FOR_CONSTANT(ENETDOWN);
            FSE_CHECK_CASE_FOR_CONSTANT(ENETUNREACH);
            FSE_CHECK_CASE_FOR_CONSTANT(ECONNABORTED);
            FSE_CHECK_CASE_FOR_CONSTANT(ECONNRESET);
            FSE_CHECK_CASE_FOR_CONSTANT(ENOTCONN);
            FSE_CHECK_CASE_FOR_CONSTANT(ETIMEDOUT);
            FSE_CHECK_CASE_FOR_CONSTANT(ECONNREFUSED);
            FSE_CHECK_CASE_FOR_CONSTANT(EHOSTUNREACH);
            FSE_CHECK_CASE_FOR_CONSTANT(EINPROGRESS);
        default:
            return "Error code " + numberTo<std::string>(ec);
    }
}
}


std::string fse::getSystemErrorDescription(ErrorCode ec)
{
    const ErrorCode ecCurrent = getLastError();
    FSE_ON_SCOPE_EXIT(errno = ecCurrent); //callers may still evaluate errno

    char buffer[256] = {};
    return trimCpy(std::string(::strerror_r(ec, buffer, sizeof(buffer)))); //GNU strerror_r: "buffer" or a static string
}


std::string fse::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


//"ETIMEDOUT: Connection timed out [recv]"
std::string fse::formatSystemError(const std::string& functionName, const std::string& errorCode, const std::string& errorMsg)
{
    std::string output = trimCpy(errorCode);

    if (const std::string msg = trimCpy(errorMsg);
        !msg.empty())
        output += (output.empty() ? "" : ": ") + msg;

    if (!functionName.empty())
        output += (output.empty() ? "[" : " [") + functionName + ']';

    return output;
}
