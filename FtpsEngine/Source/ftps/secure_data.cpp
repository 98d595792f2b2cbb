// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "secure_data.h"

using namespace fse;
using namespace ftps;


uint64_t SecureDataNegotiator::execPBSZ(uint64_t size) //throw ConnectionError, ProtocolError
{
    bufferSize_.reset();

    const FtpReply reply = control_.executeCommand("PBSZ", numberTo<std::string>(size)); //throw ConnectionError, ProtocolError
    if (classifyReply(reply.code) != ReplyClass::positiveCompletion)
        throw ProtocolError("Protection buffer size was not accepted. " + formatFtpReply(reply), reply.code);

    /*  RFC 2228: "If the server cannot accept the size [...] it should reply with a 200 reply with the
        parameter 'PBSZ=' followed by the size it can accept"                 e.g. "200 PBSZ=0"   */
    uint64_t negotiatedSize = size;
    for (const std::string& line : reply.lines)
        if (const std::string_view value = afterFirst(std::string_view(line), "PBSZ=", IfNotFoundReturn::none);
            !value.empty() && isDigit(value[0]))
            negotiatedSize = stringTo<uint64_t>(value);

    bufferSize_ = negotiatedSize;
    return negotiatedSize;
}


void SecureDataNegotiator::execPROT(ProtectionLevel level) //throw ConnectionError, ProtocolError
{
    if (!bufferSize_) //"The PBSZ command must be issued [...] before the PROT command"
        execPBSZ(0); //throw ConnectionError, ProtocolError

    protLevel_.reset();

    const FtpReply reply = control_.executeCommand("PROT", getProtectionLevelToken(level)); //throw ConnectionError, ProtocolError
    if (classifyReply(reply.code) != ReplyClass::positiveCompletion)
        throw ProtocolError("Data channel protection level was not accepted. " + formatFtpReply(reply), reply.code);

    protLevel_ = level;
}


void SecureDataNegotiator::execPROT(const std::string& levelToken) //throw ConnectionError, ProtocolError
{
    ProtectionLevel level = ProtectionLevel::priv;
    try
    {
        level = parseProtectionLevel(levelToken); //throw SysError
    }
    catch (const SysError& e) { throw ProtocolError(e.toString(), 0); }

    execPROT(level); //throw ConnectionError, ProtocolError
}


void SecureDataNegotiator::ensureNegotiated(ProtectionLevel defaultLevel) //throw ConnectionError, ProtocolError
{
    if (protLevel_)
        return;

    if (!bufferSize_)
        execPBSZ(0); //throw ConnectionError, ProtocolError

    execPROT(defaultLevel); //throw ConnectionError, ProtocolError
}


void SecureDataNegotiator::reset()
{
    bufferSize_.reset();
    protLevel_.reset();
}
