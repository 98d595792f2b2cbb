// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SECURE_DATA_H_7720193847560192837
#define SECURE_DATA_H_7720193847560192837

#include "control_channel.h"


namespace ftps
{
//data channel protection (RFC 2228, RFC 4217 section 9): PBSZ first, then PROT
class SecureDataNegotiator
{
public:
    explicit SecureDataNegotiator(ControlChannel& control) : control_(control) {}

    //always sent to the server: protection state is authoritative on the server side
    uint64_t execPBSZ(uint64_t size); //throw ConnectionError, ProtocolError; returns negotiated size
    void execPROT(ProtectionLevel level); //throw ConnectionError, ProtocolError
    void execPROT(const std::string& levelToken); //throw ConnectionError, ProtocolError; "C" or "P"

    //before the first data connection: PBSZ 0 + PROT, unless negotiated already
    void ensureNegotiated(ProtectionLevel defaultLevel); //throw ConnectionError, ProtocolError

    std::optional<ProtectionLevel> getProtectionLevel() const { return protLevel_; }
    std::optional<uint64_t> getBufferSize() const { return bufferSize_; }

    void reset(); //new control connection

private:
    SecureDataNegotiator           (const SecureDataNegotiator&) = delete;
    SecureDataNegotiator& operator=(const SecureDataNegotiator&) = delete;

    ControlChannel& control_;

    std::optional<uint64_t> bufferSize_;       //confirmed by server
    std::optional<ProtectionLevel> protLevel_; //
};
}

#endif //SECURE_DATA_H_7720193847560192837
