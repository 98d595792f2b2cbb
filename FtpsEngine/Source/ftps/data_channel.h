// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef DATA_CHANNEL_H_5529018374650192834
#define DATA_CHANNEL_H_5529018374650192834

#include "secure_data.h"


namespace ftps
{
enum class DataIntent
{
    list,        //LIST
    machineList, //MLSD
    nameList,    //NLST
    retrieve,    //RETR
    store,       //STOR
};
const char* getTransferVerb(DataIntent intent);


//per-operation data connection: closed unconditionally on destruction
class DataConnection
{
    struct PassKey { explicit PassKey() = default; }; //construction by DataChannelFactory only

public:
    DataConnection(PassKey, std::unique_ptr<fse::Socket>&& socket, DataConnectionMode mode, SessionLog& log); //throw SysError
    ~DataConnection();

    size_t tryRead(void* buffer, size_t bytesToRead); //throw DataConnectionError; may return short, only 0 means EOF!
    void write(const void* buffer, size_t bytesToWrite); //throw DataConnectionError

    std::string readAll(); //throw DataConnectionError

    //orderly shutdown: TLS close_notify + TCP FIN; required for uploads
    void close(); //throw DataConnectionError

    //unblock tryRead()/write() from another thread
    void abort(); //noexcept

    DataConnectionMode getMode() const { return mode_; }
    const fse::SocketAddress& getLocalEndpoint () const { return localEndpoint_; }
    const fse::SocketAddress& getRemoteEndpoint() const { return remoteEndpoint_; }
    bool isProtected() const { return static_cast<bool>(tls_); }
    bool isSessionReused() const { return tls_ && tls_->isSessionReused(); }

private:
    friend class DataChannelFactory;

    DataConnection           (const DataConnection&) = delete;
    DataConnection& operator=(const DataConnection&) = delete;

    std::unique_ptr<fse::Socket> socket_;
    std::unique_ptr<fse::TlsStream> tls_;
    const DataConnectionMode mode_;
    fse::SocketAddress localEndpoint_;
    fse::SocketAddress remoteEndpoint_;
    bool eofReached_ = false;
    bool closed_ = false;
    SessionLog& log_;
};


class DataChannelFactory
{
public:
    DataChannelFactory(ControlChannel& control, SecureDataNegotiator& secureData) : control_(control), secureData_(secureData) {}

    void setDataConnectionMode(DataConnectionMode mode) { mode_ = mode; }
    DataConnectionMode getDataConnectionMode() const { return mode_; }

    //pathname may be empty for listings of the current directory
    //on success the transfer command's completion reply is pending: see ControlChannel::completePendingCommand()
    std::unique_ptr<DataConnection> openDataConnection(DataIntent intent, const std::string& pathname); //throw ConnectionError, ProtocolError, NotFoundError, DataConnectionError, SecurityError

private:
    DataChannelFactory           (const DataChannelFactory&) = delete;
    DataChannelFactory& operator=(const DataChannelFactory&) = delete;

    std::unique_ptr<fse::Socket> connectPassive(); //throw ConnectionError, ProtocolError, DataConnectionError
    std::unique_ptr<fse::ServerSocket> listenActive(); //throw ConnectionError, ProtocolError, DataConnectionError

    void startTransfer(DataIntent intent, const std::string& pathname); //throw ConnectionError, ProtocolError, NotFoundError, DataConnectionError
    void secureDataConnection(DataConnection& conn); //throw DataConnectionError, SecurityError
    void abandonPendingTransfer(); //noexcept

    ControlChannel& control_;
    SecureDataNegotiator& secureData_;
    DataConnectionMode mode_ = DataConnectionMode::passive;
};


//PASV/EPSV/PORT/EPRT encoding (RFC 959, RFC 2428)
fse::SocketAddress parsePasvReply(const FtpReply& reply); //throw SysError; 227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)
uint16_t parseEpsvReply(const FtpReply& reply); //throw SysError; 229 Entering Extended Passive Mode (|||port|)
std::string formatPortArgument(const fse::SocketAddress& addr); //h1,h2,h3,h4,p1,p2
std::string formatEprtArgument(const fse::SocketAddress& addr); //|2|::1|port|

bool isRoutableIpAddress(const std::string& ip);
}

#endif //DATA_CHANNEL_H_5529018374650192834
