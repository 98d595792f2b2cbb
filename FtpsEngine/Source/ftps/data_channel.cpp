// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "data_channel.h"

using namespace fse;
using namespace ftps;


namespace
{
const size_t FTP_BLOCK_SIZE_DOWNLOAD = 64 * 1024;


std::chrono::milliseconds toMs(std::chrono::seconds sec) { return std::chrono::duration_cast<std::chrono::milliseconds>(sec); }
}


const char* ftps::getTransferVerb(DataIntent intent)
{
    switch (intent)
    {
        //*INDENT-OFF*
        case DataIntent::list:        return "LIST";
        case DataIntent::machineList: return "MLSD";
        case DataIntent::nameList:    return "NLST";
        case DataIntent::retrieve:    return "RETR";
        case DataIntent::store:       return "STOR";
        //*INDENT-ON*
    }
    assert(false);
    return "LIST";
}


SocketAddress ftps::parsePasvReply(const FtpReply& reply) //throw SysError
{
    //"227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)." parenthesis are optional according to RFC 1123, 4.1.2.6
    const std::string text = reply.lines.empty() ? std::string() : reply.lines.back();

    auto itFirst = std::find_if(text.begin() + std::min<size_t>(text.size(), 4), text.end(), [](char c) { return isDigit(c); });
    auto itLast  = std::find_if_not(itFirst, text.end(), [](char c) { return isDigit(c) || c == ','; });

    const std::vector<std::string> numbers = splitCpy(makeStringView(itFirst, itLast), ',', SplitOnEmpty::allow);
    if (numbers.size() != 6)
        throw SysError("Unexpected PASV response. (" + text + ')');

    int values[6] = {};
    for (size_t i = 0; i < 6; ++i)
    {
        if (numbers[i].empty() || numbers[i].size() > 3)
            throw SysError("Unexpected PASV response. (" + text + ')');

        values[i] = stringTo<int>(numbers[i]);
        if (values[i] > 255)
            throw SysError("Unexpected PASV response. (" + text + ')');
    }

    SocketAddress addr;
    addr.ip = numberTo<std::string>(values[0]) + '.' + numberTo<std::string>(values[1]) + '.' +
              numberTo<std::string>(values[2]) + '.' + numberTo<std::string>(values[3]);
    addr.port = static_cast<uint16_t>(values[4] * 256 + values[5]);
    addr.family = AF_INET;
    return addr;
}


uint16_t ftps::parseEpsvReply(const FtpReply& reply) //throw SysError
{
    //"229 Entering Extended Passive Mode (|||6446|)": delimiter is the first char after '('
    const std::string text = reply.lines.empty() ? std::string() : reply.lines.back();

    const std::string_view args = afterFirst(std::string_view(text), '(', IfNotFoundReturn::none);
    if (args.size() < 5 || args[1] != args[0] || args[2] != args[0])
        throw SysError("Unexpected EPSV response. (" + text + ')');

    const char delim = args[0];
    const std::string_view portStr = beforeFirst(args.substr(3), delim, IfNotFoundReturn::none);

    if (portStr.empty() || portStr.size() > 5 || !std::all_of(portStr.begin(), portStr.end(), [](char c) { return isDigit(c); }))
        throw SysError("Unexpected EPSV response. (" + text + ')');

    const int port = stringTo<int>(portStr);
    if (port <= 0 || port > 65535)
        throw SysError("Unexpected EPSV response. (" + text + ')');

    return static_cast<uint16_t>(port);
}


std::string ftps::formatPortArgument(const SocketAddress& addr)
{
    return replaceCpy(addr.ip, ".", ",") + ',' + numberTo<std::string>(addr.port / 256) + ',' + numberTo<std::string>(addr.port % 256);
}


std::string ftps::formatEprtArgument(const SocketAddress& addr)
{
    return std::string(addr.family == AF_INET6 ? "|2|" : "|1|") + addr.ip + '|' + numberTo<std::string>(addr.port) + '|';
}


bool ftps::isRoutableIpAddress(const std::string& ip)
{
    in_addr addr4 = {};
    if (::inet_pton(AF_INET, ip.c_str(), &addr4) == 1)
    {
        const uint32_t a = ntohl(addr4.s_addr);
        return !((a >> 24) == 0   ||                //0.0.0.0/8
                 (a >> 24) == 10  ||                //10.0.0.0/8
                 (a >> 24) == 127 ||                //127.0.0.0/8
                 (a >> 20) == ((172u << 4) | 1) ||  //172.16.0.0/12
                 (a >> 16) == ((192u << 8) | 168) ||//192.168.0.0/16
                 (a >> 16) == ((169u << 8) | 254)); //169.254.0.0/16
    }

    in6_addr addr6 = {};
    if (::inet_pton(AF_INET6, ip.c_str(), &addr6) == 1)
        return !(IN6_IS_ADDR_LOOPBACK(&addr6) || IN6_IS_ADDR_LINKLOCAL(&addr6) || IN6_IS_ADDR_SITELOCAL(&addr6) ||
                 IN6_IS_ADDR_UNSPECIFIED(&addr6) ||
                 (addr6.s6_addr[0] & 0xfe) == 0xfc); //fc00::/7 unique local

    return false;
}

//==============================================================================================

DataConnection::DataConnection(PassKey, std::unique_ptr<Socket>&& socket, DataConnectionMode mode, SessionLog& log) : //throw SysError
    socket_(std::move(socket)),
    mode_(mode),
    log_(log)
{
    localEndpoint_  = getLocalAddress(socket_->get()); //throw SysError
    remoteEndpoint_ = getPeerAddress (socket_->get()); //
}


DataConnection::~DataConnection()
{
    //close_notify only for orderly close(): a failed transfer just drops the connection (session stays resumable)
    tls_.reset();
    socket_.reset();
}


size_t DataConnection::tryRead(void* buffer, size_t bytesToRead) //throw DataConnectionError
{
    try
    {
        const size_t bytesRead = tls_ ?
                                 tls_->tryRead(buffer, bytesToRead) : //throw SysError
                                 tryReadSocket(socket_->get(), buffer, bytesToRead); //
        if (bytesRead == 0)
            eofReached_ = true;
        return bytesRead;
    }
    catch (const SysError& e) { throw DataConnectionError("Data transfer failed. (" + remoteEndpoint_.ip + ")\n\n" + e.toString()); }
}


void DataConnection::write(const void* buffer, size_t bytesToWrite) //throw DataConnectionError
{
    try
    {
        const char* const data = static_cast<const char*>(buffer);

        for (size_t bytesWritten = 0; bytesWritten < bytesToWrite; )
            bytesWritten += tls_ ?
                            tls_->tryWrite(data + bytesWritten, bytesToWrite - bytesWritten) : //throw SysError
                            tryWriteSocket(socket_->get(), data + bytesWritten, bytesToWrite - bytesWritten); //
    }
    catch (const SysError& e) { throw DataConnectionError("Data transfer failed. (" + remoteEndpoint_.ip + ")\n\n" + e.toString()); }
}


std::string DataConnection::readAll() //throw DataConnectionError
{
    std::string output;
    std::vector<char> buffer(FTP_BLOCK_SIZE_DOWNLOAD);

    for (;;)
    {
        const size_t bytesRead = tryRead(buffer.data(), buffer.size()); //throw DataConnectionError
        if (bytesRead == 0) //end of file
            return output;

        output.append(buffer.data(), bytesRead);
    }
}


void DataConnection::close() //throw DataConnectionError
{
    if (closed_)
        return;
    closed_ = true;

    try
    {
        if (tls_)
            tls_->shutdown(); //throw SysError

        shutdownSocketSend(socket_->get()); //throw SysError
    }
    catch (const SysError& e)
    {
        if (!eofReached_)
            throw DataConnectionError("Closing data connection failed. (" + remoteEndpoint_.ip + ")\n\n" + e.toString());

        //download complete: server may have closed its end already
        log_.logWarning("Closing data connection failed: " + e.toString());
    }
}


void DataConnection::abort() //noexcept
{
    try
    {
        socket_->shutdownBoth(); //throw SysError
    }
    catch (const SysError& e) { log_.logWarning("Aborting data connection failed: " + e.toString()); }
}

//==============================================================================================

std::unique_ptr<DataConnection> DataChannelFactory::openDataConnection(DataIntent intent, const std::string& pathname) //throw ConnectionError, ProtocolError, NotFoundError, DataConnectionError, SecurityError
{
    //protection must be in place *before* PASV/PORT: PROT is rejected while a transfer is pending
    secureData_.ensureNegotiated(ProtectionLevel::priv); //throw ConnectionError, ProtocolError

    SessionLog& log = control_.getLog();
    std::unique_ptr<DataConnection> conn;

    if (mode_ == DataConnectionMode::passive)
    {
        std::unique_ptr<Socket> socket = connectPassive(); //throw ConnectionError, ProtocolError, DataConnectionError
        try
        {
            conn = std::make_unique<DataConnection>(DataConnection::PassKey(), std::move(socket), mode_, log); //throw SysError
        }
        catch (const SysError& e) { throw DataConnectionError("Cannot open data connection.\n\n" + e.toString()); }

        startTransfer(intent, pathname); //throw ConnectionError, ProtocolError, NotFoundError, DataConnectionError
    }
    else
    {
        std::unique_ptr<ServerSocket> listener = listenActive(); //throw ConnectionError, ProtocolError, DataConnectionError

        startTransfer(intent, pathname); //throw ConnectionError, ProtocolError, NotFoundError, DataConnectionError
        FSE_ON_SCOPE_FAIL(abandonPendingTransfer());

        try
        {
            std::unique_ptr<Socket> socket = listener->accept(toMs(control_.getConnectTimeout())); //throw SysError
            conn = std::make_unique<DataConnection>(DataConnection::PassKey(), std::move(socket), mode_, log); //throw SysError
        }
        catch (const SysError& e) { throw DataConnectionError("Server did not open the data connection.\n\n" + e.toString()); }
    }

    //drop the data connection *before* waiting for the server's failure reply
    FSE_ON_SCOPE_FAIL(conn.reset(); abandonPendingTransfer());

    if (secureData_.getProtectionLevel() == ProtectionLevel::priv)
        secureDataConnection(*conn); //throw DataConnectionError, SecurityError

    try
    {
        conn->socket_->setIoTimeout(control_.getDataTimeout()); //throw SysError; 0: block indefinitely
    }
    catch (const SysError& e) { throw DataConnectionError("Cannot configure data connection.\n\n" + e.toString()); }

    log.logInfo(std::string(mode_ == DataConnectionMode::passive ? "Passive" : "Active") + " data connection " +
                conn->getLocalEndpoint().ip + ':' + numberTo<std::string>(conn->getLocalEndpoint().port) + " <-> " +
                conn->getRemoteEndpoint().ip + ':' + numberTo<std::string>(conn->getRemoteEndpoint().port) +
                (conn->isProtected() ? conn->isSessionReused() ? " (TLS session resumed)" : " (TLS new session)" : " (clear)"));
    return conn;
}


std::unique_ptr<Socket> DataChannelFactory::connectPassive() //throw ConnectionError, ProtocolError, DataConnectionError
{
    SocketAddress dataAddr;

    if (control_.getLocalAddress().family == AF_INET6) //RFC 2428: PASV is IPv4 only
    {
        const FtpReply reply = control_.executeCommand("EPSV"); //throw ConnectionError, ProtocolError
        if (reply.code != 229)
            throw DataConnectionError("Server refused passive mode. " + formatFtpReply(reply));

        dataAddr.ip = control_.getRemoteAddress();
        dataAddr.family = AF_INET6;
        try
        {
            dataAddr.port = parseEpsvReply(reply); //throw SysError
        }
        catch (const SysError& e) { throw ProtocolError(e.toString(), reply.code); }
    }
    else
    {
        const FtpReply reply = control_.executeCommand("PASV"); //throw ConnectionError, ProtocolError
        if (reply.code != 227)
            throw DataConnectionError("Server refused passive mode. " + formatFtpReply(reply));
        try
        {
            dataAddr = parsePasvReply(reply); //throw SysError
        }
        catch (const SysError& e) { throw ProtocolError(e.toString(), reply.code); }

        //servers behind NAT: "0.0.0.0" or their LAN address => same host as control connection
        const std::string& peerIp = control_.getRemoteAddress();
        if (dataAddr.ip == "0.0.0.0" ||
            (!isRoutableIpAddress(dataAddr.ip) && isRoutableIpAddress(peerIp)))
        {
            control_.getLog().logInfo("Passive mode address " + dataAddr.ip + " replaced by " + peerIp);
            dataAddr.ip = peerIp;
        }
    }

    try
    {
        return std::make_unique<Socket>(dataAddr.ip, numberTo<std::string>(dataAddr.port), toMs(control_.getConnectTimeout())); //throw SysError
    }
    catch (const SysError& e) { throw DataConnectionError("Cannot open data connection to " + dataAddr.ip + ':' + numberTo<std::string>(dataAddr.port) + ".\n\n" + e.toString()); }
}


std::unique_ptr<ServerSocket> DataChannelFactory::listenActive() //throw ConnectionError, ProtocolError, DataConnectionError
{
    const SocketAddress& localAddr = control_.getLocalAddress();

    std::unique_ptr<ServerSocket> listener;
    try
    {
        listener = std::make_unique<ServerSocket>(localAddr.ip, 0); //throw SysError
    }
    catch (const SysError& e) { throw DataConnectionError("Cannot listen for data connection on " + localAddr.ip + ".\n\n" + e.toString()); }

    SocketAddress listenAddr = localAddr;
    listenAddr.port = listener->getPort();

    const FtpReply reply = localAddr.family == AF_INET6 ?
                           control_.executeCommand("EPRT", formatEprtArgument(listenAddr)) : //throw ConnectionError, ProtocolError
                           control_.executeCommand("PORT", formatPortArgument(listenAddr));  //
    if (classifyReply(reply.code) != ReplyClass::positiveCompletion)
        throw DataConnectionError("Server refused active mode. " + formatFtpReply(reply));

    return listener;
}


void DataChannelFactory::startTransfer(DataIntent intent, const std::string& pathname) //throw ConnectionError, ProtocolError, NotFoundError, DataConnectionError
{
    const FtpReply reply = control_.startTransferCommand(getTransferVerb(intent), pathname); //throw ConnectionError, ProtocolError

    if (classifyReply(reply.code) == ReplyClass::positivePreliminary) //"150 Opening BINARY mode data connection", "125 Data connection already open"
        return;

    if (reply.code == 550)
        throw NotFoundError((pathname.empty() ? std::string(getTransferVerb(intent)) : pathname) + ": " + formatFtpReply(reply), reply.code);

    if (reply.code == 425 || reply.code == 426)
        throw DataConnectionError(formatFtpReply(reply));

    throw ProtocolError("Unexpected reply to " + std::string(getTransferVerb(intent)) + ". " + formatFtpReply(reply), reply.code);
}


void DataChannelFactory::secureDataConnection(DataConnection& conn) //throw DataConnectionError, SecurityError
{
    try
    {
        //handshake bounded by the connect timeout, not the data timeout
        conn.socket_->setIoTimeout(toMs(control_.getConnectTimeout())); //throw SysError

        //RFC 4217, 10.2: resume the control connection's session => binds data to the authenticated control peer
        conn.tls_ = std::make_unique<TlsStream>(control_.getTlsContext(), conn.socket_->get(), control_.getHost(), control_.getTlsSession()); //throw SysError, ConnectionError
    }
    catch (const ConnectionError&) { throw DataConnectionError("Control connection is closed."); }
    catch (const SysError& e) { throw DataConnectionError("TLS handshake on data connection failed.\n\n" + e.toString()); }

    //evaluated for *each* connection: session resumption doesn't imply an identity check
    if (control_.isEndpointCheckingEnabled())
    {
        bool matches = false;
        try
        {
            matches = conn.tls_->peerMatchesHost(control_.getHost()); //throw SysError
        }
        catch (const SysError& e) { throw SecurityError("Data connection certificate could not be checked for " + control_.getHost() + ".\n\n" + e.toString()); }

        if (!matches)
            throw SecurityError("Data connection certificate does not match host name " + control_.getHost() + '.');
    }
}


void DataChannelFactory::abandonPendingTransfer() //noexcept
{
    if (control_.hasPendingCommand())
        try
        {
            //the server reports the failed transfer (e.g. "425 Can't open data connection") => keep reply order in sync
            control_.completePendingCommand(); //throw ConnectionError, ProtocolError
        }
        catch (const SysError& e) { control_.getLog().logWarning("Reading transfer reply failed: " + e.toString()); }
}
