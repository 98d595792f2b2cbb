// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ftps_client.h"
#include <csignal>
#include <fse/scope_guard.h>

using namespace fse;
using namespace ftps;


namespace
{
const size_t FTP_BLOCK_SIZE_DOWNLOAD = 64 * 1024;
const size_t FTP_BLOCK_SIZE_UPLOAD   = 64 * 1024;


std::optional<std::chrono::milliseconds> toOptionalTimeout(std::chrono::milliseconds timeout)
{
    if (timeout > std::chrono::milliseconds(0))
        return timeout;
    return std::nullopt;
}


//classify reply of a command that expects 2yz; 550 denotes a missing path
void checkPathReply(const FtpReply& reply, const std::string& pathname, const std::string& context) //throw ProtocolError, NotFoundError
{
    if (classifyReply(reply.code) == ReplyClass::positiveCompletion) //throw ProtocolError
        return;
    if (reply.code == 550)
        throw NotFoundError(pathname + ": " + formatFtpReply(reply), reply.code);

    throw ProtocolError(context + ' ' + formatFtpReply(reply), reply.code);
}
}


void ftps::ftpsInit() //throw SysError
{
    openSslInit();

    if (::signal(SIGPIPE, SIG_IGN) == SIG_ERR)
        THROW_LAST_SYS_ERROR("signal(SIGPIPE)");
}


FtpsClient::FtpsClient(TlsMode tlsMode) :
    control_(tlsMode, log_)
{
    login_.tlsMode = tlsMode;
}


FtpsClient::FtpsClient(const FtpsLogin& login) :
    login_(login),
    keepAlivePolicy_(login.keepAlivePolicy),
    control_(login.tlsMode, log_)
{
    using namespace std::chrono;
    control_.setConnectTimeout(seconds(login.timeoutSec));
    control_.setControlKeepAliveTimeout     (toOptionalTimeout(seconds(login.keepAliveSec)));
    control_.setControlKeepAliveReplyTimeout(toOptionalTimeout(milliseconds(login.keepAliveReplyMs)));
    control_.setDataTimeout                 (toOptionalTimeout(seconds(login.dataTimeoutSec)));
    control_.setEndpointCheckingEnabled(login.endpointCheck);
    control_.setTrustedCaFile(login.caFile);
    dataFactory_.setDataConnectionMode(login.dataMode);
}


FtpsClient::~FtpsClient()
{
    disconnect(); //noexcept
}


void FtpsClient::connect(const std::string& host, uint16_t port) //throw ConnectionError, ProtocolError, SecurityError
{
    //new control connection => new protection state, new FEAT
    secureData_.reset();
    features_.reset();
    controlDegraded_ = false;
    lastDataSessionReused_ = false;

    try
    {
        control_.connect(host, port); //throw ConnectionError, ProtocolError, SecurityError
    }
    catch (const SysError& e)
    {
        log_.logError(e.toString());
        throw;
    }
    log_.logInfo("Connected to " + host + ':' + numberTo<std::string>(port) + " (" + control_.getTlsDescription() + ')');
}


void FtpsClient::connect() //throw ConnectionError, ProtocolError, SecurityError
{
    if (login_.server.empty())
        throw ConnectionError("Server name must not be empty.");

    connect(login_.server, getEffectivePort(login_)); //throw ConnectionError, ProtocolError, SecurityError
}


bool FtpsClient::login(const std::string& user, const std::string& pass) //throw ConnectionError, ProtocolError
{
    const bool loggedIn = control_.login(user, pass); //throw ConnectionError, ProtocolError
    if (!loggedIn)
        log_.logError("Login failed for user \"" + user + "\". " + control_.getReplyString());
    return loggedIn;
}


bool FtpsClient::login() //throw ConnectionError, ProtocolError
{
    if (login_.username.empty())
        return login("anonymous", login_.password); //throw ConnectionError, ProtocolError

    return login(login_.username, login_.password); //throw ConnectionError, ProtocolError
}


bool FtpsClient::logout() //throw ConnectionError, ProtocolError
{
    const FtpReply reply = control_.executeCommand("QUIT"); //throw ConnectionError, ProtocolError
    control_.close(); //noexcept
    return classifyReply(reply.code) == ReplyClass::positiveCompletion; //throw ProtocolError
}


void FtpsClient::disconnect() //noexcept
{
    control_.disconnect(); //noexcept
}


void FtpsClient::abort() //noexcept
{
    {
        std::lock_guard dummy(lockActiveData_);
        if (activeData_)
            activeData_->abort(); //noexcept
    }
    control_.abort(); //noexcept
    log_.logWarning("Operation aborted.");
}


FtpReply FtpsClient::sendCommand(const std::string& cmdLine) //throw ConnectionError, ProtocolError
{
    const std::string verb = beforeFirst(cmdLine, ' ', IfNotFoundReturn::all);
    const std::string args = afterFirst (cmdLine, ' ', IfNotFoundReturn::none);
    return control_.executeCommand(verb, args); //throw ConnectionError, ProtocolError
}


void FtpsClient::setFileType(TransferType type) //throw ConnectionError, ProtocolError
{
    const FtpReply reply = control_.executeCommand("TYPE", type == TransferType::binary ? "I" : "A"); //throw ConnectionError, ProtocolError

    if (classifyReply(reply.code) != ReplyClass::positiveCompletion) //throw ProtocolError
        throw ProtocolError("Failed to set transfer type. " + formatFtpReply(reply), reply.code);
}

//==============================================================================================

FtpReply FtpsClient::runDataOperation(DataIntent intent, const std::string& pathname, const std::function<void(DataConnection& conn)>& transfer /*throw X*/)
{
    std::unique_ptr<DataConnection> conn;
    try
    {
        conn = dataFactory_.openDataConnection(intent, pathname); //throw ConnectionError, ProtocolError, NotFoundError, DataConnectionError, SecurityError
    }
    catch (const SysError& e)
    {
        log_.logError(e.toString());
        throw;
    }
    lastDataSessionReused_ = conn->isSessionReused();
    {
        std::lock_guard dummy(lockActiveData_);
        activeData_ = conn.get();
    }
    FSE_ON_SCOPE_EXIT(std::lock_guard dummy(lockActiveData_); activeData_ = nullptr);

    //close the data connection *before* waiting for the server's reply
    FSE_ON_SCOPE_FAIL(if (conn) conn->abort(); abandonDataOperation(intent));

    bool degraded = false;
    std::string degradationMsg;
    {
        KeepAliveMonitor keepAlive(control_);
        //failed transfers leave the control connection just as degraded
        FSE_ON_SCOPE_EXIT(keepAlive.stop(); degraded = keepAlive.isDegraded(); degradationMsg = keepAlive.getDegradationMessage(); if (degraded) controlDegraded_ = true);

        transfer(*conn); //throw DataConnectionError, X
        conn->close();   //throw DataConnectionError
    }
    {
        std::lock_guard dummy(lockActiveData_);
        activeData_ = nullptr;
    }
    conn.reset();

    const FtpReply reply = control_.completePendingCommand(); //throw ConnectionError, ProtocolError

    if (classifyReply(reply.code) != ReplyClass::positiveCompletion) //throw ProtocolError
    {
        if (reply.code == 550)
            throw NotFoundError((pathname.empty() ? std::string(getTransferVerb(intent)) : pathname) + ": " + formatFtpReply(reply), reply.code);
        if (reply.code == 425 || reply.code == 426)
            throw DataConnectionError("Data transfer failed. " + formatFtpReply(reply));

        throw ProtocolError("Unexpected reply to " + std::string(getTransferVerb(intent)) + ". " + formatFtpReply(reply), reply.code);
    }

    //keep-alive failures surface only after the data operation is complete
    if (degraded)
    {
        if (keepAlivePolicy_ == KeepAlivePolicy::failAfterTransfer)
            throw ConnectionError("Control connection keep-alive failed during data transfer.\n\n" + degradationMsg);

        log_.logWarning("Control connection is degraded: keep-alive failed during data transfer.");
    }
    return reply;
}


void FtpsClient::abandonDataOperation(DataIntent intent) //noexcept
{
    log_.logError(std::string(getTransferVerb(intent)) + " failed.");

    if (control_.hasPendingCommand())
        try
        {
            //e.g. "426 Connection closed; transfer aborted." => keep reply order in sync for the next command
            const FtpReply reply = control_.completePendingCommand(); //throw ConnectionError, ProtocolError
            log_.logInfo("Transfer completion after failure: " + formatFtpReply(reply));
        }
        catch (const SysError& e) { log_.logWarning("Reading transfer reply failed: " + e.toString()); }
}


std::vector<FtpFile> FtpsClient::listFiles(const std::optional<std::string>& pathname)
{
    //MLSD: exact UTC times, machine-readable facts; LIST: anything goes
    const bool useMlsd = features_.hasFeature(FtpCommand::mlst); //throw ConnectionError, ProtocolError
    const DataIntent intent = useMlsd ? DataIntent::machineList : DataIntent::list;

    std::string rawListing;
    runDataOperation(intent, pathname ? *pathname : std::string(), [&](DataConnection& conn)
    {
        rawListing = conn.readAll(); //throw DataConnectionError
    });

    try
    {
        return useMlsd ? parseMlsdListing(rawListing) : parseListListing(rawListing); //throw SysError
    }
    catch (const SysError& e) { throw ProtocolError(e.toString(), control_.getReplyCode()); }
}


std::vector<std::string> FtpsClient::listNames(const std::optional<std::string>& pathname)
{
    std::string rawListing;
    runDataOperation(DataIntent::nameList, pathname ? *pathname : std::string(), [&](DataConnection& conn)
    {
        rawListing = conn.readAll(); //throw DataConnectionError
    });
    return parseNameListing(rawListing);
}


uint64_t FtpsClient::retrieveFile(const std::string& pathname, const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/)
{
    uint64_t totalBytes = 0;
    runDataOperation(DataIntent::retrieve, pathname, [&](DataConnection& conn)
    {
        std::vector<char> buffer(FTP_BLOCK_SIZE_DOWNLOAD);
        for (;;)
        {
            const size_t bytesRead = conn.tryRead(buffer.data(), buffer.size()); //throw DataConnectionError
            if (bytesRead == 0) //EOF
                break;

            writeBlock(buffer.data(), bytesRead); //throw X
            totalBytes += bytesRead;
        }
    });
    return totalBytes;
}


uint64_t FtpsClient::storeFile(const std::string& pathname, const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock /*throw X*/)
{
    uint64_t totalBytes = 0;
    runDataOperation(DataIntent::store, pathname, [&](DataConnection& conn)
    {
        std::vector<char> buffer(FTP_BLOCK_SIZE_UPLOAD);
        for (;;)
        {
            const size_t bytesRead = readBlock(buffer.data(), buffer.size()); //throw X
            if (bytesRead == 0)
                break;

            conn.write(buffer.data(), bytesRead); //throw DataConnectionError
            totalBytes += bytesRead;
        }
    });
    return totalBytes;
}

//==============================================================================================

uint64_t FtpsClient::getFileSize(const std::string& pathname) //throw ConnectionError, ProtocolError, NotFoundError
{
    //https://tools.ietf.org/html/rfc3659#section-4
    const FtpReply reply = control_.executeCommand("SIZE", pathname); //throw ConnectionError, ProtocolError

    if (reply.code == 550) //e.g. "550 I can only retrieve regular files"
        throw NotFoundError(pathname + ": " + formatFtpReply(reply), reply.code);

    if (reply.code == 213 && !reply.lines.empty())
    {
        const std::string& line = reply.lines.back(); //213<space>[rubbish]<file size>
        if (!line.empty() && isDigit(line.back()))
        {
            auto it = std::find_if(line.rbegin(), line.rend(), [](const char c) { return !isDigit(c); });
            return stringTo<uint64_t>(makeStringView(it.base(), line.end()));
        }
    }
    throw ProtocolError("Unexpected FTP response. (" + reply.getText() + ')', reply.code);
}


std::string FtpsClient::printWorkingDirectory() //throw ConnectionError, ProtocolError
{
    const FtpReply reply = control_.executeCommand("PWD"); //throw ConnectionError, ProtocolError

    if (reply.code == 257 && !reply.lines.empty())
    {
        /* 257<space>[rubbish]"<directory-name>"<space><commentary>

           "The directory name can contain any character; embedded double-quotes should be escaped by
            double-quotes (the "quote-doubling" convention)." https://tools.ietf.org/html/rfc959      */
        const std::string& line = reply.lines[0];

        auto itBegin = std::find(line.begin(), line.end(), '"');
        if (itBegin != line.end())
            for (auto it = ++itBegin; it != line.end(); ++it)
                if (*it == '"')
                {
                    if (it + 1 != line.end() && it[1] == '"')
                        ++it; //skip double quote
                    else
                        return replaceCpy(std::string(itBegin, it), "\"\"", "\"");
                }
    }
    throw ProtocolError("Unexpected FTP response. (" + reply.getText() + ')', reply.code);
}


void FtpsClient::changeWorkingDirectory(const std::string& pathname) //throw ConnectionError, ProtocolError, NotFoundError
{
    const FtpReply reply = control_.executeCommand("CWD", pathname); //throw ConnectionError, ProtocolError
    checkPathReply(reply, pathname, "Cannot change working directory."); //throw ProtocolError, NotFoundError
}


void FtpsClient::setModificationTime(const std::string& pathname, std::chrono::system_clock::time_point modTime) //throw ConnectionError, ProtocolError, NotFoundError
{
    //"Where a server-FTP process supports the MFMT command [...] it MUST include the response to the FEAT command"
    if (!features_.hasFeature(FtpCommand::mfmt)) //throw ConnectionError, ProtocolError
        throw ProtocolError("Server does not support the MFMT command.", 0);

    FtpTimestamp ts;
    try
    {
        ts = makeFtpTimestamp(modTime); //throw SysError
    }
    catch (const SysError& e) { throw ProtocolError(e.toString(), 0); }

    timestamps_.setModificationTime(pathname, ts); //throw ConnectionError, ProtocolError, NotFoundError
}
