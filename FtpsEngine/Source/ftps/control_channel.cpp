// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "control_channel.h"
#include <algorithm>
#include <fse/thread.h>
#include <fse/extra_log.h>

using namespace fse;
using namespace ftps;


namespace
{
const size_t FTP_MAX_LINE_LENGTH = 64 * 1024; //rogue server: don't buffer forever
const size_t FTP_RECV_BLOCK_SIZE = 4096;

//keep-alive waits for its reply in slices: stays responsive to KeepAliveMonitor::stop()
const std::chrono::milliseconds KEEP_ALIVE_WAIT_SLICE(100);


std::string formatEndpoint(const std::string& host, uint16_t port)
{
    if (contains(host, ':')) //IPv6 literal
        return '[' + host + "]:" + numberTo<std::string>(port);
    return host + ':' + numberTo<std::string>(port);
}
}


ControlChannel::ControlChannel(TlsMode tlsMode, SessionLog& log) : tlsMode_(tlsMode), log_(log) {}


ControlChannel::~ControlChannel()
{
    disconnect(); //noexcept
}


void ControlChannel::setConnectTimeout(std::chrono::seconds timeout)
{
    connectTimeout_ = std::max(timeout, std::chrono::seconds(1));

    std::lock_guard dummy(lockControl_);
    if (socket_)
        try
        {
            socket_->setIoTimeout(connectTimeout_); //throw SysError
        }
        catch (const SysError& e) { log_.logWarning(e.toString()); }
}


void ControlChannel::connect(const std::string& host, uint16_t port) //throw ConnectionError, ProtocolError, SecurityError
{
    std::lock_guard dummy(lockControl_);

    if (socket_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    host_ = host;
    recvBuf_.clear();
    replyParser_ = FtpReplyParser();
    lastReply_ = FtpReply();
    outstandingNoops_ = 0;
    pendingCompletion_ = false;
    stashedCompletion_.reset();

    log_.logInfo("Connecting to " + formatEndpoint(host, port) + (tlsMode_ == TlsMode::implicitTls ? " (implicit TLS)" : " (explicit TLS)"));
    try
    {
        auto tlsCtx = std::make_unique<TlsContext>(TlsRole::client); //throw SysError
        if (!caFile_.empty())
            tlsCtx->setTrustedCaFile(caFile_); //throw SysError

        auto socket = std::make_unique<Socket>(host, numberTo<std::string>(port), connectTimeout_); //throw SysError
        socket->setIoTimeout(connectTimeout_); //throw SysError

        peerAddress_  = fse::getPeerAddress (socket->get()); //throw SysError
        localAddress_ = fse::getLocalAddress(socket->get()); //

        tlsCtx_ = std::move(tlsCtx);
        std::lock_guard dummy2(lockSocket_);
        socket_ = std::move(socket);
    }
    catch (const SysError& e) { throw ConnectionError("Unable to connect to " + formatEndpoint(host, port) + ".\n\n" + e.toString()); }

    FSE_ON_SCOPE_FAIL(teardown());

    try
    {
        if (tlsMode_ == TlsMode::implicitTls)
            startTls(); //throw ConnectionError, SecurityError

        //"120 Service ready in nnn minutes." may precede the real greeting
        const FtpReply greeting = readFinalReply(); //throw SysError, ProtocolError
        lastReply_ = greeting;
        if (classifyReply(greeting.code) != ReplyClass::positiveCompletion) //throw ProtocolError
            throw ProtocolError("Server did not accept the connection. " + formatFtpReply(greeting), greeting.code);

        if (tlsMode_ == TlsMode::explicitTls)
        {
            //RFC 4217: "234 AUTH command ok. Expecting TLS Negotiation."; 334 seen with older servers
            const FtpReply authReply = runCommand("AUTH TLS"); //throw ConnectionError, ProtocolError
            if (authReply.code != 234 && authReply.code != 334)
                throw ProtocolError("Server does not support explicit TLS. " + formatFtpReply(authReply), authReply.code);

            if (!recvBuf_.empty()) //plaintext injected after the AUTH reply (CVE-2011-0411 "STARTTLS command injection")
                throw ProtocolError("Unexpected data after AUTH TLS reply.", authReply.code);

            startTls(); //throw ConnectionError, SecurityError
        }
    }
    catch (const ProtocolError&) { throw; }
    catch (const SecurityError&) { throw; }
    catch (const ConnectionError&) { throw; }
    catch (const SysError& e) { throw ConnectionError("Unable to connect to " + formatEndpoint(host, port) + ".\n\n" + e.toString()); }
}


void ControlChannel::startTls() //throw ConnectionError, SecurityError
{
    try
    {
        tls_ = std::make_unique<TlsStream>(*tlsCtx_, socket_->get(), host_, nullptr); //throw SysError
    }
    catch (const SysError& e) { throw ConnectionError("TLS handshake with " + host_ + " failed.\n\n" + e.toString()); }

    log_.logInfo("TLS established: " + tls_->getProtocolVersion() + ", " + tls_->getCipherName());

    if (endpointCheck_)
    {
        bool matches = false;
        try
        {
            matches = tls_->peerMatchesHost(host_); //throw SysError
        }
        catch (const SysError& e) { throw SecurityError("Server certificate could not be checked for " + host_ + ".\n\n" + e.toString()); }

        if (!matches)
            throw SecurityError("Server certificate does not match host name " + host_ + '.');
    }
}


bool ControlChannel::login(const std::string& user, const std::string& pass) //throw ConnectionError, ProtocolError
{
    FtpReply reply = executeCommand("USER", user); //throw ConnectionError, ProtocolError

    if (reply.code == 331) //"User name okay, need password."
        reply = executeCommand("PASS", pass); //throw ConnectionError, ProtocolError

    //332 "Need account for login." => ACCT is not supported
    return reply.code == 230 || reply.code == 202;
}


FtpReply ControlChannel::executeCommand(const std::string& verb, const std::string& args) //throw ConnectionError, ProtocolError
{
    std::lock_guard dummy(lockControl_);

    if (pendingCompletion_) //complete the transfer command first!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    FtpReply reply = runCommand(args.empty() ? verb : verb + ' ' + args); //throw ConnectionError, ProtocolError
    lastReply_ = reply;
    return reply;
}


FtpReply ControlChannel::startTransferCommand(const std::string& verb, const std::string& args) //throw ConnectionError, ProtocolError
{
    std::lock_guard dummy(lockControl_);

    if (pendingCompletion_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    FtpReply reply = runCommand(args.empty() ? verb : verb + ' ' + args); //throw ConnectionError, ProtocolError
    lastReply_ = reply;

    if (classifyReply(reply.code) == ReplyClass::positivePreliminary) //throw ProtocolError
        pendingCompletion_ = true;
    return reply;
}


FtpReply ControlChannel::completePendingCommand() //throw ConnectionError, ProtocolError
{
    std::lock_guard dummy(lockControl_);

    if (!pendingCompletion_)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    FSE_ON_SCOPE_EXIT(pendingCompletion_ = false; stashedCompletion_.reset());

    if (stashedCompletion_) //already read by the keep-alive thread
    {
        lastReply_ = *stashedCompletion_;
        return lastReply_;
    }

    checkConnected(); //throw ConnectionError
    try
    {
        for (;;)
        {
            FtpReply reply = readReply(); //throw SysError, ProtocolError

            //NOOP replies may arrive before the transfer's final reply (which is never 200)
            if (reply.code == 200 && outstandingNoops_ > 0)
            {
                --outstandingNoops_;
                continue;
            }
            lastReply_ = reply;
            return reply;
        }
    }
    catch (const ProtocolError&) { throw; }
    catch (const SysError& e) { throwConnectionError("Reading transfer completion reply", e); }
}


void ControlChannel::sendKeepAlive(std::chrono::milliseconds replyTimeout) //throw SysError, ThreadStopRequest
{
    std::lock_guard dummy(lockControl_);

    if (!socket_ || !tls_)
        throw SysError("Control connection is closed.");

    sendLine("NOOP"); //throw SysError
    ++outstandingNoops_;

    //replyTimeout == 0: wait indefinitely, i.e. not limited by the socket's I/O timeout either
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (replyTimeout > std::chrono::milliseconds(0))
        deadline = std::chrono::steady_clock::now() + replyTimeout;

    for (;;)
    {
        const auto sliceEnd = std::chrono::steady_clock::now() + KEEP_ALIVE_WAIT_SLICE;

        const std::optional<FtpReply> reply = readReply(deadline ? std::min(*deadline, sliceEnd) : sliceEnd); //throw SysError, ProtocolError
        if (!reply)
        {
            if (deadline && std::chrono::steady_clock::now() >= *deadline)
                throw SysError(formatSystemError("NOOP, " + numberTo<std::string>(replyTimeout.count()) + " ms", ETIMEDOUT));

            //monitor stopped: reply is still outstanding => drained before the next command
            interruptionPoint(); //throw ThreadStopRequest
            continue;
        }

        if (reply->code == 200) //possibly for an earlier NOOP that timed out: still proves liveness
        {
            --outstandingNoops_;
            return;
        }

        if (pendingCompletion_ && !stashedCompletion_)
        {
            stashedCompletion_ = *reply; //transfer finished first => keep for completePendingCommand()
            continue;
        }

        --outstandingNoops_;
        throw ProtocolError("Keep-alive rejected. " + formatFtpReply(*reply), reply->code);
    }
}


void ControlChannel::disconnect() //noexcept
{
    std::lock_guard dummy(lockControl_);

    if (!socket_)
        return;

    if (tls_ && !pendingCompletion_)
        try
        {
            sendLine("QUIT"); //throw SysError
            //"221 Goodbye": don't wait forever for a server that is gone already
            readReply(std::chrono::steady_clock::now() + connectTimeout_); //throw SysError, ProtocolError
        }
        catch (const SysError& e)
        {
            log_.logWarning("QUIT failed: " + e.toString());
            logExtraError("FTPS QUIT failed: " + e.toString());
        }

    closeTransport();
}


void ControlChannel::close() //noexcept
{
    std::lock_guard dummy(lockControl_);

    if (socket_)
        closeTransport();
}


void ControlChannel::closeTransport() //noexcept
{
    if (tls_)
        try
        {
            tls_->shutdown(); //throw SysError
        }
        catch (const SysError& e) { log_.logWarning("TLS shutdown failed: " + e.toString()); }

    teardown();
    log_.logInfo("Disconnected from " + host_);
}


void ControlChannel::abort() //noexcept
{
    std::lock_guard dummy(lockSocket_);
    if (socket_)
        try
        {
            socket_->shutdownBoth(); //throw SysError
        }
        catch (const SysError& e) { logExtraError("Aborting FTPS control connection failed: " + e.toString()); }
}


TlsContext& ControlChannel::getTlsContext() //throw ConnectionError
{
    std::lock_guard dummy(lockControl_);
    checkConnected(); //throw ConnectionError
    return *tlsCtx_;
}


std::shared_ptr<TlsSession> ControlChannel::getTlsSession()
{
    std::lock_guard dummy(lockControl_);
    return tls_ ? tls_->getSession() : nullptr;
}


std::string ControlChannel::getTlsDescription()
{
    std::lock_guard dummy(lockControl_);
    return tls_ ? tls_->getProtocolVersion() + ", " + tls_->getCipherName() : std::string();
}

//--------------------------------------------------------------------------------------------

FtpReply ControlChannel::runCommand(const std::string& cmdLine) //throw ConnectionError, ProtocolError
{
    if (contains(cmdLine, '\r') || contains(cmdLine, '\n'))
        throw ProtocolError("Invalid character in FTP command.", 0);

    checkConnected(); //throw ConnectionError
    try
    {
        drainKeepAliveReplies(); //throw SysError, ProtocolError

        log_.logCommand(cmdLine);
        sendLine(cmdLine); //throw SysError
        return readReply(); //throw SysError, ProtocolError
    }
    catch (const ProtocolError&) { throw; }
    catch (const SysError& e) { throwConnectionError(beforeFirst(cmdLine, ' ', IfNotFoundReturn::all), e); }
}


void ControlChannel::drainKeepAliveReplies() //throw SysError, ProtocolError
{
    while (outstandingNoops_ > 0)
    {
        readReply(); //throw SysError, ProtocolError
        --outstandingNoops_;
    }
}


void ControlChannel::sendLine(const std::string& line) //throw SysError
{
    const std::string buf = line + "\r\n";

    for (size_t bytesWritten = 0; bytesWritten < buf.size(); )
        bytesWritten += tls_ ?
                        tls_->tryWrite(buf.data() + bytesWritten, buf.size() - bytesWritten) : //throw SysError
                        tryWriteSocket(socket_->get(), buf.data() + bytesWritten, buf.size() - bytesWritten); //
}


std::optional<std::string> ControlChannel::extractLine() //throw ProtocolError
{
    const size_t pos = recvBuf_.find('\n');
    if (pos == std::string::npos)
    {
        if (recvBuf_.size() > FTP_MAX_LINE_LENGTH)
            throw ProtocolError("FTP reply line too long.", 0);
        return std::nullopt;
    }

    std::string line = recvBuf_.substr(0, pos);
    recvBuf_.erase(0, pos + 1);

    if (endsWith(line, '\r'))
        line.pop_back();
    return line;
}


std::optional<FtpReply> ControlChannel::readReply(std::optional<std::chrono::steady_clock::time_point> deadline) //throw SysError, ProtocolError
{
    for (;;)
    {
        while (std::optional<std::string> line = extractLine()) //throw ProtocolError
        {
            log_.logReplyLine(*line);

            if (std::optional<FtpReply> reply = replyParser_.pushLine(*line)) //throw ProtocolError
                return reply;
        }

        //OpenSSL may hold decrypted bytes that poll() can't see
        if (deadline && !(tls_ && tls_->hasPendingData()))
        {
            const auto now = std::chrono::steady_clock::now();
            if (now >= *deadline)
                return std::nullopt;

            const auto waitMs = std::chrono::ceil<std::chrono::milliseconds>(*deadline - now).count();
            if (!waitForSocketReadable(socket_->get(), static_cast<int>(waitMs))) //throw SysError
                return std::nullopt;
        }

        char buffer[FTP_RECV_BLOCK_SIZE];
        const size_t bytesRead = tls_ ?
                                 tls_->tryRead(buffer, sizeof(buffer)) : //throw SysError
                                 tryReadSocket(socket_->get(), buffer, sizeof(buffer)); //
        if (bytesRead == 0)
            throw SysError("Server closed the control connection.");

        recvBuf_.append(buffer, bytesRead);
    }
}


FtpReply ControlChannel::readFinalReply() //throw SysError, ProtocolError
{
    for (;;)
        if (FtpReply reply = readReply(); //throw SysError, ProtocolError
            classifyReply(reply.code) != ReplyClass::positivePreliminary)
            return reply;
}


void ControlChannel::checkConnected() const //throw ConnectionError
{
    if (!socket_)
        throw ConnectionError("Control connection is closed.");
}


void ControlChannel::throwConnectionError(const std::string& context, const SysError& e) //throw ConnectionError
{
    teardown();
    throw ConnectionError(context + ": Connection to " + host_ + " failed.\n\n" + e.toString());
}


void ControlChannel::teardown() //noexcept
{
    tls_.reset();
    {
        std::lock_guard dummy(lockSocket_);
        socket_.reset();
    }
    tlsCtx_.reset();
    recvBuf_.clear();
    replyParser_ = FtpReplyParser();
    outstandingNoops_ = 0;
}
