// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef CONTROL_CHANNEL_H_4410928374651029384
#define CONTROL_CHANNEL_H_4410928374651029384

#include <chrono>
#include <mutex>
#include <fse/open_ssl.h>
#include "ftp_reply.h"
#include "ftps_config.h"
#include "session_log.h"


namespace ftps
{
/*  FTPS control connection: TCP + TLS (RFC 4217), one command/reply exchange at a time

    Thread-safety: all command/reply exchanges are serialized by a mutex: the keep-alive thread may send NOOPs while
    the caller's thread runs a data transfer. abort() may be called from any thread.                               */
class ControlChannel
{
public:
    ControlChannel(TlsMode tlsMode, SessionLog& log);
    ~ControlChannel();

    void connect(const std::string& host, uint16_t port); //throw ConnectionError, ProtocolError, SecurityError
    bool login(const std::string& user, const std::string& pass); //throw ConnectionError, ProtocolError

    //one command line => one (possibly multi-line) reply
    FtpReply executeCommand(const std::string& verb, const std::string& args = {}); //throw ConnectionError, ProtocolError

    //transfer command (LIST, RETR, STOR...): a 1yz reply leaves the completion reply pending
    FtpReply startTransferCommand(const std::string& verb, const std::string& args); //throw ConnectionError, ProtocolError
    FtpReply completePendingCommand(); //throw ConnectionError, ProtocolError
    bool hasPendingCommand() const { return pendingCompletion_; }

    //NOOP + wait for its reply; replyTimeout == 0: wait indefinitely
    //to be called from an InterruptibleThread: interruption abandons the wait, the reply is consumed later
    void sendKeepAlive(std::chrono::milliseconds replyTimeout); //throw SysError, ThreadStopRequest

    void disconnect(); //noexcept: QUIT + close_notify; failures are logged
    void close();      //noexcept: close_notify only, e.g. after QUIT was sent by the caller
    void abort();      //noexcept: unblock pending reads/writes from any thread

    bool isConnected() const { return static_cast<bool>(socket_); }

    //------------------------------------------------------------------------------------
    //std::nullopt: disabled; reads back as zero
    void setControlKeepAliveTimeout     (std::optional<std::chrono::milliseconds> timeout) { keepAliveTimeout_      = timeout; }
    void setControlKeepAliveReplyTimeout(std::optional<std::chrono::milliseconds> timeout) { keepAliveReplyTimeout_ = timeout; }
    void setDataTimeout                 (std::optional<std::chrono::milliseconds> timeout) { dataTimeout_           = timeout; }

    std::chrono::milliseconds getControlKeepAliveTimeout     () const { return keepAliveTimeout_     .value_or(std::chrono::milliseconds(0)); }
    std::chrono::milliseconds getControlKeepAliveReplyTimeout() const { return keepAliveReplyTimeout_.value_or(std::chrono::milliseconds(0)); }
    std::chrono::milliseconds getDataTimeout                 () const { return dataTimeout_          .value_or(std::chrono::milliseconds(0)); }

    //TCP connect, TLS handshake and control replies
    void setConnectTimeout(std::chrono::seconds timeout);
    std::chrono::seconds getConnectTimeout() const { return connectTimeout_; }

    void setEndpointCheckingEnabled(bool enabled) { endpointCheck_ = enabled; }
    bool isEndpointCheckingEnabled() const { return endpointCheck_; }

    void setTrustedCaFile(const std::string& caFilePath) { caFile_ = caFilePath; } //applies to next connect()

    //------------------------------------------------------------------------------------
    TlsMode getTlsMode() const { return tlsMode_; }
    const std::string& getHost() const { return host_; }
    uint16_t getRemotePort() const { return peerAddress_.port; }
    const std::string& getRemoteAddress() const { return peerAddress_.ip; } //numeric
    const fse::SocketAddress& getLocalAddress() const { return localAddress_; }

    int getReplyCode() const { return lastReply_.code; }
    std::string getReplyString() const { return lastReply_.getText(); }
    const std::vector<std::string>& getReplyStrings() const { return lastReply_.lines; }

    //TLS material for dependent data connections
    fse::TlsContext& getTlsContext(); //throw ConnectionError
    std::shared_ptr<fse::TlsSession> getTlsSession(); //nullptr if not resumable
    std::string getTlsDescription(); //e.g. "TLSv1.3, TLS_AES_256_GCM_SHA384"

    SessionLog& getLog() { return log_; }

private:
    ControlChannel           (const ControlChannel&) = delete;
    ControlChannel& operator=(const ControlChannel&) = delete;

    FtpReply runCommand(const std::string& cmdLine); //throw ConnectionError, ProtocolError; caller must hold lockControl_
    void startTls(); //throw ConnectionError, SecurityError

    void sendLine(const std::string& line); //throw SysError
    std::optional<std::string> extractLine(); //throw ProtocolError
    std::optional<FtpReply> readReply(std::optional<std::chrono::steady_clock::time_point> deadline); //throw SysError, ProtocolError
    FtpReply readReply() { return *readReply(std::nullopt); } //throw SysError, ProtocolError
    FtpReply readFinalReply(); //throw SysError, ProtocolError; skip 1yz
    void drainKeepAliveReplies(); //throw SysError, ProtocolError

    void checkConnected() const; //throw ConnectionError
    [[noreturn]] void throwConnectionError(const std::string& context, const fse::SysError& e); //throw ConnectionError
    void closeTransport(); //noexcept; caller must hold lockControl_
    void teardown(); //noexcept

    const TlsMode tlsMode_;
    SessionLog& log_;

    std::string host_;
    std::chrono::seconds connectTimeout_{10};
    std::optional<std::chrono::milliseconds> keepAliveTimeout_;
    std::optional<std::chrono::milliseconds> keepAliveReplyTimeout_;
    std::optional<std::chrono::milliseconds> dataTimeout_;
    bool endpointCheck_ = false;
    std::string caFile_;

    std::mutex lockControl_; //serialize command/reply exchanges
    std::mutex lockSocket_;  //socket_ life time vs abort()

    std::unique_ptr<fse::Socket>     socket_;
    std::unique_ptr<fse::TlsContext> tlsCtx_;
    std::unique_ptr<fse::TlsStream>  tls_;
    fse::SocketAddress peerAddress_;
    fse::SocketAddress localAddress_;

    std::string recvBuf_;
    FtpReplyParser replyParser_;

    FtpReply lastReply_;

    int outstandingNoops_ = 0;          //NOOP replies not yet consumed
    bool pendingCompletion_ = false;    //transfer command waits for its final reply
    std::optional<FtpReply> stashedCompletion_; //final reply read by the keep-alive thread
};
}

#endif //CONTROL_CHANNEL_H_4410928374651029384
