// *****************************************************************************
// * This file is part of the FtpsEngine project. It is distributed under      *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FTPS_CLIENT_H_5510928374650192834
#define FTPS_CLIENT_H_5510928374650192834

#include <functional>
#include "data_channel.h"
#include "keep_alive.h"
#include "feature_registry.h"
#include "timestamp_query.h"


namespace ftps
{
//call once at program start: OpenSSL setup + SIGPIPE is ignored (send() on a closed socket must fail with EPIPE)
void ftpsInit(); //throw SysError


enum class TransferType
{
    binary, //TYPE I
    ascii,  //TYPE A
};


/*  One FTPS session: control connection + on-demand data connections

    - data operations (listings, transfers) open, use and close their own data connection
    - the control connection is kept alive by NOOPs while a data connection is open (if enabled)
    - not thread-safe except for abort()                                                          */
class FtpsClient
{
public:
    explicit FtpsClient(TlsMode tlsMode);
    explicit FtpsClient(const FtpsLogin& login); //applies all options; see connect()/login() without arguments
    ~FtpsClient();

    void connect(const std::string& host, uint16_t port); //throw ConnectionError, ProtocolError, SecurityError
    void connect(); //throw ConnectionError, ProtocolError, SecurityError; server + port of FtpsLogin

    bool login(const std::string& user, const std::string& pass); //throw ConnectionError, ProtocolError
    bool login(); //throw ConnectionError, ProtocolError; empty user name: "anonymous"

    bool logout(); //throw ConnectionError, ProtocolError; QUIT + close
    void disconnect(); //noexcept
    void abort(); //noexcept; from any thread: unblock the running operation

    bool isConnected() const { return control_.isConnected(); }

    FtpReply sendCommand(const std::string& cmdLine); //throw ConnectionError, ProtocolError
    void setFileType(TransferType type); //throw ConnectionError, ProtocolError

    uint64_t execPBSZ(uint64_t size) { return secureData_.execPBSZ(size); } //throw ConnectionError, ProtocolError
    void execPROT(const std::string& levelToken) { secureData_.execPROT(levelToken); } //throw ConnectionError, ProtocolError
    void execPROT(ProtectionLevel level) { secureData_.execPROT(level); } //

    bool hasFeature(const std::string& token) { return features_.hasFeature(token); } //throw ConnectionError, ProtocolError
    bool hasFeature(FtpCommand cmd) { return features_.hasFeature(cmd); } //
    FeatureRegistry& getFeatures() { return features_; }

    //------------------------------------------------------------------------------------
    //data operations
    std::vector<FtpFile> listFiles(const std::optional<std::string>& pathname = {}); //throw ConnectionError, ProtocolError, NotFoundError, DataConnectionError, SecurityError
    std::vector<std::string> listNames(const std::optional<std::string>& pathname = {}); //

    uint64_t retrieveFile(const std::string& pathname, const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/); //throw ConnectionError, ProtocolError, NotFoundError, DataConnectionError, SecurityError, X
    uint64_t storeFile   (const std::string& pathname, const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock /*throw X; return "bytesToRead" bytes unless end of stream*/); //

    //------------------------------------------------------------------------------------
    uint64_t getFileSize(const std::string& pathname); //throw ConnectionError, ProtocolError, NotFoundError

    std::string printWorkingDirectory(); //throw ConnectionError, ProtocolError
    void changeWorkingDirectory(const std::string& pathname); //throw ConnectionError, ProtocolError, NotFoundError

    FtpTimestamp mdtmTimestamp(const std::string& pathname) { return timestamps_.queryModificationTime(pathname); } //throw ConnectionError, ProtocolError, NotFoundError
    fse::TimeComp mdtmCalendar(const std::string& pathname) { return mdtmTimestamp(pathname).calendar; } //
    std::chrono::system_clock::time_point mdtmInstant(const std::string& pathname) { return mdtmTimestamp(pathname).instant; } //
    FtpFile mdtmFile(const std::string& pathname) { return makeFileRecord(pathname, mdtmTimestamp(pathname)); } //

    void setModificationTime(const std::string& pathname, std::chrono::system_clock::time_point modTime); //throw ConnectionError, ProtocolError, NotFoundError

    //------------------------------------------------------------------------------------
    //std::nullopt: disabled; reads back as zero
    void setControlKeepAliveTimeout     (std::optional<std::chrono::milliseconds> timeout) { control_.setControlKeepAliveTimeout(timeout); }
    void setControlKeepAliveReplyTimeout(std::optional<std::chrono::milliseconds> timeout) { control_.setControlKeepAliveReplyTimeout(timeout); }
    void setDataTimeout                 (std::optional<std::chrono::milliseconds> timeout) { control_.setDataTimeout(timeout); }

    std::chrono::milliseconds getControlKeepAliveTimeout     () const { return control_.getControlKeepAliveTimeout(); }
    std::chrono::milliseconds getControlKeepAliveReplyTimeout() const { return control_.getControlKeepAliveReplyTimeout(); }
    std::chrono::milliseconds getDataTimeout                 () const { return control_.getDataTimeout(); }

    void setConnectTimeout(std::chrono::seconds timeout) { control_.setConnectTimeout(timeout); }
    std::chrono::seconds getConnectTimeout() const { return control_.getConnectTimeout(); }

    void setEndpointCheckingEnabled(bool enabled) { control_.setEndpointCheckingEnabled(enabled); }
    bool isEndpointCheckingEnabled() const { return control_.isEndpointCheckingEnabled(); }

    void setTrustedCaFile(const std::string& caFilePath) { control_.setTrustedCaFile(caFilePath); }

    void setDataConnectionMode(DataConnectionMode mode) { dataFactory_.setDataConnectionMode(mode); }
    DataConnectionMode getDataConnectionMode() const { return dataFactory_.getDataConnectionMode(); }

    void setKeepAlivePolicy(KeepAlivePolicy policy) { keepAlivePolicy_ = policy; }
    KeepAlivePolicy getKeepAlivePolicy() const { return keepAlivePolicy_; }

    //------------------------------------------------------------------------------------
    bool isControlDegraded() const { return controlDegraded_; } //a keep-alive failed since connect()
    bool lastDataSessionReused() const { return lastDataSessionReused_; }

    int getReplyCode() const { return control_.getReplyCode(); }
    std::string getReplyString() const { return control_.getReplyString(); }

    ControlChannel& getControlChannel() { return control_; }

    fse::ErrorLog fetchLog() { return log_.fetchLog(); }
    void setLogCallback(const SessionLog::LogCallback& cb) { log_.setCallback(cb); }

private:
    FtpsClient           (const FtpsClient&) = delete;
    FtpsClient& operator=(const FtpsClient&) = delete;

    //open => keep-alive => transfer => close => completion reply: data connection is closed on all exit paths
    FtpReply runDataOperation(DataIntent intent, const std::string& pathname, const std::function<void(DataConnection& conn)>& transfer /*throw X*/); //throw ConnectionError, ProtocolError, NotFoundError, DataConnectionError, SecurityError, X

    void abandonDataOperation(DataIntent intent); //noexcept

    FtpsLogin login_;
    KeepAlivePolicy keepAlivePolicy_ = KeepAlivePolicy::bestEffort;
    bool controlDegraded_ = false;
    bool lastDataSessionReused_ = false;

    //member order = construction order:
    SessionLog log_;
    ControlChannel control_;
    SecureDataNegotiator secureData_{control_};
    FeatureRegistry features_{control_};
    DataChannelFactory dataFactory_{control_, secureData_};
    TimestampQuery timestamps_{control_};

    std::mutex lockActiveData_;
    DataConnection* activeData_ = nullptr; //abort() from other threads
};
}

#endif //FTPS_CLIENT_H_5510928374650192834
